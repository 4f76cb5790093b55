#ifndef CLINSCRUB_SCRUBBER_NORMALIZER_HPP
#define CLINSCRUB_SCRUBBER_NORMALIZER_HPP

#include <stdexcept>
#include <string>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>

/**
 * @file normalizer.hpp
 * @brief Canonicalizes note text before any detector runs.
 *
 * Steps, in order:
 *   1. NFKC (compatibility decomposition, canonical composition) via ICU.
 *   2. Typographic quotes and primes fold to ' or ", minus-like dashes to '-'.
 *   3. Bullets and interpuncts fold to a space.
 *   4. Runs of whitespace other than CR/LF collapse to a single space.
 *
 * Line structure is kept: '\n' and '\r' are copied through untouched.
 */

namespace clinscrub {
namespace scrubber {

namespace detail {

enum class FoldClass { Keep, SingleQuote, DoubleQuote, Dash, Space };

inline FoldClass classify(UChar32 c)
{
    switch (c) {
    case 0x2018: case 0x2019: case 0x201B: case 0x2032:
        return FoldClass::SingleQuote;
    case 0x201C: case 0x201D: case 0x2033:
        return FoldClass::DoubleQuote;
    case 0x2013: case 0x2014: case 0x2212:
        return FoldClass::Dash;
    case 0x2022: case 0x00B7: case 0x2027: case 0x2043: case 0x30FB:
        return FoldClass::Space;
    default:
        break;
    }
    if (c != '\n' && c != '\r' && u_isUWhiteSpace(c)) {
        return FoldClass::Space;
    }
    return FoldClass::Keep;
}

} // namespace detail

/**
 * @brief Normalize UTF-8 text. Malformed UTF-8 sequences become U+FFFD.
 * @throw std::runtime_error if ICU cannot provide or apply the NFKC normalizer.
 */
inline std::string normalizeText(const std::string &input)
{
    if (input.empty()) {
        return input;
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2 *nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || nfkc == nullptr) {
        throw std::runtime_error(std::string("Normalizer: NFKC instance unavailable: ") +
                                 u_errorName(status));
    }

    const icu::UnicodeString source = icu::UnicodeString::fromUTF8(input);
    const icu::UnicodeString composed = nfkc->normalize(source, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Normalizer: NFKC failed: ") + u_errorName(status));
    }

    icu::UnicodeString folded;
    bool inSpaceRun = false;
    for (int32_t i = 0; i < composed.length();) {
        const UChar32 c = composed.char32At(i);
        i += U16_LENGTH(c);

        const detail::FoldClass kind = detail::classify(c);
        if (kind == detail::FoldClass::Space) {
            if (!inSpaceRun) {
                folded.append(static_cast<UChar>(' '));
                inSpaceRun = true;
            }
            continue;
        }
        inSpaceRun = false;

        switch (kind) {
        case detail::FoldClass::SingleQuote:
            folded.append(static_cast<UChar>('\''));
            break;
        case detail::FoldClass::DoubleQuote:
            folded.append(static_cast<UChar>('"'));
            break;
        case detail::FoldClass::Dash:
            folded.append(static_cast<UChar>('-'));
            break;
        default:
            folded.append(c);
            break;
        }
    }

    std::string out;
    folded.toUTF8String(out);
    return out;
}

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_NORMALIZER_HPP
