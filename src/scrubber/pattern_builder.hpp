#ifndef CLINSCRUB_SCRUBBER_PATTERN_BUILDER_HPP
#define CLINSCRUB_SCRUBBER_PATTERN_BUILDER_HPP

#include <cctype>
#include <cstddef>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file pattern_builder.hpp
 * @brief Helpers that turn literal term lists into std::regex source text.
 *
 * std::regex has no inline (?i) modifier, so patterns that mix a
 * case-insensitive trigger with case-sensitive capitalized words spell the
 * trigger out with anyCaseLiteral() and compile without icase.
 *
 * libstdc++ matches recursively, one stack frame per repetition, so no
 * detector uses an open-ended quantifier over a character class. Runs are
 * capped with the limits below; a longer token simply doesn't match.
 */

namespace clinscrub {
namespace scrubber {
namespace pattern {

/// Longest run of letters accepted as one word.
constexpr std::size_t kMaxWordRun = 64;

/// Longest whitespace run accepted between two parts of a match.
constexpr std::size_t kMaxSpaceRun = 16;

/// atom{min,max}
inline std::string bounded(const std::string &atom, std::size_t min, std::size_t max)
{
    return atom + "{" + std::to_string(min) + "," + std::to_string(max) + "}";
}

/// Replacement for \s+ between the parts of a pattern.
inline std::string spaces()
{
    return bounded(R"(\s)", 1, kMaxSpaceRun);
}

/// Replacement for \s* between the parts of a pattern.
inline std::string optionalSpaces()
{
    return bounded(R"(\s)", 0, kMaxSpaceRun);
}

/// UTF-8 encoding of U+2019 RIGHT SINGLE QUOTATION MARK.
constexpr const char *kTypographicApostrophe = "\xE2\x80\x99";

/// An apostrophe, plain or typographic.
inline std::string apostropheClass()
{
    return std::string("(?:'|") + kTypographicApostrophe + ")";
}

/**
 * @brief One letter of a capitalized word: ASCII letters, any UTF-8 lead or
 *        continuation byte, apostrophes and hyphens.
 */
inline std::string nameCharClass()
{
    return R"([A-Za-z\x80-\xff'\-])";
}

/// A capitalized word: upper-case ASCII initial followed by name characters.
inline std::string capitalizedWord()
{
    return "[A-Z]" + bounded(nameCharClass(), 1, kMaxWordRun);
}

/**
 * @brief Escape every ECMAScript metacharacter in a literal.
 */
inline std::string escapeLiteral(const std::string &literal)
{
    static const std::string special = R"(\^$.|?*+()[]{}/)";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

/**
 * @brief Escape a literal and expand letters to [Xx] classes so it matches
 *        in any case inside an otherwise case-sensitive pattern.
 */
inline std::string anyCaseLiteral(const std::string &literal)
{
    std::string out;
    for (char c : literal) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            out.push_back('[');
            out.push_back(static_cast<char>(std::toupper(uc)));
            out.push_back(static_cast<char>(std::tolower(uc)));
            out.push_back(']');
        } else if (c == ' ') {
            out += spaces();
        } else {
            out += escapeLiteral(std::string(1, c));
        }
    }
    return out;
}

/**
 * @brief Join already-escaped alternatives into a non-capturing group.
 */
inline std::string alternation(const std::vector<std::string> &alternatives)
{
    std::string out = "(?:";
    for (std::size_t i = 0; i < alternatives.size(); ++i) {
        if (i > 0) {
            out.push_back('|');
        }
        out += alternatives[i];
    }
    out.push_back(')');
    return out;
}

/**
 * @brief Compile a pattern, reporting failures with the detector's name.
 * @throw std::runtime_error wrapping the std::regex_error message.
 */
inline std::regex compile(const std::string &detectorName, const std::string &source,
                          std::regex::flag_type flags = std::regex::ECMAScript)
{
    try {
        return std::regex(source, flags | std::regex::optimize);
    } catch (const std::regex_error &ex) {
        throw std::runtime_error("Scrubber: failed to compile " + detectorName +
                                 " pattern: " + ex.what());
    }
}

} // namespace pattern
} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_PATTERN_BUILDER_HPP
