#ifndef CLINSCRUB_SCRUBBER_REPLACEMENT_HPP
#define CLINSCRUB_SCRUBBER_REPLACEMENT_HPP

#include <cstddef>
#include <iterator>
#include <regex>
#include <string>

namespace clinscrub {
namespace scrubber {

/**
 * @brief Output of one replacement pass: the rewritten text and how many
 *        matches were replaced.
 */
struct ReplaceResult
{
    std::string text;
    std::size_t count = 0;
};

/**
 * @brief Replace every accepted match of @p re in @p input with @p token.
 *
 * Matches are visited left to right without overlap. A match rejected by
 * @p accept is copied through unchanged and is not counted.
 *
 * @param accept callable taking the matched text as const std::string& and
 *               returning true to replace it.
 */
template <typename AcceptFn>
ReplaceResult replaceMatches(const std::regex &re, const std::string &input,
                             const std::string &token, AcceptFn accept)
{
    ReplaceResult result;
    result.text.reserve(input.size());

    auto tail = input.cbegin();
    const std::sregex_iterator end;
    for (std::sregex_iterator it(input.cbegin(), input.cend(), re); it != end; ++it) {
        const std::smatch &m = *it;
        result.text.append(tail, m[0].first);
        const std::string matched = m.str(0);
        if (accept(matched)) {
            result.text += token;
            ++result.count;
        } else {
            result.text += matched;
        }
        tail = m[0].second;
    }
    result.text.append(tail, input.cend());
    return result;
}

/// Replace every match unconditionally.
inline ReplaceResult replaceAll(const std::regex &re, const std::string &input,
                                const std::string &token)
{
    return replaceMatches(re, input, token, [](const std::string &) { return true; });
}

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_REPLACEMENT_HPP
