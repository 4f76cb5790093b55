#ifndef CLINSCRUB_SCRUBBER_DICTIONARY_BUILDER_HPP
#define CLINSCRUB_SCRUBBER_DICTIONARY_BUILDER_HPP

#include <algorithm>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>
#include "pattern_builder.hpp"

/**
 * @file dictionary_builder.hpp
 * @brief Merges built-in term lists with user overrides and compiles the
 *        result into a single whole-word, case-insensitive alternation.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto terms = buildDictionary(config::defaultSurnames(), cfg.names);
 *   std::optional<std::regex> re = buildDictionaryRegex("name dictionary", terms);
 *   @endcode
 */

namespace clinscrub {
namespace scrubber {

namespace detail {

inline std::string trimCopy(const std::string &s)
{
    static const char *whitespace = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

} // namespace detail

/**
 * @brief Deduplicated, sorted union of defaults and overrides.
 *        Entries are trimmed; empty or whitespace-only entries are dropped.
 */
inline std::vector<std::string> buildDictionary(const std::vector<std::string> &defaults,
                                                const std::vector<std::string> &overrides)
{
    std::set<std::string> unique;
    for (const auto &entry : defaults) {
        std::string term = detail::trimCopy(entry);
        if (!term.empty()) {
            unique.insert(std::move(term));
        }
    }
    for (const auto &entry : overrides) {
        std::string term = detail::trimCopy(entry);
        if (!term.empty()) {
            unique.insert(std::move(term));
        }
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

/**
 * @brief Regex source for one dictionary term: escaped, with each whitespace
 *        run widened to pattern::spaces() and each apostrophe (plain or
 *        typographic) accepting either form.
 */
inline std::string dictionaryTermPattern(const std::string &term)
{
    const std::string apostrophe = pattern::kTypographicApostrophe;
    std::string out;
    bool inSpace = false;
    for (std::size_t i = 0; i < term.size();) {
        const char c = term[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (!inSpace) {
                out += pattern::spaces();
                inSpace = true;
            }
            ++i;
            continue;
        }
        inSpace = false;
        if (c == '\'') {
            out += pattern::apostropheClass();
            ++i;
        } else if (term.compare(i, apostrophe.size(), apostrophe) == 0) {
            out += pattern::apostropheClass();
            i += apostrophe.size();
        } else {
            out += pattern::escapeLiteral(std::string(1, c));
            ++i;
        }
    }
    return out;
}

/**
 * @brief Compile a dictionary into one word-bounded, case-insensitive regex.
 * @return std::nullopt when the dictionary is empty.
 * @throw std::runtime_error if the generated pattern fails to compile.
 *
 * Longer terms are placed first in the alternation so that a multi-word
 * entry wins over a shorter entry it starts with.
 */
inline std::optional<std::regex> buildDictionaryRegex(const std::string &detectorName,
                                                      const std::vector<std::string> &terms)
{
    if (terms.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> ordered(terms);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const std::string &a, const std::string &b) { return a.size() > b.size(); });

    std::vector<std::string> alternatives;
    alternatives.reserve(ordered.size());
    for (const auto &term : ordered) {
        alternatives.push_back(dictionaryTermPattern(term));
    }

    const std::string source = R"(\b)" + pattern::alternation(alternatives) + R"(\b)";
    return pattern::compile(detectorName, source, std::regex::ECMAScript | std::regex::icase);
}

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_DICTIONARY_BUILDER_HPP
