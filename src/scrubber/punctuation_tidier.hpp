#ifndef CLINSCRUB_SCRUBBER_PUNCTUATION_TIDIER_HPP
#define CLINSCRUB_SCRUBBER_PUNCTUATION_TIDIER_HPP

#include <cstddef>
#include <regex>
#include <string>
#include "pattern_builder.hpp"

namespace clinscrub {
namespace scrubber {

/**
 * @brief Post-pass run once after every category pass.
 *
 *   1. whitespace directly before . , ; : ! ? is removed
 *   2. runs of the same punctuation mark collapse to one
 *   3. leading and trailing whitespace is trimmed
 *
 * Owned by the Scrubber; patterns are compiled once in the constructor.
 */
class PunctuationTidier
{
public:
    PunctuationTidier()
        : spaceBeforePunct_(pattern::compile(
              "space-before-punctuation",
              pattern::bounded(R"(\s)", 1, kMaxRunPerPass) + R"(([.,;:!?]))")),
          repeatedPunct_(pattern::compile(
              "repeated-punctuation",
              R"(([.,;:!?]))" + pattern::bounded(R"(\1)", 1, kMaxRunPerPass)))
    {
    }

    std::string tidy(const std::string &input) const
    {
        std::string text = replaceUntilStable(input, spaceBeforePunct_);
        text = replaceUntilStable(text, repeatedPunct_);

        static const char *whitespace = " \t\r\n\f\v";
        const auto first = text.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            return std::string();
        }
        const auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

private:
    // Both patterns are bounded; a longer run shrinks by this much per pass.
    static constexpr std::size_t kMaxRunPerPass = 256;

    static std::string replaceUntilStable(const std::string &input, const std::regex &re)
    {
        std::string text = input;
        while (std::regex_search(text, re)) {
            text = std::regex_replace(text, re, "$1");
        }
        return text;
    }

    std::regex spaceBeforePunct_;
    std::regex repeatedPunct_;
};

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_PUNCTUATION_TIDIER_HPP
