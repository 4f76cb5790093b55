#ifndef CLINSCRUB_SCRUBBER_NAME_FILTER_HPP
#define CLINSCRUB_SCRUBBER_NAME_FILTER_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include "../../config/default_terms.hpp"

namespace clinscrub {
namespace scrubber {

/**
 * @brief Key used for stoplist comparison: characters other than ASCII
 *        alphanumerics, spaces and non-ASCII bytes are dropped, the rest is
 *        upper-cased and trimmed.
 */
inline std::string stoplistKey(const std::string &candidate)
{
    std::string key;
    key.reserve(candidate.size());
    for (char c : candidate) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || uc >= 0x80 || c == ' ') {
            key.push_back(static_cast<char>(std::toupper(uc)));
        }
    }
    const auto first = key.find_first_not_of(' ');
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = key.find_last_not_of(' ');
    return key.substr(first, last - first + 1);
}

/**
 * @brief Stopword predicate shared by every person detector.
 *
 * Rejects a candidate that begins with "St." or "St " (street and facility
 * abbreviations), or whose stoplistKey() equals a clinical stoplist entry.
 * Depends only on the candidate text.
 */
inline bool isNameStopword(const std::string &candidate)
{
    const auto first = candidate.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return false;
    }
    if (candidate.size() - first >= 3) {
        const char s = static_cast<char>(std::tolower(static_cast<unsigned char>(candidate[first])));
        const char t = static_cast<char>(std::tolower(static_cast<unsigned char>(candidate[first + 1])));
        const char sep = candidate[first + 2];
        if (s == 's' && t == 't') {
            if (sep == ' ') {
                return true;
            }
            if (sep == '.' && candidate.size() - first >= 4 && candidate[first + 3] == ' ') {
                return true;
            }
        }
    }

    const std::string key = stoplistKey(candidate);
    const auto &stoplist = config::nameStoplist();
    return std::find(stoplist.begin(), stoplist.end(), key) != stoplist.end();
}

/// Acceptance predicate handed to the replacement engine for person passes.
inline bool acceptPersonCandidate(const std::string &candidate)
{
    return !isNameStopword(candidate);
}

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_NAME_FILTER_HPP
