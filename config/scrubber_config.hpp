#ifndef CLINSCRUB_CONFIG_SCRUBBER_CONFIG_HPP
#define CLINSCRUB_CONFIG_SCRUBBER_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file scrubber_config.hpp
 * @brief Defines the options that augment the scrubber's built-in dictionaries.
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - It is consumed once by the Scrubber constructor.
 */

namespace clinscrub {
namespace config {

/// Default lower bound for a bare numeric identifier (MRN) digit run.
constexpr std::size_t kDefaultMrnMinLength = 6;

/// Default upper bound for a bare numeric identifier (MRN) digit run.
constexpr std::size_t kDefaultMrnMaxLength = 10;

/**
 * @struct ScrubberConfig
 * @brief Holds user-supplied additions to the detection dictionaries:
 *   - names: additional person names (matched case-insensitively).
 *   - keywords: additional facility names or keywords (matched case-insensitively).
 *   - mrnMinLength / mrnMaxLength: digit-length range for bare MRN detection.
 */
struct ScrubberConfig
{
    /// Additional person names to scrub.
    std::vector<std::string> names;

    /// Additional keywords or facility names to scrub.
    std::vector<std::string> keywords;

    /// Overrides the minimum length for MRN detection (default: 6).
    std::optional<std::size_t> mrnMinLength;

    /// Overrides the maximum length for MRN detection (default: 10).
    std::optional<std::size_t> mrnMaxLength;

    std::size_t effectiveMrnMinLength() const
    {
        return mrnMinLength.value_or(kDefaultMrnMinLength);
    }

    std::size_t effectiveMrnMaxLength() const
    {
        return mrnMaxLength.value_or(kDefaultMrnMaxLength);
    }

    /**
     * @brief Check the MRN digit range.
     * @throw std::invalid_argument if either bound is zero or min exceeds max.
     */
    void validate() const
    {
        const std::size_t lo = effectiveMrnMinLength();
        const std::size_t hi = effectiveMrnMaxLength();
        if (lo == 0 || hi == 0 || lo > hi) {
            throw std::invalid_argument("ScrubberConfig: invalid MRN length range: " +
                                        std::to_string(lo) + "-" + std::to_string(hi));
        }
    }
};

} // namespace config
} // namespace clinscrub

#endif // CLINSCRUB_CONFIG_SCRUBBER_CONFIG_HPP
