#ifndef CLINSCRUB_REPORT_STATS_REPORT_HPP
#define CLINSCRUB_REPORT_STATS_REPORT_HPP

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "../scrubber/redaction_stats.hpp"

/**
 * @file stats_report.hpp
 * @brief Human-readable and JSON renderings of RedactionStats.
 *
 * USAGE:
 *   @code
 *   std::cerr << clinscrub::report::formatSummary(result.stats);
 *   std::cerr << clinscrub::report::formatJson(result.stats) << "\n";
 *   @endcode
 */

namespace clinscrub {
namespace report {

/**
 * @brief (json key, summary label, count) for each implemented category,
 *        in report order.
 */
struct StatsRow
{
    const char *key;
    const char *label;
    std::size_t count;
};

inline std::vector<StatsRow> statsRows(const scrubber::RedactionStats &stats)
{
    return {
        {"emails", "emails", stats.emails},
        {"phones", "phones", stats.phones},
        {"dates", "dates", stats.dates},
        {"relative_dates", "relative dates", stats.relativeDates},
        {"ssn", "ssn", stats.ssn},
        {"mrn", "mrn", stats.mrn},
        {"zip_codes", "zip codes", stats.zipCodes},
        {"persons", "persons", stats.persons},
        {"facilities", "facilities", stats.facilities},
        {"addresses", "addresses", stats.addresses},
        {"coordinates", "coordinates", stats.coordinates},
    };
}

/**
 * @brief "Redactions applied: N" followed by one line per non-zero category.
 */
inline std::string formatSummary(const scrubber::RedactionStats &stats)
{
    std::ostringstream out;
    out << "Redactions applied: " << stats.total() << "\n";
    for (const auto &row : statsRows(stats)) {
        if (row.count > 0) {
            out << "  " << std::left << std::setw(15) << row.label << ": " << row.count << "\n";
        }
    }
    return out.str();
}

/**
 * @brief Pretty-printed JSON object with snake_case keys and a "total" field.
 */
inline std::string formatJson(const scrubber::RedactionStats &stats)
{
    std::ostringstream out;
    out << "{\n";
    for (const auto &row : statsRows(stats)) {
        out << "  \"" << row.key << "\": " << row.count << ",\n";
    }
    out << "  \"total\": " << stats.total() << "\n}";
    return out.str();
}

} // namespace report
} // namespace clinscrub

#endif // CLINSCRUB_REPORT_STATS_REPORT_HPP
