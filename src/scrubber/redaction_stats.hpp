#ifndef CLINSCRUB_SCRUBBER_REDACTION_STATS_HPP
#define CLINSCRUB_SCRUBBER_REDACTION_STATS_HPP

#include <cstddef>
#include "category.hpp"

namespace clinscrub {
namespace scrubber {

/**
 * @struct RedactionStats
 * @brief Per-category replacement counts for one scrub() call.
 *
 * Reserved Safe Harbor categories have no field; countFor() reports 0 for them.
 */
struct RedactionStats
{
    std::size_t emails = 0;
    std::size_t phones = 0;
    std::size_t dates = 0;
    std::size_t relativeDates = 0;
    std::size_t ssn = 0;
    std::size_t mrn = 0;
    std::size_t zipCodes = 0;
    std::size_t persons = 0;
    std::size_t facilities = 0;
    std::size_t addresses = 0;
    std::size_t coordinates = 0;

    std::size_t total() const
    {
        return emails + phones + dates + relativeDates + ssn + mrn + zipCodes + persons +
               facilities + addresses + coordinates;
    }

    std::size_t countFor(Category category) const
    {
        switch (category) {
        case Category::Email: return emails;
        case Category::Phone: return phones;
        case Category::Date: return dates;
        case Category::RelativeDate: return relativeDates;
        case Category::Ssn: return ssn;
        case Category::Mrn: return mrn;
        case Category::Zip: return zipCodes;
        case Category::Person: return persons;
        case Category::Facility: return facilities;
        case Category::Address: return addresses;
        case Category::Coordinate: return coordinates;
        default: return 0;
        }
    }

    // Aggregation across notes (batch runs, archive totals).
    RedactionStats &operator+=(const RedactionStats &other)
    {
        emails += other.emails;
        phones += other.phones;
        dates += other.dates;
        relativeDates += other.relativeDates;
        ssn += other.ssn;
        mrn += other.mrn;
        zipCodes += other.zipCodes;
        persons += other.persons;
        facilities += other.facilities;
        addresses += other.addresses;
        coordinates += other.coordinates;
        return *this;
    }
};

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_REDACTION_STATS_HPP
