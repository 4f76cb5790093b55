#ifndef CLINSCRUB_SCRUBBER_CATEGORY_HPP
#define CLINSCRUB_SCRUBBER_CATEGORY_HPP

#include <algorithm>
#include <bitset>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>

namespace clinscrub {
namespace scrubber {

/**
 * @brief Closed set of redaction kinds.
 *
 * Url through Ip are reserved for the HIPAA Safe Harbor identifiers that have
 * no detector yet. They may appear in a skip set but never produce counts.
 */
enum class Category {
    Email = 0,
    Phone,
    Date,
    RelativeDate,
    Ssn,
    Mrn,
    Zip,
    Person,
    Facility,
    Address,
    Coordinate,
    Url,
    Insurance,
    License,
    Vehicle,
    Device,
    Ip
};

constexpr std::size_t kCategoryCount = static_cast<std::size_t>(Category::Ip) + 1;

inline const char *categoryName(Category category)
{
    switch (category) {
    case Category::Email: return "email";
    case Category::Phone: return "phone";
    case Category::Date: return "date";
    case Category::RelativeDate: return "relative-date";
    case Category::Ssn: return "ssn";
    case Category::Mrn: return "mrn";
    case Category::Zip: return "zip";
    case Category::Person: return "person";
    case Category::Facility: return "facility";
    case Category::Address: return "address";
    case Category::Coordinate: return "coordinate";
    case Category::Url: return "url";
    case Category::Insurance: return "insurance";
    case Category::License: return "license";
    case Category::Vehicle: return "vehicle";
    case Category::Device: return "device";
    case Category::Ip: return "ip";
    }
    return "unknown";
}

/**
 * @brief Inverse of categoryName(). Case-insensitive; '_' is accepted for '-'.
 */
inline std::optional<Category> parseCategory(const std::string &text)
{
    std::string key(text);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });

    for (std::size_t i = 0; i < kCategoryCount; ++i) {
        const auto category = static_cast<Category>(i);
        if (key == categoryName(category)) {
            return category;
        }
    }
    return std::nullopt;
}

/// True for categories that have a detector in the current engine.
inline bool isImplemented(Category category)
{
    return static_cast<std::size_t>(category) <= static_cast<std::size_t>(Category::Coordinate);
}

/**
 * @brief Membership set over Category, used for the caller-supplied skip list.
 */
class CategorySet
{
public:
    CategorySet() = default;

    CategorySet(std::initializer_list<Category> categories)
    {
        for (Category c : categories) {
            insert(c);
        }
    }

    void insert(Category category) { bits_.set(index(category)); }
    void erase(Category category) { bits_.reset(index(category)); }
    bool contains(Category category) const { return bits_.test(index(category)); }
    bool empty() const { return bits_.none(); }
    std::size_t size() const { return bits_.count(); }

private:
    static std::size_t index(Category category) { return static_cast<std::size_t>(category); }

    std::bitset<kCategoryCount> bits_;
};

} // namespace scrubber
} // namespace clinscrub

#endif // CLINSCRUB_SCRUBBER_CATEGORY_HPP
