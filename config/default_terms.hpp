#ifndef CLINSCRUB_CONFIG_DEFAULT_TERMS_HPP
#define CLINSCRUB_CONFIG_DEFAULT_TERMS_HPP

#include <string>
#include <vector>

/**
 * @file default_terms.hpp
 * @brief Built-in term lists and placeholder tokens used by the scrubber.
 *
 * The lists here are merged with ScrubberConfig overrides at engine
 * construction (see dictionary_builder.hpp). Placeholder tokens are part of
 * the output contract: none of them may be matched by any detector.
 *
 * Example usage:
 *  @code
 *    for (const auto &name : clinscrub::config::defaultSurnames()) { ... }
 *  @endcode
 */

namespace clinscrub {
namespace config {

// ----------------------------------------------------------------------------
//  Placeholder tokens
// ----------------------------------------------------------------------------
constexpr const char *kEmailToken = "[EMAIL]";
constexpr const char *kPhoneToken = "[PHONE]";
constexpr const char *kDateToken = "[DATE]";
constexpr const char *kRelativeDateToken = "[REL_DATE]";
constexpr const char *kSsnToken = "[SSN]";
constexpr const char *kMrnToken = "[MRN]";
constexpr const char *kAddressToken = "[ADDRESS]";
constexpr const char *kPersonToken = "[PERSON]";
constexpr const char *kFacilityToken = "[FACILITY]";
constexpr const char *kZipToken = "[ZIP]";
constexpr const char *kCoordinateToken = "[COORD]";

/**
 * @brief Common surnames redacted wherever they appear as whole words.
 */
inline const std::vector<std::string> &defaultSurnames()
{
    static const std::vector<std::string> names = {
        "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
        "Rodriguez", "Martinez", "Hernandez", "Lopez", "Gonzalez", "Wilson", "Anderson",
        "Thomas", "Taylor", "Moore", "Jackson", "Martin", "Lee", "Perez", "Thompson",
        "White", "Harris", "Sanchez", "Clark", "Ramirez", "Lewis", "Robinson", "Walker",
        "Young", "Allen", "King", "Wright", "Scott", "Torres", "Nguyen", "Hill", "Flores",
        "Green", "Adams", "Nelson", "Baker", "Hall", "Rivera", "Campbell", "Mitchell",
        "Carter", "Roberts", "Gomez", "Phillips", "Turner", "Parker", "Evans", "Edwards",
        "Collins", "Stewart", "Morris", "Murphy", "Cook", "Rogers", "Morgan",
        "Patel", "Singh", "Khan", "Ali", "Mohammed", "Mohammad", "Abdullah", "Hussain",
        "Kim", "Park", "Chen", "Wang", "Zhang", "Lin", "Tran", "Ng", "Chaudhry", "Ahmad",
        "Iqbal", "Rahman",
    };
    return names;
}

/**
 * @brief Common given names. A match here followed by one or two capitalized
 *        words is treated as a first+surname pair.
 */
inline const std::vector<std::string> &commonFirstNames()
{
    static const std::vector<std::string> names = {
        "James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael", "Linda",
        "William", "Elizabeth", "David", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
        "Thomas", "Sarah", "Charles", "Karen", "Christopher", "Nancy", "Daniel", "Lisa",
        "Matthew", "Betty", "Anthony", "Margaret", "Mark", "Sandra", "Donald", "Ashley",
        "Steven", "Kimberly", "Paul", "Emily", "Andrew", "Donna", "Joshua", "Michelle",
        "Kenneth", "Dorothy", "Kevin", "Carol", "Brian", "Amanda", "George", "Melissa",
        "Timothy", "Deborah", "Ronald", "Stephanie", "Edward", "Rebecca", "Jason", "Sharon",
        "Jeffrey", "Laura", "Ryan", "Cynthia", "Jacob", "Kathleen", "Gary", "Amy",
        "Nicholas", "Shirley", "Eric", "Angela", "Jonathan", "Helen", "Stephen", "Anna",
        "Larry", "Brenda", "Justin", "Pamela", "Scott", "Nicole", "Brandon", "Samantha",
        "Frank", "Katherine", "Benjamin", "Emma", "Gregory", "Ruth", "Samuel", "Christine",
        "Patrick", "Catherine", "Alexander", "Debra", "Jack", "Rachel", "Dennis", "Carolyn",
        "Jerry", "Janet", "Tyler", "Maria", "Mohammed", "Muhammad", "Ahmed", "Ahmad",
        "Omar", "Hassan", "Hussein", "Abdullah", "Fatima", "Aisha", "Amelia", "Priya",
        "Anjali", "Sofia", "Noor", "Amina", "Li", "Wei", "Min", "Hao", "Jin", "Sang",
        "Hye", "Yuki", "Mei", "Ravi", "Imran", "Farah", "Leila", "Zara",
    };
    return names;
}

/**
 * @brief Facility phrases that are always redacted, independent of the
 *        prefix-driven facility pattern.
 */
inline const std::vector<std::string> &defaultFacilityTerms()
{
    static const std::vector<std::string> terms = {
        "General Hospital", "Medical Center", "Children's Hospital", "Urgent Care",
        "Cardiology Clinic", "Dialysis Center", "Health System", "Cancer Institute",
        "Family Practice", "Primary Care", "Internal Medicine",
    };
    return terms;
}

/**
 * @brief Honorifics and titles that introduce a person's name.
 *        A trailing '.' is optional when matching.
 */
inline const std::vector<std::string> &honorificTitles()
{
    static const std::vector<std::string> titles = {
        "Drs", "Dr", "Prof", "Mrs", "Mr", "Ms", "Mx", "Capt", "Captain", "Lt",
        "Lieutenant", "Sgt", "Sergeant", "Officer", "Chief", "Judge", "Sir", "Dame",
        "Madam", "Rev", "Reverend", "Father", "Fr", "Sister", "Brother", "Pastor",
        "Chaplain", "Rabbi", "Imam",
    };
    return titles;
}

/**
 * @brief Clinical abbreviations and jargon that look like names but are not.
 *        Entries are upper-case with punctuation removed.
 */
inline const std::vector<std::string> &nameStoplist()
{
    static const std::vector<std::string> words = {
        "CKD", "ESBL", "ICU", "BKA", "IDDM", "MRSA", "ASTHMA", "DIALYSIS", "MEROPENEM",
        "SEPSIS", "HYPERTENSION", "DIABETES", "E COLI", "HGB", "HCT", "POC", "IV",
    };
    return words;
}

} // namespace config
} // namespace clinscrub

#endif // CLINSCRUB_CONFIG_DEFAULT_TERMS_HPP
