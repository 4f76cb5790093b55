// test/unit/test_scrubber.cpp
// -----------------------------------------------------------
// End-to-end behaviour of the redaction cascade: one test per detector
// family, skip handling, construction checks and re-redaction.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/default_terms.hpp"
#include "config/scrubber_config.hpp"
#include "src/scrubber/scrubber.hpp"

namespace {

using clinscrub::config::ScrubberConfig;
using clinscrub::scrubber::Category;
using clinscrub::scrubber::CategorySet;
using clinscrub::scrubber::Scrubber;
using clinscrub::scrubber::ScrubResult;

namespace tokens = clinscrub::config;

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::size_t occurrences(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------
TEST(ScrubberConstructionTest, DefaultConfigBuilds) {
    ScrubberConfig cfg;
    Scrubber engine(cfg);
    EXPECT_EQ(engine.mrnMinLength(), (std::size_t)6);
    EXPECT_EQ(engine.mrnMaxLength(), (std::size_t)10);
    EXPECT_FALSE(engine.nameTerms().empty());
    EXPECT_FALSE(engine.facilityTerms().empty());
}

TEST(ScrubberConstructionTest, RejectsInvalidMrnRange) {
    ScrubberConfig zeroMin;
    zeroMin.mrnMinLength = 0;
    EXPECT_THROW(Scrubber{zeroMin}, std::invalid_argument);

    ScrubberConfig zeroMax;
    zeroMax.mrnMaxLength = 0;
    EXPECT_THROW(Scrubber{zeroMax}, std::invalid_argument);

    ScrubberConfig inverted;
    inverted.mrnMinLength = 8;
    inverted.mrnMaxLength = 4;
    EXPECT_THROW(Scrubber{inverted}, std::invalid_argument);
}

TEST(ScrubberConstructionTest, AcceptsEqualBounds) {
    ScrubberConfig cfg;
    cfg.mrnMinLength = 7;
    cfg.mrnMaxLength = 7;
    EXPECT_NO_THROW(Scrubber{cfg});

    ScrubberConfig one;
    one.mrnMinLength = 1;
    one.mrnMaxLength = 1;
    EXPECT_NO_THROW(Scrubber{one});
}

TEST(ScrubberConstructionTest, OverridesAreMergedIntoDictionaries) {
    ScrubberConfig cfg;
    cfg.names = {"Zelda Fitzgerald", "  ", "Smith"};
    cfg.keywords = {"Lakeside Rehab"};
    Scrubber engine(cfg);
    Scrubber defaults{ScrubberConfig()};

    EXPECT_EQ(engine.nameTerms().size(), defaults.nameTerms().size() + 1);
    EXPECT_EQ(engine.facilityTerms().size(), defaults.facilityTerms().size() + 1);
}

// -----------------------------------------------------------------------------
// Acceptance scenarios
// -----------------------------------------------------------------------------
TEST(ScrubberTest, RedactsEmailAndPhone) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Reach me at jane.doe@example.com or (555) 867-5309.");
    EXPECT_EQ(occurrences(r.text, tokens::kEmailToken), (std::size_t)1);
    EXPECT_EQ(occurrences(r.text, tokens::kPhoneToken), (std::size_t)1);
    EXPECT_EQ(r.stats.emails, (std::size_t)1);
    EXPECT_EQ(r.stats.phones, (std::size_t)1);
    EXPECT_FALSE(contains(r.text, "867-5309"));
}

TEST(ScrubberTest, HonorsSkipCategories) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Call 555-111-2222 and email foo@bar.com.", {Category::Phone});
    EXPECT_TRUE(contains(r.text, "555-111-2222"));
    EXPECT_TRUE(contains(r.text, tokens::kEmailToken));
    EXPECT_EQ(r.stats.phones, (std::size_t)0);
    EXPECT_EQ(r.stats.emails, (std::size_t)1);
}

TEST(ScrubberTest, RedactsConfiguredNames) {
    ScrubberConfig cfg;
    cfg.names.push_back("Zelda Fitzgerald");
    Scrubber engine(cfg);
    ScrubResult r = engine.scrub("Discussed plan with Zelda Fitzgerald today.");
    EXPECT_TRUE(contains(r.text, tokens::kPersonToken));
    EXPECT_EQ(r.stats.persons, (std::size_t)1);
    EXPECT_EQ(r.stats.relativeDates, (std::size_t)1);
}

TEST(ScrubberTest, RedactsCoordinates) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Coordinates 41.8781\xC2\xB0 N, 87.6298\xC2\xB0 W were logged.");
    EXPECT_TRUE(contains(r.text, tokens::kCoordinateToken));
    EXPECT_EQ(r.stats.coordinates, (std::size_t)1);
}

TEST(ScrubberTest, RedactsSaintFacilityWithTypographicApostrophe) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Transferred from St. John\xE2\x80\x99s Medical Center.");
    EXPECT_TRUE(contains(r.text, tokens::kFacilityToken));
    EXPECT_EQ(r.stats.facilities, (std::size_t)1);
    EXPECT_EQ(r.stats.persons, (std::size_t)0);
}

TEST(ScrubberTest, DetectsRelativeDates) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Symptoms started 3 days ago and worsened yesterday.");
    EXPECT_TRUE(contains(r.text, tokens::kRelativeDateToken));
    EXPECT_EQ(r.stats.relativeDates, (std::size_t)2);
}

// -----------------------------------------------------------------------------
// Person detection
// -----------------------------------------------------------------------------
TEST(ScrubberPersonTest, CommonFirstNamePlusSurname) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("David Harmon discussed the plan.");
    EXPECT_TRUE(contains(r.text, tokens::kPersonToken));
    EXPECT_EQ(r.stats.persons, (std::size_t)1);
}

TEST(ScrubberPersonTest, ExtendedHonorifics) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Rev. O'Connor provided counseling.");
    EXPECT_TRUE(contains(r.text, tokens::kPersonToken));
    EXPECT_EQ(r.stats.persons, (std::size_t)1);
}

TEST(ScrubberPersonTest, TitledNameAndStreetAddress) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Dr. Harmon visited 128 Elmwood Drive.");
    EXPECT_TRUE(contains(r.text, tokens::kPersonToken));
    EXPECT_TRUE(contains(r.text, tokens::kAddressToken));
    EXPECT_EQ(r.stats.persons, (std::size_t)1);
    EXPECT_EQ(r.stats.addresses, (std::size_t)1);
}

TEST(ScrubberPersonTest, DefaultSurnameDictionary) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Spoke with patel about dosing.");
    EXPECT_EQ(r.text, "Spoke with [PERSON] about dosing.");
    EXPECT_EQ(r.stats.persons, (std::size_t)1);
}

TEST(ScrubberPersonTest, StoplistSuppressesClinicalTerms) {
    ScrubberConfig cfg;
    cfg.names.push_back("ICU");
    Scrubber engine(cfg);
    ScrubResult r = engine.scrub("Transferred to ICU overnight.");
    EXPECT_TRUE(contains(r.text, "ICU"));
    EXPECT_EQ(r.stats.persons, (std::size_t)0);
}

TEST(ScrubberPersonTest, SaintPrefixIsNotAName) {
    ScrubberConfig cfg;
    cfg.names.push_back("St. Vincent");
    Scrubber engine(cfg);
    ScrubResult r = engine.scrub("Seen at St. Vincent today.", {Category::Facility});
    EXPECT_TRUE(contains(r.text, "St. Vincent"));
    EXPECT_EQ(r.stats.persons, (std::size_t)0);
    EXPECT_EQ(r.stats.facilities, (std::size_t)0);
}

// -----------------------------------------------------------------------------
// Identifiers, locations, dates
// -----------------------------------------------------------------------------
TEST(ScrubberIdentifierTest, SsnPlainAndMasked) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("SSN 123-45-6789, prior xxx-xx-4321.");
    EXPECT_EQ(r.stats.ssn, (std::size_t)2);
    EXPECT_EQ(occurrences(r.text, tokens::kSsnToken), (std::size_t)2);
}

TEST(ScrubberIdentifierTest, LabeledMrn) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Patient ID: 00123456 admitted.");
    EXPECT_EQ(r.text, "[MRN] admitted.");
    EXPECT_EQ(r.stats.mrn, (std::size_t)1);
}

TEST(ScrubberIdentifierTest, BareMrnUsesConfiguredRange) {
    ScrubberConfig cfg;
    cfg.mrnMinLength = 4;
    cfg.mrnMaxLength = 5;
    Scrubber engine(cfg);
    ScrubResult r = engine.scrub("Lab code 12345 noted, reference 1234567 kept.");
    EXPECT_EQ(r.stats.mrn, (std::size_t)1);
    EXPECT_EQ(r.stats.zipCodes, (std::size_t)0);
    EXPECT_TRUE(contains(r.text, "1234567"));
    EXPECT_FALSE(contains(r.text, "12345 "));
}

TEST(ScrubberIdentifierTest, ZipPlusFour) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Mail to Springfield, IL 62704-1234.");
    EXPECT_EQ(r.stats.zipCodes, (std::size_t)1);
    EXPECT_TRUE(contains(r.text, tokens::kZipToken));
    EXPECT_FALSE(contains(r.text, "62704"));
}

TEST(ScrubberIdentifierTest, PhoneWithCountryCodeAndExtension) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Call +1 555.867.5309 ext 12 now.");
    EXPECT_EQ(r.text, "Call [PHONE] now.");
    EXPECT_EQ(r.stats.phones, (std::size_t)1);
}

TEST(ScrubberIdentifierTest, PhoneWithBulletSeparators) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Pager 555\xE2\x80\xA2" "867\xE2\x80\xA2" "5309 overnight.");
    EXPECT_EQ(r.stats.phones, (std::size_t)1);
}

TEST(ScrubberIdentifierTest, CountsEveryEmail) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("cc a@b.io and c.d@e.org please");
    EXPECT_EQ(r.stats.emails, (std::size_t)2);
    EXPECT_EQ(occurrences(r.text, tokens::kEmailToken), (std::size_t)2);
}

TEST(ScrubberLocationTest, AddressWithUnit) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Lives at 42 Oak Lane Apt 3B.");
    EXPECT_EQ(r.text, "Lives at [ADDRESS].");
    EXPECT_EQ(r.stats.addresses, (std::size_t)1);
}

TEST(ScrubberLocationTest, FacilityKeywordsFromConfigAndDefaults) {
    ScrubberConfig cfg;
    cfg.keywords.push_back("Lakeside Rehab");
    Scrubber engine(cfg);

    ScrubResult custom = engine.scrub("Discharged to lakeside rehab yesterday.");
    EXPECT_EQ(custom.stats.facilities, (std::size_t)1);
    EXPECT_EQ(custom.stats.relativeDates, (std::size_t)1);

    ScrubResult builtin = engine.scrub("Referred to Urgent Care for sutures.");
    EXPECT_EQ(builtin.text, "Referred to [FACILITY] for sutures.");
    EXPECT_EQ(builtin.stats.facilities, (std::size_t)1);
}

TEST(ScrubberDateTest, NumericAndMonthNameDates) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Seen 2024-03-14 and again on March 3, 2024; follow-up 04/02.");
    EXPECT_EQ(r.stats.dates, (std::size_t)3);
    EXPECT_EQ(occurrences(r.text, tokens::kDateToken), (std::size_t)3);
}

TEST(ScrubberDateTest, RelativeVocabulary) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Seen last Tuesday and this morning.");
    EXPECT_EQ(r.text, "Seen [REL_DATE] and [REL_DATE].");
    EXPECT_EQ(r.stats.relativeDates, (std::size_t)2);
}

// -----------------------------------------------------------------------------
// Whole-call properties
// -----------------------------------------------------------------------------
TEST(ScrubberPropertyTest, EmptyInput) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("");
    EXPECT_EQ(r.text, "");
    EXPECT_EQ(r.stats.total(), (std::size_t)0);
}

TEST(ScrubberPropertyTest, NewlinesArePreserved) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub("Line one\nCall 555-111-2222\nEnd");
    EXPECT_EQ(r.text, "Line one\nCall [PHONE]\nEnd");
}

TEST(ScrubberPropertyTest, VeryLongTokensPassThrough) {
    Scrubber engine{ScrubberConfig()};
    const std::string lower(100000, 'a');
    ScrubResult r = engine.scrub("note " + lower + " end");
    EXPECT_EQ(r.text, "note " + lower + " end");
    EXPECT_EQ(r.stats.total(), (std::size_t)0);

    const std::string capitalized = "A" + std::string(100000, 'a');
    r = engine.scrub(capitalized + " Bb");
    EXPECT_EQ(r.text, capitalized + " Bb");
    EXPECT_EQ(r.stats.persons, (std::size_t)0);
}

TEST(ScrubberPropertyTest, LongRunsAroundRealMatches) {
    Scrubber engine{ScrubberConfig()};
    const std::string digits(100000, '7');
    const std::string newlines(5000, '\n');
    ScrubResult r = engine.scrub(digits + " mail foo@bar.com" + newlines + "." +
                                 std::string(100000, '!'));
    EXPECT_EQ(r.stats.emails, (std::size_t)1);
    EXPECT_EQ(r.stats.mrn, (std::size_t)0);
    EXPECT_EQ(r.text, digits + " mail [EMAIL].!");
}

TEST(ScrubberPropertyTest, ReservedCategorySkipHasNoEffect) {
    Scrubber engine{ScrubberConfig()};
    const std::string note = "Reach me at jane.doe@example.com or (555) 867-5309.";
    ScrubResult plain = engine.scrub(note);
    ScrubResult skipped = engine.scrub(note, {Category::Url, Category::Ip});
    EXPECT_EQ(plain.text, skipped.text);
    EXPECT_EQ(plain.stats.total(), skipped.stats.total());
    EXPECT_EQ(skipped.stats.countFor(Category::Url), (std::size_t)0);
}

TEST(ScrubberPropertyTest, TotalIsSumOfCategories) {
    Scrubber engine{ScrubberConfig()};
    ScrubResult r = engine.scrub(
        "Dr. Harmon visited 128 Elmwood Drive on 03/14/2024, email foo@bar.com.");
    std::size_t sum = 0;
    for (std::size_t i = 0; i < clinscrub::scrubber::kCategoryCount; ++i) {
        sum += r.stats.countFor(static_cast<Category>(i));
    }
    EXPECT_EQ(r.stats.total(), sum);
    EXPECT_EQ(r.stats.total(), (std::size_t)4);
}

TEST(ScrubberPropertyTest, RedactedOutputIsAFixedPoint) {
    Scrubber engine{ScrubberConfig()};
    const std::string note =
        "Reach me at jane.doe@example.com or (555) 867-5309. Dr. Harmon visited 128 Elmwood "
        "Drive on 03/14/2024. SSN 123-45-6789, MRN: A12345, ZIP 60614.";

    ScrubResult first = engine.scrub(note);
    EXPECT_EQ(first.stats.emails, (std::size_t)1);
    EXPECT_EQ(first.stats.phones, (std::size_t)1);
    EXPECT_EQ(first.stats.persons, (std::size_t)1);
    EXPECT_EQ(first.stats.addresses, (std::size_t)1);
    EXPECT_EQ(first.stats.dates, (std::size_t)1);
    EXPECT_EQ(first.stats.ssn, (std::size_t)1);
    EXPECT_EQ(first.stats.mrn, (std::size_t)1);
    EXPECT_EQ(first.stats.zipCodes, (std::size_t)1);

    ScrubResult second = engine.scrub(first.text);
    EXPECT_EQ(second.text, first.text);
    EXPECT_EQ(second.stats.total(), (std::size_t)0);
}

TEST(ScrubberPropertyTest, SharedEngineIsSafeAcrossThreads) {
    Scrubber engine{ScrubberConfig()};
    const std::string note = "Dr. Harmon visited 128 Elmwood Drive, call (555) 867-5309.";
    const ScrubResult expected = engine.scrub(note);

    std::vector<std::string> results(4);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < results.size(); ++t) {
        workers.emplace_back([&engine, &note, &results, t]() {
            std::string last;
            for (int i = 0; i < 20; ++i) {
                last = engine.scrub(note).text;
            }
            results[t] = last;
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    for (const auto& r : results) {
        EXPECT_EQ(r, expected.text);
    }
}

} // anonymous namespace
