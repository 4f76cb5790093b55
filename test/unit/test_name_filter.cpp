// test/unit/test_name_filter.cpp
// -----------------------------------------------------------
// Stopword predicate applied to every person candidate.

#include <gtest/gtest.h>
#include <string>

#include "src/scrubber/name_filter.hpp"

namespace {

using clinscrub::scrubber::acceptPersonCandidate;
using clinscrub::scrubber::isNameStopword;
using clinscrub::scrubber::stoplistKey;

TEST(NameFilterTest, StoplistKeyStripsPunctuationAndUppercases) {
    EXPECT_EQ(stoplistKey("E. coli"), "E COLI");
    EXPECT_EQ(stoplistKey("  icu, "), "ICU");
    EXPECT_EQ(stoplistKey("..."), "");
}

TEST(NameFilterTest, RejectsClinicalJargon) {
    EXPECT_TRUE(isNameStopword("MRSA"));
    EXPECT_TRUE(isNameStopword("Sepsis"));
    EXPECT_TRUE(isNameStopword("E. Coli"));
    EXPECT_TRUE(isNameStopword("icu"));
}

TEST(NameFilterTest, RejectsSaintAbbreviationPrefix) {
    EXPECT_TRUE(isNameStopword("St. Vincent"));
    EXPECT_TRUE(isNameStopword("st Vincent"));
    EXPECT_FALSE(isNameStopword("Stanley Kubrick"));
    EXPECT_FALSE(isNameStopword("St."));
}

TEST(NameFilterTest, AcceptsOrdinaryNames) {
    EXPECT_FALSE(isNameStopword("David Harmon"));
    EXPECT_FALSE(isNameStopword("ICU Admission"));
    EXPECT_TRUE(acceptPersonCandidate("Dr. Harmon"));
    EXPECT_FALSE(acceptPersonCandidate("MRSA"));
}

TEST(NameFilterTest, DecisionDependsOnlyOnCandidateText) {
    const std::string candidate = "Hypertension";
    const bool first = isNameStopword(candidate);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(isNameStopword(candidate), first);
    }
    EXPECT_TRUE(first);
}

} // anonymous namespace
