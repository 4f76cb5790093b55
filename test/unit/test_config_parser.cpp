// test/unit/test_config_parser.cpp
// -----------------------------------------------------------

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/scrubber_config.hpp"
#include "src/scrubber/scrubber.hpp"
#include "src/util/config_parser.hpp"

namespace {

using clinscrub::config::ScrubberConfig;
using clinscrub::util::ConfigParser;

void parse(ScrubberConfig& cfg, const std::string& json) {
    ConfigParser parser(cfg);
    std::istringstream in(json);
    parser.loadFromStream(in);
}

TEST(ConfigParserTest, ParsesAllFields) {
    ScrubberConfig cfg;
    parse(cfg, R"({
        "names": ["Zelda Fitzgerald", "Ada Lovelace"],
        "keywords": ["Lakeside Rehab"],
        "mrn_min_length": 7,
        "mrn_max_length": 12
    })");

    ASSERT_EQ(cfg.names.size(), (std::size_t)2);
    EXPECT_EQ(cfg.names[0], "Zelda Fitzgerald");
    EXPECT_EQ(cfg.names[1], "Ada Lovelace");
    ASSERT_EQ(cfg.keywords.size(), (std::size_t)1);
    EXPECT_EQ(cfg.keywords[0], "Lakeside Rehab");
    ASSERT_TRUE(cfg.mrnMinLength.has_value());
    EXPECT_EQ(*cfg.mrnMinLength, (std::size_t)7);
    EXPECT_EQ(cfg.effectiveMrnMaxLength(), (std::size_t)12);
}

TEST(ConfigParserTest, MissingFieldsKeepDefaults) {
    ScrubberConfig cfg;
    parse(cfg, R"({"names": ["Smith"]})");
    EXPECT_EQ(cfg.names.size(), (std::size_t)1);
    EXPECT_TRUE(cfg.keywords.empty());
    EXPECT_FALSE(cfg.mrnMinLength.has_value());
    EXPECT_EQ(cfg.effectiveMrnMinLength(), (std::size_t)6);
    EXPECT_EQ(cfg.effectiveMrnMaxLength(), (std::size_t)10);

    ScrubberConfig empty;
    parse(empty, "{}");
    EXPECT_TRUE(empty.names.empty());
    EXPECT_FALSE(empty.mrnMaxLength.has_value());
}

TEST(ConfigParserTest, NullFieldsKeepDefaults) {
    ScrubberConfig cfg;
    parse(cfg, R"({"names": null, "mrn_min_length": null, "mrn_max_length": 9})");
    EXPECT_TRUE(cfg.names.empty());
    EXPECT_FALSE(cfg.mrnMinLength.has_value());
    EXPECT_EQ(cfg.effectiveMrnMaxLength(), (std::size_t)9);
}

TEST(ConfigParserTest, BlankEntriesAreDroppedByTheEngine) {
    ScrubberConfig cfg;
    parse(cfg, R"({"keywords": ["  ", "Mercy West", "", "Mercy West"]})");
    EXPECT_EQ(cfg.keywords.size(), (std::size_t)4);

    clinscrub::scrubber::Scrubber engine(cfg);
    clinscrub::scrubber::Scrubber defaults{ScrubberConfig()};
    EXPECT_EQ(engine.facilityTerms().size(), defaults.facilityTerms().size() + 1);
}

TEST(ConfigParserTest, UnknownKeysAreIgnored) {
    ScrubberConfig cfg;
    EXPECT_NO_THROW(parse(cfg, R"({"colour": "blue", "names": ["Smith"]})"));
    EXPECT_EQ(cfg.names.size(), (std::size_t)1);
}

TEST(ConfigParserTest, RejectsMalformedJson) {
    ScrubberConfig cfg;
    EXPECT_THROW(parse(cfg, R"({"names": ["Smith")"), std::runtime_error);
    EXPECT_THROW(parse(cfg, "names=Smith"), std::runtime_error);
    EXPECT_THROW(parse(cfg, R"(["Smith"])"), std::runtime_error);
}

TEST(ConfigParserTest, RejectsWrongTypes) {
    ScrubberConfig cfg;
    EXPECT_THROW(parse(cfg, R"({"names": "Smith"})"), std::runtime_error);
    EXPECT_THROW(parse(cfg, R"({"keywords": ["Mercy", 3]})"), std::runtime_error);
    EXPECT_THROW(parse(cfg, R"({"mrn_min_length": "six"})"), std::runtime_error);
    EXPECT_THROW(parse(cfg, R"({"mrn_max_length": -3})"), std::runtime_error);
    EXPECT_THROW(parse(cfg, R"({"mrn_max_length": 7.5})"), std::runtime_error);
    EXPECT_THROW(parse(cfg, R"({"mrn_min_length": true})"), std::runtime_error);
}

TEST(ConfigParserTest, ZeroLengthParsesButFailsValidation) {
    ScrubberConfig cfg;
    EXPECT_NO_THROW(parse(cfg, R"({"mrn_min_length": 0})"));
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(ConfigParserTest, MissingFileThrows) {
    ScrubberConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromFile("/nonexistent/clinscrub-test.json"), std::runtime_error);
}

} // anonymous namespace
