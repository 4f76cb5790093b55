#ifndef CLINSCRUB_UTIL_CONFIG_PARSER_HPP
#define CLINSCRUB_UTIL_CONFIG_PARSER_HPP

#include <cstddef>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>
#include <json/json.h>
#include "../../config/scrubber_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser that fills a ScrubberConfig from a JSON document.
 *
 * FORMAT:
 *   {
 *     "names": ["Zelda Fitzgerald", "Ada Lovelace"],
 *     "keywords": ["Lakeside Rehab"],
 *     "mrn_min_length": 7,
 *     "mrn_max_length": 12
 *   }
 *
 *   - Every field is optional. A missing or null field keeps its default.
 *   - names/keywords must be arrays of strings. Entries are appended as
 *     written; blank ones are dropped later by the dictionary builder.
 *   - mrn_*_length must be non-negative integers. Range checks are left to
 *     ScrubberConfig::validate().
 *   - Unrecognized keys are logged and ignored.
 *
 * USAGE:
 *   @code
 *   clinscrub::config::ScrubberConfig cfg;
 *   clinscrub::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("clinscrub.json");
 *   @endcode
 */

namespace clinscrub {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(clinscrub::config::ScrubberConfig &scrubberConfig)
        : scrubberConfig_(scrubberConfig)
    {
    }

    /**
     * @brief Read the given file and apply every recognized field.
     * @throw std::runtime_error if the file can't be opened or isn't a valid config.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            throw std::runtime_error("ConfigParser: failed to open config file: " + filepath);
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("ConfigParser: Config loaded (" +
                     std::to_string(scrubberConfig_.names.size()) + " names, " +
                     std::to_string(scrubberConfig_.keywords.size()) + " keywords).");
    }

    /**
     * @brief Parse a JSON document from an already opened stream.
     * @throw std::runtime_error on malformed JSON or a field of the wrong type.
     */
    inline void loadFromStream(std::istream &in)
    {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        builder["failIfExtra"] = true;

        Json::Value root;
        std::string errs;
        if (!Json::parseFromStream(builder, in, &root, &errs)) {
            throw std::runtime_error("ConfigParser: invalid JSON: " + errs);
        }
        if (!root.isObject()) {
            throw std::runtime_error("ConfigParser: config must be a JSON object");
        }

        for (const std::string &key : root.getMemberNames()) {
            applyField(key, root[key]);
        }
    }

private:
    clinscrub::config::ScrubberConfig &scrubberConfig_;

    inline void applyField(const std::string &key, const Json::Value &value)
    {
        if (key == "names") {
            appendStrings(key, value, scrubberConfig_.names);
        } else if (key == "keywords") {
            appendStrings(key, value, scrubberConfig_.keywords);
        } else if (key == "mrn_min_length") {
            if (!value.isNull()) {
                scrubberConfig_.mrnMinLength = parseLength(key, value);
                logger::debug("ConfigParser: mrn_min_length set to " +
                              std::to_string(*scrubberConfig_.mrnMinLength));
            }
        } else if (key == "mrn_max_length") {
            if (!value.isNull()) {
                scrubberConfig_.mrnMaxLength = parseLength(key, value);
                logger::debug("ConfigParser: mrn_max_length set to " +
                              std::to_string(*scrubberConfig_.mrnMaxLength));
            }
        } else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "'");
        }
    }

    inline void appendStrings(const std::string &key, const Json::Value &value,
                              std::vector<std::string> &out)
    {
        if (value.isNull()) {
            return;
        }
        if (!value.isArray()) {
            throw std::runtime_error("ConfigParser: " + key + " must be an array of strings");
        }
        for (Json::Value::ArrayIndex i = 0; i < value.size(); ++i) {
            if (!value[i].isString()) {
                throw std::runtime_error("ConfigParser: " + key + "[" + std::to_string(i) +
                                         "] must be a string");
            }
            out.push_back(value[i].asString());
        }
    }

    /**
     * @throw std::runtime_error unless the value is a non-negative integer.
     */
    inline std::size_t parseLength(const std::string &key, const Json::Value &value) const
    {
        if (!value.isIntegral() || !value.isUInt64()) {
            throw std::runtime_error("ConfigParser: " + key +
                                     " must be a non-negative integer, got " +
                                     Json::writeString(Json::StreamWriterBuilder(), value));
        }
        return static_cast<std::size_t>(value.asUInt64());
    }
};

} // namespace util
} // namespace clinscrub

#endif // CLINSCRUB_UTIL_CONFIG_PARSER_HPP
