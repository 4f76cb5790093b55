#ifndef CLINSCRUB_CLI_CLI_OPTIONS_HPP
#define CLINSCRUB_CLI_CLI_OPTIONS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../scrubber/category.hpp"

/**
 * @file cli_options.hpp
 * @brief Command-line options for the clinscrub executable.
 */

namespace clinscrub {
namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line. Paths left empty mean stdin/stdout.
 */
struct CliOptions
{
    std::string inputPath;
    std::string outputPath;
    std::string configPath;
    std::string archivePath;
    scrubber::CategorySet skip;
    bool quiet = false;
    bool statsJson = false;
    bool safeHarbor = false;
    bool verbose = false;
    bool showHelp = false;
};

inline std::string usage(const std::string &program)
{
    return "Usage: " + program + " [options]\n"
           "Redacts common PHI elements from clinical notes.\n\n"
           "  -i, --input PATH     input file, '-' for STDIN (default)\n"
           "  -o, --output PATH    output file, '-' for STDOUT (default)\n"
           "  -c, --config PATH    JSON config augmenting the default dictionaries\n"
           "      --skip CATEGORY  category to leave untouched (repeatable)\n"
           "      --quiet          suppress the redaction summary\n"
           "      --stats-json     emit redaction stats as JSON to stderr\n"
           "      --safe-harbor    request the extended HIPAA Safe Harbor categories\n"
           "      --archive PATH   store the redacted note in a SQLite archive\n"
           "      --verbose        debug logging\n"
           "  -h, --help           show this help\n\n"
           "Categories: email, phone, date, relative-date, ssn, mrn, zip, person,\n"
           "  facility, address, coordinate, url, insurance, license, vehicle, device, ip\n";
}

/**
 * @brief Parse argv.
 * @throw std::invalid_argument on an unknown option, a missing value or an
 *        unknown category name.
 */
inline CliOptions parseArguments(const std::vector<std::string> &args)
{
    CliOptions opts;

    auto requireValue = [&args](std::size_t &i, const std::string &flag) -> const std::string & {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + flag);
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        if (arg == "-i" || arg == "--input") {
            opts.inputPath = requireValue(i, arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.outputPath = requireValue(i, arg);
        } else if (arg == "-c" || arg == "--config") {
            opts.configPath = requireValue(i, arg);
        } else if (arg == "--archive") {
            opts.archivePath = requireValue(i, arg);
        } else if (arg == "--skip") {
            const std::string &name = requireValue(i, arg);
            std::optional<scrubber::Category> category = scrubber::parseCategory(name);
            if (!category) {
                throw std::invalid_argument("unknown category '" + name + "'");
            }
            opts.skip.insert(*category);
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--stats-json") {
            opts.statsJson = true;
        } else if (arg == "--safe-harbor") {
            opts.safeHarbor = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.showHelp = true;
        } else {
            throw std::invalid_argument("unknown option '" + arg + "'");
        }
    }
    return opts;
}

} // namespace cli
} // namespace clinscrub

#endif // CLINSCRUB_CLI_CLI_OPTIONS_HPP
