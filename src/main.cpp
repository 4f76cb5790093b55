#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "archive/redaction_archive.hpp"
#include "cli/cli_options.hpp"
#include "io/note_io.hpp"
#include "report/stats_report.hpp"
#include "scrubber/scrubber.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

int run(const clinscrub::cli::CliOptions &opts)
{
    using clinscrub::util::logger::Logger;

    // 1. Configuration
    clinscrub::config::ScrubberConfig scrubberConfig;
    if (!opts.configPath.empty()) {
        clinscrub::util::ConfigParser configParser(scrubberConfig);
        configParser.loadFromFile(opts.configPath);
    }

    if (opts.safeHarbor) {
        Logger::getInstance().warn(
            "[main] --safe-harbor requested; no Safe Harbor detectors beyond the default set "
            "are available yet.");
    }

    // 2. Build the engine (throws on invalid configuration)
    clinscrub::scrubber::Scrubber engine(scrubberConfig);

    // 3. Scrub
    const std::string input = clinscrub::io::readNote(opts.inputPath);
    clinscrub::scrubber::ScrubResult result = engine.scrub(input, opts.skip);
    clinscrub::io::writeNote(opts.outputPath, result.text);

    // 4. Optional archive
    if (!opts.archivePath.empty()) {
        clinscrub::archive::RedactionArchive archive(opts.archivePath);
        if (!archive.Store(input, result.text, result.stats)) {
            Logger::getInstance().error("[main] Failed to archive note in " + opts.archivePath);
            return 1;
        }
    }

    // 5. Report
    if (!opts.quiet) {
        if (opts.statsJson) {
            std::cerr << clinscrub::report::formatJson(result.stats) << std::endl;
        } else {
            std::cerr << clinscrub::report::formatSummary(result.stats);
        }
    }
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    using clinscrub::util::logger::Logger;
    using clinscrub::util::logger::LogLevel;

    const std::string program = argc > 0 ? argv[0] : "clinscrub";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    clinscrub::cli::CliOptions opts;
    try {
        opts = clinscrub::cli::parseArguments(args);
    } catch (const std::invalid_argument &ex) {
        std::cerr << program << ": " << ex.what() << "\n\n" << clinscrub::cli::usage(program);
        return 2;
    }

    if (opts.showHelp) {
        std::cout << clinscrub::cli::usage(program);
        return 0;
    }

    Logger::getInstance().setLogLevel(opts.verbose ? LogLevel::DEBUG
                                      : opts.quiet ? LogLevel::WARN
                                                   : LogLevel::INFO);

    try {
        return run(opts);
    } catch (const std::exception &ex) {
        Logger::getInstance().error(std::string("[main] ") + ex.what());
        return 1;
    }
}
