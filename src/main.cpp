#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Core models
#include "core/LogEntry.hpp"
#include "core/LogSession.hpp"
#include "core/ParseError.hpp"

// Input
#include "input/FileParser.hpp"
#include "input/LogDirectory.hpp"

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

// Analysis
#include "analysis/AgentAnalyzer.hpp"
#include "analysis/CompositeAnalyzer.hpp"
#include "analysis/EntryQuery.hpp"
#include "analysis/PatternAnalyzer.hpp"
#include "analysis/TimingAnalyzer.hpp"

// Reporting
#include "report/ConsoleReporter.hpp"
#include "report/SummaryAnalyzer.hpp"

namespace Core     = AgentLog::Core;
namespace Input    = AgentLog::Input;
namespace Analysis = AgentLog::Analysis;
namespace Report   = AgentLog::Report;
namespace Utils    = AgentLog::Utils;

// -------------------------
// CLI
// -------------------------
namespace
{
    constexpr const char *kDefaultLogsDir    = ".claude/runtime/logs";
    constexpr std::size_t kParsePreviewCount = 10;
    constexpr std::size_t kQueryResultLimit  = 20;
    constexpr std::size_t kDefaultIterations = 10;

    struct CliOptions
    {
        std::string command;
        std::string inputFile;
        std::string configFile;
        std::optional<std::string> logsDir;
        std::optional<double> sinceDays;
        std::optional<std::string> agent;
        std::optional<std::string> contains;
        std::size_t iterations = kDefaultIterations;
        bool verbose = false;
        bool help = false;
    };

    /// Value following a flag; throws std::invalid_argument when missing.
    std::string takeValue(int argc, char *argv[], int &i, const std::string &flag)
    {
        if (i + 1 >= argc)
            throw std::invalid_argument("missing value for " + flag);
        return argv[++i];
    }

    CliOptions parseArgs(int argc, char *argv[])
    {
        CliOptions opts;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                opts.help = true;
            }
            else if (arg == "--config" || arg == "-c")
            {
                opts.configFile = takeValue(argc, argv, i, arg);
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                opts.verbose = true;
            }
            else if (arg == "--logs-dir")
            {
                opts.logsDir = takeValue(argc, argv, i, arg);
            }
            else if (arg == "--since")
            {
                const auto value = takeValue(argc, argv, i, arg);
                std::size_t used = 0;
                const double days = std::stod(value, &used);
                if (used != value.size() || !std::isfinite(days) || days < 0.0)
                    throw std::invalid_argument("invalid --since value: " + value);
                opts.sinceDays = days;
            }
            else if (arg == "--agent")
            {
                opts.agent = takeValue(argc, argv, i, arg);
            }
            else if (arg == "--contains")
            {
                opts.contains = takeValue(argc, argv, i, arg);
            }
            else if (arg == "--iterations")
            {
                const auto value = takeValue(argc, argv, i, arg);
                std::size_t used = 0;
                const unsigned long n = std::stoul(value, &used);
                if (used != value.size() || n == 0 || value[0] == '-')
                    throw std::invalid_argument("invalid --iterations value: " + value);
                opts.iterations = static_cast<std::size_t>(n);
            }
            else if (!arg.empty() && arg[0] == '-')
            {
                throw std::invalid_argument("unknown option: " + arg);
            }
            else if (opts.command.empty())
            {
                opts.command = arg;
            }
            else if (opts.inputFile.empty())
            {
                opts.inputFile = arg;
            }
            else
            {
                throw std::invalid_argument("unexpected argument: " + arg);
            }
        }

        return opts;
    }

    void printUsage(const char *progName)
    {
        std::cout
            << "Usage: " << progName << " [OPTIONS] <command> [ARGS]\n\n"
            << "COMMANDS:\n"
            << "  parse <file>                          Parse one log file and preview its entries\n"
            << "  analyze [--logs-dir DIR] [--since DAYS]\n"
            << "                                        Timing, agent and pattern analysis over all logs\n"
            << "  query [--logs-dir DIR] [--agent NAME] [--contains TEXT]\n"
            << "                                        Print matching entries\n"
            << "  bench [--logs-dir DIR] [--iterations N]\n"
            << "                                        Time parsing and analysis\n\n"
            << "OPTIONS:\n"
            << "  -c, --config FILE        Config file (key = value)\n"
            << "  -v, --verbose            Verbose logging\n"
            << "  -h, --help               Show this help\n\n"
            << "Default logs directory: " << kDefaultLogsDir << "\n";
    }

    /// Apply log_level / log_file settings to the diagnostic logger.
    void configureLogger(Utils::Logger &logger, const Utils::ConfigLoader &config, bool verbose)
    {
        if (const auto levelName = config.getString("log_level"))
        {
            if (const auto level = Utils::parseLogLevel(*levelName))
                logger.setLevel(*level);
            else
                logger.warn("Unknown log_level in config: " + *levelName);
        }

        if (verbose)
            logger.setLevel(Utils::LogLevel::DEBUG);

        if (const auto logFile = config.getString("log_file"))
        {
            if (!logger.openFile(*logFile))
                logger.warn("Could not open log file: " + *logFile);
        }
    }

    std::filesystem::path resolveLogsDir(const CliOptions &opts, const Utils::ConfigLoader &config)
    {
        if (opts.logsDir)
            return *opts.logsDir;
        return config.getStringOr("logs_dir", kDefaultLogsDir);
    }

    std::vector<Core::LogEntry> loadAllEntries(const std::filesystem::path &logsDir,
                                               Input::FileParser &parser,
                                               Utils::Logger &logger)
    {
        const auto files = Input::findLogFiles(logsDir);
        logger.debug("Found " + std::to_string(files.size()) + " log file(s) in " + logsDir.string());
        return Input::parseLogFiles(files, parser, logger);
    }

    Analysis::CompositeAnalyzer<std::string> buildAnalyzers(const Analysis::PatternThresholds &thresholds)
    {
        Analysis::CompositeAnalyzer<std::string> composite;
        composite.emplace<Report::SummaryAnalyzer<Analysis::TimingAnalyzer>>();
        composite.emplace<Report::SummaryAnalyzer<Analysis::AgentAnalyzer>>();
        composite.emplace<Report::SummaryAnalyzer<Analysis::PatternAnalyzer>>(
            Analysis::PatternAnalyzer(thresholds));
        return composite;
    }

    // -------------------------
    // Commands
    // -------------------------
    int runParse(const CliOptions &opts, Utils::Logger &logger)
    {
        if (opts.inputFile.empty())
        {
            logger.error("parse: input file required");
            return 1;
        }

        Input::FileParser parser(logger);
        const auto entries = parser.parseFile(opts.inputFile);
        const auto &summary = parser.lastSummary();

        logger.info("Parsed " + std::to_string(entries.size()) + " entries from " + opts.inputFile);
        if (summary.skippedLines > 0)
            logger.warn("Skipped " + std::to_string(summary.skippedLines) + " malformed line(s)");

        Report::ConsoleReporter reporter;
        std::cout << "Parsed " << entries.size() << " entries from " << opts.inputFile << "\n\n";
        reporter.printEntries(entries, kParsePreviewCount);

        std::cout << "\nEntry types:\n";
        reporter.printTypeCounts(Analysis::countEntryTypes(entries));
        reporter.flush();
        return 0;
    }

    int runAnalyze(const CliOptions &opts, const Utils::ConfigLoader &config, Utils::Logger &logger)
    {
        const auto logsDir = resolveLogsDir(opts, config);
        Input::FileParser parser(logger);
        auto entries = loadAllEntries(logsDir, parser, logger);

        if (opts.sinceDays)
        {
            // A window reaching past the clock's range sets no lower bound.
            if (const auto since = Utils::subtractSeconds(Utils::now(), *opts.sinceDays * 86400.0))
            {
                Analysis::EntryFilter filter;
                filter.since = *since;
                entries = Analysis::filterEntries(entries, filter);
                logger.debug(std::to_string(entries.size()) + " entries within the last "
                             + std::to_string(*opts.sinceDays) + " day(s)");
            }
            else
            {
                logger.debug("--since window exceeds the clock range, keeping all entries");
            }
        }

        if (entries.empty())
        {
            std::cout << "No log entries found in " << logsDir.string() << "\n";
            return 0;
        }

        const auto session = Core::makeSession("aggregate", std::move(entries));
        const auto composite = buildAnalyzers(Analysis::PatternThresholds::fromConfig(config));

        Report::ConsoleReporter reporter;
        std::cout << "Analyzed " << session.size() << " entries from " << logsDir.string() << "\n";

        for (const auto &run : composite.runAll(session))
        {
            reporter.printRule();
            if (run.ok())
            {
                std::cout << *run.result;
            }
            else
            {
                logger.error(run.name + " failed: " + run.error->what());
                std::cout << run.name << ": failed\n";
            }
        }
        reporter.printRule();
        reporter.flush();
        return 0;
    }

    int runQuery(const CliOptions &opts, const Utils::ConfigLoader &config, Utils::Logger &logger)
    {
        Input::FileParser parser(logger);
        const auto entries = loadAllEntries(resolveLogsDir(opts, config), parser, logger);

        Analysis::EntryFilter filter;
        filter.agent    = opts.agent;
        filter.contains = opts.contains;

        const auto matches = Analysis::filterEntries(entries, filter);

        Report::ConsoleReporter reporter;
        std::cout << "Found " << matches.size() << " matching entries\n\n";
        reporter.printEntries(matches, kQueryResultLimit);
        reporter.flush();
        return 0;
    }

    void printTimes(const std::string &label, const Utils::DurationStats &times)
    {
        std::cout << "  " << label << " " << times.average().count() << " ms avg, "
                  << times.min().count() << " ms min, "
                  << times.max().count() << " ms max\n";
    }

    int runBench(const CliOptions &opts, const Utils::ConfigLoader &config, Utils::Logger &logger)
    {
        const auto files = Input::findLogFiles(resolveLogsDir(opts, config));
        if (files.empty())
        {
            std::cout << "No log files to benchmark\n";
            return 0;
        }

        const auto composite = buildAnalyzers(Analysis::PatternThresholds::fromConfig(config));

        // Per-line warnings would drown the timing output.
        Utils::Logger quiet(std::cerr, Utils::LogLevel::ERROR);
        Input::FileParser parser(quiet);

        Utils::DurationStats parseTimes;
        Utils::DurationStats analyzeTimes;
        std::size_t entryCount = 0;

        for (std::size_t i = 0; i < opts.iterations; ++i)
        {
            std::vector<Core::LogEntry> entries;
            Utils::ScopedTimer::Duration parseTime{0};
            {
                Utils::ScopedTimer timer(parseTime);
                entries = Input::parseLogFiles(files, parser, quiet);
            }
            parseTimes.add(parseTime);
            entryCount = entries.size();

            const auto session = Core::makeSession("bench", std::move(entries));
            Utils::ScopedTimer::Duration analyzeTime{0};
            {
                Utils::ScopedTimer timer(analyzeTime);
                const auto runs = composite.runAll(session);
                logger.trace("Ran " + std::to_string(runs.size()) + " analyzers");
            }
            analyzeTimes.add(analyzeTime);
        }

        std::cout << "Benchmark over " << files.size() << " file(s), " << entryCount << " entries, "
                  << opts.iterations << " iteration(s)\n";
        printTimes("Parse:  ", parseTimes);
        printTimes("Analyze:", analyzeTimes);
        return 0;
    }
} // namespace

int main(int argc, char *argv[])
{
    auto &logger = Utils::getLogger();

    CliOptions opts;
    try
    {
        opts = parseArgs(argc, argv);
    }
    catch (const std::logic_error &e)
    {
        // std::invalid_argument / std::out_of_range from flag parsing.
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    if (opts.help)
    {
        printUsage(argv[0]);
        return 0;
    }

    if (opts.command.empty())
    {
        std::cerr << "Error: command required.\n\n";
        printUsage(argv[0]);
        return 1;
    }

    Utils::ConfigLoader config;
    if (!opts.configFile.empty() && !config.loadFromFile(opts.configFile))
    {
        logger.error("Could not read config file: " + opts.configFile);
        return 1;
    }
    configureLogger(logger, config, opts.verbose);

    logger.debug("Command: " + opts.command);

    try
    {
        if (opts.command == "parse")
            return runParse(opts, logger);
        if (opts.command == "analyze")
            return runAnalyze(opts, config, logger);
        if (opts.command == "query")
            return runQuery(opts, config, logger);
        if (opts.command == "bench")
            return runBench(opts, config, logger);
    }
    catch (const Core::ParseError &e)
    {
        logger.error(e.what());
        return 1;
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        logger.error(e.what());
        return 1;
    }

    std::cerr << "Error: unknown command '" << opts.command << "'\n\n";
    printUsage(argv[0]);
    return 1;
}
