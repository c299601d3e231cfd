#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/LogRecord.hpp"
#include "core/Report.hpp"

#include "input/RecordReader.hpp"

#include "history/JsonFileHistoryStore.hpp"

#include "pipeline/EngineSettings.hpp"
#include "pipeline/RunCoordinator.hpp"

#include "report/ConsoleReporter.hpp"
#include "report/JsonReporter.hpp"

#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace
{
    constexpr int kExitOk          = 0;
    constexpr int kExitUsage       = 1;
    constexpr int kExitHistorySave = 2;

    // -------------------------
    // CLI
    // -------------------------
    struct CliOptions
    {
        std::vector<std::string> inputFiles;
        std::string configFile;
        std::optional<std::string> historyPath;
        std::optional<std::string> retentionDays;
        std::vector<std::string> ignorePatterns;
        std::optional<std::string> today;
        std::optional<std::string> source;
        std::optional<std::string> jsonFile;
        bool dryRun = false;
        bool verbose = false;
        bool help = false;
        std::string error;
    };

    CliOptions parseArgs(int argc, char *argv[])
    {
        CliOptions opts;

        auto takeValue = [&](int &i, const std::string &name) -> std::optional<std::string> {
            if (i + 1 >= argc)
            {
                opts.error = "option " + name + " needs a value";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        for (int i = 1; i < argc && opts.error.empty(); ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                opts.help = true;
            }
            else if (arg == "--config" || arg == "-c")
            {
                if (auto v = takeValue(i, arg))
                    opts.configFile = *v;
            }
            else if (arg == "--history")
            {
                opts.historyPath = takeValue(i, arg);
            }
            else if (arg == "--retention-days")
            {
                opts.retentionDays = takeValue(i, arg);
            }
            else if (arg == "--ignore")
            {
                if (auto v = takeValue(i, arg))
                    opts.ignorePatterns.push_back(*v);
            }
            else if (arg == "--today")
            {
                opts.today = takeValue(i, arg);
            }
            else if (arg == "--source")
            {
                opts.source = takeValue(i, arg);
            }
            else if (arg == "--json")
            {
                opts.jsonFile = takeValue(i, arg);
            }
            else if (arg == "--dry-run")
            {
                opts.dryRun = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                opts.verbose = true;
            }
            else if (!arg.empty() && arg[0] == '-' && arg != "-")
            {
                opts.error = "unknown option " + arg;
            }
            else
            {
                opts.inputFiles.push_back(arg);
            }
        }

        return opts;
    }

    void printUsage(const char *progName)
    {
        std::cout
            << "Usage: " << progName << " [OPTIONS] FILE...\n\n"
            << "Groups error lines into signatures, separates known noise and\n"
            << "tracks which signatures are new since earlier runs.\n\n"
            << "OPTIONS:\n"
            << "  -c, --config FILE        key=value config file\n"
            << "  --history FILE           History file (default: data/error-history.json)\n"
            << "  --retention-days N       Forget signatures unseen for N days (default: 30)\n"
            << "  --ignore PATTERN         Extra noise regex, repeatable\n"
            << "  --today YYYY-MM-DD       Run date (default: today at the configured UTC offset)\n"
            << "  --source NAME            Source for records that carry none (default: file name)\n"
            << "  --json FILE              Also write the report as JSON\n"
            << "  --dry-run                Do not update the history file\n"
            << "  -v, --verbose            Debug logging\n"
            << "  -h, --help               This text\n\n"
            << "Exit status: 0 ok, 1 usage/config/input error, 2 history could not be saved.\n";
    }

    // Command-line values win over the config file.
    void applyOverrides(const CliOptions &opts, ErrorWatch::Pipeline::EngineSettings &settings)
    {
        if (opts.historyPath)
            settings.historyPath = *opts.historyPath;

        if (opts.retentionDays)
        {
            std::size_t idx = 0;
            int days = 0;
            try
            {
                days = std::stoi(*opts.retentionDays, &idx);
            }
            catch (const std::logic_error &)
            {
                idx = 0;
            }
            if (idx == 0 || idx != opts.retentionDays->size())
                throw std::invalid_argument("--retention-days needs an integer, got '" + *opts.retentionDays + "'");
            settings.retentionDays = days;
        }

        for (const auto &p : opts.ignorePatterns)
            settings.customNoisePatterns.push_back({p, false});

        if (opts.dryRun)
            settings.persistHistory = false;

        if (opts.verbose)
            settings.logLevel = "DEBUG";

        settings.validate();
    }
}

int main(int argc, char *argv[])
{
    using namespace ErrorWatch;

    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (!opts.error.empty())
    {
        std::cerr << "Error: " << opts.error << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (opts.inputFiles.empty())
    {
        std::cerr << "Error: at least one input file required.\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    auto &logger = Utils::getLogger();

    try
    {
        // Configuration
        Utils::ConfigLoader config;
        if (!opts.configFile.empty() && !config.loadFromFile(opts.configFile))
        {
            logger.error("Cannot read config file: " + opts.configFile);
            return kExitUsage;
        }

        Pipeline::EngineSettings settings = Pipeline::EngineSettings::fromConfig(config);
        applyOverrides(opts, settings);

        // Logger
        if (auto level = Utils::parseLogLevel(settings.logLevel))
            logger.setLevel(*level);
        if (!settings.logFile.empty() && !logger.openFile(settings.logFile))
            logger.warn("Cannot open log file " + settings.logFile + ", logging to console only");

        logger.info("Starting ErrorWatch");
        const auto started = Utils::now();
        if (!opts.configFile.empty())
            logger.info("Config: " + opts.configFile + " (" + std::to_string(config.size()) + " keys)");

        // Run date
        Utils::CivilDate today = Utils::today(settings.timezoneOffsetHours);
        if (opts.today)
        {
            auto parsed = Utils::CivilDate::parse(*opts.today);
            if (!parsed)
            {
                logger.error("--today expects YYYY-MM-DD, got '" + *opts.today + "'");
                return kExitUsage;
            }
            today = *parsed;
        }

        // Input
        Input::RecordReader reader(Input::ErrorFilter(settings.errorPatterns), opts.source);
        std::vector<core::LogRecord> records;
        for (const auto &file : opts.inputFiles)
        {
            std::string err;
            if (!reader.readFile(file, records, &err))
            {
                logger.error(err);
                return kExitUsage;
            }
        }

        const auto &stats = reader.stats();
        logger.info("Input: " + std::to_string(stats.files) + " files, " +
                    std::to_string(stats.linesRead) + " lines, " +
                    std::to_string(stats.records) + " records kept, " +
                    std::to_string(stats.filteredOut) + " filtered, " +
                    std::to_string(stats.malformed) + " malformed");

        // Engine
        History::JsonFileHistoryStore store(settings.historyPath);
        Pipeline::RunCoordinator coordinator(settings, store);
        const Pipeline::RunOutcome outcome = coordinator.run(records, today);

        // Reports
        Report::ConsoleReporter console;
        console.generateReport(outcome.report);

        int exitCode = kExitOk;

        if (opts.jsonFile)
        {
            Report::JsonReporter json(Report::JsonReporter::PrettyPrint::PRETTY);
            json.generateReport(outcome.report);

            std::string err;
            if (json.writeFile(*opts.jsonFile, &err))
            {
                logger.info("JSON report written to " + *opts.jsonFile);
            }
            else
            {
                logger.error(err);
                exitCode = kExitUsage;
            }
        }

        if (!outcome.historyError.empty())
        {
            logger.error("History not saved: " + outcome.historyError);
            exitCode = kExitHistorySave;
        }

        logger.info("Done in " + std::to_string(Utils::diffMillis(started, Utils::now())) + " ms");
        return exitCode;
    }
    catch (const std::invalid_argument &ex)
    {
        // Bad settings or patterns (core::PatternError derives from this).
        logger.error(std::string("Configuration error: ") + ex.what());
        return kExitUsage;
    }
    catch (const std::exception &ex)
    {
        logger.critical(std::string("Fatal: ") + ex.what());
        return kExitUsage;
    }
}
