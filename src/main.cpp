#include "core/analysis_config.hpp"
#include "core/batch_analyzer.hpp"
#include "core/file_utils.hpp"
#include "core/image_analyzer.hpp"
#include "core/image_loader.hpp"
#include "core/poco_config_manager.hpp"
#include "core/report_writer.hpp"
#include "logging/logger.hpp"
#include <csignal>
#include <cstdint>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

// Batch currently running, for the interrupt handler
static BatchAnalyzer *g_batch = nullptr;

static void signalHandler(int)
{
    if (g_batch)
    {
        g_batch->cancel();
    }
}

static void printUsage(const char *program)
{
    std::cout << "BioProof - image authenticity screening" << std::endl;
    std::cout << "Usage: " << program << " <folder> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --out FILE             Output JSON report (default: bioproof_report.json)" << std::endl;
    std::cout << "  --config FILE          Configuration file (default: " << PocoConfigManager::DEFAULT_CONFIG_FILE << ")" << std::endl;
    std::cout << "  --recursive, -r        Scan subfolders" << std::endl;
    std::cout << "  --declared A,B,...     File names declared as digitally generated" << std::endl;
    std::cout << "  --stamp FILE           Visible watermark stamp template" << std::endl;
    std::cout << "  --seed N               Seed for clone sampling (reproducible runs)" << std::endl;
    std::cout << "  --threads N            Maximum images analyzed in parallel" << std::endl;
    std::cout << "  --log-level LEVEL      TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
    std::cout << "  --help, -h             Show this help message" << std::endl;
}

static bool parseNonNegative(const std::string &text, long long &value)
{
    try
    {
        size_t pos = 0;
        value = std::stoll(text, &pos);
        return pos == text.size() && value >= 0;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

int main(int argc, char *argv[])
{
    std::string folder;
    std::string out_path = "bioproof_report.json";
    std::string config_path = PocoConfigManager::DEFAULT_CONFIG_FILE;
    bool config_path_given = false;
    bool recursive = false;
    std::set<std::string> declared;
    std::string stamp_path;
    std::string log_level;
    long long seed = -1;
    long long threads = -1;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto next = [&](std::string &value) -> bool
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--recursive" || arg == "-r")
        {
            recursive = true;
        }
        else if (arg == "--out")
        {
            if (!next(out_path))
                return 2;
        }
        else if (arg == "--config")
        {
            if (!next(config_path))
                return 2;
            config_path_given = true;
        }
        else if (arg == "--declared")
        {
            if (!next(value))
                return 2;
            std::stringstream ss(value);
            std::string name;
            while (std::getline(ss, name, ','))
            {
                if (!name.empty())
                    declared.insert(name);
            }
        }
        else if (arg == "--stamp")
        {
            if (!next(stamp_path))
                return 2;
        }
        else if (arg == "--seed")
        {
            if (!next(value) || !parseNonNegative(value, seed) || seed > UINT32_MAX)
            {
                std::cerr << "Error: --seed expects an unsigned 32-bit integer" << std::endl;
                return 2;
            }
        }
        else if (arg == "--threads")
        {
            if (!next(value) || !parseNonNegative(value, threads) || threads == 0 ||
                threads > AnalysisConfig::MAX_ANALYSIS_THREADS)
            {
                std::cerr << "Error: --threads expects an integer from 1 to " << AnalysisConfig::MAX_ANALYSIS_THREADS
                          << std::endl;
                return 2;
            }
        }
        else if (arg == "--log-level")
        {
            if (!next(log_level))
                return 2;
            if (!Logger::isValidLevel(log_level))
            {
                std::cerr << "Error: unknown log level " << log_level << std::endl;
                return 2;
            }
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
        else if (folder.empty())
        {
            folder = arg;
        }
        else
        {
            std::cerr << "Error: more than one folder given" << std::endl;
            return 2;
        }
    }

    if (folder.empty())
    {
        printUsage(argv[0]);
        return 2;
    }

    // Initialize configuration manager
    auto &config_manager = PocoConfigManager::getInstance();
    if (!config_manager.load(config_path))
    {
        if (config_path_given)
        {
            std::cerr << "Error: cannot load configuration file " << config_path << std::endl;
            return 1;
        }
        Logger::debug("No configuration file " + config_path + ", using defaults");
    }

    // Command line overrides the configuration file
    if (!log_level.empty())
        config_manager.update({{"logging", {{"level", log_level}}}});
    if (seed >= 0)
        config_manager.update({{"clone", {{"seed", static_cast<unsigned long long>(seed)}}}});
    if (threads > 0)
        config_manager.update({{"threading", {{"max_analysis_threads", static_cast<int>(threads)}}}});
    if (!stamp_path.empty())
        config_manager.update({{"watermark", {{"stamp_path", stamp_path}}}});

    // Initialize logger with configured log level
    Logger::init(config_manager.getLogLevel());

    if (!config_manager.validateConfig())
    {
        std::cerr << "Error: invalid configuration, see log for details" << std::endl;
        return 1;
    }

    try
    {
        const AnalysisConfig config = config_manager.toAnalysisConfig();
        ImageAnalyzer analyzer(config, ImageLoader::loadStamp(config.watermark.stamp_path));
        ImageLoader loader(config.watermark.metadata_scan_bytes);
        BatchAnalyzer batch(analyzer, loader, static_cast<size_t>(config.max_analysis_threads));

        if (!FileUtils::isValidDirectory(folder))
        {
            std::cerr << "Error: not a folder: " << folder << std::endl;
            return 1;
        }

        g_batch = &batch;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto reports = batch.analyzeFolder(folder, recursive, declared);
        g_batch = nullptr;

        ReportWriter::writeReport(out_path, reports);
        std::cout << "Wrote " << out_path << " with " << reports.size() << " items" << std::endl;
    }
    catch (const ConfigurationError &e)
    {
        Logger::error(e.what());
        return 1;
    }
    catch (const std::runtime_error &e)
    {
        g_batch = nullptr;
        Logger::error(e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        g_batch = nullptr;
        Logger::error(std::string("Unexpected error: ") + e.what());
        return 1;
    }

    return 0;
}
