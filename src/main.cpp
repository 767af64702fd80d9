#include "core/backend/ffmpeg_media_backend.hpp"
#include "core/cache_manager.hpp"
#include "core/conversion_coordinator.hpp"
#include "core/converters/converter_factory.hpp"
#include "core/file_utils.hpp"
#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/resource_pool.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace
{
    // Prints stage transitions and whole-percent progress steps
    class ConsoleProgressObserver : public ProgressObserver
    {
    public:
        void onProgress(const ProgressUpdate &update) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            int percent = static_cast<int>(update.progress * 100.0);
            auto &last = last_seen_[update.task_id];
            if (last.first == update.stage && last.second == percent)
            {
                return;
            }
            last = {update.stage, percent};

            std::cout << "[" << update.task_id << "] " << std::setw(10) << std::left << stageName(update.stage)
                      << std::right << std::setw(4) << percent << "%";
            if (!update.message.empty())
            {
                std::cout << "  " << update.message;
            }
            std::cout << std::endl;

            if (isTerminalStage(update.stage))
            {
                last_seen_.erase(update.task_id);
            }
        }

    private:
        std::mutex mutex_;
        std::map<std::string, std::pair<Stage, int>> last_seen_;
    };

    void printUsage(const char *program)
    {
        std::cout << "Media Converter - convert images, audio, video and documents" << std::endl;
        std::cout << "Usage: " << program << " [options] <target-format> <file>..." << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>      Load configuration from a JSON file (default: config.json if present)"
                  << std::endl;
        std::cout << "  --output, -o <dir>       Copy converted outputs into <dir>" << std::endl;
        std::cout << "  --log-level, -l <level>  TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --quiet, -q              Do not print progress" << std::endl;
        std::cout << "  --help, -h               Show this help message" << std::endl;
        std::cout << "Example: " << program << " -o out mp4 clip.mov song.mp3" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    // Initialize coordinated signal handling FIRST
    ShutdownManager::getInstance().installSignalHandlers();

    std::string config_path;
    std::string output_dir;
    std::string log_level;
    bool quiet = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--output" || arg == "-o") && i + 1 < argc)
        {
            output_dir = argv[++i];
        }
        else if ((arg == "--log-level" || arg == "-l") && i + 1 < argc)
        {
            log_level = argv[++i];
        }
        else if (arg == "--quiet" || arg == "-q")
        {
            quiet = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown or incomplete option " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2)
    {
        printUsage(argv[0]);
        return 2;
    }

    auto target = FormatDescriptor::fromExtension(positional.front());
    if (!target)
    {
        std::cerr << "Error: unknown target format '" << positional.front() << "'" << std::endl;
        return 2;
    }
    std::vector<std::string> inputs(positional.begin() + 1, positional.end());

    // Initialize configuration manager
    auto &config_manager = PocoConfigAdapter::getInstance();
    Logger::init(config_manager.getLogLevel());

    // Register log level observer before loading so file values apply
    auto logger_observer = std::make_unique<LoggerObserver>();
    config_manager.subscribe(logger_observer.get());

    if (config_path.empty() && fs::exists("config.json"))
    {
        config_path = "config.json";
    }
    if (!config_path.empty() && !config_manager.loadConfig(config_path))
    {
        std::cerr << "Error: failed to load configuration from " << config_path << std::endl;
        config_manager.unsubscribe(logger_observer.get());
        return 2;
    }
    if (!log_level.empty())
    {
        config_manager.setLogLevel(log_level);
    }

    if (!output_dir.empty())
    {
        std::error_code ec;
        fs::create_directories(output_dir, ec);
        if (ec)
        {
            std::cerr << "Error: cannot create output directory " << output_dir << ": " << ec.message()
                      << std::endl;
            config_manager.unsubscribe(logger_observer.get());
            return 2;
        }
    }

    int exit_code = 0;
    try
    {
        auto pool = std::make_shared<ResourcePool>();
        auto cache = std::make_shared<CacheManager>(pool, CacheOptions::fromConfig(config_manager));
        auto backend = std::make_shared<FFmpegMediaBackend>(BackendOptions::fromConfig(config_manager));
        auto factory = std::make_shared<ConverterFactory>(
            ConverterContext{backend, cache, pool, ConversionSettings::fromConfig(config_manager)});
        ConversionCoordinator coordinator(factory, pool, cache, CoordinatorOptions::fromConfig(config_manager));

        ConsoleProgressObserver console;
        if (!quiet)
        {
            coordinator.subscribe(&console);
        }

        auto root_token = CancellationToken::create();
        ShutdownManager::getInstance().watch(root_token);

        Logger::info("Converting " + std::to_string(inputs.size()) + " file(s) to " + target->toString());
        auto outcomes = coordinator.convertBatch(inputs, *target, root_token);

        size_t succeeded = 0;
        for (const auto &outcome : outcomes)
        {
            if (!outcome.succeeded())
            {
                std::cout << "FAILED  " << outcome.input_path << ": "
                          << (outcome.error ? outcome.error->what() : "unknown error") << std::endl;
                continue;
            }

            const auto &result = *outcome.result;
            std::string location = result.output_path;
            if (!output_dir.empty())
            {
                auto copied = FileUtils::copyInto(result.output_path, output_dir, result.suggested_filename);
                if (!copied)
                {
                    std::cout << "FAILED  " << outcome.input_path << ": could not copy output to " << output_dir
                              << std::endl;
                    continue;
                }
                location = *copied;
            }
            ++succeeded;
            std::cout << "OK      " << outcome.input_path << " -> " << location << std::endl;
        }

        if (!quiet)
        {
            coordinator.unsubscribe(&console);
        }
        coordinator.shutdown();

        std::cout << succeeded << "/" << outcomes.size() << " conversion(s) succeeded" << std::endl;
        if (ShutdownManager::getInstance().isShutdownRequested())
        {
            exit_code = 130;
        }
        else if (succeeded != outcomes.size())
        {
            exit_code = 1;
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error: " + std::string(e.what()));
        exit_code = 1;
    }

    config_manager.unsubscribe(logger_observer.get());
    return exit_code;
}
