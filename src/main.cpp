/**
 * Courier - Concurrent Download Coordinator
 *
 * Main entry point for the command-line front end.
 * Loads configuration, starts the coordinator and reads commands from stdin.
 *
 * @version 1.0.0
 * @license MIT
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include <spdlog/fmt/fmt.h>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadCoordinator.hpp"
#include "core/downloader/HttpTransferClient.hpp"
#include "ui/ConsoleSurface.hpp"
#include "utils/HttpClient.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using courier::core::Config;
using courier::core::Logger;
using courier::core::downloader::CoordinatorSettings;
using courier::core::downloader::DownloadCoordinator;
using courier::core::downloader::DownloadRequest;
using courier::core::downloader::HttpTransferClient;
using courier::ui::ConsoleSurface;
using courier::utils::StringUtils;

namespace {

constexpr const char* kDefaultConfigFile = "courier.json";

// Set by the signal handler, polled by the command loop
std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler for graceful shutdown. Closing stdin ends the blocking
 * read in the command loop.
 */
void signalHandler(int) {
    g_stopRequested = true;
    ::close(STDIN_FILENO);
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printHelp(const char* program) {
    std::cout << "Courier - concurrent download coordinator\n"
              << "\nUsage: " << program << " [options] [url...]\n"
              << "\nOptions:\n"
              << "  -c, --config <file>  Configuration file (default: " << kDefaultConfigFile << ")\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\nCommands (stdin):\n"
              << "  get <url> [name]     Download url, optionally saving it as name\n"
              << "  cancel <id>          Cancel a running or queued download\n"
              << "  active               List running downloads\n"
              << "  queue                List queued downloads\n"
              << "  stats                Show coordinator counters\n"
              << "  cleanup              Remove finished downloads from tracking\n"
              << "  quit                 Exit once running downloads finish\n"
              << std::endl;
}

/**
 * Load configuration file and environment overrides
 */
bool loadConfiguration(const std::string& explicitPath) {
    auto& logger = Logger::instance();
    auto& config = Config::instance();

    try {
        fs::path configPath = explicitPath.empty() ? fs::path(kDefaultConfigFile) : fs::path(explicitPath);

        if (fs::exists(configPath)) {
            if (!config.load(configPath.string())) {
                logger.error("Could not read configuration from {}", configPath.string());
                return false;
            }
            logger.info("Configuration loaded from {}", configPath.string());
        } else if (!explicitPath.empty()) {
            config.setDefaults();
            if (config.save(configPath.string())) {
                logger.info("Default configuration created at {}", configPath.string());
            }
        }

        config.loadEnvironment();
        return true;

    } catch (const std::exception& e) {
        logger.error("Failed to load configuration: {}", e.what());
        return false;
    }
}

DownloadRequest makeRequest(ConsoleSurface& surface, const std::string& url, const std::string& name) {
    DownloadRequest request;
    request.source.location = url;
    request.surface = surface.newRef();
    request.filename = name.empty() ? courier::utils::HttpClient::fileNameFromUrl(url) : name;
    return request;
}

void submitUrl(DownloadCoordinator& coordinator, ConsoleSurface& surface,
               const std::string& url, const std::string& name = "") {
    try {
        auto result = coordinator.submit(makeRequest(surface, url, name));
        surface.println(fmt::format("{} {}", result.isQueued() ? "queued" : "started", result.taskId));
    } catch (const std::exception& e) {
        Logger::instance().error("Cannot submit {}: {}", url, e.what());
    }
}

void printActive(DownloadCoordinator& coordinator, ConsoleSurface& surface) {
    auto active = coordinator.listActive();
    if (active.empty()) {
        surface.println("No active downloads");
        return;
    }

    for (const auto& [id, info] : active) {
        std::string progress = info.size > 0
            ? fmt::format("{} / {}", StringUtils::formatBytes(static_cast<double>(info.downloaded)),
                          StringUtils::formatBytes(static_cast<double>(info.size)))
            : StringUtils::formatBytes(static_cast<double>(info.downloaded));

        surface.println(fmt::format("{}  {:<11}  {}  {}/s  {}", id,
                                    courier::core::downloader::toString(info.status),
                                    progress, StringUtils::formatBytes(info.speed), info.filename));
    }
}

void printQueue(DownloadCoordinator& coordinator, ConsoleSurface& surface) {
    auto queued = coordinator.listQueued();
    if (queued.empty()) {
        surface.println("Queue is empty");
        return;
    }

    for (const auto& entry : queued) {
        surface.println(fmt::format("#{}  {}  {}  (since {})", entry.position, entry.taskId, entry.filename,
                                    StringUtils::formatDate(entry.enqueuedAt, "%H:%M:%S")));
    }
}

/**
 * Execute one stdin command
 * @return false when the user asked to quit
 */
bool handleCommand(const std::string& line, DownloadCoordinator& coordinator, ConsoleSurface& surface) {
    auto words = StringUtils::splitWords(StringUtils::trim(line), 3);
    if (words.empty()) {
        return true;
    }

    const std::string command = StringUtils::toLower(words[0]);

    if (command == "get" || command == "download") {
        if (words.size() < 2) {
            surface.println("Usage: get <url> [name]");
            return true;
        }
        submitUrl(coordinator, surface, words[1], words.size() > 2 ? words[2] : "");

    } else if (command == "cancel") {
        if (words.size() < 2) {
            surface.println("Usage: cancel <id>");
            return true;
        }
        auto result = coordinator.cancel(words[1]);
        if (result.success) {
            surface.println(fmt::format("Cancelled {} ({}{})", result.taskId, result.filename,
                                        result.wasQueued ? ", was queued" : ""));
        } else {
            surface.println(result.message);
        }

    } else if (command == "active") {
        printActive(coordinator, surface);

    } else if (command == "queue") {
        printQueue(coordinator, surface);

    } else if (command == "stats") {
        auto stats = coordinator.stats();
        surface.println(fmt::format("active {}/{}, queued {}, tracked {}",
                                    stats.active, stats.maxConcurrent, stats.queued, stats.tracked));

    } else if (command == "cleanup") {
        surface.println(fmt::format("Removed {} finished downloads", coordinator.pruneCompleted()));

    } else if (command == "quit" || command == "exit") {
        return false;

    } else {
        surface.println(fmt::format("Unknown command: {}", words[0]));
    }

    return true;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    bool debugMode = false;
    std::string configPath;
    std::vector<std::string> urls;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return 2;
            }
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "Courier v1.0.0\n"
                      << "Built with spdlog, nlohmann/json and cpr\n"
                      << std::endl;
            return 0;
        } else if (StringUtils::startsWith(arg, "-")) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 2;
        } else {
            urls.push_back(arg);
        }
    }

    if (!loadConfiguration(configPath)) {
        return 1;
    }

    auto& config = Config::instance();

    courier::core::LoggingOptions logging;
    logging.level = debugMode ? courier::core::LogLevel::Debug
                              : courier::core::parseLogLevel(config.get<std::string>("logging.level", "info"));
    logging.directory = config.get<std::string>("logging.directory", "logs");
    Logger::instance().initialize(logging);

    auto& logger = Logger::instance();
    logger.info("Courier v1.0.0 starting...");

    setupSignalHandlers();

    try {
        courier::utils::HttpOptions httpOptions;
        httpOptions.timeoutSeconds = config.get<int>("downloads.timeoutSeconds", 0);
        courier::utils::HttpClient::instance().setDefaultOptions(httpOptions);

        HttpTransferClient client(httpOptions);
        ConsoleSurface surface(std::cout);
        DownloadCoordinator coordinator(CoordinatorSettings::fromConfig(config), client, surface);

        coordinator.setCompletionCallback([&logger](const std::string& id, const std::string& path,
                                                    std::uint64_t size) {
            logger.info("Catalogued {}: {} ({} bytes)", id, path, size);
        });

        for (const auto& url : urls) {
            submitUrl(coordinator, surface, url);
        }

        std::string line;
        while (!g_stopRequested && std::getline(std::cin, line)) {
            if (!handleCommand(line, coordinator, surface)) {
                break;
            }
        }

        if (!g_stopRequested) {
            logger.info("Waiting for running downloads to finish");
            while (!g_stopRequested && !coordinator.waitUntilIdle(std::chrono::milliseconds(500))) {
            }
        }

        coordinator.shutdown();
        logger.info("Courier shutdown complete");
        logger.flush();
        return 0;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
