#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logging for the coordinator and the command-line front end,
 * built on spdlog. Console output goes to stderr so it never mixes with the
 * status text the console surface prints on stdout.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace courier::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Parse a level name ("debug", "info", ...). Unknown names map to Info.
 */
inline LogLevel parseLogLevel(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

/**
 * Where and how much to log
 */
struct LoggingOptions {
    LogLevel level{LogLevel::Info};
    std::string directory;                    // empty = console only
    std::string fileName{"courier.log"};
    std::size_t maxFileSize{10 * 1024 * 1024};
    std::size_t maxFiles{5};
};

/**
 * Logger - thread-safe singleton over a named spdlog logger
 *
 * Until initialize() runs, messages go to spdlog's default console logger.
 * A failing file sink downgrades to console-only logging instead of
 * throwing.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void initialize(const LoggingOptions& options) {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console);

        std::string fileError;
        if (!options.directory.empty()) {
            try {
                const auto path = std::filesystem::path(options.directory) / options.fileName;
                std::filesystem::create_directories(path.parent_path());

                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), options.maxFileSize, options.maxFiles);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& e) {
                fileError = e.what();
            } catch (const std::filesystem::filesystem_error& e) {
                fileError = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("courier", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(options.level));
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(3));
        m_logger = std::move(logger);

        if (!fileError.empty()) {
            m_logger->error("File logging disabled: {}", fileError);
        }
    }

    void setLevel(LogLevel level) {
        m_logger->set_level(toSpdlogLevel(level));
    }

    void flush() {
        m_logger->flush();
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        m_logger->critical(fmt, std::forward<Args>(args)...);
    }

private:
    Logger() : m_logger(spdlog::default_logger()) {}

    ~Logger() {
        m_logger->flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace courier::core

// Convenience macros
#define LOG_TRACE(...)    courier::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    courier::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     courier::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     courier::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    courier::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) courier::core::Logger::instance().critical(__VA_ARGS__)
