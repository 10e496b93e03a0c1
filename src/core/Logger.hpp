#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the ftpget library and command line tool.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace ftpget::core {

/**
 * Log level enumeration
 */
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
 * Logger class - Thread-safe singleton logger
 *
 * Console output goes to stderr so that progress lines on stdout stay
 * readable. A rotating file sink is added when a log directory is given.
 * Until initialize() is called the logger writes warnings and above to
 * stderr, which keeps library users and tests quiet by default.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = console only)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (!logDir.empty()) {
                std::filesystem::path logPath = std::filesystem::path(logDir) / "ftpget.log";
                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 5, // 5 MB
                    3,               // 3 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>("ftpget", sinks.begin(), sinks.end());
            logger->set_level(toSpdlogLevel(level));
            logger->flush_on(spdlog::level::warn);
            m_logger = logger;

        } catch (const spdlog::spdlog_ex& ex) {
            m_logger = makeFallbackLogger();
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = makeFallbackLogger();
            m_logger->error("Cannot create log directory {}: {}", logDir, ex.what());
        }
    }

    /**
     * Parse a level name as found in configuration files
     * ("trace", "debug", "info", "warn", "error", "critical", "off").
     * Unknown names map to Info.
     */
    static LogLevel parseLevel(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return LogLevel::Info;
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
    Logger() : m_logger(makeFallbackLogger()) {}
    ~Logger() {
        m_logger->flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::shared_ptr<spdlog::logger> makeFallbackLogger() {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("ftpget", sink);
        logger->set_level(spdlog::level::warn);
        return logger;
    }

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace ftpget::core

// Convenience macros
#define LOG_TRACE(...)    ftpget::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ftpget::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     ftpget::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     ftpget::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    ftpget::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ftpget::core::Logger::instance().critical(__VA_ARGS__)
