#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logging for the toolkit, on top of spdlog.
 */

#include "Config.hpp"
#include "../utils/PathUtils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace craftkit::core {

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
 * Logger - singleton front for the "craftkit" spdlog logger
 *
 * Until one of the initialize() overloads runs, records go to spdlog's
 * default logger, so library code never depends on setup order.
 */
class Logger {
public:
    static constexpr const char* LOG_FILE = "craftkit.log";
    static constexpr size_t MAX_FILE_SIZE = 10 * 1024 * 1024;
    static constexpr size_t MAX_FILES = 5;

    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Console sink at `level`, plus a rotating craftkit.log under logDir
     * that records everything. An empty logDir means console only.
     */
    void initialize(LogLevel level = LogLevel::Info, const std::string& logDir = "") {
        try {
            auto sinks = makeSinks(level, logDir);
            install(std::make_shared<spdlog::logger>("craftkit", sinks.begin(), sinks.end()), level);
        } catch (const spdlog::spdlog_ex& ex) {
            installFallback(ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            installFallback(ex.what());
        }
    }

    /**
     * Initialize from the "log" section: log.level and log.directory.
     * A relative directory lives under the data directory.
     */
    void initialize(const Config& config) {
        auto directory = config.get<std::string>("log.directory", "logs");
        initialize(parseLevel(config.get<std::string>("log.level", "info")),
                   directory.empty() ? directory : utils::PathUtils::resolve(directory).string());
    }

    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->log(toSpdlogLevel(level), fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    // Level names as written in config files; anything unknown is Info
    static LogLevel parseLevel(const std::string& name) {
        if (name == "off") {
            return LogLevel::Off;
        }
        switch (spdlog::level::from_str(name)) {
            case spdlog::level::trace:    return LogLevel::Trace;
            case spdlog::level::debug:    return LogLevel::Debug;
            case spdlog::level::warn:     return LogLevel::Warn;
            case spdlog::level::err:      return LogLevel::Error;
            case spdlog::level::critical: return LogLevel::Critical;
            default:                      return LogLevel::Info;
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::vector<spdlog::sink_ptr> makeSinks(LogLevel level, const std::string& logDir) {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(toSpdlogLevel(level));
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console);

        if (!logDir.empty()) {
            std::filesystem::create_directories(logDir);
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (std::filesystem::path(logDir) / LOG_FILE).string(), MAX_FILE_SIZE, MAX_FILES);
            file->set_level(spdlog::level::trace);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file);
        }
        return sinks;
    }

    void install(std::shared_ptr<spdlog::logger> logger, LogLevel level) {
        // The logger passes everything through; each sink filters for itself
        logger->set_level(level == LogLevel::Off ? spdlog::level::off : spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);
        m_logger = std::move(logger);
    }

    void installFallback(const std::string& reason) {
        m_logger = std::make_shared<spdlog::logger>(
            "craftkit", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        m_logger->error("File logging unavailable: {}", reason);
    }

    spdlog::logger* logger() {
        return m_logger ? m_logger.get() : spdlog::default_logger_raw();
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
        }
        return spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace craftkit::core

#define LOG_DEBUG(...)    craftkit::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     craftkit::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     craftkit::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    craftkit::core::Logger::instance().error(__VA_ARGS__)
