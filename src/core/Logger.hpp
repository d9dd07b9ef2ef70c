#pragma once

/**
 * Logger.hpp
 * 
 * Centralized logging system with multiple log levels and sinks.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include "../utils/PathUtils.hpp"
#include "../utils/StringUtils.hpp"

namespace fastget::core {

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
 * Provides formatted logging with multiple output sinks:
 * - Console output with colors (stderr, stdout may carry a payload)
 * - Rotating file output
 * 
 * Until initialize() is called every log call is a no-op.
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
     * @param logDir Log file directory (empty = platform default)
     * @param fileOutput Also write a rotating log file
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "",
                   bool fileOutput = true) {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            
            // Console sink with colors
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);
            
            if (fileOutput) {
                std::filesystem::path logPath = logDir.empty()
                    ? utils::PathUtils::getLogsPath() / "fastget.log"
                    : std::filesystem::path(logDir) / "fastget.log";
                
                std::filesystem::create_directories(logPath.parent_path());
                
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }
            
            m_logger = std::make_shared<spdlog::logger>("fastget", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);
            
            spdlog::set_default_logger(m_logger);
            
            m_initialized = true;
            
        } catch (const spdlog::spdlog_ex& ex) {
            // Fallback to console only
            m_logger = spdlog::stderr_color_mt("fastget_fallback");
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->error("Logger initialization failed: {}", ex.what());
            m_initialized = true;
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = spdlog::stderr_color_mt("fastget_fallback");
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->error("Cannot create log directory: {}", ex.what());
            m_initialized = true;
        }
    }
    
    bool isInitialized() const { return m_initialized; }
    
    /**
     * Set log level
     * @param level New log level
     */
    void setLevel(LogLevel level) {
        if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
            for (auto& sink : m_logger->sinks()) {
                sink->set_level(toSpdlogLevel(level));
            }
        }
    }
    
    /**
     * Parse a level name ("debug", "warn", ...); unknown names map to Info
     */
    static LogLevel levelFromString(const std::string& name) {
        std::string l = utils::StringUtils::toLower(utils::StringUtils::trim(name));
        if (l == "trace") return LogLevel::Trace;
        if (l == "debug") return LogLevel::Debug;
        if (l == "warn" || l == "warning") return LogLevel::Warn;
        if (l == "error") return LogLevel::Error;
        if (l == "critical") return LogLevel::Critical;
        if (l == "off") return LogLevel::Off;
        return LogLevel::Info;
    }
    
    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }
    
    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }
    
    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    /**
     * Convert LogLevel to spdlog::level
     */
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
    bool m_initialized{false};
};

} // namespace fastget::core

// Convenience macros
#define FASTGET_LOG_TRACE(...)    fastget::core::Logger::instance().trace(__VA_ARGS__)
#define FASTGET_LOG_DEBUG(...)    fastget::core::Logger::instance().debug(__VA_ARGS__)
#define FASTGET_LOG_INFO(...)     fastget::core::Logger::instance().info(__VA_ARGS__)
#define FASTGET_LOG_WARN(...)     fastget::core::Logger::instance().warn(__VA_ARGS__)
#define FASTGET_LOG_ERROR(...)    fastget::core::Logger::instance().error(__VA_ARGS__)
#define FASTGET_LOG_CRITICAL(...) fastget::core::Logger::instance().critical(__VA_ARGS__)
