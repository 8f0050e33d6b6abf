#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace appbridge::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Writes to stderr: stdout belongs to the protocol stream.
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) appbridge::core::logging::Logger::get().log(appbridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  appbridge::core::logging::Logger::get().log(appbridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  appbridge::core::logging::Logger::get().log(appbridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) appbridge::core::logging::Logger::get().log(appbridge::core::logging::LogLevel::ERROR, msg)

} // namespace appbridge::core::logging
