#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace toolgate::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every component shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // Diagnostics go to stderr so stdout stays usable for command output.
            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
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

    // 3. Helper macros
    #define LOG_DEBUG(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::ERROR, msg)

} // namespace toolgate::core::logging
