#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace sandrun::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so every execution shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            tag_ = tag;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // stdout belongs to the execution result, so log lines go to stderr.
        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (tag_.empty() ? "" : "[" + tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string tag_;
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
    #define LOG_DEBUG(msg) sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) sandrun::core::logging::Logger::get().log(sandrun::core::logging::LogLevel::ERROR, msg)

} // namespace sandrun::core::logging
