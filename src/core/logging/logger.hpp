#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace bashgate::core::logging {

    // Ordered by severity.
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Writes to stderr: stdout carries the decision document for the hook harness.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::WARN;

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

    // Callers log through these macros.
    #define LOG_DEBUG(msg) bashgate::core::logging::Logger::get().log(bashgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  bashgate::core::logging::Logger::get().log(bashgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  bashgate::core::logging::Logger::get().log(bashgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) bashgate::core::logging::Logger::get().log(bashgate::core::logging::LogLevel::ERROR, msg)

} // namespace bashgate::core::logging
