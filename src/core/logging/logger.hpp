#pragma once
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace codeloop::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // "debug", "info", "warn"/"warning", "error"; anything else is nullopt.
    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // Process-wide logger. stdout carries the event stream, so every line goes
    // to stderr as "HH:MM:SS.mmm [LEVEL] [session] message".
    class Logger {
    public:
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

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << timestamp() << " [" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()).count() % 1000;
            std::tm local{};
            localtime_r(&seconds, &local);
            char buffer[16];
            const std::size_t len = std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &local);
            std::string out(buffer, len);
            out += ".";
            if (millis < 100) out += "0";
            if (millis < 10) out += "0";
            out += std::to_string(millis);
            return out;
        }

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) codeloop::core::logging::Logger::get().log(codeloop::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  codeloop::core::logging::Logger::get().log(codeloop::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  codeloop::core::logging::Logger::get().log(codeloop::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) codeloop::core::logging::Logger::get().log(codeloop::core::logging::LogLevel::ERROR, msg)

} // namespace codeloop::core::logging
