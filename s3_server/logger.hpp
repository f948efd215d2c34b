#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static void Log(LogLevel level, const std::string& message, const std::string& component = "Server") {
        if (level < min_level_.load()) {
            return;
        }

        json log_entry;
        log_entry["timestamp"] = GetTimestamp();
        log_entry["level"] = LevelToString(level);
        log_entry["component"] = component;
        log_entry["message"] = message;

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << log_entry.dump() << std::endl;
    }

    static void Debug(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::DEBUG, message, component);
    }

    static void Info(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::INFO, message, component);
    }

    static void Warn(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::WARN, message, component);
    }

    static void Error(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::ERROR, message, component);
    }

    static void Fatal(const std::string& message, const std::string& component = "Server") {
        Log(LogLevel::FATAL, message, component);
    }

    static void SetLevel(LogLevel level) { min_level_.store(level); }

    // Accepts "DEBUG", "INFO", "WARN", "ERROR", "FATAL". Unknown names fall back to INFO.
    static LogLevel ParseLevel(const std::string& name);

    static std::string LevelToString(LogLevel level);

    // ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
    static std::string GetTimestamp();

private:
    static std::mutex mutex_;
    static std::atomic<LogLevel> min_level_;
};

#endif // LOGGER_HPP
