#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace common {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

/**
 * @brief Interface for logging
 * Components receive a shared logger and tag their own messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;
    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

/**
 * @brief Console logger implementation
 * Timestamped output; warnings and errors go to stderr.
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

    void debug(const std::string& message) override { log(LogLevel::Debug, "DEBUG", message); }
    void info(const std::string& message) override { log(LogLevel::Info, "INFO", message); }
    void warn(const std::string& message) override { log(LogLevel::Warn, "WARN", message); }
    void error(const std::string& message) override { log(LogLevel::Error, "ERROR", message); }

private:
    void log(LogLevel level, const char* tag, const std::string& message) {
        if (level < min_level_) return;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&time, &local);

        // Polling worker and command thread both log
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
        out << "[" << std::put_time(&local, "%H:%M:%S")
            << "] [" << tag << "] " << message << std::endl;
    }

    LogLevel min_level_;
    std::mutex mutex_;
};

/**
 * @brief Null logger for testing or disabled logging
 */
class NullLogger : public ILogger {
public:
    void debug(const std::string&) override {}
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string&) override {}
};

} // namespace common
