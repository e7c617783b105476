#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Writes prefixed log lines to a single stream, std::cerr for the process
// logger. stdout is left to the admin tool's command output.
class ConsoleLogger : public ILogger {
public:
    // The first call fixes the level for the lifetime of the process.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);

    ConsoleLogger(LogUtils::LogLevel logLevel, std::ostream& out) : logLevel(logLevel), out_(&out) {}
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel; }

private:
    void write(const std::string& prefix, const std::string& message);

    LogUtils::LogLevel logLevel;
    std::ostream* out_;
    std::mutex out_mutex_;

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
