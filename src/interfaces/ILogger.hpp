#pragma once

#include <string>

#include "../config/AppConfig.hpp" // For LogUtils

class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void setup(const std::string& message) = 0;
    virtual LogUtils::LogLevel getLogLevel() const = 0;

    // Lets callers skip building debug strings nobody will see.
    bool isDebugEnabled() const {
        return getLogLevel() <= LogUtils::LogLevel::DEBUG;
    }
};
