#include "utils/log.hpp"

#include <iostream>

namespace blobkit::utils {
namespace {

LogLevel gThreshold = LogLevel::Warning;

const char* levelPrefix(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::Error: return "Error: ";
    case LogLevel::Warning: return "Warning: ";
    case LogLevel::Info: return "";
    case LogLevel::Debug: return "Debug: ";
    }
    return "";
}

} // namespace

void setLogLevel(LogLevel level) noexcept
{
    gThreshold = level;
}

LogLevel logLevel() noexcept
{
    return gThreshold;
}

void logMessage(LogLevel level, const std::string& message)
{
    if (static_cast<int>(level) > static_cast<int>(gThreshold)) {
        return;
    }
    std::cerr << levelPrefix(level) << message << "\n";
}

} // namespace blobkit::utils
