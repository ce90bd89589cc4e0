#pragma once

#include <string>

namespace blobkit::utils {

enum class LogLevel {
    Error = 0,
    Warning,
    Info,
    Debug
};

void setLogLevel(LogLevel level) noexcept;
LogLevel logLevel() noexcept;

void logMessage(LogLevel level, const std::string& message);

inline void logError(const std::string& message) { logMessage(LogLevel::Error, message); }
inline void logWarning(const std::string& message) { logMessage(LogLevel::Warning, message); }
inline void logInfo(const std::string& message) { logMessage(LogLevel::Info, message); }
inline void logDebug(const std::string& message) { logMessage(LogLevel::Debug, message); }

} // namespace blobkit::utils
