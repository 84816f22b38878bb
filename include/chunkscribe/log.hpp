#ifndef CHUNKSCRIBE_LOG_HPP
#define CHUNKSCRIBE_LOG_HPP

#include <string>

namespace chunkscribe {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Minimum level that reaches the console (default: Info)
void setLogLevel(LogLevel level);
LogLevel logLevel();

// Accepts "debug", "info", "warning"/"warn", "error"
bool parseLogLevel(const std::string& name, LogLevel& level);

bool isLogEnabled(LogLevel level);

// "[Tag] message" lines; Debug/Info go to stdout, Warning/Error to stderr
void logDebug(const std::string& tag, const std::string& message);
void logInfo(const std::string& tag, const std::string& message);
void logWarning(const std::string& tag, const std::string& message);
void logError(const std::string& tag, const std::string& message);

} // namespace chunkscribe

#endif // CHUNKSCRIBE_LOG_HPP
