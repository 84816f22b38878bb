#include "chunkscribe/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace chunkscribe {

namespace {
    std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
    std::mutex g_output_mutex;

    void write(LogLevel level, const std::string& tag, const std::string& message) {
        if (!isLogEnabled(level)) return;

        std::lock_guard<std::mutex> lock(g_output_mutex);
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[" << tag << "] [DEBUG] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[" << tag << "] [WARN] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[" << tag << "] [ERROR] " << message << std::endl;
                break;
        }
    }
}

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(g_level.load());
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
    if (name == "debug") {
        level = LogLevel::Debug;
    } else if (name == "info") {
        level = LogLevel::Info;
    } else if (name == "warning" || name == "warn") {
        level = LogLevel::Warning;
    } else if (name == "error") {
        level = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

bool isLogEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load();
}

void logDebug(const std::string& tag, const std::string& message) { write(LogLevel::Debug, tag, message); }
void logInfo(const std::string& tag, const std::string& message) { write(LogLevel::Info, tag, message); }
void logWarning(const std::string& tag, const std::string& message) { write(LogLevel::Warning, tag, message); }
void logError(const std::string& tag, const std::string& message) { write(LogLevel::Error, tag, message); }

} // namespace chunkscribe
