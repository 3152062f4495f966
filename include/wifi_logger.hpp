#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace wifiprov {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);
    void setLogLevel(LogLevel level);

    // Parses "debug", "info", "warning", "error" or "critical"; falls back to INFO
    static LogLevel parseLevel(const std::string& name);

    template<typename... Args>
    void debug(Args&&... args) {
        if (currentLevel > LogLevel::DEBUG) return;
        log(LogLevel::DEBUG, formatMessage(std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(Args&&... args) {
        log(LogLevel::INFO, formatMessage(std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warning(Args&&... args) {
        log(LogLevel::WARNING, formatMessage(std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(Args&&... args) {
        log(LogLevel::ERROR, formatMessage(std::forward<Args>(args)...));
    }

    template<typename... Args>
    void critical(Args&&... args) {
        log(LogLevel::CRITICAL, formatMessage(std::forward<Args>(args)...));
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    std::string formatMessage(Args&&... args) {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        return oss.str();
    }

    std::atomic<LogLevel> currentLevel{LogLevel::INFO};
    std::mutex outputMutex;
};

} // namespace wifiprov
