#include "wifi_logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace wifiprov {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::parseLevel(const std::string& name) {
    if (name == "debug")    return LogLevel::DEBUG;
    if (name == "warning")  return LogLevel::WARNING;
    if (name == "error")    return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < currentLevel) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    const char* levelStr;
    switch (level) {
        case LogLevel::DEBUG:    levelStr = "DEBUG"; break;
        case LogLevel::INFO:     levelStr = "INFO"; break;
        case LogLevel::WARNING:  levelStr = "WARN"; break;
        case LogLevel::ERROR:    levelStr = "ERROR"; break;
        case LogLevel::CRITICAL: levelStr = "CRITICAL"; break;
        default:                 levelStr = "UNKNOWN";
    }

    std::lock_guard<std::mutex> lock(outputMutex);
    std::ostream& out = level >= LogLevel::WARNING ? std::cerr : std::cout;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << " [" << levelStr << "] "
        << message << std::endl;
}

} // namespace wifiprov
