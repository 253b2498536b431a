/**
 * @file logger.cpp
 * @brief Logger singleton and level helpers.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/utils/logger.hpp"

#include <algorithm>
#include <cctype>

namespace nsqsub {
namespace utils {

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

LogLevel parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO") return LogLevel::INFO;
    if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    if (name == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

// Defined here so every library and executable shares one instance.
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::resetSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
}

std::string Logger::levelName(LogLevel level) {
    std::string name = logLevelToString(level);
    name.erase(name.find_last_not_of(' ') + 1);
    return name;
}

const char* Logger::getColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
        default:              return "";
    }
}

}  // namespace utils
}  // namespace nsqsub
