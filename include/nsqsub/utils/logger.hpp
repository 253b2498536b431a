/**
 * @file logger.hpp
 * @brief Thread-safe logging for the nsqsub client library.
 *
 * Structured log lines with configurable levels, component tags and
 * timestamps. Output goes to stderr unless the application installs its
 * own sink.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace nsqsub {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Convert LogLevel to its fixed-width column label.
 */
NSQSUB_UTILS_API const char* logLevelToString(LogLevel level);

/**
 * @brief Parse a level name such as "debug" or "WARN".
 * @return The matching level, or INFO when the name is unknown.
 */
NSQSUB_UTILS_API LogLevel parseLogLevel(std::string name);

/**
 * @class Logger
 * @brief Thread-safe singleton logger with a replaceable sink.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Reader", "Connected to {}:{}", host, port);
 * LOG_WARN("Discovery", "Lookup against {} failed", endpoint);
 * @endcode
 */
class NSQSUB_UTILS_API Logger {
public:
    /// Receives the level and the fully formatted line (no trailing newline).
    using Sink = std::function<void(LogLevel, const std::string&)>;

    /// Process-wide instance, owned by nsqsub_utils.
    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     * Only applies to the default stderr sink.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Route log lines to a custom sink instead of stderr.
     */
    void setSink(Sink sink);

    /**
     * @brief Restore the default stderr sink.
     */
    void resetSink();

    /**
     * @brief Level name without column padding ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    /**
     * @brief Log a message with the given level and component.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level) || level == LogLevel::OFF) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        std::ostringstream oss;

        // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            oss << "[" << logLevelToString(level) << "] [" << component << "] " << message;
            sink_(level, oss.str());
            return;
        }

        bool color = colorEnabled_.load(std::memory_order_relaxed);
        if (color) {
            oss << getColorCode(level);
        }
        oss << "[" << logLevelToString(level) << "]";
        if (color) {
            oss << "\033[0m";
        }
        oss << " [" << component << "] " << message;
        std::cerr << oss.str() << std::endl;
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::INFO)), colorEnabled_(true) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    static const char* getColorCode(LogLevel level);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    Sink sink_;
};

}  // namespace utils
}  // namespace nsqsub

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::nsqsub::utils::Logger::instance().log(::nsqsub::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::nsqsub::utils::Logger::instance().log(::nsqsub::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::nsqsub::utils::Logger::instance().log(::nsqsub::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::nsqsub::utils::Logger::instance().log(::nsqsub::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::nsqsub::utils::Logger::instance().log(::nsqsub::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::nsqsub::utils::Logger::instance().log(::nsqsub::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Conditional logging (avoid evaluation if level disabled)
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::nsqsub::utils::Logger::instance().isEnabled(level)) { \
            ::nsqsub::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
