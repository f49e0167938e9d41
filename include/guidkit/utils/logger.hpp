/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for guidkit.
 *
 * Zero external dependencies. Provides leveled logging with component
 * tags, timestamps and a replaceable output stream.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#pragma once

#include "guidkit/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace guidkit {
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
 * @brief Padded label used in log lines.
 */
inline const char* logLevelToString(LogLevel level) {
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

/**
 * @brief Convert a level name to LogLevel (case-insensitive).
 * @param name Level name, e.g. "debug" or "WARN"
 * @param fallback Returned when the name is not recognized
 */
GUIDKIT_UTILS_API LogLevel parseLogLevel(const std::string& name,
                                        LogLevel fallback = LogLevel::INFO);

/**
 * @brief Strict variant of parseLogLevel().
 * @return false if @p name is not a level name; @p level is then unchanged
 */
GUIDKIT_UTILS_API bool tryParseLogLevel(const std::string& name, LogLevel& level);

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_DEBUG("Parser", "Rejected input of length {}", text.size());
 * LOG_ERROR("Codec", "Cannot decode {}", value);
 * @endcode
 */
class GUIDKIT_UTILS_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Unpadded name of a level, e.g. "INFO".
     */
    static std::string levelName(LogLevel level) {
        std::string name = logLevelToString(level);
        name.erase(name.find_last_not_of(' ') + 1);
        return name;
    }

    /**
     * @brief Set the minimum log level. Messages below this are ignored.
     */
    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    /**
     * @brief Check if a level would be logged.
     */
    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     */
    void setColorEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colorEnabled_ = enabled;
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setStream(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = stream ? stream : &std::cerr;
    }

    /**
     * @brief Log a message with the given level and component.
     *
     * Each "{}" in @p format is replaced by the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

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

        std::lock_guard<std::mutex> lock(mutex_);

        std::ostringstream oss;
        oss << "["
            << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        if (colorEnabled_) {
            oss << getColorCode(level);
        }
        oss << "[" << logLevelToString(level) << "]";
        if (colorEnabled_) {
            oss << "\033[0m";
        }

        oss << " [" << component << "] " << message;

        *stream_ << oss.str() << std::endl;
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO)),
          colorEnabled_(false),
          stream_(&std::cerr) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string formatMessage(const char* format) {
        return std::string(format);
    }

    template<typename T, typename... Args>
    static std::string formatMessage(const char* format, T&& value, Args&&... args) {
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

    static const char* getColorCode(LogLevel level) {
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

    std::atomic<int> level_;
    bool colorEnabled_;
    std::ostream* stream_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace guidkit

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::guidkit::utils::Logger::instance().log(::guidkit::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::guidkit::utils::Logger::instance().log(::guidkit::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::guidkit::utils::Logger::instance().log(::guidkit::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::guidkit::utils::Logger::instance().log(::guidkit::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::guidkit::utils::Logger::instance().log(::guidkit::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::guidkit::utils::Logger::instance().log(::guidkit::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Conditional logging (avoid evaluation if level disabled)
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::guidkit::utils::Logger::instance().isEnabled(level)) { \
            ::guidkit::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
