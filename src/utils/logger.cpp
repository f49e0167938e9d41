/**
 * @file logger.cpp
 * @brief Logger helpers that do not need to live in the header.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#include "guidkit/utils/logger.hpp"

#include <algorithm>
#include <cctype>

namespace guidkit {
namespace utils {

bool tryParseLogLevel(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") { level = LogLevel::TRACE; return true; }
    if (upper == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (upper == "INFO") { level = LogLevel::INFO; return true; }
    if (upper == "WARN" || upper == "WARNING") { level = LogLevel::WARN; return true; }
    if (upper == "ERROR") { level = LogLevel::ERROR; return true; }
    if (upper == "FATAL") { level = LogLevel::FATAL; return true; }
    if (upper == "OFF") { level = LogLevel::OFF; return true; }
    return false;
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    LogLevel level = fallback;
    tryParseLogLevel(name, level);
    return level;
}

}  // namespace utils
}  // namespace guidkit
