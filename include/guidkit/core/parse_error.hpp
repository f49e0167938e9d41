/**
 * @file parse_error.hpp
 * @brief Error raised when text is not a canonical GUID.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#pragma once

#include "guidkit/core/export.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace guidkit {
namespace core {

/**
 * @class ParseError
 * @brief Malformed-input error for Guid::parse().
 *
 * The message describes the expected grammar only; it does not identify
 * which character failed. The rejected text is kept for callers that want
 * to report it.
 */
class GUIDKIT_CORE_API ParseError : public std::runtime_error {
public:
    explicit ParseError(std::string_view input);

    /**
     * @brief The text that was rejected.
     */
    const std::string& input() const noexcept { return input_; }

private:
    std::string input_;
};

}  // namespace core
}  // namespace guidkit
