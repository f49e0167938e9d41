/**
 * @file guid.cpp
 * @brief Guid generation, parsing and formatting.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#include "guidkit/core/guid.hpp"
#include "guidkit/utils/logger.hpp"

#include <iterator>
#include <ostream>
#include <random>

namespace guidkit {
namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

// Bytes per dash-separated group of the canonical form (8-4-4-4-12 digits).
constexpr size_t GROUP_BYTES[] = {4, 2, 2, 2, 6};

constexpr const char* EXPECTED_FORM = "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

/**
 * @brief Scan the canonical grammar into @p out.
 * @return false on any deviation; @p out is then unspecified.
 */
bool scan(std::string_view text, Guid::Bytes& out) {
    if (text.size() != Guid::STRING_LENGTH) {
        return false;
    }

    size_t pos = 0;
    size_t index = 0;
    for (size_t group = 0; group < std::size(GROUP_BYTES); ++group) {
        if (group > 0) {
            if (text[pos] != '-') {
                return false;
            }
            ++pos;
        }
        for (size_t i = 0; i < GROUP_BYTES[group]; ++i) {
            int hi = hexValue(text[pos]);
            int lo = hexValue(text[pos + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out[index++] = static_cast<uint8_t>((hi << 4) | lo);
            pos += 2;
        }
    }

    // Every character must be consumed.
    return pos == text.size();
}

std::mt19937_64& engine() {
    thread_local std::mt19937_64 gen = [] {
        std::random_device rd;
        std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seed);
    }();
    return gen;
}

}  // namespace

ParseError::ParseError(std::string_view input)
    : std::runtime_error(std::string("Malformed GUID, expecting ") + EXPECTED_FORM),
      input_(input) {}

Guid Guid::random() {
    auto& gen = engine();
    uint64_t words[2] = {gen(), gen()};

    Bytes b{};
    for (size_t i = 0; i < SIZE; ++i) {
        b[i] = static_cast<uint8_t>(words[i / 8] >> (8 * (i % 8)));
    }
    return Guid(b);
}

std::optional<Guid> Guid::tryParse(std::string_view text) {
    Bytes b{};
    if (!scan(text, b)) {
        LOG_TRACE("Guid", "Rejected malformed input ({} bytes)", text.size());
        return std::nullopt;
    }
    return Guid(b);
}

Guid Guid::parse(std::string_view text) {
    auto guid = tryParse(text);
    if (!guid) {
        throw ParseError(text);
    }
    return *guid;
}

std::string Guid::toString() const {
    std::string out;
    out.reserve(STRING_LENGTH);

    size_t index = 0;
    for (size_t group = 0; group < std::size(GROUP_BYTES); ++group) {
        if (group > 0) {
            out.push_back('-');
        }
        for (size_t i = 0; i < GROUP_BYTES[group]; ++i) {
            uint8_t byte = bytes_[index++];
            out.push_back(HEX_DIGITS[byte >> 4]);
            out.push_back(HEX_DIGITS[byte & 0x0F]);
        }
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const Guid& guid) {
    return os << guid.toString();
}

}  // namespace core
}  // namespace guidkit
