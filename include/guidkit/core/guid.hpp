/**
 * @file guid.hpp
 * @brief 128-bit globally unique identifier value type.
 *
 * A Guid is 16 bytes of storage viewed as four fields:
 *
 *   | Field | Bytes | Type                         |
 *   |-------|-------|------------------------------|
 *   | data1 | 0-3   | uint32_t, big-endian          |
 *   | data2 | 4-5   | uint16_t, big-endian          |
 *   | data3 | 6-7   | uint16_t, big-endian          |
 *   | data4 | 8-15  | 8 opaque bytes               |
 *
 * The byte layout does not depend on host endianness. No version or
 * variant bits are reserved; every 16-byte pattern is a valid Guid.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#pragma once

#include "guidkit/core/export.hpp"
#include "guidkit/core/parse_error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace guidkit {
namespace core {

/**
 * @class Guid
 * @brief Immutable 16-byte identifier with canonical text form.
 *
 * Canonical form: XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX (uppercase hex).
 *
 * Usage:
 * @code
 * Guid a = Guid::random();
 * Guid b = Guid::parse("87935CDE-7094-4C2B-A0F4-DD7D512DD261");
 * Guid c = Guid::fromComponents(0x87935CDE, 0x7094, 0x4C2B,
 *                               {0xA0, 0xF4, 0xDD, 0x7D, 0x51, 0x2D, 0xD2, 0x61});
 * std::string s = c.toString();  // "87935CDE-7094-4C2B-A0F4-DD7D512DD261"
 * @endcode
 */
class GUIDKIT_CORE_API Guid {
public:
    static constexpr size_t SIZE = 16;
    static constexpr size_t STRING_LENGTH = 36;

    using Bytes = std::array<uint8_t, SIZE>;
    using Data4 = std::array<uint8_t, 8>;

    /**
     * @brief Construct the nil Guid (all bytes zero).
     */
    constexpr Guid() noexcept : bytes_{} {}

    static constexpr Guid nil() noexcept { return Guid(); }

    /**
     * @brief Construct from 16 raw bytes, copied as-is.
     */
    static constexpr Guid fromBytes(const Bytes& bytes) noexcept {
        return Guid(bytes);
    }

    /**
     * @brief Construct from the four fields.
     *
     * data1..data3 are stored big-endian; data4 is copied verbatim.
     */
    static constexpr Guid fromComponents(uint32_t data1, uint16_t data2, uint16_t data3,
                                         const Data4& data4) noexcept {
        Bytes b{};
        b[0] = static_cast<uint8_t>(data1 >> 24);
        b[1] = static_cast<uint8_t>(data1 >> 16);
        b[2] = static_cast<uint8_t>(data1 >> 8);
        b[3] = static_cast<uint8_t>(data1);
        b[4] = static_cast<uint8_t>(data2 >> 8);
        b[5] = static_cast<uint8_t>(data2);
        b[6] = static_cast<uint8_t>(data3 >> 8);
        b[7] = static_cast<uint8_t>(data3);
        for (size_t i = 0; i < data4.size(); ++i) {
            b[8 + i] = data4[i];
        }
        return Guid(b);
    }

    /**
     * @brief Generate a Guid from 16 uniformly random bytes.
     *
     * Thread-safe: each thread draws from its own engine. The source is
     * not cryptographically secure and no RFC 4122 bits are set.
     */
    static Guid random();

    /**
     * @brief Parse the canonical form (hex digits in either case).
     * @throws ParseError if @p text is not exactly the canonical grammar.
     */
    static Guid parse(std::string_view text);

    /**
     * @brief Non-throwing variant of parse().
     * @return The parsed Guid, or std::nullopt for malformed input.
     */
    static std::optional<Guid> tryParse(std::string_view text);

    constexpr uint32_t data1() const noexcept {
        return (static_cast<uint32_t>(bytes_[0]) << 24) |
               (static_cast<uint32_t>(bytes_[1]) << 16) |
               (static_cast<uint32_t>(bytes_[2]) << 8) |
               static_cast<uint32_t>(bytes_[3]);
    }

    constexpr uint16_t data2() const noexcept {
        return static_cast<uint16_t>((bytes_[4] << 8) | bytes_[5]);
    }

    constexpr uint16_t data3() const noexcept {
        return static_cast<uint16_t>((bytes_[6] << 8) | bytes_[7]);
    }

    constexpr Data4 data4() const noexcept {
        Data4 d{};
        for (size_t i = 0; i < d.size(); ++i) {
            d[i] = bytes_[8 + i];
        }
        return d;
    }

    /**
     * @brief The underlying 16 bytes.
     */
    constexpr const Bytes& bytes() const noexcept { return bytes_; }

    constexpr bool isNil() const noexcept {
        for (uint8_t b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    /**
     * @brief Render the canonical uppercase form (36 characters).
     */
    std::string toString() const;

    friend constexpr bool operator==(const Guid& lhs, const Guid& rhs) noexcept {
        for (size_t i = 0; i < SIZE; ++i) {
            if (lhs.bytes_[i] != rhs.bytes_[i]) return false;
        }
        return true;
    }

    friend constexpr bool operator!=(const Guid& lhs, const Guid& rhs) noexcept {
        return !(lhs == rhs);
    }

private:
    explicit constexpr Guid(const Bytes& bytes) noexcept : bytes_(bytes) {}

    Bytes bytes_;
};

GUIDKIT_CORE_API std::ostream& operator<<(std::ostream& os, const Guid& guid);

}  // namespace core
}  // namespace guidkit

namespace std {

template<>
struct hash<guidkit::core::Guid> {
    size_t operator()(const guidkit::core::Guid& guid) const noexcept {
        const auto& b = guid.bytes();
        uint64_t hi = 0;
        uint64_t lo = 0;
        for (size_t i = 0; i < 8; ++i) {
            hi = (hi << 8) | b[i];
            lo = (lo << 8) | b[8 + i];
        }
        return static_cast<size_t>(hi ^ (lo * 0x9E3779B97F4A7C15ULL));
    }
};

}  // namespace std
