/**
 * @file guid_codec.hpp
 * @brief Protobuf mapping for Guid.
 *
 * A Guid is carried as a single string field holding the canonical form
 * (see proto/guidkit/v1/guid.proto). Decoding rejects anything that
 * Guid::parse() rejects.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#pragma once

#include "guidkit/serialization/export.hpp"
#include "guidkit/core/guid.hpp"
#include "guidkit/v1/guid.pb.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace guidkit {
namespace serialization {

/**
 * @class SerializationError
 * @brief Raised when a message does not hold a valid Guid.
 *
 * The message names the offending input, e.g.
 * "cannot convert not-a-guid to guid".
 */
class GUIDKIT_SERIALIZATION_API SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& input);
    SerializationError(const std::string& input, const std::string& what);

    const std::string& input() const noexcept { return input_; }

private:
    std::string input_;
};

/**
 * @brief Store @p guid in @p out as its canonical form.
 */
GUIDKIT_SERIALIZATION_API void toProto(const core::Guid& guid, v1::Guid* out);

GUIDKIT_SERIALIZATION_API v1::Guid toProto(const core::Guid& guid);

/**
 * @brief Read a Guid back from a message.
 * @throws SerializationError if the value is not canonical.
 */
GUIDKIT_SERIALIZATION_API core::Guid fromProto(const v1::Guid& message);

GUIDKIT_SERIALIZATION_API v1::GuidList toProtoList(const std::vector<core::Guid>& guids);

/**
 * @throws SerializationError on the first malformed entry.
 */
GUIDKIT_SERIALIZATION_API std::vector<core::Guid> fromProtoList(const v1::GuidList& message);

/**
 * @brief Encode a Guid as protobuf wire bytes.
 */
GUIDKIT_SERIALIZATION_API std::string serialize(const core::Guid& guid);

/**
 * @brief Decode protobuf wire bytes produced by serialize().
 * @throws SerializationError if the bytes are not a message or hold a bad value.
 */
GUIDKIT_SERIALIZATION_API core::Guid deserialize(const std::string& bytes);

}  // namespace serialization
}  // namespace guidkit
