/**
 * @file guid_codec.cpp
 * @brief Protobuf mapping for Guid.
 *
 * @copyright Copyright (c) 2024 guidkit Contributors
 * @license MIT License
 */

#include "guidkit/serialization/guid_codec.hpp"
#include "guidkit/utils/logger.hpp"

namespace guidkit {
namespace serialization {

SerializationError::SerializationError(const std::string& input)
    : std::runtime_error("cannot convert " + input + " to guid"),
      input_(input) {}

SerializationError::SerializationError(const std::string& input, const std::string& what)
    : std::runtime_error(what),
      input_(input) {}

void toProto(const core::Guid& guid, v1::Guid* out) {
    out->set_value(guid.toString());
}

v1::Guid toProto(const core::Guid& guid) {
    v1::Guid message;
    toProto(guid, &message);
    return message;
}

core::Guid fromProto(const v1::Guid& message) {
    auto guid = core::Guid::tryParse(message.value());
    if (!guid) {
        LOG_DEBUG("Codec", "Cannot convert value of {} bytes to guid", message.value().size());
        throw SerializationError(message.value());
    }
    return *guid;
}

v1::GuidList toProtoList(const std::vector<core::Guid>& guids) {
    v1::GuidList message;
    for (const auto& guid : guids) {
        toProto(guid, message.add_guids());
    }
    return message;
}

std::vector<core::Guid> fromProtoList(const v1::GuidList& message) {
    std::vector<core::Guid> guids;
    guids.reserve(static_cast<size_t>(message.guids_size()));
    for (const auto& entry : message.guids()) {
        guids.push_back(fromProto(entry));
    }
    return guids;
}

std::string serialize(const core::Guid& guid) {
    return toProto(guid).SerializeAsString();
}

core::Guid deserialize(const std::string& bytes) {
    v1::Guid message;
    if (!message.ParseFromString(bytes)) {
        LOG_DEBUG("Codec", "Undecodable message ({} bytes)", bytes.size());
        throw SerializationError(bytes, "cannot decode guidkit.v1.Guid message");
    }
    return fromProto(message);
}

}  // namespace serialization
}  // namespace guidkit
