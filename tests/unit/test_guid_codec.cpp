/**
 * @file test_guid_codec.cpp
 * @brief Unit tests for the protobuf Guid mapping
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <guidkit/serialization/guid_codec.hpp>
#include <guidkit/utils/logger.hpp>

#include <sstream>

#include <string>
#include <vector>

using namespace guidkit;
using namespace guidkit::serialization;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

const char* const kCanonical = "87935CDE-7094-4C2B-A0F4-DD7D512DD261";

}  // namespace

TEST(GuidCodecTest, EncodesCanonicalString) {
    auto guid = core::Guid::parse("87935cde-7094-4c2b-a0f4-dd7d512dd261");
    v1::Guid message = toProto(guid);
    EXPECT_EQ(message.value(), kCanonical);
}

TEST(GuidCodecTest, DecodesCanonicalString) {
    v1::Guid message;
    message.set_value(kCanonical);

    core::Guid guid = fromProto(message);
    EXPECT_EQ(guid.data1(), 0x87935CDEu);
    EXPECT_EQ(guid.toString(), kCanonical);
}

TEST(GuidCodecTest, DecodeFailureNamesInput) {
    v1::Guid message;
    message.set_value("definitely-not-a-guid");

    try {
        fromProto(message);
        FAIL() << "expected SerializationError";
    } catch (const SerializationError& e) {
        EXPECT_EQ(std::string(e.what()), "cannot convert definitely-not-a-guid to guid");
        EXPECT_EQ(e.input(), "definitely-not-a-guid");
    }
}

TEST(GuidCodecTest, EmptyValueIsRejected) {
    v1::Guid message;
    EXPECT_THROW(fromProto(message), SerializationError);
}

TEST(GuidCodecTest, WireBytesRoundTrip) {
    for (int i = 0; i < 100; ++i) {
        auto guid = core::Guid::random();
        std::string bytes = serialize(guid);
        EXPECT_EQ(deserialize(bytes), guid);
    }
}

TEST(GuidCodecTest, UndecodableBytesAreRejected) {
    // Field 1, wire type 2, claims 100 bytes but none follow
    std::string truncated = "\x0A\x64";
    try {
        deserialize(truncated);
        FAIL() << "expected SerializationError";
    } catch (const SerializationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("cannot decode"));
    }
}

TEST(GuidCodecTest, ListRoundTrip) {
    std::vector<core::Guid> guids = {
        core::Guid::parse(kCanonical),
        core::Guid::nil(),
        core::Guid::random(),
    };

    v1::GuidList message = toProtoList(guids);
    ASSERT_EQ(message.guids_size(), 3);
    EXPECT_EQ(message.guids(0).value(), kCanonical);
    EXPECT_EQ(message.guids(1).value(), "00000000-0000-0000-0000-000000000000");

    EXPECT_EQ(fromProtoList(message), guids);
}

TEST(GuidCodecTest, ListStopsAtMalformedEntry) {
    v1::GuidList message;
    message.add_guids()->set_value(kCanonical);
    message.add_guids()->set_value("87935CDE-7094-4C2B-A0F4-DD7D512DD26");

    EXPECT_THROW(fromProtoList(message), SerializationError);
}

TEST(GuidCodecTest, DecodeFailureLogsSizeNotValue) {
    std::ostringstream sink;
    utils::Logger::instance().setLevel(utils::LogLevel::DEBUG);
    utils::Logger::instance().setColorEnabled(false);
    utils::Logger::instance().setStream(&sink);

    v1::Guid message;
    message.set_value(std::string(4096, 'Z'));
    EXPECT_THROW(fromProto(message), SerializationError);

    utils::Logger::instance().setStream(nullptr);
    utils::Logger::instance().setLevel(utils::LogLevel::INFO);

    EXPECT_THAT(sink.str(), HasSubstr("4096 bytes"));
    EXPECT_THAT(sink.str(), Not(HasSubstr("ZZZZ")));
}
