/**
 * @file test_commands.cpp
 * @brief Unit tests for guidgen commands and output formatting
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <guidkit/app/commands.hpp>
#include <guidkit/app/output_formatter.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace guidkit;
using namespace guidkit::app;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

const char* const kCanonical = "87935CDE-7094-4C2B-A0F4-DD7D512DD261";

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        result.push_back(line);
    }
    return result;
}

}  // namespace

class CommandsTest : public ::testing::Test {
protected:
    int run(Config config, bool json = false) {
        out_.str("");
        err_.str("");
        config.json = json;
        OutputFormatter output(json, out_, err_);
        return run_command(config, output);
    }

    std::ostringstream out_;
    std::ostringstream err_;
};

// =============================================================================
// new
// =============================================================================

TEST_F(CommandsTest, NewPrintsCountGuids) {
    Config config;
    config.count = 5;

    EXPECT_EQ(run(config), 0);

    auto output = lines(out_.str());
    ASSERT_EQ(output.size(), 5u);
    for (const auto& line : output) {
        EXPECT_TRUE(core::Guid::tryParse(line).has_value()) << line;
    }
}

TEST_F(CommandsTest, NewJsonIsArray) {
    Config config;
    config.count = 2;

    EXPECT_EQ(run(config, true), 0);

    std::string json = out_.str();
    EXPECT_THAT(json, StartsWith("[\""));
    EXPECT_EQ(json.size(), 2 + 2 * 38 + 1 + 1u);  // [ "..." , "..." ] \n
}

// =============================================================================
// parse
// =============================================================================

TEST_F(CommandsTest, ParseShowsFields) {
    Config config;
    config.command = "parse";
    config.args = {"87935cde-7094-4c2b-a0f4-dd7d512dd261"};

    EXPECT_EQ(run(config), 0);

    std::string text = out_.str();
    EXPECT_THAT(text, HasSubstr(kCanonical));
    EXPECT_THAT(text, HasSubstr("0x87935CDE"));
    EXPECT_THAT(text, HasSubstr("0x7094"));
    EXPECT_THAT(text, HasSubstr("0x4C2B"));
    EXPECT_THAT(text, HasSubstr("A0F4DD7D512DD261"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CommandsTest, ParseJsonObject) {
    Config config;
    config.command = "parse";
    config.args = {kCanonical};

    EXPECT_EQ(run(config, true), 0);
    EXPECT_EQ(out_.str(),
              "{\"value\":\"87935CDE-7094-4C2B-A0F4-DD7D512DD261\",\"data1\":2274581726,"
              "\"data2\":28820,\"data3\":19499,\"data4\":\"A0F4DD7D512DD261\"}\n");
}

TEST_F(CommandsTest, ParseReportsMalformedInput) {
    Config config;
    config.command = "parse";
    config.args = {kCanonical, "87935CDE-7094-4C2B-A0F4-DD7D512DD26Z"};

    EXPECT_EQ(run(config), 1);
    EXPECT_THAT(err_.str(), HasSubstr("Malformed GUID"));
    EXPECT_THAT(err_.str(), HasSubstr("DD26Z"));
    EXPECT_THAT(out_.str(), HasSubstr(kCanonical));
}

TEST_F(CommandsTest, ParseWithoutArguments) {
    Config config;
    config.command = "parse";

    EXPECT_EQ(run(config), 1);
    EXPECT_THAT(err_.str(), HasSubstr("at least one"));
}

TEST_F(CommandsTest, JsonErrorsGoToOutput) {
    Config config;
    config.command = "parse";
    config.args = {"bad\"input"};

    EXPECT_EQ(run(config, true), 1);
    EXPECT_THAT(out_.str(), StartsWith("{\"error\":"));
    EXPECT_THAT(out_.str(), HasSubstr("bad\\\"input"));
    EXPECT_TRUE(err_.str().empty());
}

// =============================================================================
// build
// =============================================================================

TEST_F(CommandsTest, BuildFromHexFields) {
    core::Guid guid = build_from_hex({"87935CDE", "7094", "4C2B", "A0F4DD7D512DD261"});
    EXPECT_EQ(guid.toString(), kCanonical);
}

TEST_F(CommandsTest, BuildAcceptsPrefixAndShortFields) {
    core::Guid guid = build_from_hex({"0x1F4", "258", "0x2bc", "0xa0f4dd7d512dd261"});
    EXPECT_EQ(guid.data1(), 500u);
    EXPECT_EQ(guid.data2(), 600u);
    EXPECT_EQ(guid.data3(), 700u);
}

TEST_F(CommandsTest, BuildRejectsBadFields) {
    EXPECT_THROW(build_from_hex({"87935CDE", "7094", "4C2B"}), std::invalid_argument);
    EXPECT_THROW(build_from_hex({"187935CDE", "7094", "4C2B", "A0F4DD7D512DD261"}),
                 std::invalid_argument);
    EXPECT_THROW(build_from_hex({"87935CDE", "70945", "4C2B", "A0F4DD7D512DD261"}),
                 std::invalid_argument);
    EXPECT_THROW(build_from_hex({"87935CDE", "7094", "4C2B", "A0F4DD7D512DD2"}),
                 std::invalid_argument);
    EXPECT_THROW(build_from_hex({"8793XCDE", "7094", "4C2B", "A0F4DD7D512DD261"}),
                 std::invalid_argument);
    EXPECT_THROW(build_from_hex({"", "7094", "4C2B", "A0F4DD7D512DD261"}),
                 std::invalid_argument);
}

TEST_F(CommandsTest, BuildCommandPrintsDetails) {
    Config config;
    config.command = "build";
    config.args = {"87935CDE", "7094", "4C2B", "A0F4DD7D512DD261"};

    EXPECT_EQ(run(config), 0);
    EXPECT_THAT(out_.str(), HasSubstr(kCanonical));
}

TEST_F(CommandsTest, BuildCommandReportsError) {
    Config config;
    config.command = "build";
    config.args = {"87935CDE", "7094", "4C2B", "nothex"};

    EXPECT_EQ(run(config), 1);
    EXPECT_THAT(err_.str(), HasSubstr("data4"));
}

TEST_F(CommandsTest, UnknownCommandFails) {
    Config config;
    config.command = "explode";

    EXPECT_EQ(run(config), 1);
    EXPECT_THAT(err_.str(), HasSubstr("Unknown command"));
}

// =============================================================================
// Formatter
// =============================================================================

TEST(OutputFormatterTest, TextListOnePerLine) {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter formatter(false, out, err);

    formatter.print_guids({core::Guid::parse(kCanonical), core::Guid::nil()});
    EXPECT_EQ(out.str(),
              "87935CDE-7094-4C2B-A0F4-DD7D512DD261\n"
              "00000000-0000-0000-0000-000000000000\n");
}

TEST(OutputFormatterTest, JsonModeToggle) {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter formatter(false, out, err);
    EXPECT_FALSE(formatter.is_json_mode());

    formatter.set_json_mode(true);
    formatter.print_guids({core::Guid::nil()});
    EXPECT_EQ(out.str(), "[\"00000000-0000-0000-0000-000000000000\"]\n");
}

TEST(OutputFormatterTest, JsonDetailsForSeveralGuidsIsArray) {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter formatter(true, out, err);

    formatter.print_details({core::Guid::nil(), core::Guid::nil()});
    EXPECT_THAT(out.str(), StartsWith("[{\"value\""));
}
