/**
 * @file commands.cpp
 * @brief guidgen command implementations
 */

#include <guidkit/app/commands.hpp>
#include <guidkit/utils/logger.hpp>

#include <stdexcept>

namespace guidkit::app {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

uint64_t parse_hex_field(const std::string& name, const std::string& text,
                         size_t max_digits, bool exact) {
    std::string digits = text;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }

    if (digits.empty() || digits.size() > max_digits || (exact && digits.size() != max_digits)) {
        throw std::invalid_argument("Invalid " + name + " '" + text + "': expected " +
                                    (exact ? "exactly " : "up to ") +
                                    std::to_string(max_digits) + " hex digits");
    }

    uint64_t value = 0;
    for (char c : digits) {
        int v = hex_value(c);
        if (v < 0) {
            throw std::invalid_argument("Invalid " + name + " '" + text + "': not hexadecimal");
        }
        value = (value << 4) | static_cast<uint64_t>(v);
    }
    return value;
}

} // anonymous namespace

core::Guid build_from_hex(const std::vector<std::string>& fields) {
    if (fields.size() != 4) {
        throw std::invalid_argument("build expects 4 fields, got " + std::to_string(fields.size()));
    }

    auto data1 = static_cast<uint32_t>(parse_hex_field("data1", fields[0], 8, false));
    auto data2 = static_cast<uint16_t>(parse_hex_field("data2", fields[1], 4, false));
    auto data3 = static_cast<uint16_t>(parse_hex_field("data3", fields[2], 4, false));
    uint64_t tail = parse_hex_field("data4", fields[3], 16, true);

    core::Guid::Data4 data4{};
    for (size_t i = 0; i < data4.size(); ++i) {
        data4[i] = static_cast<uint8_t>(tail >> (8 * (data4.size() - 1 - i)));
    }
    return core::Guid::fromComponents(data1, data2, data3, data4);
}

int run_new(const Config& config, OutputFormatter& output) {
    std::vector<core::Guid> guids;
    guids.reserve(config.count);
    for (uint32_t i = 0; i < config.count; ++i) {
        guids.push_back(core::Guid::random());
    }
    LOG_DEBUG("guidgen", "Generated {} GUID(s)", guids.size());
    output.print_guids(guids);
    return 0;
}

int run_parse(const Config& config, OutputFormatter& output) {
    if (config.args.empty()) {
        output.print_error("parse expects at least one GUID");
        return 1;
    }

    std::vector<core::Guid> parsed;
    int rc = 0;
    for (const auto& text : config.args) {
        try {
            parsed.push_back(core::Guid::parse(text));
        } catch (const core::ParseError& e) {
            LOG_INFO("guidgen", "Rejected '{}'", e.input());
            output.print_error(std::string(e.what()) + ", got '" + e.input() + "'");
            rc = 1;
        }
    }

    if (!parsed.empty()) {
        output.print_details(parsed);
    }
    return rc;
}

int run_build(const Config& config, OutputFormatter& output) {
    try {
        output.print_details({build_from_hex(config.args)});
        return 0;
    } catch (const std::invalid_argument& e) {
        output.print_error(e.what());
        return 1;
    }
}

int run_command(const Config& config, OutputFormatter& output) {
    LOG_DEBUG("guidgen", "Running command '{}' with {} argument(s)",
              config.command, config.args.size());

    int rc = 1;
    if (config.command == "new") {
        rc = run_new(config, output);
    } else if (config.command == "parse") {
        rc = run_parse(config, output);
    } else if (config.command == "build") {
        rc = run_build(config, output);
    } else {
        output.print_error("Unknown command " + config.command);
    }
    output.flush();
    return rc;
}

} // namespace guidkit::app
