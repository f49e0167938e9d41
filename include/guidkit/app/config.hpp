/**
 * @file config.hpp
 * @brief guidgen configuration and CLI parsing
 */

#pragma once

#include <guidkit/utils/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace guidkit {
namespace app {

/// Upper bound for --count
constexpr uint32_t MAX_COUNT = 1000000;

/**
 * @brief guidgen configuration structure
 */
struct Config {
    std::string command = "new";       ///< new, parse or build (lowercase)
    std::vector<std::string> args;     ///< Command arguments, case-preserved
    uint32_t count = 1;                ///< Identifiers generated by "new"
    bool json = false;
    std::string log_level = "WARN";
    bool help = false;
    bool version = false;
    std::string error;                 ///< Set when the command line is invalid
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name, std::ostream& out = std::cout) {
    out << "guidgen - GUID generation and inspection tool\n\n"
        << "Usage: " << program_name << " [OPTIONS] [COMMAND] [ARGS...]\n\n"
        << "Commands:\n"
        << "  new                       Generate random GUIDs (default)\n"
        << "  parse <text>...           Validate GUIDs and show their fields\n"
        << "  build <d1> <d2> <d3> <d4> Build a GUID from hex fields\n"
        << "                            (d1: 8 digits, d2/d3: 4 digits, d4: 16 digits)\n"
        << "\nOptions:\n"
        << "  --count <n>         Number of GUIDs for 'new', 1 to 1000000 (default: 1)\n"
        << "  --json              Output in JSON format\n"
        << "  --log-level <level> TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: WARN)\n"
        << "  --version           Show version information\n"
        << "  --help              Show this help message\n\n"
        << "Example:\n"
        << "  " << program_name << " --count 5\n"
        << "  " << program_name << " parse 87935CDE-7094-4C2B-A0F4-DD7D512DD261\n"
        << "  " << program_name << " --json build 87935CDE 7094 4C2B A0F4DD7D512DD261\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; on error, help is set and error describes it
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto fail = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }
        if (std::strcmp(arg, "--version") == 0) {
            config.version = true;
            return config;
        }
        if (std::strcmp(arg, "--json") == 0) {
            config.json = true;
            continue;
        }

        if (arg[0] != '-') {
            // First non-option argument is the command, the rest are its args
            std::string command = arg;
            std::transform(command.begin(), command.end(), command.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            config.command = command;
            for (int j = i + 1; j < argc; ++j) {
                config.args.push_back(argv[j]);
            }
            break;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return fail(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        if (std::strcmp(arg, "--count") == 0) {
            // Digits only; std::stoul alone would accept " 7" or "5abc"
            if (!std::isdigit(static_cast<unsigned char>(value[0]))) {
                return fail(std::string("Invalid count: ") + value);
            }
            unsigned long count = 0;
            size_t pos = 0;
            try {
                count = std::stoul(value, &pos);
            } catch (const std::exception&) {
                return fail(std::string("Invalid count: ") + value);
            }
            if (pos != std::strlen(value) || count == 0) {
                return fail(std::string("Invalid count: ") + value);
            }
            if (count > MAX_COUNT) {
                return fail(std::string("Count ") + value + " exceeds the maximum of " +
                            std::to_string(MAX_COUNT));
            }
            config.count = static_cast<uint32_t>(count);
        } else if (std::strcmp(arg, "--log-level") == 0) {
            utils::LogLevel level;
            if (!utils::tryParseLogLevel(value, level)) {
                return fail(std::string("Unknown log level ") + value);
            }
            config.log_level = value;
        } else {
            return fail(std::string("Unknown option ") + arg);
        }
    }

    if (config.command != "new" && config.command != "parse" && config.command != "build") {
        return fail("Unknown command " + config.command);
    }

    return config;
}

}  // namespace app
}  // namespace guidkit
