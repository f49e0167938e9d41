/**
 * @file main.cpp
 * @brief guidgen entry point
 *
 * Thin executable over the guidkit core: generates, validates and builds
 * GUIDs from the command line.
 */

#include <guidkit/app/commands.hpp>
#include <guidkit/app/config.hpp>
#include <guidkit/app/output_formatter.hpp>
#include <guidkit/utils/logger.hpp>

#include <exception>
#include <iostream>

using namespace guidkit;
using namespace guidkit::app;

#ifndef GUIDKIT_VERSION
#define GUIDKIT_VERSION "0.0.0"
#endif

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (!config.error.empty()) {
        std::cerr << "Error: " << config.error << "\n\n";
        printUsage(argv[0], std::cerr);
        return 1;
    }
    if (config.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (config.version) {
        std::cout << "guidgen version " << GUIDKIT_VERSION << "\n";
        return 0;
    }

    utils::Logger::instance().setLevel(
        utils::parseLogLevel(config.log_level, utils::LogLevel::WARN));

    try {
        OutputFormatter output(config.json);
        return run_command(config, output);
    } catch (const std::exception& e) {
        LOG_ERROR("guidgen", "Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
