/**
 * @file commands.hpp
 * @brief guidgen command implementations
 */

#pragma once

#include <guidkit/app/config.hpp>
#include <guidkit/app/output_formatter.hpp>
#include <guidkit/core/guid.hpp>

#include <string>
#include <vector>

namespace guidkit::app {

/**
 * @brief Dispatch config.command
 * @return Process exit code (0 = success, 1 = at least one failure)
 */
int run_command(const Config& config, OutputFormatter& output);

int run_new(const Config& config, OutputFormatter& output);
int run_parse(const Config& config, OutputFormatter& output);
int run_build(const Config& config, OutputFormatter& output);

/**
 * @brief Build a GUID from four hex fields ("0x" prefix optional)
 *
 * data1 takes up to 8 digits, data2 and data3 up to 4, data4 exactly 16.
 *
 * @throws std::invalid_argument naming the offending field
 */
core::Guid build_from_hex(const std::vector<std::string>& fields);

} // namespace guidkit::app
