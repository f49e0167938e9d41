/**
 * @file output_formatter.hpp
 * @brief Text and JSON rendering of guidgen results
 */

#pragma once

#include <guidkit/core/guid.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace guidkit::app {

/**
 * @brief Output formatter supporting plain text and JSON
 *
 * Results go to the output stream. In text mode errors go to the error
 * stream; in JSON mode they are emitted as {"error": ...} on the output
 * stream so that a consumer sees one JSON document per line.
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr);

    void set_json_mode(bool enabled);
    bool is_json_mode() const { return json_mode_; }

    /**
     * @brief One canonical GUID per line, or a JSON array of strings.
     */
    void print_guids(const std::vector<core::Guid>& guids);

    /**
     * @brief Canonical form plus data1..data4 for each GUID.
     */
    void print_details(const std::vector<core::Guid>& guids);

    void print_error(const std::string& message);

    void flush();

private:
    bool json_mode_;
    std::ostream& out_;
    std::ostream& err_;

    std::vector<std::pair<std::string, std::string>> describe(const core::Guid& guid) const;
    std::string details_json(const core::Guid& guid) const;
    std::string escape_json_string(const std::string& s) const;
};

} // namespace guidkit::app
