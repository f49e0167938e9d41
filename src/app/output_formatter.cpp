/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include <guidkit/app/output_formatter.hpp>

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace guidkit::app {

namespace {

std::string hex(uint64_t value, int width) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(width) << value;
    return oss.str();
}

std::string hex_bytes(const core::Guid::Data4& bytes) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(b);
    }
    return oss.str();
}

} // anonymous namespace

OutputFormatter::OutputFormatter(bool json_mode, std::ostream& out, std::ostream& err)
    : json_mode_(json_mode), out_(out), err_(err) {}

void OutputFormatter::set_json_mode(bool enabled) {
    json_mode_ = enabled;
}

void OutputFormatter::print_guids(const std::vector<core::Guid>& guids) {
    if (json_mode_) {
        out_ << "[";
        for (size_t i = 0; i < guids.size(); ++i) {
            if (i > 0) out_ << ",";
            out_ << "\"" << guids[i].toString() << "\"";
        }
        out_ << "]\n";
    } else {
        for (const auto& guid : guids) {
            out_ << guid.toString() << "\n";
        }
    }
}

void OutputFormatter::print_details(const std::vector<core::Guid>& guids) {
    if (json_mode_) {
        if (guids.size() == 1) {
            out_ << details_json(guids.front()) << "\n";
            return;
        }
        out_ << "[";
        for (size_t i = 0; i < guids.size(); ++i) {
            if (i > 0) out_ << ",";
            out_ << details_json(guids[i]);
        }
        out_ << "]\n";
        return;
    }

    for (size_t i = 0; i < guids.size(); ++i) {
        if (i > 0) out_ << "\n";
        auto pairs = describe(guids[i]);
        size_t max_key_len = 0;
        for (const auto& [key, _] : pairs) {
            max_key_len = std::max(max_key_len, key.size());
        }
        for (const auto& [key, value] : pairs) {
            out_ << std::left << std::setw(static_cast<int>(max_key_len + 1)) << (key + ":")
                 << " " << value << "\n";
        }
    }
}

void OutputFormatter::print_error(const std::string& message) {
    if (json_mode_) {
        out_ << R"({"error":")" << escape_json_string(message) << "\"}\n";
    } else {
        err_ << "(error) " << message << "\n";
    }
}

void OutputFormatter::flush() {
    out_.flush();
    err_.flush();
}

std::vector<std::pair<std::string, std::string>> OutputFormatter::describe(
    const core::Guid& guid) const {
    return {
        {"value", guid.toString()},
        {"data1", hex(guid.data1(), 8)},
        {"data2", hex(guid.data2(), 4)},
        {"data3", hex(guid.data3(), 4)},
        {"data4", hex_bytes(guid.data4())},
    };
}

std::string OutputFormatter::details_json(const core::Guid& guid) const {
    std::ostringstream oss;
    oss << "{\"value\":\"" << guid.toString() << "\""
        << ",\"data1\":" << guid.data1()
        << ",\"data2\":" << guid.data2()
        << ",\"data3\":" << guid.data3()
        << ",\"data4\":\"" << hex_bytes(guid.data4()) << "\"}";
    return oss.str();
}

std::string OutputFormatter::escape_json_string(const std::string& s) const {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

} // namespace guidkit::app
