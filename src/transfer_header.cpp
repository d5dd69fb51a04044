#include "protocol/transfer_header.hpp"
#include "errors.hpp"
#include <limits>

namespace protocol {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    std::size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

std::string serialize_header(const TransferHeader& header) {
    return header.archive_name + "\n" + std::to_string(header.size) + "\n";
}

std::optional<ParsedHeader> parse_header(const std::string& text) {
    std::size_t first = text.find('\n');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    std::size_t second = text.find('\n', first + 1);
    if (second == std::string::npos) {
        return std::nullopt;
    }

    ParsedHeader parsed;
    parsed.header.archive_name = trim(text.substr(0, first));
    if (parsed.header.archive_name.empty() ||
        parsed.header.archive_name.find('/') != std::string::npos) {
        throw errors::MalformedHeaderError("invalid archive name: '" + parsed.header.archive_name + "'");
    }

    std::string size_str = trim(text.substr(first + 1, second - first - 1));
    if (size_str.empty()) {
        throw errors::MalformedHeaderError("missing declared size");
    }
    uint64_t size = 0;
    for (char c : size_str) {
        if (c < '0' || c > '9') {
            throw errors::MalformedHeaderError("declared size is not a number: '" + size_str + "'");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (size > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw errors::MalformedHeaderError("declared size out of range: '" + size_str + "'");
        }
        size = size * 10 + digit;
    }
    parsed.header.size = size;
    parsed.remainder = text.substr(second + 1);
    return parsed;
}

std::string ack_message(const std::string& archive_name) {
    return "Received and extracted " + archive_name + "\n";
}

} // namespace protocol
