#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace protocol {

// First frame of every transfer: "<archive-name>\n<declared-size>\n"
struct TransferHeader {
    std::string archive_name;
    uint64_t size;
};

struct ParsedHeader {
    TransferHeader header;
    std::string remainder; // bytes after the second newline, already archive data
};

std::string serialize_header(const TransferHeader& header);

// Splits accumulated header text into name, size and remainder. Returns
// nullopt while fewer than two newlines have arrived.
// Throws errors::MalformedHeaderError if the name or size is unusable.
std::optional<ParsedHeader> parse_header(const std::string& text);

std::string ack_message(const std::string& archive_name);

} // namespace protocol
