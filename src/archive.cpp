#include "archive.hpp"
#include "errors.hpp"
#include "naming.hpp"
#include <array>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace archive {

namespace {

std::size_t read_up_to(std::istream& in, char* dest, std::size_t count) {
    in.read(dest, static_cast<std::streamsize>(count));
    if (in.bad()) {
        throw errors::DecodeError("I/O error while reading archive");
    }
    return static_cast<std::size_t>(in.gcount());
}

uint64_t parse_field(const std::string& field, const char* what) {
    uint64_t value = 0;
    for (char c : field) {
        if (c < '0' || c > '9') {
            throw errors::CorruptArchiveError(std::string("Error reading header ") + what + ": Got '" + field + "'");
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

// Reads the next entry header. nullopt means the stream ended cleanly on an
// entry boundary; a header cut short anywhere else is corrupt.
std::optional<EntryInfo> read_entry_header(std::istream& in) {
    std::string field(FIELD_WIDTH, '\0');

    std::size_t got = read_up_to(in, field.data(), FIELD_WIDTH);
    if (got == 0) {
        return std::nullopt;
    }
    if (got < FIELD_WIDTH) {
        throw errors::CorruptArchiveError("Error reading header byte size: Got " + std::to_string(got) + " of " +
                                          std::to_string(FIELD_WIDTH) + " bytes");
    }
    EntryInfo entry;
    entry.size = parse_field(field, "byte size");

    got = read_up_to(in, field.data(), FIELD_WIDTH);
    if (got < FIELD_WIDTH) {
        throw errors::CorruptArchiveError("Error reading header filename len: Got " + std::to_string(got) + " of " +
                                          std::to_string(FIELD_WIDTH) + " bytes");
    }
    uint64_t name_len = parse_field(field, "filename len");
    if (name_len == 0) {
        throw errors::CorruptArchiveError("Error reading header filename: zero length name");
    }

    entry.name.resize(static_cast<std::size_t>(name_len));
    got = read_up_to(in, entry.name.data(), entry.name.size());
    if (got < entry.name.size()) {
        throw errors::CorruptArchiveError("Error reading header filename: Got " + std::to_string(got) + " of " +
                                          std::to_string(name_len) + " bytes");
    }
    if (entry.name.find('/') != std::string::npos) {
        throw errors::CorruptArchiveError("Entry name contains a path separator: '" + entry.name + "'");
    }
    return entry;
}

// Moves exactly entry.size bytes from `in` to `out` (or discards them when
// out is null).
void copy_content(std::istream& in, std::ostream* out, const EntryInfo& entry) {
    std::array<char, CHUNK_SIZE> buffer;
    uint64_t remaining = entry.size;
    while (remaining > 0) {
        std::size_t want = remaining < CHUNK_SIZE ? static_cast<std::size_t>(remaining) : CHUNK_SIZE;
        std::size_t got = read_up_to(in, buffer.data(), want);
        if (got == 0) {
            throw errors::TruncatedEntryError("Unexpected end of file while reading " + entry.name + ": " +
                                              std::to_string(remaining) + " bytes missing");
        }
        if (out) {
            out->write(buffer.data(), static_cast<std::streamsize>(got));
            if (!*out) {
                throw errors::DecodeError("Error writing file for entry " + entry.name);
            }
        }
        remaining -= got;
    }
}

} // namespace

std::string format_field(uint64_t value) {
    if (value > MAX_FIELD_VALUE) {
        throw errors::FieldOverflowError(std::to_string(value) + " does not fit in " + std::to_string(FIELD_WIDTH) +
                                         " decimal digits");
    }
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(FIELD_WIDTH) << value;
    return oss.str();
}

void write_archive(const fs::path& output_path, const std::vector<std::string>& files) {
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw errors::EncodeError("Failed to open output file: " + output_path.string());
    }

    std::array<char, CHUNK_SIZE> buffer;
    for (const auto& file : files) {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec)) {
            throw errors::NotFoundError("File: " + file + ": does not exist!");
        }
        uint64_t file_size = fs::file_size(file, ec);
        if (ec) {
            throw errors::EncodeError("Error archiving " + file + ": " + ec.message());
        }

        std::string name = fs::path(file).filename().string();
        std::string header = format_field(file_size) + format_field(name.size()) + name;

        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) {
            throw errors::EncodeError("Error archiving " + file + ": could not open for reading");
        }

        out.write(header.data(), static_cast<std::streamsize>(header.size()));

        // Exactly the size recorded in the header, even if the file changes underneath
        uint64_t remaining = file_size;
        while (remaining > 0 && out) {
            std::size_t want = remaining < CHUNK_SIZE ? static_cast<std::size_t>(remaining) : CHUNK_SIZE;
            in.read(buffer.data(), static_cast<std::streamsize>(want));
            std::streamsize got = in.gcount();
            if (got <= 0) {
                throw errors::EncodeError("Error archiving " + file + ": file shrank while reading");
            }
            out.write(buffer.data(), got);
            remaining -= static_cast<uint64_t>(got);
        }
        if (!out) {
            throw errors::EncodeError("Error archiving " + file + ": write to " + output_path.string() + " failed");
        }
    }

    out.close();
    if (!out) {
        throw errors::EncodeError("Failed to close output file: " + output_path.string());
    }
}

std::vector<fs::path> extract_archive(std::istream& in, const fs::path& output_dir) {
    std::vector<fs::path> written;
    while (auto entry = read_entry_header(in)) {
        fs::path target = naming::received_path(output_dir, entry->name);
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw errors::DecodeError("Error creating file " + target.string());
        }
        copy_content(in, &out, *entry);
        out.close();
        if (!out) {
            throw errors::DecodeError("Error closing file " + target.string());
        }
        written.push_back(target);
    }
    return written;
}

std::vector<fs::path> extract_archive(const fs::path& archive_path, const fs::path& output_dir) {
    std::ifstream in(archive_path, std::ios::binary);
    if (!in.is_open()) {
        throw errors::DecodeError("Failed to open archive file: " + archive_path.string());
    }
    return extract_archive(in, output_dir);
}

std::vector<EntryInfo> list_archive(std::istream& in) {
    std::vector<EntryInfo> entries;
    while (auto entry = read_entry_header(in)) {
        copy_content(in, nullptr, *entry);
        entries.push_back(*entry);
    }
    return entries;
}

} // namespace archive
