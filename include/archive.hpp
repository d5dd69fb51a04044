#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace archive {

// Entry layout: size (8 ascii digits) | name length (8 ascii digits) | name | content
// No entry count and no terminator: the archive ends where the stream ends.
constexpr std::size_t FIELD_WIDTH = 8;
constexpr uint64_t MAX_FIELD_VALUE = 99999999;
constexpr std::size_t CHUNK_SIZE = 4096;

struct EntryInfo {
    std::string name;
    uint64_t size;
};

// Zero padded to FIELD_WIDTH digits. Throws errors::FieldOverflowError above MAX_FIELD_VALUE.
std::string format_field(uint64_t value);

// Creates/truncates output_path and appends every file in order.
// Not transactional: a failure leaves the partial archive behind.
void write_archive(const std::filesystem::path& output_path, const std::vector<std::string>& files);

// Extracts every entry into output_dir (names get the received prefix) and
// returns the paths written, in archive order. A failing entry aborts the rest.
std::vector<std::filesystem::path> extract_archive(std::istream& in, const std::filesystem::path& output_dir);
std::vector<std::filesystem::path> extract_archive(const std::filesystem::path& archive_path,
                                                   const std::filesystem::path& output_dir);

// Walks the archive without writing anything
std::vector<EntryInfo> list_archive(std::istream& in);

} // namespace archive
