#pragma once

#include <string>
#include <filesystem>

namespace naming {

// Marker prepended on the receiving side so a received file never
// overwrites an input of the same name.
inline constexpr const char* RECEIVED_PREFIX = "new_";

// "archive_<8 hex digits>.tar", random part from libsodium
std::string generate_archive_name();

// Unique path for the sender's temporary archive
std::filesystem::path temp_archive_path();

// Where a received file called `name` is written inside `output_dir`
std::filesystem::path received_path(const std::filesystem::path& output_dir, const std::string& name);

} // namespace naming
