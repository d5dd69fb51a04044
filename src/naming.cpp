#include "naming.hpp"
#include <sodium.h>
#include <random>
#include <sstream>
#include <iomanip>
#include <iostream>

namespace naming {

std::string generate_archive_name() {
    unsigned char bytes[4];
    if (sodium_init() < 0) {
        std::cerr << "libsodium initialization failed!\n";
        // Fallback to std::random_device
        std::random_device rd;
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(rd() & 0xff);
        }
    } else {
        randombytes_buf(bytes, sizeof(bytes));
    }

    std::ostringstream oss;
    oss << "archive_";
    for (unsigned char b : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    oss << ".tar";
    return oss.str();
}

std::filesystem::path temp_archive_path() {
    return std::filesystem::temp_directory_path() / generate_archive_name();
}

std::filesystem::path received_path(const std::filesystem::path& output_dir, const std::string& name) {
    return output_dir / (std::string(RECEIVED_PREFIX) + name);
}

} // namespace naming
