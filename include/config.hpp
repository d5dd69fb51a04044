#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <nlohmann/json.hpp>

namespace config {

constexpr unsigned short DEFAULT_PORT = 50001;

struct Settings {
    std::string bind_address = "127.0.0.1";
    unsigned short listen_port = DEFAULT_PORT;
    std::string server = "127.0.0.1:50001";
    std::string output_dir = ".";
    bool debug = false;
    bool keep_archive = false;
};

// Missing keys keep their defaults
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Settings, bind_address, listen_port, server, output_dir, debug,
                                                keep_archive)

// Throws errors::ConfigError if the file cannot be read or parsed
Settings load(const std::string& path);

// "host:port" -> {host, port}. Throws errors::ConfigError.
std::pair<std::string, unsigned short> parse_endpoint(const std::string& endpoint);

unsigned short parse_port(const std::string& value);

} // namespace config
