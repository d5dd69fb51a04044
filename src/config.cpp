#include "config.hpp"
#include "errors.hpp"
#include <fstream>

namespace config {

Settings load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw errors::ConfigError("Could not open config file: " + path);
    }
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return j.get<Settings>();
    } catch (const nlohmann::json::exception& e) {
        throw errors::ConfigError("Invalid config file " + path + ": " + e.what());
    }
}

unsigned short parse_port(const std::string& value) {
    if (value.empty() || value.size() > 5 || value.find_first_not_of("0123456789") != std::string::npos) {
        throw errors::ConfigError("Invalid port: '" + value + "'");
    }
    unsigned long port = std::stoul(value);
    if (port == 0 || port > 65535) {
        throw errors::ConfigError("Port out of range: " + value);
    }
    return static_cast<unsigned short>(port);
}

std::pair<std::string, unsigned short> parse_endpoint(const std::string& endpoint) {
    std::size_t colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw errors::ConfigError("Invalid server format: '" + endpoint + "'. Expected host:port");
    }
    return {endpoint.substr(0, colon), parse_port(endpoint.substr(colon + 1))};
}

} // namespace config
