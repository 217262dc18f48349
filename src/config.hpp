#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sfuctl {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    uint16_t port = 8000;
    bool enableTls = false;
    std::chrono::milliseconds adaptationInterval{5000};
    std::string logLevel = "info";
    std::string preferredVideoCodec;
    std::vector<std::string> iceServers;
};

Config ParseConfig(const nlohmann::json& j);
Config LoadConfig(const std::string& path);

} // namespace sfuctl
