#include "config.hpp"

#include <fstream>
#include <limits>

namespace sfuctl {

namespace {

using json = nlohmann::json;

const json& Field(const json& j, const char* key, json::value_t type) {
    const auto& value = j.at(key);
    bool numeric = type == json::value_t::number_unsigned && value.is_number_integer();
    if (value.type() != type && !numeric) {
        throw ConfigError(std::string("config field '") + key + "' has wrong type " + value.type_name());
    }
    return value;
}

} // namespace

Config ParseConfig(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    Config config;

    if (j.contains("port")) {
        auto port = Field(j, "port", json::value_t::number_unsigned).get<int64_t>();
        if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError("config field 'port' out of range: " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);
    }

    if (j.contains("enable_tls")) {
        config.enableTls = Field(j, "enable_tls", json::value_t::boolean).get<bool>();
    }

    if (j.contains("adaptation_interval_ms")) {
        auto interval = Field(j, "adaptation_interval_ms", json::value_t::number_unsigned).get<int64_t>();
        if (interval <= 0) {
            throw ConfigError("config field 'adaptation_interval_ms' must be positive");
        }
        config.adaptationInterval = std::chrono::milliseconds(interval);
    }

    if (j.contains("log_level")) {
        config.logLevel = Field(j, "log_level", json::value_t::string).get<std::string>();
    }

    if (j.contains("preferred_video_codec")) {
        config.preferredVideoCodec = Field(j, "preferred_video_codec", json::value_t::string).get<std::string>();
    }

    if (j.contains("ice_servers")) {
        for (const auto& server : Field(j, "ice_servers", json::value_t::array)) {
            if (!server.is_string()) {
                throw ConfigError("config field 'ice_servers' must contain strings");
            }
            config.iceServers.push_back(server.get<std::string>());
        }
    }

    return config;
}

Config LoadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("invalid config file " + path + ": " + e.what());
    }
    return ParseConfig(j);
}

} // namespace sfuctl
