// =============================================================================
// config.cpp - JSON configuration loader
// =============================================================================

#include "flash/config.hpp"
#include "flash/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace flash {

using json = nlohmann::json;

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid config JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }

    Config config;
    try {
        if (doc.contains("log_level")) {
            config.log_level = doc.at("log_level").get<std::string>();
            log::parse_level(config.log_level);  // validate
        }
        if (doc.contains("max_lock_depth")) {
            int64_t depth = doc.at("max_lock_depth").get<int64_t>();
            if (depth < 0 || depth > UINT32_MAX) {
                throw ConfigError("max_lock_depth out of range: " + std::to_string(depth));
            }
            config.max_lock_depth = static_cast<uint32_t>(depth);
        }
        if (doc.contains("manager_address")) {
            config.manager_address =
                addresses::from_hex(doc.at("manager_address").get<std::string>());
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

void Config::apply_logging() const {
    log::set_level(log::parse_level(log_level));
}

} // namespace flash
