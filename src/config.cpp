// =============================================================================
// config.cpp - Engine configuration and logging setup
// =============================================================================

#include "amm/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace amm {

// Simple TOML parser (sections and scalar keys only)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (ends_with(path_str, ".json")) return from_json(buffer.str());
    return from_toml(buffer.str());
}

EngineConfig EngineConfig::from_toml(std::string_view content) {
    EngineConfig config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                current_section = trim(line.substr(1, end - 1));
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "engine") {
            if (key == "address") config.engine_address = address_from_hex(value);
            else if (key == "protocol_fee_controller") config.protocol_fee_controller = address_from_hex(value);
        }
        else if (current_section == "logging") {
            if (key == "level") config.log_level = value;
        }
    }

    return config;
}

EngineConfig EngineConfig::from_json(std::string_view content) {
    EngineConfig config;
    nlohmann::json j = nlohmann::json::parse(content);

    if (j.contains("engine")) {
        const auto& engine = j.at("engine");
        if (engine.contains("address")) {
            config.engine_address = address_from_hex(engine.at("address").get<std::string>());
        }
        if (engine.contains("protocol_fee_controller")) {
            config.protocol_fee_controller =
                address_from_hex(engine.at("protocol_fee_controller").get<std::string>());
        }
    }
    if (j.contains("logging")) {
        config.log_level = j.at("logging").value("level", config.log_level);
    }
    return config;
}

void init_logging(const std::string& level) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    spdlog::set_level(parsed);
    spdlog::debug("Log level set to {}", level);
}

} // namespace amm
