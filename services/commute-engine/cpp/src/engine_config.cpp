/**
 * @file engine_config.cpp
 * @brief Config file loading.
 */

#include "engine_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace commute {

using json = nlohmann::json;

bool load_config(const std::string& path, EngineConfig& config) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "[config] Config file not found: " << path << "\n";
        return false;
    }

    try {
        json doc = json::parse(file);
        EngineConfig c = config;

        // Server settings
        if (doc.contains("host")) c.host = doc["host"].get<std::string>();
        if (doc.contains("port")) c.port = doc["port"].get<int>();
        if (doc.contains("graph_path")) c.graph_path = doc["graph_path"].get<std::string>();

        if (doc.contains("provider")) {
            const json& p = doc["provider"];
            c.provider.base_url = p.value("base_url", c.provider.base_url);
            c.provider.api_key = p.value("api_key", c.provider.api_key);
            c.provider.country = p.value("country", c.provider.country);
            c.provider.search_size = p.value("search_size", c.provider.search_size);
            c.provider_timeout_ms = p.value("timeout_ms", c.provider_timeout_ms);
        }

        if (doc.contains("throttle")) {
            const json& t = doc["throttle"];
            c.provider.search_interval = std::chrono::milliseconds(
                t.value("search_interval_ms", static_cast<long>(c.provider.search_interval.count())));
            c.provider.reverse_interval = std::chrono::milliseconds(
                t.value("reverse_interval_ms", static_cast<long>(c.provider.reverse_interval.count())));
            c.provider.directions_interval = std::chrono::milliseconds(
                t.value("directions_interval_ms", static_cast<long>(c.provider.directions_interval.count())));
        }

        config = c;
        std::cout << "[config] Loaded config from: " << path << "\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[config] Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void apply_environment(EngineConfig& config) {
    if (const char* key = std::getenv("ORS_API_KEY")) {
        config.provider.api_key = key;
    }
}

}  // namespace commute
