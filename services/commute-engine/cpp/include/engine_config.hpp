/**
 * @file engine_config.hpp
 * @brief Service configuration: defaults, JSON file, environment.
 */

#pragma once

#include "geocoding_gateway.hpp"

#include <string>

namespace commute {

struct EngineConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string graph_path;  ///< Empty: use the built-in district graph
    GatewayConfig provider;
    long provider_timeout_ms = 8000;
};

/**
 * @brief Overlay settings from a JSON config file onto config.
 *
 * Keys that are absent keep their current value. On failure config is
 * left untouched.
 *
 * @return true if the file was read and parsed
 */
bool load_config(const std::string& path, EngineConfig& config);

/**
 * @brief Take the provider API key from ORS_API_KEY when set.
 */
void apply_environment(EngineConfig& config);

}  // namespace commute
