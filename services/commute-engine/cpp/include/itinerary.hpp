/**
 * @file itinerary.hpp
 * @brief Routed itinerary types shared by graph mode and live mode.
 */

#pragma once

#include "geo_types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace commute {

using json = nlohmann::json;

/**
 * @brief Weight dimension the pathfinder optimizes for.
 */
enum class Metric {
    Time,      ///< Edge timeMin
    Distance,  ///< Edge distanceKm
    Cost       ///< Edge fare
};

enum class RouteCategory {
    Fastest,
    Cheapest,
    Shortest
};

enum class TransportMode {
    Bus,
    Jeep,
    EJeep,
    Tricycle,
    Mixed,
    Walk,
    Car
};

/**
 * @brief One leg of an itinerary ("step").
 */
struct RouteLeg {
    std::string instruction;
    TransportMode mode = TransportMode::Car;
    double distance_meters = 0.0;
    double duration_seconds = 0.0;
    std::pair<int, int> waypoints{0, 0};  ///< Indices into Itinerary::path
};

/**
 * @brief One fully computed trip plan.
 *
 * Built once per request and handed to the caller by value.
 */
struct Itinerary {
    std::string id;
    double total_time_min = 0.0;
    double total_distance_km = 0.0;
    double total_cost = 0.0;
    std::vector<Coordinate> path;
    std::vector<RouteLeg> legs;
    RouteCategory category = RouteCategory::Fastest;
    std::vector<std::string> labels;
};

// ============================================================
// NAMES
// ============================================================

const char* to_string(Metric metric);
const char* to_string(RouteCategory category);
const char* to_string(TransportMode mode);

/**
 * @brief Parse "time" / "distance" / "cost" (case-insensitive).
 */
std::optional<Metric> parse_metric(const std::string& text);

/**
 * @brief Map a vehicle kind ("JEEP", "BUS", ...) to a transport mode.
 * Unknown kinds map to TransportMode::Car.
 */
TransportMode transport_mode_from_vehicle(const std::string& vehicle_kind);

RouteCategory category_for(Metric metric);

/**
 * @brief Fresh itinerary id, unique for the lifetime of the process.
 *
 * Format: route-<epoch millis>-<counter>.
 */
std::string next_itinerary_id();

// ============================================================
// JSON
// ============================================================

void to_json(json& j, const Coordinate& c);
void to_json(json& j, const RouteLeg& leg);
void to_json(json& j, const Itinerary& itinerary);

}  // namespace commute
