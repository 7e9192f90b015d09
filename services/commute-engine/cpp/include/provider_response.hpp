/**
 * @file provider_response.hpp
 * @brief Typed views of OpenRouteService payloads and their normalization.
 *
 * Everything here is pure: parsing takes an already decoded JSON document
 * and never touches the network, so the field-priority and fare rules can
 * be tested on canned payloads.
 */

#pragma once

#include "itinerary.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace commute {

using json = nlohmann::json;

/// Fare model constants for live directions.
constexpr double kBaseFare = 13.0;
constexpr double kBaseFareKm = 4.0;
constexpr double kFarePerExtraKm = 2.0;

struct Place {
    std::string name;
    std::string address;
    Coordinate position;
};

struct AreaLabel {
    std::string short_name;   ///< Barangay / locality level name
    std::string area_label;   ///< Street or feature label
};

/**
 * @brief Properties of the single feature returned by reverse geocoding.
 * Absent or empty fields are nullopt.
 */
struct ReverseGeocodeProperties {
    std::optional<std::string> neighbourhood;
    std::optional<std::string> locality;
    std::optional<std::string> borough;
    std::optional<std::string> county;
    std::optional<std::string> region;
    std::optional<std::string> name;
    std::optional<std::string> street;
    std::optional<std::string> label;
};

struct DirectionsStep {
    std::string instruction;
    double distance_km = 0.0;
    double duration_sec = 0.0;
    std::pair<int, int> waypoints{0, 0};
};

struct DirectionsResponse {
    std::vector<Coordinate> geometry;
    std::vector<DirectionsStep> steps;
    double distance_km = 0.0;
    double duration_sec = 0.0;
};

// ============================================================
// PARSING
// ============================================================

/**
 * @brief Places from a /geocode/search FeatureCollection.
 * Missing "features" yields an empty list.
 * @throws nlohmann::json::exception on malformed features
 */
std::vector<Place> parse_search_response(const json& doc);

/**
 * @brief Properties of the first /geocode/reverse feature.
 * @return nullopt when the collection has no features
 */
std::optional<ReverseGeocodeProperties> parse_reverse_response(const json& doc);

/**
 * @brief Geometry, steps and summary of the first directions feature.
 * @return nullopt when the collection has no features
 * @throws nlohmann::json::exception on malformed features
 */
std::optional<DirectionsResponse> parse_directions_response(const json& doc);

// ============================================================
// NORMALIZATION
// ============================================================

/**
 * @brief Field-priority rule for reverse geocoding.
 *
 * short name: neighbourhood, locality, borough, county, region, else
 * "Unknown Location". area: name, street, label, else "Unknown Area".
 */
AreaLabel select_area_label(const ReverseGeocodeProperties& props);

/**
 * @brief ceil(13 + max(0, km - 4) * 2)
 */
double fare_for_distance(double distance_km);

/**
 * @brief FASTEST itinerary for a directions response (CAR legs).
 */
Itinerary itinerary_from_directions(const DirectionsResponse& response);

void to_json(json& j, const Place& place);
void to_json(json& j, const AreaLabel& label);

}  // namespace commute
