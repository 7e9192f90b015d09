/**
 * @file provider_response.cpp
 * @brief OpenRouteService payload parsing.
 */

#include "provider_response.hpp"
#include "route_variants.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace commute {

namespace {

std::optional<std::string> non_empty_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    std::string value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

// GeoJSON positions are [lon, lat]
Coordinate from_lon_lat(const json& pos) {
    return {pos.at(1).get<double>(), pos.at(0).get<double>()};
}

const std::string& first_of(std::initializer_list<const std::optional<std::string>*> fields,
                            const std::string& fallback) {
    for (const auto* f : fields) {
        if (*f && !(*f)->empty()) return **f;
    }
    return fallback;
}

}  // namespace

// ============================================================
// PARSING
// ============================================================

std::vector<Place> parse_search_response(const json& doc) {
    std::vector<Place> places;
    auto features = doc.find("features");
    if (features == doc.end() || !features->is_array()) return places;

    for (const auto& f : *features) {
        const json& props = f.at("properties");
        Place p;
        p.name = props.value("name", "");
        p.address = props.value("label", p.name);
        p.position = from_lon_lat(f.at("geometry").at("coordinates"));
        places.push_back(std::move(p));
    }
    return places;
}

std::optional<ReverseGeocodeProperties> parse_reverse_response(const json& doc) {
    auto features = doc.find("features");
    if (features == doc.end() || !features->is_array() || features->empty()) {
        return std::nullopt;
    }

    const json& props = features->front().at("properties");
    ReverseGeocodeProperties out;
    out.neighbourhood = non_empty_string(props, "neighbourhood");
    out.locality = non_empty_string(props, "locality");
    out.borough = non_empty_string(props, "borough");
    out.county = non_empty_string(props, "county");
    out.region = non_empty_string(props, "region");
    out.name = non_empty_string(props, "name");
    out.street = non_empty_string(props, "street");
    out.label = non_empty_string(props, "label");
    return out;
}

std::optional<DirectionsResponse> parse_directions_response(const json& doc) {
    auto features = doc.find("features");
    if (features == doc.end() || !features->is_array() || features->empty()) {
        return std::nullopt;
    }

    const json& feature = features->front();
    const json& props = feature.at("properties");

    DirectionsResponse out;
    for (const auto& pos : feature.at("geometry").at("coordinates")) {
        out.geometry.push_back(from_lon_lat(pos));
    }

    if (props.contains("segments")) {
        for (const auto& segment : props["segments"]) {
            if (!segment.contains("steps")) continue;
            for (const auto& s : segment["steps"]) {
                DirectionsStep step;
                step.instruction = s.value("instruction", "");
                step.distance_km = s.value("distance", 0.0);
                step.duration_sec = s.value("duration", 0.0);
                if (s.contains("way_points") && s["way_points"].size() >= 2) {
                    step.waypoints = {s["way_points"][0].get<int>(), s["way_points"][1].get<int>()};
                }
                out.steps.push_back(std::move(step));
            }
        }
    }

    const json& summary = props.at("summary");
    out.distance_km = summary.value("distance", 0.0);
    out.duration_sec = summary.value("duration", 0.0);
    return out;
}

// ============================================================
// NORMALIZATION
// ============================================================

AreaLabel select_area_label(const ReverseGeocodeProperties& props) {
    static const std::string kUnknownLocation = "Unknown Location";
    static const std::string kUnknownArea = "Unknown Area";

    AreaLabel label;
    label.short_name = first_of({&props.neighbourhood, &props.locality, &props.borough,
                                 &props.county, &props.region},
                                kUnknownLocation);
    label.area_label = first_of({&props.name, &props.street, &props.label}, kUnknownArea);
    return label;
}

double fare_for_distance(double distance_km) {
    return std::ceil(kBaseFare + std::max(0.0, (distance_km - kBaseFareKm) * kFarePerExtraKm));
}

Itinerary itinerary_from_directions(const DirectionsResponse& response) {
    Itinerary it;
    it.id = next_itinerary_id();
    it.total_time_min = std::ceil(response.duration_sec / 60.0);
    it.total_distance_km = round2(response.distance_km);
    it.total_cost = fare_for_distance(response.distance_km);
    it.path = response.geometry;
    it.category = RouteCategory::Fastest;
    it.labels = {"Fare", "Distance", "Time"};

    for (const auto& s : response.steps) {
        RouteLeg leg;
        leg.instruction = s.instruction;
        leg.mode = TransportMode::Car;
        leg.distance_meters = std::max(0.0, s.distance_km * 1000.0);
        leg.duration_seconds = std::max(0.0, s.duration_sec);
        leg.waypoints = s.waypoints;
        it.legs.push_back(std::move(leg));
    }
    return it;
}

void to_json(json& j, const Place& place) {
    j = json{
        {"name", place.name},
        {"address", place.address},
        {"lat", place.position.latitude},
        {"lng", place.position.longitude}
    };
}

void to_json(json& j, const AreaLabel& label) {
    j = json{{"name", label.short_name}, {"area", label.area_label}};
}

}  // namespace commute
