/**
 * @file itinerary.cpp
 * @brief Names, id generation and JSON encoding for itineraries.
 */

#include "itinerary.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>

namespace commute {

namespace {

std::atomic<unsigned long long> g_itinerary_counter{0};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

}  // namespace

const char* to_string(Metric metric) {
    switch (metric) {
        case Metric::Time: return "TIME";
        case Metric::Distance: return "DISTANCE";
        case Metric::Cost: return "COST";
    }
    return "TIME";
}

const char* to_string(RouteCategory category) {
    switch (category) {
        case RouteCategory::Fastest: return "FASTEST";
        case RouteCategory::Cheapest: return "CHEAPEST";
        case RouteCategory::Shortest: return "SHORTEST";
    }
    return "FASTEST";
}

const char* to_string(TransportMode mode) {
    switch (mode) {
        case TransportMode::Bus: return "BUS";
        case TransportMode::Jeep: return "JEEP";
        case TransportMode::EJeep: return "E_JEEP";
        case TransportMode::Tricycle: return "TRICYCLE";
        case TransportMode::Mixed: return "MIXED";
        case TransportMode::Walk: return "WALK";
        case TransportMode::Car: return "CAR";
    }
    return "CAR";
}

std::optional<Metric> parse_metric(const std::string& text) {
    std::string upper = to_upper(text);
    if (upper == "TIME") return Metric::Time;
    if (upper == "DISTANCE") return Metric::Distance;
    if (upper == "COST") return Metric::Cost;
    return std::nullopt;
}

TransportMode transport_mode_from_vehicle(const std::string& vehicle_kind) {
    std::string upper = to_upper(vehicle_kind);
    if (upper == "BUS") return TransportMode::Bus;
    if (upper == "JEEP") return TransportMode::Jeep;
    if (upper == "E_JEEP") return TransportMode::EJeep;
    if (upper == "TRICYCLE") return TransportMode::Tricycle;
    if (upper == "MIXED") return TransportMode::Mixed;
    if (upper == "WALK") return TransportMode::Walk;
    return TransportMode::Car;
}

RouteCategory category_for(Metric metric) {
    switch (metric) {
        case Metric::Distance: return RouteCategory::Shortest;
        case Metric::Cost: return RouteCategory::Cheapest;
        case Metric::Time: break;
    }
    return RouteCategory::Fastest;
}

std::string next_itinerary_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    unsigned long long n = ++g_itinerary_counter;
    return "route-" + std::to_string(ms) + "-" + std::to_string(n);
}

void to_json(json& j, const Coordinate& c) {
    j = json{{"lat", c.latitude}, {"lng", c.longitude}};
}

void to_json(json& j, const RouteLeg& leg) {
    j = json{
        {"instruction", leg.instruction},
        {"type", to_string(leg.mode)},
        {"distance", leg.distance_meters},
        {"duration", leg.duration_seconds},
        {"way_points", {leg.waypoints.first, leg.waypoints.second}}
    };
}

void to_json(json& j, const Itinerary& itinerary) {
    j = json{
        {"id", itinerary.id},
        {"total_time_min", itinerary.total_time_min},
        {"total_distance_km", itinerary.total_distance_km},
        {"total_cost", itinerary.total_cost},
        {"path", itinerary.path},
        {"steps", itinerary.legs},
        {"type", to_string(itinerary.category)},
        {"tags", itinerary.labels}
    };
}

}  // namespace commute
