/**
 * @file commute_engine.cpp
 * @brief Engine facade.
 */

#include "commute_engine.hpp"

#include <iostream>

namespace commute {

CommuteEngine::CommuteEngine(TransitGraph graph, GeocodingGateway& gateway)
    : graph_(std::move(graph)), pathfinder_(graph_), gateway_(gateway) {}

std::optional<Itinerary> CommuteEngine::compute_graph_route(const Coordinate& start,
                                                            const Coordinate& end,
                                                            Metric metric) const {
    if (!start.in_range() || !end.in_range()) {
        std::cerr << "[engine] Coordinates outside lat/lng range, routing anyway\n";
    }
    return pathfinder_.shortest_path(start, end, metric);
}

std::optional<Itinerary> CommuteEngine::compute_live_route(const Coordinate& start,
                                                           const Coordinate& end) {
    auto reply = gateway_.fetch_directions(start, end);
    return std::move(reply.value);
}

}  // namespace commute
