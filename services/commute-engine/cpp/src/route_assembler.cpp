/**
 * @file route_assembler.cpp
 * @brief Route assembly implementation.
 */

#include "route_assembler.hpp"

#include <stdexcept>

namespace commute {

double edge_weight(const TransitEdge& edge, Metric metric) {
    switch (metric) {
        case Metric::Time: return edge.time_min;
        case Metric::Distance: return edge.distance_km;
        case Metric::Cost: return edge.cost;
    }
    return edge.time_min;
}

const TransitEdge* RouteAssembler::find_edge(NodeIndex from, NodeIndex to, Metric metric) const {
    const TransitEdge* best = nullptr;
    for (const auto& e : graph_.node(from).outgoing) {
        if (e.target != to) continue;
        if (!best || edge_weight(e, metric) < edge_weight(*best, metric)) {
            best = &e;
        }
    }
    return best;
}

Itinerary RouteAssembler::assemble(const std::vector<NodeIndex>& path, Metric metric) const {
    if (path.size() < 2) {
        throw std::invalid_argument("Route needs at least two nodes");
    }

    Itinerary it;
    it.id = next_itinerary_id();
    it.category = category_for(metric);
    switch (metric) {
        case Metric::Time: it.labels = {"Fastest"}; break;
        case Metric::Distance: it.labels = {"Shortest"}; break;
        case Metric::Cost: it.labels = {"Cheapest"}; break;
    }

    for (NodeIndex idx : path) {
        if (idx >= graph_.node_count()) {
            throw std::invalid_argument("Node index " + std::to_string(idx) + " out of range");
        }
        it.path.push_back(graph_.node(idx).position);
    }

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const TransitEdge* edge = find_edge(path[i], path[i + 1], metric);
        if (!edge) {
            throw std::invalid_argument("No edge from '" + graph_.node(path[i]).id +
                                        "' to '" + graph_.node(path[i + 1]).id + "'");
        }

        const TransitNode& dest = graph_.node(path[i + 1]);
        RouteLeg leg;
        if (edge->mode == EdgeMode::Walk) {
            leg.instruction = "Walk to " + dest.name;
            leg.mode = TransportMode::Walk;
        } else {
            std::string vehicle = edge->vehicle_kind.value_or("");
            leg.instruction = "Ride " + vehicle + " to " + dest.name;
            leg.mode = transport_mode_from_vehicle(vehicle);
        }
        leg.distance_meters = edge->distance_km * 1000.0;
        leg.duration_seconds = edge->time_min * 60.0;
        leg.waypoints = {0, 0};  // not tracked for graph routes
        it.legs.push_back(std::move(leg));

        it.total_time_min += edge->time_min;
        it.total_distance_km += edge->distance_km;
        it.total_cost += edge->cost;
    }

    return it;
}

Itinerary RouteAssembler::assemble(const std::vector<std::string>& node_ids, Metric metric) const {
    std::vector<NodeIndex> path;
    path.reserve(node_ids.size());
    for (const auto& id : node_ids) {
        auto idx = graph_.index_of(id);
        if (!idx) {
            throw std::invalid_argument("Unknown node id '" + id + "'");
        }
        path.push_back(*idx);
    }
    return assemble(path, metric);
}

}  // namespace commute
