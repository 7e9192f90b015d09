/**
 * @file pathfinder.hpp
 * @brief Single-source shortest path over the static transit graph.
 */

#pragma once

#include "itinerary.hpp"
#include "route_assembler.hpp"
#include "transit_graph.hpp"

#include <optional>
#include <string>
#include <vector>

namespace commute {

/**
 * @brief Result of a shortest path query.
 */
struct QueryResult {
    double distance = -1.0;        ///< Summed metric weight
    std::vector<NodeIndex> path;   ///< Node sequence, source first
    bool reachable = false;        ///< True if a path was found
    std::string error;             ///< Error description if not reachable
};

class Pathfinder {
public:
    explicit Pathfinder(const TransitGraph& graph) : graph_(graph), assembler_(graph) {}

    /**
     * @brief Dijkstra from source to target under one metric.
     *
     * Selection order is (distance, node index), so equal-distance ties
     * always settle the lowest index first. Stops as soon as the target is
     * settled or nothing reachable is left.
     */
    QueryResult query(NodeIndex source, NodeIndex target, Metric metric) const;

    /**
     * @brief Snap both coordinates to graph nodes and route between them.
     * @return nullopt if either end does not resolve, both resolve to the
     *         same node, or the nodes are disconnected
     */
    std::optional<Itinerary> shortest_path(const Coordinate& start, const Coordinate& end,
                                           Metric metric) const;

private:
    const TransitGraph& graph_;
    RouteAssembler assembler_;
};

}  // namespace commute
