/**
 * @file route_assembler.hpp
 * @brief Turns a node path into an itinerary with legs and totals.
 */

#pragma once

#include "itinerary.hpp"
#include "transit_graph.hpp"

#include <string>
#include <vector>

namespace commute {

/**
 * @brief Weight of an edge under the given metric.
 */
double edge_weight(const TransitEdge& edge, Metric metric);

class RouteAssembler {
public:
    explicit RouteAssembler(const TransitGraph& graph) : graph_(graph) {}

    /**
     * @brief Build an itinerary from consecutive graph nodes.
     *
     * For each hop the leg uses the first outgoing edge to the next node
     * with the smallest metric weight, which is the edge the pathfinder
     * relaxed. Totals are raw km / min / fare sums.
     *
     * @param path Node indices, at least two
     * @param metric Metric the path was optimized for
     * @throws std::invalid_argument if the path is shorter than two nodes or
     *         a hop has no connecting edge
     */
    Itinerary assemble(const std::vector<NodeIndex>& path, Metric metric) const;

    /**
     * @brief Same as above with string node ids.
     * @throws std::invalid_argument on unknown ids
     */
    Itinerary assemble(const std::vector<std::string>& node_ids, Metric metric) const;

private:
    const TransitEdge* find_edge(NodeIndex from, NodeIndex to, Metric metric) const;

    const TransitGraph& graph_;
};

}  // namespace commute
