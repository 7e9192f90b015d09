/**
 * @file pathfinder.cpp
 * @brief Heap-based Dijkstra with deterministic tie-breaking.
 */

#include "pathfinder.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <limits>
#include <queue>

namespace commute {

// ============================================================
// PRIORITY QUEUE ENTRIES
// ============================================================

namespace {

struct PQEntry {
    double dist;
    NodeIndex node;
    bool operator>(const PQEntry& o) const {
        if (dist != o.dist) return dist > o.dist;
        return node > o.node;
    }
};

using MinHeap = std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>>;

}  // namespace

QueryResult Pathfinder::query(NodeIndex source, NodeIndex target, Metric metric) const {
    constexpr double INF = std::numeric_limits<double>::infinity();
    const size_t n = graph_.node_count();

    if (source >= n) {
        return {-1, {}, false, "Source node " + std::to_string(source) + " not found in graph"};
    }
    if (target >= n) {
        return {-1, {}, false, "Target node " + std::to_string(target) + " not found in graph"};
    }

    std::vector<double> dist(n, INF);
    std::vector<NodeIndex> parent(n);
    std::vector<bool> settled(n, false);
    for (NodeIndex i = 0; i < n; ++i) parent[i] = i;

    MinHeap pq;
    dist[source] = 0.0;
    pq.push({0.0, source});

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();

        if (settled[u] || d > dist[u]) continue;
        settled[u] = true;
        if (u == target) break;

        for (const auto& e : graph_.node(u).outgoing) {
            if (settled[e.target]) continue;

            double nd = d + edge_weight(e, metric);
            if (nd < dist[e.target]) {
                dist[e.target] = nd;
                parent[e.target] = u;
                pq.push({nd, e.target});
            }
        }
    }

    if (dist[target] == INF) {
        return {-1, {}, false, "No path found between source and target"};
    }

    // Reconstruct path
    std::vector<NodeIndex> path;
    NodeIndex curr = target;
    while (true) {
        path.push_back(curr);
        if (parent[curr] == curr) break;
        curr = parent[curr];
    }
    std::reverse(path.begin(), path.end());

    if (path.front() != source) {
        return {-1, {}, false, "Path does not originate at source"};
    }

    return {dist[target], path, true, ""};
}

std::optional<Itinerary> Pathfinder::shortest_path(const Coordinate& start, const Coordinate& end,
                                                   Metric metric) const {
    auto source = graph_.find_nearest_node(start);
    auto target = graph_.find_nearest_node(end);

    if (!source || !target) {
        std::cerr << "[pathfinder] Endpoint did not resolve to a graph node\n";
        return std::nullopt;
    }
    if (*source == *target) {
        std::cout << "[pathfinder] Start and end snap to '" << graph_.node(*source).id
                  << "', no route\n";
        return std::nullopt;
    }

    QueryResult result = query(*source, *target, metric);
    if (!result.reachable) {
        std::cout << "[pathfinder] " << graph_.node(*source).id << " -> "
                  << graph_.node(*target).id << ": " << result.error << "\n";
        return std::nullopt;
    }

    return assembler_.assemble(result.path, metric);
}

}  // namespace commute
