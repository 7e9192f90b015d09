/**
 * @file transit_graph.hpp
 * @brief Static district transit graph stored as an index arena.
 *
 * Nodes live in one dense vector and edges point at node indices. The
 * string id -> index map is built once when the graph is finalized, so the
 * search loops never hash strings.
 */

#pragma once

#include "geo_types.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace commute {

using NodeIndex = uint32_t;

enum class TerminalCategory {
    Bus,
    Jeep,
    EJeep,
    Tricycle,
    Mixed
};

enum class EdgeMode {
    Walk,
    Ride
};

const char* to_string(TerminalCategory category);
std::optional<TerminalCategory> parse_terminal_category(const std::string& text);

/**
 * @brief Directed, weighted connection. Every weight is independent.
 */
struct TransitEdge {
    NodeIndex target = 0;
    double distance_km = 0.0;
    double time_min = 0.0;
    double cost = 0.0;
    EdgeMode mode = EdgeMode::Walk;
    std::optional<std::string> vehicle_kind;
};

struct TransitNode {
    std::string id;
    std::string name;
    std::string address;
    Coordinate position;
    TerminalCategory category = TerminalCategory::Mixed;
    std::vector<TransitEdge> outgoing;
};

/**
 * @brief Raised while building a graph with dangling or duplicate ids.
 */
class GraphLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Read-only transit graph.
 */
class TransitGraph {
public:
    /**
     * @brief Incremental construction with string-keyed edges.
     *
     * Edges may name nodes added later; targets are resolved by build().
     */
    class Builder {
    public:
        Builder& add_node(const std::string& id, const std::string& name,
                          const std::string& address, Coordinate position,
                          TerminalCategory category);

        Builder& add_edge(const std::string& from, const std::string& to,
                          double distance_km, double time_min, double cost,
                          EdgeMode mode,
                          std::optional<std::string> vehicle_kind = std::nullopt);

        /**
         * @brief Resolve ids and produce the graph.
         * @throws GraphLoadError on duplicate node ids, unknown edge endpoints,
         *         or an edge weight that is negative, NaN or infinite
         */
        TransitGraph build() const;

    private:
        struct PendingEdge {
            std::string from;
            std::string to;
            double distance_km;
            double time_min;
            double cost;
            EdgeMode mode;
            std::optional<std::string> vehicle_kind;
        };

        std::vector<TransitNode> nodes_;
        std::vector<PendingEdge> edges_;
    };

    /**
     * @brief The compiled-in Tandang Sora district graph.
     */
    static TransitGraph district();

    /**
     * @brief Load a graph from a JSON file (same schema as the district data).
     * @param path JSON file path
     * @param out Receives the graph on success
     * @return true if successful
     */
    static bool load_json(const std::string& path, TransitGraph& out);

    /**
     * @brief Closest node by squared planar distance in degrees.
     *
     * Linear scan; ties keep the first node in arena order. Returns nullopt
     * for an empty graph.
     */
    std::optional<NodeIndex> find_nearest_node(const Coordinate& point) const;

    /**
     * @brief Same lookup, reported as the node's string id.
     */
    std::optional<std::string> resolve(const Coordinate& point) const;

    std::optional<NodeIndex> index_of(const std::string& id) const;

    const TransitNode& node(NodeIndex index) const { return nodes_[index]; }
    const std::vector<TransitNode>& nodes() const { return nodes_; }
    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const;
    bool empty() const { return nodes_.empty(); }

private:
    std::vector<TransitNode> nodes_;
    std::unordered_map<std::string, NodeIndex> index_by_id_;
};

}  // namespace commute
