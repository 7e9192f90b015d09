/**
 * @file transit_graph.cpp
 * @brief Graph construction, JSON loading and nearest-node lookup.
 */

#include "transit_graph.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>

namespace commute {

using json = nlohmann::json;

const char* to_string(TerminalCategory category) {
    switch (category) {
        case TerminalCategory::Bus: return "BUS";
        case TerminalCategory::Jeep: return "JEEP";
        case TerminalCategory::EJeep: return "E_JEEP";
        case TerminalCategory::Tricycle: return "TRICYCLE";
        case TerminalCategory::Mixed: return "MIXED";
    }
    return "MIXED";
}

std::optional<TerminalCategory> parse_terminal_category(const std::string& text) {
    if (text == "BUS") return TerminalCategory::Bus;
    if (text == "JEEP") return TerminalCategory::Jeep;
    if (text == "E_JEEP") return TerminalCategory::EJeep;
    if (text == "TRICYCLE") return TerminalCategory::Tricycle;
    if (text == "MIXED") return TerminalCategory::Mixed;
    return std::nullopt;
}

// ============================================================
// BUILDER
// ============================================================

TransitGraph::Builder& TransitGraph::Builder::add_node(
    const std::string& id, const std::string& name, const std::string& address,
    Coordinate position, TerminalCategory category) {
    TransitNode node;
    node.id = id;
    node.name = name;
    node.address = address;
    node.position = position;
    node.category = category;
    nodes_.push_back(std::move(node));
    return *this;
}

TransitGraph::Builder& TransitGraph::Builder::add_edge(
    const std::string& from, const std::string& to, double distance_km,
    double time_min, double cost, EdgeMode mode,
    std::optional<std::string> vehicle_kind) {
    edges_.push_back({from, to, distance_km, time_min, cost, mode, std::move(vehicle_kind)});
    return *this;
}

TransitGraph TransitGraph::Builder::build() const {
    TransitGraph graph;
    graph.nodes_ = nodes_;

    for (NodeIndex i = 0; i < graph.nodes_.size(); ++i) {
        auto inserted = graph.index_by_id_.emplace(graph.nodes_[i].id, i);
        if (!inserted.second) {
            throw GraphLoadError("Duplicate node id '" + graph.nodes_[i].id + "'");
        }
    }

    // Edges keep their insertion order per source node
    for (const auto& pe : edges_) {
        auto from_it = graph.index_by_id_.find(pe.from);
        if (from_it == graph.index_by_id_.end()) {
            throw GraphLoadError("Edge source '" + pe.from + "' not found in graph");
        }
        auto to_it = graph.index_by_id_.find(pe.to);
        if (to_it == graph.index_by_id_.end()) {
            throw GraphLoadError("Edge target '" + pe.to + "' not found in graph");
        }

        // Dijkstra needs non-negative weights; legs report them as-is
        for (double w : {pe.distance_km, pe.time_min, pe.cost}) {
            if (!std::isfinite(w) || w < 0.0) {
                throw GraphLoadError("Edge '" + pe.from + "' -> '" + pe.to +
                                     "' has a negative or non-finite weight");
            }
        }

        TransitEdge edge;
        edge.target = to_it->second;
        edge.distance_km = pe.distance_km;
        edge.time_min = pe.time_min;
        edge.cost = pe.cost;
        edge.mode = pe.mode;
        edge.vehicle_kind = pe.vehicle_kind;
        graph.nodes_[from_it->second].outgoing.push_back(std::move(edge));
    }

    return graph;
}

// ============================================================
// DISTRICT DATA
// ============================================================

TransitGraph TransitGraph::district() {
    Builder b;
    b.add_node("ts_palengke", "Tandang Sora Palengke",
               "Tandang Sora Palengke, Tandang Sora Ave, Quezon City, 1116 Metro Manila",
               {14.6741, 121.0359}, TerminalCategory::Mixed)
     .add_node("visayas_ave", "Visayas Avenue Junction",
               "Visayas Avenue, corner Tandang Sora Ave, Quezon City, 1128 Metro Manila",
               {14.6650, 121.0450}, TerminalCategory::Jeep)
     .add_node("comm_ave", "Commonwealth Avenue",
               "Commonwealth Ave, Diliman, Quezon City, 1101 Metro Manila",
               {14.6680, 121.0550}, TerminalCategory::Bus)
     .add_node("technohub", "UP Ayala Technohub",
               "UP Ayala Technohub, Commonwealth Ave, Diliman, Quezon City, 1101 Metro Manila",
               {14.6575, 121.0580}, TerminalCategory::EJeep)
     .add_node("culiat_tricycle", "Culiat Tricycle Toda",
               "Culiat High School, Tandang Sora Ave, Quezon City, 1128 Metro Manila",
               {14.6620, 121.0500}, TerminalCategory::Tricycle);

    b.add_edge("ts_palengke", "visayas_ave", 2.5, 15, 13, EdgeMode::Ride, std::string("JEEP"))
     .add_edge("ts_palengke", "comm_ave", 3.0, 20, 15, EdgeMode::Ride, std::string("JEEP"))
     .add_edge("visayas_ave", "ts_palengke", 2.5, 15, 13, EdgeMode::Ride, std::string("JEEP"))
     .add_edge("visayas_ave", "technohub", 4.0, 25, 20, EdgeMode::Ride, std::string("BUS"))
     .add_edge("comm_ave", "ts_palengke", 3.0, 20, 15, EdgeMode::Ride, std::string("JEEP"))
     .add_edge("comm_ave", "technohub", 1.5, 5, 0, EdgeMode::Walk)
     .add_edge("technohub", "visayas_ave", 4.0, 25, 20, EdgeMode::Ride, std::string("BUS"))
     .add_edge("culiat_tricycle", "visayas_ave", 1.0, 10, 20, EdgeMode::Ride, std::string("TRICYCLE"));

    return b.build();
}

// ============================================================
// LOADING - JSON
// ============================================================

bool TransitGraph::load_json(const std::string& path, TransitGraph& out) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "[graph] File not found: " << path << "\n";
        return false;
    }

    try {
        json doc = json::parse(file);
        Builder b;

        for (const auto& n : doc.at("nodes")) {
            std::string id = n.at("id").get<std::string>();
            std::string type = n.value("terminal_type", "MIXED");
            auto category = parse_terminal_category(type);
            if (!category) {
                throw GraphLoadError("Unknown terminal_type '" + type + "' on node '" + id + "'");
            }

            b.add_node(id, n.value("name", id), n.value("address", ""),
                       {n.at("lat").get<double>(), n.at("lng").get<double>()}, *category);

            if (!n.contains("connections")) continue;
            for (const auto& c : n["connections"]) {
                std::string type_str = c.value("type", "WALK");
                EdgeMode mode = (type_str == "RIDE") ? EdgeMode::Ride : EdgeMode::Walk;
                std::optional<std::string> vehicle;
                if (c.contains("vehicle_type")) vehicle = c["vehicle_type"].get<std::string>();

                b.add_edge(id, c.at("target_id").get<std::string>(),
                           c.value("distance_km", 0.0), c.value("time_min", 0.0),
                           c.value("cost", 0.0), mode, vehicle);
            }
        }

        out = b.build();
        std::cout << "[graph] Loaded " << out.node_count() << " nodes, "
                  << out.edge_count() << " edges from " << path << "\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[graph] Error loading " << path << ": " << e.what() << "\n";
        return false;
    }
}

// ============================================================
// LOOKUP
// ============================================================

std::optional<NodeIndex> TransitGraph::find_nearest_node(const Coordinate& point) const {
    std::optional<NodeIndex> nearest;
    double best = std::numeric_limits<double>::infinity();

    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        double d = planar_distance_sq(nodes_[i].position, point);
        if (d < best) {
            best = d;
            nearest = i;
        }
    }
    return nearest;
}

std::optional<std::string> TransitGraph::resolve(const Coordinate& point) const {
    auto idx = find_nearest_node(point);
    if (!idx) return std::nullopt;
    return nodes_[*idx].id;
}

std::optional<NodeIndex> TransitGraph::index_of(const std::string& id) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) return std::nullopt;
    return it->second;
}

size_t TransitGraph::edge_count() const {
    size_t total = 0;
    for (const auto& n : nodes_) total += n.outgoing.size();
    return total;
}

}  // namespace commute
