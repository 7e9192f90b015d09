/**
 * @file location_search.cpp
 * @brief Terminal listing and local hybrid search.
 */

#include "location_search.hpp"
#include "itinerary.hpp"
#include "text_utils.hpp"


namespace commute {

namespace {

const std::vector<std::string>& known_streets() {
    static const std::vector<std::string> streets = {
        "1 Sampaguita Ave, Quezon City, 1107 Metro Manila",
        "25 Banlat Road, Tandang Sora, Quezon City, 1116 Metro Manila",
        "St. James College, Mindanao Ave, Quezon City, 1100 Metro Manila",
        "Cherry Foodarama, Congressional Ave, Quezon City, 1100 Metro Manila",
        "Project 6, Quezon City, 1100 Metro Manila",
        "SM City North EDSA, North Avenue, corner Epifanio de los Santos Ave, Quezon City, 1100 Metro Manila"
    };
    return streets;
}

bool contains(const std::string& haystack, const std::string& lower_needle) {
    return to_lower(haystack).find(lower_needle) != std::string::npos;
}

}  // namespace

std::vector<Terminal> list_terminals(const TransitGraph& graph) {
    std::vector<Terminal> terminals;
    terminals.reserve(graph.node_count());
    for (const auto& n : graph.nodes()) {
        Terminal t;
        t.id = n.id;
        t.name = n.name;
        t.address = n.address;
        t.category = n.category;
        t.position = n.position;
        t.route_count = n.outgoing.size();
        terminals.push_back(std::move(t));
    }
    return terminals;
}

std::vector<LocationMatch> search_locations(const TransitGraph& graph, const std::string& query) {
    std::vector<LocationMatch> results;
    if (utf16_length(query) < 2) return results;

    std::string needle = to_lower(query);

    for (const auto& n : graph.nodes()) {
        if (contains(n.name, needle) || contains(n.address, needle)) {
            results.push_back({n.name, n.address, LocationKind::Terminal});
        }
    }

    for (const auto& street : known_streets()) {
        if (contains(street, needle)) {
            results.push_back({street.substr(0, street.find(',')), street, LocationKind::Location});
        }
    }

    return results;
}

void to_json(json& j, const Terminal& t) {
    j = json{
        {"id", t.id},
        {"name", t.name},
        {"address", t.address},
        {"type", to_string(t.category)},
        {"location", t.position},
        {"rating", t.rating},
        {"route_count", t.route_count}
    };
}

void to_json(json& j, const LocationMatch& m) {
    j = json{
        {"name", m.name},
        {"address", m.address},
        {"type", m.kind == LocationKind::Terminal ? "TERMINAL" : "LOCATION"}
    };
}

}  // namespace commute
