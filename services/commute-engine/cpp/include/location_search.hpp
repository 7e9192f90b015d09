/**
 * @file location_search.hpp
 * @brief Terminal listing and offline location search.
 */

#pragma once

#include "transit_graph.hpp"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace commute {

using json = nlohmann::json;

struct Terminal {
    std::string id;
    std::string name;
    std::string address;
    TerminalCategory category = TerminalCategory::Mixed;
    Coordinate position;
    double rating = 4.5;
    size_t route_count = 0;  ///< Outgoing connections
};

enum class LocationKind {
    Terminal,
    Location
};

struct LocationMatch {
    std::string name;
    std::string address;
    LocationKind kind = LocationKind::Location;
};

std::vector<Terminal> list_terminals(const TransitGraph& graph);

/**
 * @brief Hybrid search without the provider.
 *
 * Terminals whose name or address contains the query come first, then
 * known street addresses (named by their first comma-separated part).
 * Case-insensitive; queries shorter than two characters return nothing.
 */
std::vector<LocationMatch> search_locations(const TransitGraph& graph, const std::string& query);

void to_json(json& j, const Terminal& t);
void to_json(json& j, const LocationMatch& m);

}  // namespace commute
