/**
 * @file commute_engine.hpp
 * @brief Inbound operations of the routing & geocoding engine.
 */

#pragma once

#include "geocoding_gateway.hpp"
#include "location_search.hpp"
#include "pathfinder.hpp"
#include "route_variants.hpp"
#include "transit_graph.hpp"

#include <optional>
#include <string>
#include <vector>

namespace commute {

/**
 * @brief Static-graph routing plus the provider-backed live mode.
 *
 * Owns the graph for the process lifetime; the gateway is borrowed.
 */
class CommuteEngine {
public:
    CommuteEngine(TransitGraph graph, GeocodingGateway& gateway);

    CommuteEngine(const CommuteEngine&) = delete;
    CommuteEngine& operator=(const CommuteEngine&) = delete;

    /**
     * @brief Route over the transit graph. nullopt means no path.
     */
    std::optional<Itinerary> compute_graph_route(const Coordinate& start, const Coordinate& end,
                                                 Metric metric) const;

    /**
     * @brief Driving directions from the provider. nullopt when unreachable.
     */
    std::optional<Itinerary> compute_live_route(const Coordinate& start, const Coordinate& end);

    static RouteVariants expand(const Itinerary& base) { return expand_variants(base); }

    Sequenced<std::vector<Place>> search(const std::string& query) {
        return gateway_.search_places(query);
    }

    Sequenced<std::optional<AreaLabel>> reverse_geocode(const Coordinate& point) {
        return gateway_.reverse_geocode(point);
    }

    std::vector<Terminal> terminals() const { return list_terminals(graph_); }

    std::vector<LocationMatch> search_locations(const std::string& query) const {
        return commute::search_locations(graph_, query);
    }

    const TransitGraph& graph() const { return graph_; }

private:
    TransitGraph graph_;
    Pathfinder pathfinder_;
    GeocodingGateway& gateway_;
};

}  // namespace commute
