/**
 * @file geocoding_gateway.hpp
 * @brief Throttled OpenRouteService client with local fallback data.
 */

#pragma once

#include "http_transport.hpp"
#include "itinerary.hpp"
#include "provider_response.hpp"
#include "rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace commute {

/**
 * @brief Gateway result stamped with its request sequence number.
 *
 * Sequence numbers increase monotonically per gateway, in the order the
 * calls were issued, so a caller can drop a response that arrives after a
 * newer one was applied.
 */
template <typename T>
struct Sequenced {
    uint64_t sequence = 0;
    T value;
    bool from_fallback = false;  ///< Served from local data after a provider failure
};

struct GatewayConfig {
    std::string base_url = "https://api.openrouteservice.org";
    std::string api_key;
    std::string country = "PH";
    int search_size = 5;
    std::chrono::milliseconds search_interval{1000};
    std::chrono::milliseconds reverse_interval{500};
    std::chrono::milliseconds directions_interval{1000};
};

/// Queries shorter than this never reach the provider.
constexpr size_t kMinSearchQueryLength = 3;

/**
 * @brief Known places served when place search cannot reach the provider.
 */
const std::vector<Place>& fallback_places();

/**
 * @brief Case-insensitive substring match on name or address.
 */
std::vector<Place> search_fallback_places(const std::string& query);

/**
 * @brief Label used when reverse geocoding fails: coordinates at 4 decimals.
 */
AreaLabel coordinate_area_label(const Coordinate& position);

class GeocodingGateway {
public:
    /**
     * @param transport HTTP seam, must outlive the gateway
     * @param limiter Shared throttle, must outlive the gateway
     */
    GeocodingGateway(GatewayConfig config, HttpTransport& transport, RateLimiter& limiter);

    /**
     * @brief Free-text place search scoped to the configured country.
     *
     * Queries under three characters return empty without any call.
     * Provider failures fall back to the known-place list.
     */
    Sequenced<std::vector<Place>> search_places(const std::string& query);

    /**
     * @brief Nearest labelled feature for a position.
     *
     * Never empty in practice: provider failure yields the coordinate label,
     * an empty feature collection yields "Unknown Location".
     */
    Sequenced<std::optional<AreaLabel>> reverse_geocode(const Coordinate& position);

    /**
     * @brief Driving directions as a FASTEST itinerary with fare estimate.
     * @return value is nullopt on provider failure; there is no fallback
     */
    Sequenced<std::optional<Itinerary>> fetch_directions(const Coordinate& start,
                                                         const Coordinate& end);

    const GatewayConfig& config() const { return config_; }

private:
    uint64_t next_sequence() { return ++sequence_; }
    std::vector<std::string> auth_headers() const;

    GatewayConfig config_;
    HttpTransport& transport_;
    RateLimiter& limiter_;
    std::atomic<uint64_t> sequence_{0};
};

}  // namespace commute
