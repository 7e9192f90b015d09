/**
 * @file geocoding_gateway.cpp
 * @brief Gateway calls, throttling and fallback.
 */

#include "geocoding_gateway.hpp"
#include "text_utils.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace commute {

namespace {

std::string format_coord(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

// Parses a provider body, treating non-2xx as a failure.
json decode(const HttpResponse& response) {
    if (!response.ok()) {
        throw TransportError("provider returned HTTP " + std::to_string(response.status));
    }
    return json::parse(response.body);
}

}  // namespace

// ============================================================
// FALLBACK DATA
// ============================================================

const std::vector<Place>& fallback_places() {
    static const std::vector<Place> places = {
        {"Tandang Sora Palengke", "Tandang Sora Ave, Quezon City", {14.6741, 121.0359}},
        {"Visayas Avenue Junction", "Visayas Ave, Quezon City", {14.6650, 121.0450}},
        {"Commonwealth Market", "Commonwealth Ave, Quezon City", {14.6680, 121.0550}},
        {"UP Ayala Technohub", "Commonwealth Ave, Diliman, QC", {14.6575, 121.0580}},
        {"SM City North EDSA", "North Avenue, Quezon City", {14.6560, 121.0290}},
        {"Trinoma Mall", "North Avenue, Quezon City", {14.6540, 121.0330}},
        {"Quezon City Hall", "Kalayaan Ave, Quezon City", {14.6460, 121.0490}},
        {"Iglesia Ni Cristo (Central)", "Commonwealth Ave, Quezon City", {14.6610, 121.0540}},
        {"Culiat High School", "Tandang Sora Ave, Quezon City", {14.6620, 121.0500}},
    };
    return places;
}

std::vector<Place> search_fallback_places(const std::string& query) {
    std::string needle = to_lower(query);
    std::vector<Place> matches;
    for (const auto& p : fallback_places()) {
        if (to_lower(p.name).find(needle) != std::string::npos ||
            to_lower(p.address).find(needle) != std::string::npos) {
            matches.push_back(p);
        }
    }
    return matches;
}

AreaLabel coordinate_area_label(const Coordinate& position) {
    return {"Location Coordinates",
            format_coord(position.latitude) + ", " + format_coord(position.longitude)};
}

// ============================================================
// GATEWAY
// ============================================================

GeocodingGateway::GeocodingGateway(GatewayConfig config, HttpTransport& transport,
                                   RateLimiter& limiter)
    : config_(std::move(config)), transport_(transport), limiter_(limiter) {}

std::vector<std::string> GeocodingGateway::auth_headers() const {
    std::vector<std::string> headers{"Accept: application/json, application/geo+json"};
    if (!config_.api_key.empty()) {
        headers.push_back("Authorization: " + config_.api_key);
    }
    return headers;
}

Sequenced<std::vector<Place>> GeocodingGateway::search_places(const std::string& query) {
    Sequenced<std::vector<Place>> result;
    result.sequence = next_sequence();
    if (utf16_length(query) < kMinSearchQueryLength) return result;

    limiter_.acquire(config_.search_interval);

    try {
        std::string url = config_.base_url + "/geocode/search?api_key=" + url_encode(config_.api_key) +
                          "&text=" + url_encode(query) +
                          "&boundary.country=" + url_encode(config_.country) +
                          "&size=" + std::to_string(config_.search_size);
        result.value = parse_search_response(decode(transport_.get(url, auth_headers())));
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Geocoding failed, using fallback data: " << e.what() << "\n";
        result.value = search_fallback_places(query);
        result.from_fallback = true;
    }
    return result;
}

Sequenced<std::optional<AreaLabel>> GeocodingGateway::reverse_geocode(const Coordinate& position) {
    Sequenced<std::optional<AreaLabel>> result;
    result.sequence = next_sequence();

    limiter_.acquire(config_.reverse_interval);

    try {
        std::ostringstream url;
        url << std::setprecision(10) << config_.base_url
            << "/geocode/reverse?api_key=" << url_encode(config_.api_key)
            << "&point.lat=" << position.latitude
            << "&point.lon=" << position.longitude
            << "&size=1&boundary.country=" << url_encode(config_.country);

        auto props = parse_reverse_response(decode(transport_.get(url.str(), auth_headers())));
        if (props) {
            result.value = select_area_label(*props);
        } else {
            result.value = AreaLabel{"Unknown Location", "Address not found"};
        }
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Reverse geocode failed, using generic name: " << e.what() << "\n";
        result.value = coordinate_area_label(position);
        result.from_fallback = true;
    }
    return result;
}

Sequenced<std::optional<Itinerary>> GeocodingGateway::fetch_directions(const Coordinate& start,
                                                                       const Coordinate& end) {
    Sequenced<std::optional<Itinerary>> result;
    result.sequence = next_sequence();

    limiter_.acquire(config_.directions_interval);

    try {
        json body = {
            {"coordinates", {{start.longitude, start.latitude}, {end.longitude, end.latitude}}},
            {"instructions", true},
            {"language", "en"},
            {"units", "km"}
        };
        std::string url = config_.base_url + "/v2/directions/driving-car/geojson";

        auto directions = parse_directions_response(
            decode(transport_.post_json(url, body.dump(), auth_headers())));
        if (!directions) {
            std::cout << "[gateway] Directions returned no route\n";
            return result;
        }
        if (directions->geometry.size() < 2) {
            std::cerr << "[gateway] Directions geometry has fewer than two points\n";
            return result;
        }
        result.value = itinerary_from_directions(*directions);
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Routing error: " << e.what() << "\n";
    }
    return result;
}

}  // namespace commute
