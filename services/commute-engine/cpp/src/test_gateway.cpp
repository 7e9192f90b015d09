/**
 * @file test_gateway.cpp
 * @brief Geocoding gateway against a scripted transport: parsing, fallback,
 * throttling and sequence numbers. No network access.
 *
 * Usage: ./test_gateway
 */

#include "geocoding_gateway.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"
#include "text_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

using namespace commute;
using commute_test::check;
using commute_test::check_near;
using commute_test::FakeClock;
using commute_test::ScriptedTransport;
using json = nlohmann::json;
using std::chrono::milliseconds;

namespace {

GatewayConfig test_config() {
    GatewayConfig config;
    config.base_url = "https://maps.test";
    config.api_key = "test-key";
    return config;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

json search_payload() {
    return {
        {"type", "FeatureCollection"},
        {"features", {
            {{"geometry", {{"coordinates", {121.0290, 14.6560}}}},
             {"properties", {{"name", "SM City North EDSA"},
                             {"label", "SM City North EDSA, Quezon City, Philippines"}}}},
            {{"geometry", {{"coordinates", {121.0330, 14.6540}}}},
             {"properties", {{"name", "Trinoma"}}}}
        }}
    };
}

json reverse_payload(const json& properties) {
    return {{"features", {{{"properties", properties}}}}};
}

json directions_payload(size_t points) {
    json coords = json::array();
    for (size_t i = 0; i < points; ++i) {
        coords.push_back({121.0359 + 0.01 * static_cast<double>(i), 14.6741 - 0.005 * static_cast<double>(i)});
    }
    return {
        {"features", {{
            {"geometry", {{"coordinates", coords}}},
            {"properties", {
                {"segments", {{
                    {"steps", {
                        {{"instruction", "Head east on Tandang Sora Avenue"}, {"distance", 2.5},
                         {"duration", 400.0}, {"way_points", {0, 1}}},
                        {{"instruction", "Turn right onto Commonwealth Avenue"}, {"distance", 3.5},
                         {"duration", 500.0}, {"way_points", {1, 2}}}
                    }}
                }}},
                {"summary", {{"distance", 6.0}, {"duration", 900.0}}}
            }}
        }}}
    };
}

// ============================================================
// TESTS
// ============================================================

void test_short_query() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    auto reply = gateway.search_places("SM");
    check(reply.value.empty(), "two-character query is empty");
    check(!reply.from_fallback, "short query is not a fallback");
    check(transport.requests.empty(), "short query makes no call");
    check(!limiter.last_call().has_value(), "short query does not touch the throttle");
}

void test_query_length_in_characters() {
    check(utf16_length("abc") == 3, "ascii length");
    check(utf16_length("\xE6\x97\xA5\xE6\x9C\xAC") == 2, "two CJK characters count as two");
    check(utf16_length("\xC3\xA9t\xC3\xA9") == 3, "accented letters count once");
    check(utf16_length("\xF0\x9F\x9A\x8C") == 2, "emoji outside the BMP counts as a pair");

    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    gateway.search_places("\xE6\x97\xA5\xE6\x9C\xAC");
    check(transport.requests.empty(), "two multibyte characters are still too short");

    gateway.search_places("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");
    check(transport.requests.size() == 1, "three multibyte characters reach the provider");

    gateway.search_places("\xF0\x9F\x9A\x8C" "a");
    check(transport.requests.size() == 2, "emoji plus a letter reaches the provider");
}

void test_search() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    transport.reply(200, search_payload());
    auto reply = gateway.search_places("SM City");
    check(!reply.from_fallback, "provider answer used");
    check(reply.value.size() == 2, "two places parsed");
    if (reply.value.size() == 2) {
        check(reply.value[0].name == "SM City North EDSA", "place name");
        check(reply.value[0].address == "SM City North EDSA, Quezon City, Philippines", "place address from label");
        check_near(reply.value[0].position.latitude, 14.6560, "GeoJSON latitude is second");
        check_near(reply.value[0].position.longitude, 121.0290, "GeoJSON longitude is first");
        check(reply.value[1].address == "Trinoma", "missing label falls back to name");
    }

    check(transport.requests.size() == 1, "one call");
    const auto& req = transport.requests.front();
    check(req.method == "GET", "search is a GET");
    check(contains(req.url, "https://maps.test/geocode/search?"), "search endpoint");
    check(contains(req.url, "text=SM%20City"), "query text encoded");
    check(contains(req.url, "boundary.country=PH"), "scoped to PH");
    check(contains(req.url, "size=5"), "at most five results");
    check(contains(req.url, "api_key=test-key"), "key in query string");

    transport.fail();
    auto fallback = gateway.search_places("SM City");
    check(fallback.from_fallback, "transport failure served from fallback");
    check(fallback.value.size() == 1 && fallback.value[0].name == "SM City North EDSA",
          "fallback finds SM City North EDSA");

    transport.reply(503, json{{"error", "busy"}});
    auto busy = gateway.search_places("technohub");
    check(busy.from_fallback, "HTTP 503 served from fallback");
    check(busy.value.size() == 1 && busy.value[0].name == "UP Ayala Technohub", "fallback by name");

    transport.reply_raw(200, "<html>not json</html>");
    auto garbled = gateway.search_places("quezon city hall");
    check(garbled.from_fallback, "unparseable body served from fallback");
    check(garbled.value.size() == 1, "fallback match on full name");

    transport.fail();
    auto none = gateway.search_places("zzzz");
    check(none.from_fallback && none.value.empty(), "fallback without matches is empty");
}

void test_fallback_data() {
    check(fallback_places().size() == 9, "nine known places");

    auto north = search_fallback_places("NORTH");
    check(north.size() == 2, "case-insensitive match on name and address");

    AreaLabel label = coordinate_area_label({14.67414, 121.03591});
    check(label.short_name == "Location Coordinates", "coordinate label name");
    check(label.area_label == "14.6741, 121.0359", "coordinate label at four decimals");
}

void test_reverse() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    transport.reply(200, reverse_payload({{"neighbourhood", ""},
                                          {"locality", "Quezon City"},
                                          {"region", "Metro Manila"},
                                          {"name", "Tandang Sora Avenue"},
                                          {"label", "Tandang Sora Avenue, Quezon City"}}));
    auto reply = gateway.reverse_geocode({14.6741, 121.0359});
    check(reply.value.has_value() && !reply.from_fallback, "reverse answered");
    if (reply.value) {
        check(reply.value->short_name == "Quezon City", "empty neighbourhood skipped");
        check(reply.value->area_label == "Tandang Sora Avenue", "name wins over label");
    }
    const auto& req = transport.requests.back();
    check(contains(req.url, "/geocode/reverse?"), "reverse endpoint");
    check(contains(req.url, "point.lat=14.6741") && contains(req.url, "point.lon=121.0359"), "point sent");
    check(contains(req.url, "size=1"), "single feature");

    transport.reply(200, json{{"features", json::array()}});
    auto empty = gateway.reverse_geocode({14.0, 121.0});
    check(empty.value.has_value() && !empty.from_fallback, "empty collection still labelled");
    if (empty.value) {
        check(empty.value->short_name == "Unknown Location", "empty collection name");
        check(empty.value->area_label == "Address not found", "empty collection area");
    }

    transport.fail();
    auto failed = gateway.reverse_geocode({14.6741, 121.0359});
    check(failed.from_fallback && failed.value.has_value(), "failure served from fallback");
    if (failed.value) {
        check(failed.value->short_name == "Location Coordinates", "failure name");
        check(contains(failed.value->area_label, "14.6741"), "failure label has latitude");
        check(contains(failed.value->area_label, "121.0359"), "failure label has longitude");
    }
}

void test_area_label_priority() {
    ReverseGeocodeProperties none;
    AreaLabel unknown = select_area_label(none);
    check(unknown.short_name == "Unknown Location", "no locality fields");
    check(unknown.area_label == "Unknown Area", "no feature fields");

    ReverseGeocodeProperties p;
    p.borough = "Diliman";
    p.county = "Second District";
    p.label = "Diliman, Quezon City";
    AreaLabel l = select_area_label(p);
    check(l.short_name == "Diliman", "borough before county");
    check(l.area_label == "Diliman, Quezon City", "label used when name and street missing");

    p.neighbourhood = "Pasong Tamo";
    p.street = "Tandang Sora Avenue";
    l = select_area_label(p);
    check(l.short_name == "Pasong Tamo", "neighbourhood first");
    check(l.area_label == "Tandang Sora Avenue", "street before label");

    auto parsed = parse_reverse_response(reverse_payload({{"county", "Quezon City"}, {"street", ""}}));
    check(parsed.has_value() && parsed->county == std::optional<std::string>("Quezon City"), "county parsed");
    check(parsed.has_value() && !parsed->street.has_value(), "empty street parsed as absent");
    check(!parse_reverse_response(json::object()).has_value(), "no features key");
}

void test_directions() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    transport.reply(200, directions_payload(3));
    auto reply = gateway.fetch_directions({14.6741, 121.0359}, {14.6575, 121.0580});
    check(reply.value.has_value(), "directions parsed");
    if (reply.value) {
        const Itinerary& it = *reply.value;
        check_near(it.total_time_min, 15, "900 s -> 15 min");
        check_near(it.total_cost, 17, "6 km -> fare 17");
        check_near(it.total_distance_km, 6.0, "distance kept");
        check(it.path.size() == 3, "geometry becomes path");
        check(it.legs.size() == 2, "every step becomes a leg");
        if (it.legs.size() == 2) {
            check_near(it.legs[0].distance_meters, 2500, "step distance in meters");
            check_near(it.legs[1].duration_seconds, 500, "step duration in seconds");
            check(it.legs[1].waypoints == std::make_pair(1, 2), "step waypoints");
            check(it.legs[0].instruction == "Head east on Tandang Sora Avenue", "step instruction");
        }
        check(it.id.rfind("route-", 0) == 0, "itinerary id prefix");
    }

    const auto& req = transport.requests.back();
    check(req.method == "POST", "directions is a POST");
    check(contains(req.url, "/v2/directions/driving-car/geojson"), "driving profile endpoint");
    check(std::find(req.headers.begin(), req.headers.end(), "Authorization: test-key") != req.headers.end(),
          "key sent as Authorization header");
    json body = json::parse(req.body);
    check(body["units"] == "km", "kilometre units requested");
    check(body["coordinates"][0][0] == 121.0359 && body["coordinates"][0][1] == 14.6741,
          "coordinates sent as lon,lat");

    transport.fail();
    auto failed = gateway.fetch_directions({14.6741, 121.0359}, {14.6575, 121.0580});
    check(!failed.value.has_value() && !failed.from_fallback, "failure has no fallback");

    transport.reply(200, directions_payload(1));
    check(!gateway.fetch_directions({0, 0}, {1, 1}).value.has_value(), "single-point geometry rejected");

    transport.reply(200, json{{"features", json::array()}});
    check(!gateway.fetch_directions({0, 0}, {1, 1}).value.has_value(), "no route feature");

    transport.reply(404, json{{"error", {{"code", 2010}}}});
    check(!gateway.fetch_directions({0, 0}, {1, 1}).value.has_value(), "HTTP 404 is a failure");
}

void test_fake_clock_throttle() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    transport.reply(200, search_payload());
    gateway.search_places("SM City");
    check(clock.sleeps.empty(), "first call does not wait");

    transport.reply(200, search_payload());
    gateway.search_places("Trinoma");
    check(clock.sleeps.size() == 1 && clock.sleeps.back() == milliseconds(1000),
          "back-to-back search waits 1000 ms");

    clock.advance(milliseconds(300));
    transport.reply(200, reverse_payload({{"locality", "Quezon City"}}));
    gateway.reverse_geocode({14.6741, 121.0359});
    check(clock.sleeps.size() == 2 && clock.sleeps.back() == milliseconds(200),
          "reverse waits the rest of its 500 ms");

    transport.reply(200, directions_payload(2));
    gateway.fetch_directions({14.6741, 121.0359}, {14.6575, 121.0580});
    check(clock.sleeps.size() == 3 && clock.sleeps.back() == milliseconds(1000),
          "directions shares the last-call time");

    clock.advance(milliseconds(5000));
    transport.fail();
    gateway.search_places("SM City");
    check(clock.sleeps.size() == 3, "no wait after a long pause");

    gateway.search_places("ab");
    check(clock.sleeps.size() == 3, "short query never sleeps");

    GatewayConfig fast = test_config();
    fast.reverse_interval = milliseconds(50);
    FakeClock clock2;
    RateLimiter limiter2(clock2);
    GeocodingGateway tuned(fast, transport, limiter2);
    transport.fail();
    transport.fail();
    tuned.reverse_geocode({0, 0});
    tuned.reverse_geocode({0, 0});
    check(clock2.sleeps.size() == 1 && clock2.sleeps.back() == milliseconds(50), "interval is configurable");
}

void test_wall_clock_throttle() {
    SteadyClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    transport.reply(200, search_payload());
    transport.reply(200, search_payload());
    transport.reply(200, reverse_payload({{"locality", "Quezon City"}}));
    std::vector<Clock::time_point> calls;
    gateway.search_places("SM City");
    calls.push_back(*limiter.last_call());
    gateway.search_places("Trinoma");
    calls.push_back(*limiter.last_call());
    gateway.reverse_geocode({14.6741, 121.0359});
    calls.push_back(*limiter.last_call());

    check(transport.requests.size() == 3, "three calls made");
    check(calls[1] - calls[0] >= milliseconds(1000), "search calls at least 1000 ms apart");
    check(calls[2] - calls[1] >= milliseconds(500), "reverse at least 500 ms after search");
    check(transport.requests[1].at - transport.requests[0].at >= milliseconds(900),
          "outbound requests spaced by the throttle");
}

void test_sequence_numbers() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(test_config(), transport, limiter);

    transport.fail();
    transport.fail();
    transport.fail();
    uint64_t a = gateway.search_places("xy").sequence;
    uint64_t b = gateway.search_places("SM City").sequence;
    uint64_t c = gateway.reverse_geocode({14.6741, 121.0359}).sequence;
    uint64_t d = gateway.fetch_directions({0, 0}, {1, 1}).sequence;
    check(a < b && b < c && c < d, "sequence numbers increase across operations");
    check(a >= 1, "sequence numbers start above zero");
}

}  // namespace

int main() {
    test_short_query();
    test_query_length_in_characters();
    test_search();
    test_fallback_data();
    test_reverse();
    test_area_label_priority();
    test_directions();
    test_fake_clock_throttle();
    test_wall_clock_throttle();
    test_sequence_numbers();
    return commute_test::finish("test_gateway");
}
