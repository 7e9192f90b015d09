/**
 * @file test_engine.cpp
 * @brief Config loading and the CommuteEngine facade end to end.
 *
 * Usage: ./test_engine
 */

#include "commute_engine.hpp"
#include "engine_config.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace commute;
using commute_test::check;
using commute_test::check_near;
using commute_test::FakeClock;
using commute_test::ScriptedTransport;
using json = nlohmann::json;
using std::chrono::milliseconds;

namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

void test_config_loading() {
    EngineConfig defaults;
    check(defaults.port == 8080 && defaults.host == "0.0.0.0", "server defaults");
    check(defaults.provider.country == "PH" && defaults.provider.search_size == 5, "provider defaults");
    check(defaults.provider.search_interval == milliseconds(1000), "search interval default");
    check(defaults.provider.reverse_interval == milliseconds(500), "reverse interval default");
    check(defaults.provider.directions_interval == milliseconds(1000), "directions interval default");

    fs::path path = write_temp("commute_test_config.json", R"({
        "port": 9090,
        "graph_path": "data/custom.json",
        "provider": {"api_key": "abc123", "timeout_ms": 2500},
        "throttle": {"reverse_interval_ms": 750}
    })");

    EngineConfig config;
    check(load_config(path.string(), config), "config file loads");
    check(config.port == 9090, "port overridden");
    check(config.host == "0.0.0.0", "absent host keeps default");
    check(config.graph_path == "data/custom.json", "graph path overridden");
    check(config.provider.api_key == "abc123", "api key overridden");
    check(config.provider.base_url == "https://api.openrouteservice.org", "absent base_url keeps default");
    check(config.provider_timeout_ms == 2500, "timeout overridden");
    check(config.provider.reverse_interval == milliseconds(750), "reverse interval overridden");
    check(config.provider.search_interval == milliseconds(1000), "search interval kept");

    // Keys the service does not read are ignored
    fs::path legacy = write_temp("commute_test_config_legacy.json",
                                 R"({"port": 7070, "debounce": {"search_quiet_ms": 300}})");
    EngineConfig with_extra;
    check(load_config(legacy.string(), with_extra), "unread keys do not fail the load");
    check(with_extra.port == 7070, "known keys still applied next to unread ones");

    fs::path broken = write_temp("commute_test_config_bad.json", R"({"port": "not a number"})");
    EngineConfig untouched;
    check(!load_config(broken.string(), untouched), "wrongly typed key fails");
    check(untouched.port == 8080, "failed load leaves config untouched");
    check(!load_config((fs::temp_directory_path() / "commute_no_such_config.json").string(), untouched),
          "missing config fails");

    setenv("ORS_API_KEY", "from-env", 1);
    apply_environment(config);
    check(config.provider.api_key == "from-env", "environment key applied");
    unsetenv("ORS_API_KEY");

    fs::remove(path);
    fs::remove(broken);
    fs::remove(legacy);
}

json live_directions() {
    return {
        {"features", {{
            {"geometry", {{"coordinates", {{121.0359, 14.6741}, {121.0450, 14.6650}, {121.0580, 14.6575}}}}},
            {"properties", {
                {"segments", {{
                    {"steps", {
                        {{"instruction", "Head southeast on Tandang Sora Avenue"}, {"distance", 3.2},
                         {"duration", 540.0}, {"way_points", {0, 1}}},
                        {{"instruction", "Turn left onto Commonwealth Avenue"}, {"distance", 2.8},
                         {"duration", 360.0}, {"way_points", {1, 2}}}
                    }}
                }}},
                {"summary", {{"distance", 6.0}, {"duration", 900.0}}}
            }}
        }}}
    };
}

void test_graph_routes() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(GatewayConfig{}, transport, limiter);
    CommuteEngine engine(TransitGraph::district(), gateway);

    auto route = engine.compute_graph_route({14.6742, 121.0358}, {14.6574, 121.0581}, Metric::Time);
    check(route.has_value(), "graph route found");
    if (route) {
        check_near(route->total_time_min, 25, "graph route time");
        check(route->category == RouteCategory::Fastest, "graph route category");
        json j = *route;
        check(j["type"] == "FASTEST", "category serialized");
        check(j["steps"].size() == 2, "legs serialized as steps");
        check(j["path"][0]["lat"] == 14.6741, "path serialized as lat/lng");
    }

    check(!engine.compute_graph_route({14.6741, 121.0359}, {14.6741, 121.0359}, Metric::Cost).has_value(),
          "self route is empty");
    check(engine.compute_graph_route({95.0, 200.0}, {14.6574, 121.0581}, Metric::Distance).has_value(),
          "out-of-range start still routed");
    check(transport.requests.empty(), "graph mode never calls the provider");
}

void test_live_routes() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(GatewayConfig{}, transport, limiter);
    CommuteEngine engine(TransitGraph::district(), gateway);

    transport.reply(200, live_directions());
    auto route = engine.compute_live_route({14.6741, 121.0359}, {14.6575, 121.0580});
    check(route.has_value(), "live route computed");
    if (!route) return;

    check_near(route->total_time_min, 15, "live time");
    check_near(route->total_cost, 17, "live fare");
    check(route->legs.size() == 2 && route->legs[0].mode == TransportMode::Car, "live legs");

    RouteVariants v = CommuteEngine::expand(*route);
    check(v.fastest.id == route->id + "_fast", "fastest variant id");
    check_near(v.cheapest.total_cost, 13, "cheapest variant floored");
    check_near(v.cheapest.total_time_min, 20, "cheapest variant time");
    check_near(v.shortest.total_distance_km, 5.7, "shortest variant distance");
    check(v.shortest.path == route->path, "variants share path");

    json tags = json(v.cheapest)["tags"];
    check(tags == json({"Budget", "Saver"}), "variant tags serialized");

    transport.fail();
    check(!engine.compute_live_route({14.6741, 121.0359}, {14.6575, 121.0580}).has_value(),
          "provider failure yields no live route");
}

void test_geocoding_passthrough() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(GatewayConfig{}, transport, limiter);
    CommuteEngine engine(TransitGraph::district(), gateway);

    transport.fail();
    auto places = engine.search("Trinoma");
    check(places.from_fallback && places.value.size() == 1, "search falls back through the facade");

    transport.fail();
    auto label = engine.reverse_geocode({14.6741, 121.0359});
    check(label.value && label.value->short_name == "Location Coordinates", "reverse falls back");
    check(label.sequence > places.sequence, "facade keeps gateway sequence order");

    json j = *label.value;
    check(j["name"] == "Location Coordinates" && j["area"] == "14.6741, 121.0359", "area label serialized");
}

void test_terminals_and_locations() {
    FakeClock clock;
    RateLimiter limiter(clock);
    ScriptedTransport transport;
    GeocodingGateway gateway(GatewayConfig{}, transport, limiter);
    CommuteEngine engine(TransitGraph::district(), gateway);

    auto terminals = engine.terminals();
    check(terminals.size() == 5, "every node is a terminal");
    if (terminals.size() == 5) {
        check(terminals[0].id == "ts_palengke", "terminals in graph order");
        check(terminals[2].category == TerminalCategory::Bus && terminals[2].route_count == 2,
              "comm_ave is a bus terminal with two routes");
        check(terminals[4].route_count == 1, "tricycle terminal has one route");
        check_near(terminals[0].rating, 4.5, "default rating");

        json j = terminals[3];
        check(j["type"] == "E_JEEP" && j["route_count"] == 1, "terminal serialized");
    }

    auto sora = engine.search_locations("SORA");
    check(sora.size() == 4, "terminals and streets matched");
    if (sora.size() == 4) {
        check(sora[0].name == "Tandang Sora Palengke" && sora[0].kind == LocationKind::Terminal,
              "terminal matches come first");
        check(sora[1].name == "Visayas Avenue Junction", "address match on terminal");
        check(sora[3].name == "25 Banlat Road" && sora[3].kind == LocationKind::Location,
              "street named by its first part");
        check(json(sora[3])["type"] == "LOCATION", "location kind serialized");
    }

    auto sm = engine.search_locations("sm");
    check(sm.size() == 1 && sm[0].name == "SM City North EDSA", "two-character query accepted");
    check(engine.search_locations("q").empty(), "one-character query is empty");
    check(engine.search_locations("\xC3\xA9").empty(), "one accented character is empty");
    check(engine.search_locations("\xE6\x97\xA5\xE6\x9C\xAC").empty(),
          "two multibyte characters searched without matches");
    check(transport.requests.empty(), "local search never calls the provider");
}

}  // namespace

int main() {
    test_config_loading();
    test_graph_routes();
    test_live_routes();
    test_geocoding_passthrough();
    test_terminals_and_locations();
    return commute_test::finish("test_engine");
}
