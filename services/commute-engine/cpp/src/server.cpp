/**
 * @file server.cpp
 * @brief HTTP server for the commute routing API using Crow framework.
 *
 * Serves static-graph routes, live provider routes with variants, place
 * search, reverse geocoding and the terminal directory.
 */

#include "commute_engine.hpp"
#include "engine_config.hpp"
#include "http_transport.hpp"
#include "rate_limiter.hpp"

#include <crow.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <string>

using json = nlohmann::json;
using namespace commute;

// Server configuration
EngineConfig g_config;

// Helper: read start/end coordinates from a POST body
bool read_endpoints(const json& body, Coordinate& start, Coordinate& end) {
    if (!body.contains("start_lat") || !body.contains("start_lng") ||
        !body.contains("end_lat") || !body.contains("end_lng")) {
        return false;
    }
    start = {body["start_lat"].get<double>(), body["start_lng"].get<double>()};
    end = {body["end_lat"].get<double>(), body["end_lng"].get<double>()};
    return true;
}

crow::response json_response(int status, const json& body) {
    crow::response resp(status, body.dump());
    resp.set_header("Content-Type", "application/json");
    return resp;
}

int main(int argc, char* argv[]) {
    std::cout << "=== Commute Routing HTTP Server ===\n\n";

    // Parse command line args
    std::string config_path = "config/server.json";  // Default config path
    bool use_config = false;
    int cli_port = -1;
    std::string cli_host, cli_graph, cli_api_key;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            cli_port = std::stoi(argv[++i]);
        } else if (arg == "--host" && i + 1 < argc) {
            cli_host = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            use_config = true;
        } else if (arg == "--graph" && i + 1 < argc) {
            cli_graph = argv[++i];
        } else if (arg == "--api-key" && i + 1 < argc) {
            cli_api_key = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: commute_server [options]\n"
                      << "  --config PATH      Config file (default: config/server.json)\n"
                      << "  --port PORT        Server port (default: 8080)\n"
                      << "  --host HOST        Bind address (default: 0.0.0.0)\n"
                      << "  --graph PATH       Transit graph JSON (default: built-in district)\n"
                      << "  --api-key KEY      OpenRouteService key (or env ORS_API_KEY)\n";
            return 0;
        }
    }

    // Config file first, then environment, then explicit flags
    if (use_config) {
        load_config(config_path, g_config);
    }
    apply_environment(g_config);
    if (cli_port > 0) g_config.port = cli_port;
    if (!cli_host.empty()) g_config.host = cli_host;
    if (!cli_graph.empty()) g_config.graph_path = cli_graph;
    if (!cli_api_key.empty()) g_config.provider.api_key = cli_api_key;

    TransitGraph graph = TransitGraph::district();
    if (!g_config.graph_path.empty()) {
        if (!TransitGraph::load_json(g_config.graph_path, graph)) {
            std::cerr << "Falling back to built-in district graph\n";
            graph = TransitGraph::district();
        }
    }
    std::cout << "Graph: " << graph.node_count() << " nodes, " << graph.edge_count() << " edges\n";

    SteadyClock clock;
    RateLimiter limiter(clock);
    CurlTransport transport(g_config.provider_timeout_ms);
    GeocodingGateway gateway(g_config.provider, transport, limiter);
    CommuteEngine engine(std::move(graph), gateway);

    // Create Crow app
    crow::SimpleApp app;

    // ============================================================
    // HEALTH ENDPOINT
    // ============================================================
    CROW_ROUTE(app, "/health")([&engine]() {
        json response = {
            {"status", "healthy"},
            {"nodes", engine.graph().node_count()},
            {"edges", engine.graph().edge_count()}
        };
        return json_response(200, response);
    });

    // ============================================================
    // TERMINALS
    // ============================================================
    CROW_ROUTE(app, "/terminals")([&engine]() {
        json response = {{"terminals", engine.terminals()}};
        return json_response(200, response);
    });

    // ============================================================
    // LOCAL LOCATION SEARCH (no provider)
    // ============================================================
    CROW_ROUTE(app, "/locations")([&engine](const crow::request& req) {
        std::string q = req.url_params.get("q") ? req.url_params.get("q") : "";
        json response = {{"query", q}, {"results", engine.search_locations(q)}};
        return json_response(200, response);
    });

    // ============================================================
    // ROUTE (static graph)
    // ============================================================
    CROW_ROUTE(app, "/route/graph").methods("POST"_method)([&engine](const crow::request& req) {
        auto start_time = std::chrono::high_resolution_clock::now();

        try {
            auto body = json::parse(req.body);
            Coordinate start, end;
            if (!read_endpoints(body, start, end)) {
                return json_response(400, {{"success", false},
                                           {"error", "start_lat, start_lng, end_lat, end_lng required"}});
            }

            auto metric = parse_metric(body.value("metric", "time"));
            if (!metric) {
                return json_response(400, {{"success", false},
                                           {"error", "metric must be time, distance or cost"}});
            }

            auto route = engine.compute_graph_route(start, end, *metric);

            auto end_time = std::chrono::high_resolution_clock::now();
            double runtime_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

            json response;
            if (route) {
                response["success"] = true;
                response["route"] = *route;
            } else {
                response["success"] = false;
                response["error"] = "No path found";
            }
            response["runtime_ms"] = runtime_ms;
            return json_response(200, response);

        } catch (const std::exception& e) {
            return json_response(400, {{"success", false}, {"error", e.what()}});
        }
    });

    // ============================================================
    // ROUTE (live provider directions + variants)
    // ============================================================
    CROW_ROUTE(app, "/route/live").methods("POST"_method)([&engine](const crow::request& req) {
        try {
            auto body = json::parse(req.body);
            Coordinate start, end;
            if (!read_endpoints(body, start, end)) {
                return json_response(400, {{"success", false},
                                           {"error", "start_lat, start_lng, end_lat, end_lng required"}});
            }

            auto route = engine.compute_live_route(start, end);
            if (!route) {
                return json_response(502, {{"success", false},
                                           {"error", "Directions unavailable, please retry"}});
            }

            RouteVariants variants = CommuteEngine::expand(*route);
            json response = {
                {"success", true},
                {"routes", json::array({variants.fastest, variants.cheapest, variants.shortest})}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return json_response(400, {{"success", false}, {"error", e.what()}});
        }
    });

    // ============================================================
    // GEOCODING
    // ============================================================
    CROW_ROUTE(app, "/geocode/search")([&engine](const crow::request& req) {
        std::string q = req.url_params.get("q") ? req.url_params.get("q") : "";
        auto reply = engine.search(q);
        json response = {
            {"query", q},
            {"sequence", reply.sequence},
            {"fallback", reply.from_fallback},
            {"results", reply.value}
        };
        return json_response(200, response);
    });

    CROW_ROUTE(app, "/geocode/reverse")([&engine](const crow::request& req) {
        try {
            if (!req.url_params.get("lat") || !req.url_params.get("lon")) {
                return json_response(400, {{"error", "lat and lon required"}});
            }
            Coordinate point{std::stod(req.url_params.get("lat")),
                             std::stod(req.url_params.get("lon"))};

            auto reply = engine.reverse_geocode(point);
            json response = {
                {"sequence", reply.sequence},
                {"fallback", reply.from_fallback},
                {"label", reply.value ? json(*reply.value) : json(nullptr)}
            };
            return json_response(200, response);

        } catch (const std::exception& e) {
            return json_response(400, {{"error", e.what()}});
        }
    });

    std::cout << "\nStarting server on " << g_config.host << ":" << g_config.port << "\n";
    app.port(g_config.port).bindaddr(g_config.host).multithreaded().run();

    return 0;
}
