#include "events.hpp"
#include "request.hpp"
#include "result.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace std;

json example_request() {
    return json::parse(R"({
        "pickup": {"address": "Warehouse, Mumbai", "zipcode": "400001",
                   "lat": 18.9356, "lng": 72.8376,
                   "start_time": "09:00", "end_time": "18:00"},
        "settings": {"return_to_origin": true, "time_per_stop_minutes": 10,
                     "vehicle_speed_kmph": 40.0, "optimize_by": "priority"},
        "deliveries": [
            {"address": "Client A", "zipcode": "400020", "lat": 18.9447, "lng": 72.8235,
             "priority": 1, "time_window": {"start": "10:00", "end": "13:00"}},
            {"address": "Client B", "zipcode": "400028", "lat": 18.9894, "lng": 72.8295,
             "priority": 2, "time_window": {"start": "12:00", "end": "17:00"}},
            {"address": "Client C", "zipcode": "400033", "lat": 19.0158, "lng": 72.8438,
             "priority": 3, "time_window": {"start": "09:00", "end": "11:30"}}
        ]
    })");
}

static json validation_error(const string& details) {
    return {{"error", "Validation failed"}, {"details", details}};
}

json optimize_payload(const HeuristicSolver& solver, const json& payload, bool debug,
                      ostream& debug_out) {
    RouteRequest req;
    string error;
    if (!parse_request(payload, solver.config(), req, error)) {
        cerr << "Rejected request: " << error << "\n";
        return validation_error(error);
    }

    OptimizationResult result = solver.solve(req);
    if (debug) print_route_summary(debug_out, req, result);
    return result_to_json(req, result);
}

static json distance_matrix_event(const HeuristicSolver& solver, const json& event) {
    vector<GeoPoint> points;
    string error;
    if (!parse_points(event.value("points", json()), points, error))
        return validation_error(error);

    double speed = solver.config().routing.default_speed_kmh;
    if (event.contains("speed_kmph")) {
        if (!event["speed_kmph"].is_number())
            return validation_error("speed_kmph must be a number");
        speed = event["speed_kmph"].get<double>();
    }
    if (!(speed > 0) || speed > 200)
        return validation_error("speed_kmph must be within (0, 200]");
    return distance_matrix_to_json(points, speed);
}

json process_event(const HeuristicSolver& solver, const json& event, ostream& debug_out) {
    json result;
    if (!event.is_object()) {
        result["error"] = "event must be an object";
        return result;
    }
    result["id"] = event.value("id", json());

    try {
        string type = "optimize_route";
        if (event.contains("type")) {
            if (!event["type"].is_string()) {
                result["error"] = "event type must be a string";
                return result;
            }
            type = event["type"].get<string>();
        }

        if (type == "optimize_route" || type == "debug_route") {
            if (!event.contains("request")) {
                result.update(validation_error("request is required"));
            } else {
                result.update(optimize_payload(solver, event["request"],
                                               type == "debug_route", debug_out));
            }
        } else if (type == "distance_matrix") {
            result.update(distance_matrix_event(solver, event));
        } else if (type == "config") {
            result.update(config_to_json(solver.config()));
        } else if (type == "example") {
            result["request"] = example_request();
        } else {
            result["error"] = "unknown event type: " + type;
        }
    } catch (const exception& e) {
        cerr << "Error processing event " << result["id"] << ": " << e.what() << "\n";
        result["error"] = e.what();
    }

    return result;
}
