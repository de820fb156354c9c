#include "result.hpp"
#include <iomanip>

using json = nlohmann::json;
using namespace std;

OptimizationResult assemble_result(const RouteRequest& req, const SolvedRoute& solved,
                                   double processing_time_seconds) {
    OptimizationResult res;
    const RouteEvaluation& ev = solved.evaluation;
    double start = req.pickup.window.start;

    res.route.push_back(Stop{StopKind::ORIGIN, -1, req.pickup.location,
                             start, start, 0.0, 0.0, 0.0});

    for (size_t i = 0; i < ev.stops.size(); i++) {
        const Admission& a = ev.stops[i];
        int idx = solved.order[i];
        res.route.push_back(Stop{StopKind::DELIVERY, idx, req.deliveries[idx].location,
                                 a.arrival, a.departure, a.wait_minutes,
                                 a.leg_distance_km, a.leg_minutes});
    }

    if (ev.has_return) {
        res.route.push_back(Stop{StopKind::RETURN, -1, req.pickup.location,
                                 ev.return_arrival, ev.return_arrival, 0.0,
                                 ev.return_leg_km, ev.return_leg_minutes});
    }

    // travel and waiting over every leg, plus service at each delivery
    for (const auto& s : res.route) {
        res.total_distance_km += s.leg_distance_km;
        res.total_time_minutes += s.leg_minutes + s.wait_minutes;
        if (s.kind == StopKind::DELIVERY) res.total_time_minutes += s.departure - s.arrival;
    }

    res.is_feasible = solved.is_feasible;
    res.skipped = solved.skipped;

    res.metrics.processing_time_seconds = processing_time_seconds;
    res.metrics.optimization_method = solved.method;
    res.metrics.total_stops = static_cast<int>(res.route.size());
    res.metrics.skipped_stops = static_cast<int>(res.skipped.size());
    res.metrics.improvement_iterations = solved.iterations;
    return res;
}

static json window_to_json(const TimeWindow& w) {
    return {{"start", format_time_of_day(w.start)}, {"end", format_time_of_day(w.end)}};
}

json result_to_json(const RouteRequest& req, const OptimizationResult& result) {
    json out;
    out["route"] = json::array();

    for (const auto& s : result.route) {
        json stop;
        if (s.kind == StopKind::DELIVERY) {
            const Delivery& d = req.deliveries[s.delivery_index];
            stop["stop"] = d.address;
            stop["zipcode"] = d.zipcode;
            stop["address"] = d.address;
            stop["priority"] = static_cast<int>(d.priority);
        } else {
            const Pickup& p = req.pickup;
            stop["stop"] = s.kind == StopKind::RETURN ? p.address + " (Return)" : p.address;
            stop["zipcode"] = p.zipcode;
            stop["address"] = p.address;
        }
        stop["arrival_time"] = format_time_of_day(s.arrival);
        stop["departure_time"] = format_time_of_day(s.departure);
        stop["lat"] = s.location.lat;
        stop["lng"] = s.location.lng;
        out["route"].push_back(stop);
    }

    out["total_distance_km"] = result.total_distance_km;
    out["total_time_minutes"] = result.total_time_minutes;
    out["is_feasible"] = result.is_feasible;

    out["skipped_deliveries"] = json::array();
    for (const auto& sk : result.skipped) {
        const Delivery& d = req.deliveries[sk.delivery_index];
        out["skipped_deliveries"].push_back({
            {"address", d.address},
            {"zipcode", d.zipcode},
            {"lat", d.location.lat},
            {"lng", d.location.lng},
            {"priority", static_cast<int>(d.priority)},
            {"time_window", window_to_json(d.window)},
            {"reason", to_string(sk.reason)}
        });
    }

    const auto& m = result.metrics;
    out["optimization_metrics"] = {
        {"processing_time_seconds", m.processing_time_seconds},
        {"optimization_method", to_string(m.optimization_method)},
        {"total_stops", m.total_stops},
        {"skipped_stops", m.skipped_stops},
        {"improvement_iterations", m.improvement_iterations}
    };
    return out;
}

json distance_matrix_to_json(const vector<GeoPoint>& points, double speed_kmph) {
    json pts = json::array();
    for (const auto& p : points) pts.push_back({{"lat", p.lat}, {"lng", p.lng}});
    return {
        {"distances", build_distance_matrix(points)},
        {"times", build_time_matrix(points, speed_kmph)},
        {"points", pts}
    };
}

void print_route_summary(ostream& out, const RouteRequest& req,
                         const OptimizationResult& result) {
    ios::fmtflags flags = out.flags();
    streamsize precision = out.precision();

    out << "=== ROUTE ===\n";
    out << "Feasible: " << (result.is_feasible ? "yes" : "no") << "\n";
    out << fixed << setprecision(2);
    out << "Total distance: " << result.total_distance_km << " km\n";
    out << "Total time: " << result.total_time_minutes << " minutes\n";
    out << "Stops: " << result.route.size() << "\n";

    for (size_t i = 0; i < result.route.size(); i++) {
        const Stop& s = result.route[i];
        out << "  " << i + 1 << ". ";
        if (s.kind == StopKind::DELIVERY) {
            const Delivery& d = req.deliveries[s.delivery_index];
            out << d.address << " (" << d.zipcode << ") P" << static_cast<int>(d.priority);
        } else {
            out << req.pickup.address << (s.kind == StopKind::RETURN ? " (Return)" : "");
        }
        out << " arrive " << format_time_of_day(s.arrival)
            << " depart " << format_time_of_day(s.departure);
        if (s.wait_minutes > 0) out << " wait " << s.wait_minutes << " min";
        out << "\n";
    }

    if (!result.skipped.empty()) {
        out << "Skipped:\n";
        for (const auto& sk : result.skipped) {
            const Delivery& d = req.deliveries[sk.delivery_index];
            out << "  - " << d.address << " P" << static_cast<int>(d.priority)
                << ": " << to_string(sk.reason) << "\n";
        }
    }
    out.flags(flags);
    out.precision(precision);
}
