#include "feasibility.hpp"
#include <algorithm>

using namespace std;

static const double EPS = 1e-9;

FeasibilityChecker::FeasibilityChecker(const RouteRequest& request, const RoutingConfig& cfg)
    : req(request),
      max_distance_km(cfg.max_route_distance_km),
      max_elapsed_minutes(cfg.max_travel_time_hours * 60.0) {
    vector<GeoPoint> points;
    points.reserve(req.deliveries.size() + 1);
    points.push_back(req.pickup.location);
    for (const auto& d : req.deliveries) points.push_back(d.location);

    dist = build_distance_matrix(points);
    times = build_time_matrix(points, req.settings.vehicle_speed_kmph);
}

RouteState FeasibilityChecker::start_state() const {
    return RouteState{0, static_cast<double>(req.pickup.window.start), 0.0, 0.0};
}

Admission FeasibilityChecker::check(const RouteState& state, int delivery_index) const {
    const Delivery& d = req.deliveries[delivery_index];
    int to = node_of(delivery_index);

    Admission a{};
    a.admitted = false;
    a.reason = SkipReason::NONE;
    a.leg_distance_km = dist[state.node][to];
    a.leg_minutes = times[state.node][to];

    double arrival = state.clock + a.leg_minutes;
    if (arrival > d.window.end + EPS) {
        a.reason = SkipReason::TIME_WINDOW_VIOLATED;
        return a;
    }
    a.wait_minutes = max(0.0, d.window.start - arrival);
    a.arrival = arrival + a.wait_minutes;
    a.departure = a.arrival + req.settings.time_per_stop_minutes;
    // the last representable departure is 23:59
    if (a.departure >= MINUTES_PER_DAY) {
        a.reason = SkipReason::TIME_WINDOW_VIOLATED;
        return a;
    }

    double distance = state.distance_km + a.leg_distance_km;
    if (distance > max_distance_km + EPS) {
        a.reason = SkipReason::MAX_DISTANCE_EXCEEDED;
        return a;
    }

    double elapsed = a.departure - req.pickup.window.start;
    if (elapsed > max_elapsed_minutes + EPS) {
        a.reason = SkipReason::MAX_TIME_EXCEEDED;
        return a;
    }

    if (req.settings.return_to_origin &&
        a.departure + times[to][0] > req.pickup.window.end + EPS) {
        a.reason = SkipReason::RETURN_INFEASIBLE;
        return a;
    }

    a.admitted = true;
    a.next = RouteState{to, a.departure, distance, elapsed};
    return a;
}

RouteEvaluation FeasibilityChecker::evaluate_route(const vector<int>& order) const {
    RouteEvaluation ev{};
    ev.feasible = true;
    ev.reason = SkipReason::NONE;
    ev.failed_position = -1;
    ev.stops.reserve(order.size());

    RouteState state = start_state();
    for (size_t i = 0; i < order.size(); i++) {
        Admission a = check(state, order[i]);
        if (!a.admitted) {
            ev.feasible = false;
            ev.reason = a.reason;
            ev.failed_position = static_cast<int>(i);
            return ev;
        }
        ev.stops.push_back(a);
        state = a.next;
    }

    ev.distance_km = state.distance_km;
    double end_clock = state.clock;

    if (req.settings.return_to_origin) {
        ev.has_return = true;
        ev.return_leg_km = dist[state.node][0];
        ev.return_leg_minutes = times[state.node][0];
        ev.return_arrival = state.clock + ev.return_leg_minutes;
        ev.distance_km += ev.return_leg_km;
        end_clock = ev.return_arrival;
        if (ev.return_arrival > req.pickup.window.end + EPS) {
            ev.feasible = false;
            ev.reason = SkipReason::RETURN_INFEASIBLE;
            ev.failed_position = static_cast<int>(order.size());
        }
    }

    ev.duration_minutes = end_clock - req.pickup.window.start;
    return ev;
}
