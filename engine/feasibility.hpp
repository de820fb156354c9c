#pragma once
#include "models.hpp"
#include "config.hpp"
#include <vector>

// Matrix index 0 is the pickup, delivery i lives at index i + 1.
inline int node_of(int delivery_index) { return delivery_index + 1; }

struct RouteState {
    int node;
    double clock;            // minutes since midnight
    double distance_km;      // cumulative since departure
    double elapsed_minutes;  // cumulative since departure, waits included
};

struct Admission {
    bool admitted;
    SkipReason reason;  // first violated constraint when !admitted
    double leg_distance_km;
    double leg_minutes;
    double wait_minutes;
    double arrival;     // service start, after any wait
    double departure;
    RouteState next;
};

struct RouteEvaluation {
    bool feasible;
    SkipReason reason;
    int failed_position;  // order index of the first rejected stop, order.size() for the return leg
    std::vector<Admission> stops;
    bool has_return;
    double return_leg_km;
    double return_leg_minutes;
    double return_arrival;
    double distance_km;       // return leg included
    double duration_minutes;  // departure from pickup to end of route
};

class FeasibilityChecker {
public:
    // Keeps a reference to the request; it must outlive the checker.
    FeasibilityChecker(const RouteRequest& request, const RoutingConfig& cfg);

    RouteState start_state() const;

    // Checks, in order: time window, distance cap, time cap, return trip.
    Admission check(const RouteState& state, int delivery_index) const;

    // Replays an ordering of delivery indices from the pickup.
    RouteEvaluation evaluate_route(const std::vector<int>& order) const;

    double leg_km(int from_node, int to_node) const { return dist[from_node][to_node]; }
    double leg_minutes(int from_node, int to_node) const { return times[from_node][to_node]; }

    const RouteRequest& request() const { return req; }

private:
    const RouteRequest& req;
    double max_distance_km;
    double max_elapsed_minutes;
    std::vector<std::vector<double>> dist;
    std::vector<std::vector<double>> times;
};
