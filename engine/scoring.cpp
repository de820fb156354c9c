#include "scoring.hpp"
#include <cmath>

using namespace std;

static const double EPS = 1e-9;

double construction_score(OptimizeBy mode, const PriorityModel& priorities,
                          Priority p, const Admission& a) {
    switch (mode) {
        case OptimizeBy::PRIORITY: return priorities.weight(p) / (1.0 + a.leg_distance_km);
        case OptimizeBy::DISTANCE: return -a.leg_distance_km;
        case OptimizeBy::TIME:     return -a.leg_minutes;
    }
    return -a.leg_distance_km;
}

bool better_candidate(OptimizeBy mode, const Candidate& a, const Candidate& b) {
    if (fabs(a.score - b.score) > EPS) return a.score > b.score;
    if (mode == OptimizeBy::PRIORITY &&
        fabs(a.leg_distance_km - b.leg_distance_km) > EPS)
        return a.leg_distance_km < b.leg_distance_km;
    if (a.window_end != b.window_end) return a.window_end < b.window_end;
    return a.delivery_index < b.delivery_index;
}

double route_cost(OptimizeBy mode, const PriorityModel& priorities, const RouteRequest& req,
                  const vector<int>& order, const RouteEvaluation& ev) {
    switch (mode) {
        case OptimizeBy::DISTANCE: return ev.distance_km;
        case OptimizeBy::TIME:     return ev.duration_minutes;
        case OptimizeBy::PRIORITY: {
            // weighted completion: high tiers pull their arrivals forward
            double cost = 0.0;
            for (size_t i = 0; i < order.size(); i++) {
                const Delivery& d = req.deliveries[order[i]];
                cost += priorities.weight(d.priority) *
                        (ev.stops[i].arrival - req.pickup.window.start);
            }
            return cost;
        }
    }
    return ev.distance_km;
}

bool improves(const Objective& candidate, const Objective& incumbent) {
    if (candidate.penalty < incumbent.penalty - EPS) return true;
    if (candidate.penalty > incumbent.penalty + EPS) return false;
    return candidate.cost < incumbent.cost - 1e-6;
}
