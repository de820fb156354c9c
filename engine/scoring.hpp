#pragma once
#include "models.hpp"
#include "priority.hpp"
#include "feasibility.hpp"
#include <vector>

struct Candidate {
    int delivery_index;
    double score;
    double leg_distance_km;
    int window_end;
};

// Per-step construction score; higher is better.
//   priority: weight / (1 + leg km)
//   distance: -leg km
//   time:     -leg minutes
double construction_score(OptimizeBy mode, const PriorityModel& priorities,
                          Priority p, const Admission& a);

// True if a should be appended before b.
bool better_candidate(OptimizeBy mode, const Candidate& a, const Candidate& b);

// Skip penalties are compared first, then the mode's route cost.
struct Objective {
    double penalty;
    double cost;
};

double route_cost(OptimizeBy mode, const PriorityModel& priorities, const RouteRequest& req,
                  const std::vector<int>& order, const RouteEvaluation& ev);

bool improves(const Objective& candidate, const Objective& incumbent);
