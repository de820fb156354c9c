#pragma once
#include "models.hpp"
#include "feasibility.hpp"
#include "nlohmann/json.hpp"
#include <ostream>
#include <vector>

// What the search hands to the assembler.
struct SolvedRoute {
    OptimizeBy method;
    std::vector<int> order;       // delivery indices in visiting order
    RouteEvaluation evaluation;   // replay of `order`
    std::vector<SkippedDelivery> skipped;
    bool is_feasible;
    int iterations;
};

OptimizationResult assemble_result(const RouteRequest& req, const SolvedRoute& solved,
                                   double processing_time_seconds);

nlohmann::json result_to_json(const RouteRequest& req, const OptimizationResult& result);

nlohmann::json distance_matrix_to_json(const std::vector<GeoPoint>& points, double speed_kmph);

void print_route_summary(std::ostream& out, const RouteRequest& req,
                         const OptimizationResult& result);
