#pragma once
#include "models.hpp"
#include "config.hpp"
#include "priority.hpp"
#include "result.hpp"

class Solver {
public:
    virtual ~Solver() = default;
    virtual OptimizationResult solve(const RouteRequest& request) const = 0;
};

// Construction by per-step scoring, then bounded local search
// (insert, exchange, relocate, swap, 2-opt). Holds no per-request state,
// so one instance may serve concurrent solves.
class HeuristicSolver : public Solver {
public:
    explicit HeuristicSolver(const EngineConfig& cfg);

    OptimizationResult solve(const RouteRequest& request) const override;

    // The search without result assembly.
    SolvedRoute search(const RouteRequest& request) const;

    const EngineConfig& config() const { return cfg; }

private:
    EngineConfig cfg;
    PriorityModel priorities;
};
