#pragma once
#include "solver.hpp"
#include "nlohmann/json.hpp"
#include <ostream>

// Built-in sample request served by the "example" event.
nlohmann::json example_request();

// Decodes, solves and serializes one request. A payload that fails
// validation yields {"error": "Validation failed", "details": ...}.
nlohmann::json optimize_payload(const HeuristicSolver& solver, const nlohmann::json& payload,
                                bool debug, std::ostream& debug_out);

// Runs one batch event. Never throws; failures are reported in the "error" field.
nlohmann::json process_event(const HeuristicSolver& solver, const nlohmann::json& event,
                             std::ostream& debug_out);
