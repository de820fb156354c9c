#pragma once
#include <string>
#include "nlohmann/json.hpp"

struct RoutingConfig {
    double max_travel_time_hours = 4.0;
    double default_speed_kmh = 50.0;
    double buffer_time_minutes = 15.0;
    double max_route_distance_km = 200.0;
    double default_service_time_minutes = 10.0;
};

struct PriorityConfig {
    double high_priority_weight = 1000.0;
    double medium_priority_weight = 100.0;
    double low_priority_weight = 1.0;
    double penalty_missing_high_priority = 10000.0;
    double penalty_missing_medium_priority = 100.0;
    double penalty_missing_low_priority = 1.0;
};

struct EngineConfig {
    RoutingConfig routing;
    PriorityConfig priority;
    int max_improvement_iterations = 200;
};

// Overlays keys present in the file onto cfg.
bool load_config_file(const std::string& filename, EngineConfig& cfg);
void apply_config_json(const nlohmann::json& j, EngineConfig& cfg);

// Throws std::invalid_argument if a variable is set but not a number.
void apply_env_overrides(EngineConfig& cfg);

bool validate_config(const EngineConfig& cfg, std::string& error);

nlohmann::json config_to_json(const EngineConfig& cfg);
