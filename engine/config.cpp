#include "config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
using namespace std;

static void set_if_env_set(double& val, const char* env_var) {
    const char* str = getenv(env_var);
    if (str == NULL) return;
    try {
        size_t used = 0;
        double parsed = stod(str, &used);
        if (used != string(str).size()) throw invalid_argument(str);
        val = parsed;
    } catch (const exception&) {
        throw invalid_argument(string(env_var) + " is not a number: " + str);
    }
}

static void set_if_env_set(int& val, const char* env_var) {
    const char* str = getenv(env_var);
    if (str == NULL) return;
    try {
        size_t used = 0;
        int parsed = stoi(str, &used);
        if (used != string(str).size()) throw invalid_argument(str);
        val = parsed;
    } catch (const exception&) {
        throw invalid_argument(string(env_var) + " is not an integer: " + str);
    }
}

void apply_config_json(const json& j, EngineConfig& cfg) {
    auto& r = cfg.routing;
    r.max_travel_time_hours = j.value("max_travel_time_hours", r.max_travel_time_hours);
    r.default_speed_kmh = j.value("default_speed_kmh", r.default_speed_kmh);
    r.buffer_time_minutes = j.value("buffer_time_minutes", r.buffer_time_minutes);
    r.max_route_distance_km = j.value("max_route_distance_km", r.max_route_distance_km);
    r.default_service_time_minutes =
        j.value("default_service_time_minutes", r.default_service_time_minutes);

    auto& p = cfg.priority;
    p.high_priority_weight = j.value("high_priority_weight", p.high_priority_weight);
    p.medium_priority_weight = j.value("medium_priority_weight", p.medium_priority_weight);
    p.low_priority_weight = j.value("low_priority_weight", p.low_priority_weight);
    p.penalty_missing_high_priority =
        j.value("penalty_missing_high_priority", p.penalty_missing_high_priority);
    p.penalty_missing_medium_priority =
        j.value("penalty_missing_medium_priority", p.penalty_missing_medium_priority);
    p.penalty_missing_low_priority =
        j.value("penalty_missing_low_priority", p.penalty_missing_low_priority);

    cfg.max_improvement_iterations =
        j.value("max_improvement_iterations", cfg.max_improvement_iterations);
}

bool load_config_file(const string& filename, EngineConfig& cfg) {
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open config file: " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
        if (!j.is_object()) {
            cerr << "Config file must hold a JSON object: " << filename << "\n";
            return false;
        }
        apply_config_json(j, cfg);
    } catch (const json::exception& e) {
        cerr << "Error parsing config JSON: " << e.what() << "\n";
        return false;
    }
    return true;
}

void apply_env_overrides(EngineConfig& cfg) {
    set_if_env_set(cfg.routing.max_travel_time_hours, "MAX_TRAVEL_TIME_HOURS");
    set_if_env_set(cfg.routing.default_speed_kmh, "DEFAULT_SPEED_KMH");
    set_if_env_set(cfg.routing.buffer_time_minutes, "BUFFER_TIME_MINUTES");
    set_if_env_set(cfg.routing.max_route_distance_km, "MAX_ROUTE_DISTANCE_KM");
    set_if_env_set(cfg.routing.default_service_time_minutes, "DEFAULT_SERVICE_TIME_MINUTES");

    set_if_env_set(cfg.priority.high_priority_weight, "HIGH_PRIORITY_WEIGHT");
    set_if_env_set(cfg.priority.medium_priority_weight, "MEDIUM_PRIORITY_WEIGHT");
    set_if_env_set(cfg.priority.low_priority_weight, "LOW_PRIORITY_WEIGHT");
    set_if_env_set(cfg.priority.penalty_missing_high_priority, "PENALTY_MISSING_HIGH_PRIORITY");
    set_if_env_set(cfg.priority.penalty_missing_medium_priority, "PENALTY_MISSING_MEDIUM_PRIORITY");
    set_if_env_set(cfg.priority.penalty_missing_low_priority, "PENALTY_MISSING_LOW_PRIORITY");

    set_if_env_set(cfg.max_improvement_iterations, "MAX_IMPROVEMENT_ITERATIONS");
}

bool validate_config(const EngineConfig& cfg, string& error) {
    const auto& r = cfg.routing;
    const auto& p = cfg.priority;

    if (!(r.default_speed_kmh > 0) || r.default_speed_kmh > 200)
        error = "default_speed_kmh must be within (0, 200]";
    else if (!(r.max_travel_time_hours > 0)) error = "max_travel_time_hours must be positive";
    else if (!(r.max_route_distance_km > 0)) error = "max_route_distance_km must be positive";
    else if (!(r.default_service_time_minutes >= 1 && r.default_service_time_minutes <= 120) ||
             floor(r.default_service_time_minutes) != r.default_service_time_minutes)
        error = "default_service_time_minutes must be a whole number within [1, 120]";
    else if (!(r.buffer_time_minutes >= 0)) error = "buffer_time_minutes must not be negative";
    else if (!(p.low_priority_weight > 0)) error = "priority weights must be positive";
    else if (!(p.high_priority_weight > p.medium_priority_weight &&
               p.medium_priority_weight > p.low_priority_weight))
        error = "priority weights must decrease from HIGH to MEDIUM to LOW";
    else if (!(p.penalty_missing_low_priority >= 0)) error = "skip penalties must not be negative";
    else if (!(p.penalty_missing_high_priority >= p.penalty_missing_medium_priority &&
               p.penalty_missing_medium_priority >= p.penalty_missing_low_priority))
        error = "skip penalties must not increase from HIGH to MEDIUM to LOW";
    else if (cfg.max_improvement_iterations <= 0)
        error = "max_improvement_iterations must be positive";
    else return true;

    return false;
}

json config_to_json(const EngineConfig& cfg) {
    const auto& r = cfg.routing;
    const auto& p = cfg.priority;
    return {
        {"routing_config", {
            {"max_travel_time_hours", r.max_travel_time_hours},
            {"default_speed_kmh", r.default_speed_kmh},
            {"buffer_time_minutes", r.buffer_time_minutes},
            {"max_route_distance_km", r.max_route_distance_km},
            {"default_service_time_minutes", r.default_service_time_minutes}
        }},
        {"priority_config", {
            {"high_priority_weight", p.high_priority_weight},
            {"medium_priority_weight", p.medium_priority_weight},
            {"low_priority_weight", p.low_priority_weight},
            {"penalty_missing_high_priority", p.penalty_missing_high_priority},
            {"penalty_missing_medium_priority", p.penalty_missing_medium_priority},
            {"penalty_missing_low_priority", p.penalty_missing_low_priority}
        }},
        {"max_improvement_iterations", cfg.max_improvement_iterations}
    };
}
