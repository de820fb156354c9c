#pragma once
#include "geo.hpp"
#include <string>
#include <vector>

const int MINUTES_PER_DAY = 1440;

enum class Priority { HIGH = 1, MEDIUM = 2, LOW = 3 };

enum class OptimizeBy { DISTANCE, TIME, PRIORITY };

enum class SkipReason {
    NONE,
    TIME_WINDOW_VIOLATED,
    MAX_DISTANCE_EXCEEDED,
    MAX_TIME_EXCEEDED,
    RETURN_INFEASIBLE,
    NOT_BENEFICIAL
};

// Minutes since midnight.
struct TimeWindow {
    int start;
    int end;
};

struct Pickup {
    std::string address;
    std::string zipcode;
    GeoPoint location;
    TimeWindow window;
};

struct Delivery {
    std::string address;
    std::string zipcode;
    GeoPoint location;
    Priority priority;
    TimeWindow window;
};

struct Settings {
    bool return_to_origin = true;
    int time_per_stop_minutes = 10;
    double vehicle_speed_kmph = 40.0;
    OptimizeBy optimize_by = OptimizeBy::PRIORITY;
};

struct RouteRequest {
    Pickup pickup;
    Settings settings;
    std::vector<Delivery> deliveries;
};

enum class StopKind { ORIGIN, DELIVERY, RETURN };

struct Stop {
    StopKind kind;
    int delivery_index;     // -1 for the pickup
    GeoPoint location;
    double arrival;         // minutes since midnight
    double departure;
    double wait_minutes;
    double leg_distance_km; // leg ending at this stop
    double leg_minutes;
};

struct SkippedDelivery {
    int delivery_index;
    SkipReason reason;
};

struct OptimizationMetrics {
    double processing_time_seconds = 0.0;
    OptimizeBy optimization_method = OptimizeBy::PRIORITY;
    int total_stops = 0;
    int skipped_stops = 0;
    int improvement_iterations = 0;
};

struct OptimizationResult {
    std::vector<Stop> route;
    double total_distance_km = 0.0;
    double total_time_minutes = 0.0;
    bool is_feasible = false;
    std::vector<SkippedDelivery> skipped;
    OptimizationMetrics metrics;
};

// "H:MM" or "HH:MM", hour 0-23, minute 0-59.
bool parse_time_of_day(const std::string& text, int& minutes);
std::string format_time_of_day(double minutes);

std::string to_string(OptimizeBy mode);
bool parse_optimize_by(const std::string& text, OptimizeBy& mode);
std::string to_string(SkipReason reason);
bool priority_from_int(int value, Priority& priority);
