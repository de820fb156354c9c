#pragma once
#include <vector>

struct GeoPoint {
    double lat;
    double lng;
};

bool operator==(const GeoPoint& a, const GeoPoint& b);

bool is_valid_coordinate(double lat, double lng);

// Great-circle distance in kilometers.
double distance_km(const GeoPoint& a, const GeoPoint& b);

// Throws std::invalid_argument when speed_kmph <= 0.
double travel_minutes(const GeoPoint& a, const GeoPoint& b, double speed_kmph);
double minutes_for_distance(double km, double speed_kmph);

std::vector<std::vector<double>> build_distance_matrix(const std::vector<GeoPoint>& points);
std::vector<std::vector<double>> build_time_matrix(const std::vector<GeoPoint>& points,
                                                   double speed_kmph);
