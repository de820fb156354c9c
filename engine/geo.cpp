#include "geo.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

static const double EARTH_RADIUS_KM = 6371.0;

static double to_radians(double deg) {
    static const double PI = acos(-1.0);
    return deg * PI / 180.0;
}

bool operator==(const GeoPoint& a, const GeoPoint& b) {
    return a.lat == b.lat && a.lng == b.lng;
}

bool is_valid_coordinate(double lat, double lng) {
    return lat >= -90.0 && lat <= 90.0 && lng >= -180.0 && lng <= 180.0;
}

double distance_km(const GeoPoint& a, const GeoPoint& b) {
    if (a == b) return 0.0;

    double dlat = to_radians(b.lat - a.lat);
    double dlng = to_radians(b.lng - a.lng);
    double h = sin(dlat / 2) * sin(dlat / 2) +
               cos(to_radians(a.lat)) * cos(to_radians(b.lat)) *
               sin(dlng / 2) * sin(dlng / 2);
    // rounding can push h just past 1 for antipodal points
    h = min(1.0, max(0.0, h));
    return 2.0 * EARTH_RADIUS_KM * asin(sqrt(h));
}

double minutes_for_distance(double km, double speed_kmph) {
    if (!(speed_kmph > 0.0))
        throw invalid_argument("invalid speed: vehicle speed must be positive");
    return km / speed_kmph * 60.0;
}

double travel_minutes(const GeoPoint& a, const GeoPoint& b, double speed_kmph) {
    return minutes_for_distance(distance_km(a, b), speed_kmph);
}

vector<vector<double>> build_distance_matrix(const vector<GeoPoint>& points) {
    size_t n = points.size();
    vector<vector<double>> dist(n, vector<double>(n, 0.0));
    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            dist[i][j] = distance_km(points[i], points[j]);
            dist[j][i] = dist[i][j];
        }
    }
    return dist;
}

vector<vector<double>> build_time_matrix(const vector<GeoPoint>& points,
                                                   double speed_kmph) {
    size_t n = points.size();
    vector<vector<double>> times(n, vector<double>(n, 0.0));
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) {
            if (i != j) times[i][j] = travel_minutes(points[i], points[j], speed_kmph);
        }
    }
    return times;
}
