#include "request.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
using namespace std;

namespace {

struct FieldError : runtime_error {
    explicit FieldError(const string& msg) : runtime_error(msg) {}
};

const json& field(const json& j, const string& key, const string& path) {
    if (!j.is_object() || !j.contains(key))
        throw FieldError(path + key + " is required");
    return j[key];
}

double get_number(const json& j, const string& key, const string& path) {
    const json& v = field(j, key, path);
    if (!v.is_number()) throw FieldError(path + key + " must be a number");
    return v.get<double>();
}

string get_string(const json& j, const string& key, const string& path) {
    const json& v = field(j, key, path);
    if (v.is_number_integer()) return v.dump();  // zipcodes sometimes arrive as numbers
    if (!v.is_string()) throw FieldError(path + key + " must be a string");
    return v.get<string>();
}

int get_time(const json& j, const string& key, const string& path) {
    string text = get_string(j, key, path);
    int minutes = 0;
    if (!parse_time_of_day(text, minutes))
        throw FieldError(path + key + " must be HH:MM, got \"" + text + "\"");
    return minutes;
}

GeoPoint get_location(const json& j, const string& path) {
    GeoPoint p{get_number(j, "lat", path), get_number(j, "lng", path)};
    if (p.lat < -90 || p.lat > 90)
        throw FieldError(path + "lat must be within [-90, 90]");
    if (p.lng < -180 || p.lng > 180)
        throw FieldError(path + "lng must be within [-180, 180]");
    return p;
}

TimeWindow get_window(const json& j, const string& start_key, const string& end_key,
                      const string& path) {
    TimeWindow w{get_time(j, start_key, path), get_time(j, end_key, path)};
    if (w.start >= w.end)
        throw FieldError(path + start_key + " must be earlier than " + end_key);
    return w;
}

Settings get_settings(const json& j, const EngineConfig& cfg) {
    Settings s;
    s.time_per_stop_minutes = static_cast<int>(cfg.routing.default_service_time_minutes);
    s.vehicle_speed_kmph = cfg.routing.default_speed_kmh;
    if (!j.is_null() && !j.is_object()) throw FieldError("settings must be an object");
    bool given = j.is_object();

    if (given && j.contains("return_to_origin")) {
        if (!j["return_to_origin"].is_boolean())
            throw FieldError("settings.return_to_origin must be a boolean");
        s.return_to_origin = j["return_to_origin"].get<bool>();
    }
    if (given && j.contains("time_per_stop_minutes")) {
        const json& v = j["time_per_stop_minutes"];
        if (!v.is_number_integer())
            throw FieldError("settings.time_per_stop_minutes must be an integer");
        s.time_per_stop_minutes = v.get<int>();
    }
    if (given && j.contains("vehicle_speed_kmph"))
        s.vehicle_speed_kmph = get_number(j, "vehicle_speed_kmph", "settings.");
    if (given && j.contains("optimize_by")) {
        string mode = get_string(j, "optimize_by", "settings.");
        if (!parse_optimize_by(mode, s.optimize_by))
            throw FieldError("settings.optimize_by must be distance, time or priority");
    }

    // applies to configured defaults as well as explicit values
    if (s.time_per_stop_minutes < 1 || s.time_per_stop_minutes > 120)
        throw FieldError("settings.time_per_stop_minutes must be within [1, 120]");
    if (!(s.vehicle_speed_kmph > 0) || s.vehicle_speed_kmph > 200)
        throw FieldError("settings.vehicle_speed_kmph must be within (0, 200]");
    return s;
}

}  // namespace

bool parse_request(const json& j, const EngineConfig& cfg, RouteRequest& out, string& error) {
    try {
        if (!j.is_object()) throw FieldError("request must be a JSON object");

        RouteRequest req;
        const json& jp = field(j, "pickup", "");
        req.pickup.address = get_string(jp, "address", "pickup.");
        req.pickup.zipcode = get_string(jp, "zipcode", "pickup.");
        req.pickup.location = get_location(jp, "pickup.");
        req.pickup.window = get_window(jp, "start_time", "end_time", "pickup.");

        req.settings = get_settings(j.contains("settings") ? j["settings"] : json(), cfg);

        const json& jd = field(j, "deliveries", "");
        if (!jd.is_array()) throw FieldError("deliveries must be an array");
        if (jd.empty()) throw FieldError("at least one delivery is required");

        for (size_t i = 0; i < jd.size(); i++) {
            string path = "deliveries[" + std::to_string(i) + "].";
            const json& d = jd[i];
            Delivery del;
            del.address = get_string(d, "address", path);
            del.zipcode = get_string(d, "zipcode", path);
            del.location = get_location(d, path);

            const json& pr = field(d, "priority", path);
            if (!pr.is_number_integer() || !priority_from_int(pr.get<int>(), del.priority))
                throw FieldError(path + "priority must be 1, 2 or 3");

            const json& tw = field(d, "time_window", path);
            del.window = get_window(tw, "start", "end", path + "time_window.");
            req.deliveries.push_back(del);
        }

        out = req;
        return true;
    } catch (const FieldError& e) {
        error = e.what();
    } catch (const json::exception& e) {
        error = string("malformed request: ") + e.what();
    }
    return false;
}

bool load_request(const string& filename, const EngineConfig& cfg, RouteRequest& out,
                  string& error) {
    ifstream fin(filename);
    if (!fin) {
        error = "could not open request file: " + filename;
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const json::exception& e) {
        error = string("error parsing JSON: ") + e.what();
        return false;
    }
    return parse_request(j, cfg, out, error);
}

bool parse_points(const json& j, vector<GeoPoint>& out, string& error) {
    if (!j.is_array() || j.size() < 2) {
        error = "at least 2 points are required";
        return false;
    }

    vector<GeoPoint> points;
    for (size_t i = 0; i < j.size(); i++) {
        const json& p = j[i];
        const char* lat_key = p.contains("latitude") ? "latitude" : "lat";
        const char* lng_key = p.contains("longitude") ? "longitude" : "lng";
        if (!p.contains(lat_key) || !p.contains(lng_key) ||
            !p[lat_key].is_number() || !p[lng_key].is_number()) {
            error = "points[" + std::to_string(i) + "] must have numeric latitude and longitude";
            return false;
        }
        GeoPoint g{p[lat_key].get<double>(), p[lng_key].get<double>()};
        if (!is_valid_coordinate(g.lat, g.lng)) {
            error = "points[" + std::to_string(i) + "] has invalid coordinates";
            return false;
        }
        points.push_back(g);
    }
    out = points;
    return true;
}
