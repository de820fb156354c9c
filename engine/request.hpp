#pragma once
#include "models.hpp"
#include "config.hpp"
#include "nlohmann/json.hpp"
#include <string>

// Decodes and validates an optimization payload. On failure returns false
// and leaves a message naming the offending field in `error`.
bool parse_request(const nlohmann::json& j, const EngineConfig& cfg,
                   RouteRequest& out, std::string& error);

bool load_request(const std::string& filename, const EngineConfig& cfg,
                  RouteRequest& out, std::string& error);

// Reads [{"lat":..,"lng":..}] (or latitude/longitude keys).
bool parse_points(const nlohmann::json& j, std::vector<GeoPoint>& out, std::string& error);
