#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

TEST(config, defaults_are_valid)
{
  EngineConfig cfg;
  std::string error;
  EXPECT_TRUE(validate_config(cfg, error)) << error;
  EXPECT_DOUBLE_EQ(cfg.routing.max_travel_time_hours, 4.0);
  EXPECT_DOUBLE_EQ(cfg.routing.default_speed_kmh, 50.0);
  EXPECT_DOUBLE_EQ(cfg.routing.max_route_distance_km, 200.0);
  EXPECT_DOUBLE_EQ(cfg.priority.high_priority_weight, 1000.0);
  EXPECT_DOUBLE_EQ(cfg.priority.penalty_missing_high_priority, 10000.0);
}

TEST(config, rejects_non_positive_values)
{
  std::string error;

  EngineConfig cfg;
  cfg.routing.default_speed_kmh = 0;
  EXPECT_FALSE(validate_config(cfg, error));
  EXPECT_NE(error.find("default_speed_kmh"), std::string::npos);

  cfg = EngineConfig{};
  cfg.routing.max_route_distance_km = -1;
  EXPECT_FALSE(validate_config(cfg, error));

  cfg = EngineConfig{};
  cfg.routing.max_travel_time_hours = 0;
  EXPECT_FALSE(validate_config(cfg, error));

  cfg = EngineConfig{};
  cfg.routing.buffer_time_minutes = -5;
  EXPECT_FALSE(validate_config(cfg, error));

  cfg = EngineConfig{};
  cfg.max_improvement_iterations = 0;
  EXPECT_FALSE(validate_config(cfg, error));
}

TEST(config, rejects_defaults_outside_request_ranges)
{
  std::string error;

  EngineConfig cfg;
  cfg.routing.default_speed_kmh = 250;
  EXPECT_FALSE(validate_config(cfg, error));
  EXPECT_NE(error.find("default_speed_kmh"), std::string::npos);

  cfg = EngineConfig{};
  cfg.routing.default_speed_kmh = 200;
  EXPECT_TRUE(validate_config(cfg, error)) << error;

  cfg = EngineConfig{};
  cfg.routing.default_service_time_minutes = 0.5;
  EXPECT_FALSE(validate_config(cfg, error));
  EXPECT_NE(error.find("default_service_time_minutes"), std::string::npos);

  cfg.routing.default_service_time_minutes = 7.5;
  EXPECT_FALSE(validate_config(cfg, error));

  cfg.routing.default_service_time_minutes = 121;
  EXPECT_FALSE(validate_config(cfg, error));

  cfg.routing.default_service_time_minutes = 120;
  EXPECT_TRUE(validate_config(cfg, error)) << error;
}

TEST(config, rejects_non_monotone_priorities)
{
  std::string error;

  EngineConfig cfg;
  cfg.priority.medium_priority_weight = cfg.priority.high_priority_weight;
  EXPECT_FALSE(validate_config(cfg, error));

  cfg = EngineConfig{};
  cfg.priority.penalty_missing_low_priority = cfg.priority.penalty_missing_high_priority + 1;
  EXPECT_FALSE(validate_config(cfg, error));

  cfg = EngineConfig{};
  cfg.priority.penalty_missing_low_priority = 0;
  EXPECT_TRUE(validate_config(cfg, error)) << error;
}

TEST(config, json_overlay_keeps_unset_fields)
{
  EngineConfig cfg;
  apply_config_json(json{{"max_route_distance_km", 80.0}, {"low_priority_weight", 0.5}}, cfg);
  EXPECT_DOUBLE_EQ(cfg.routing.max_route_distance_km, 80.0);
  EXPECT_DOUBLE_EQ(cfg.priority.low_priority_weight, 0.5);
  EXPECT_DOUBLE_EQ(cfg.routing.default_speed_kmh, 50.0);
}

TEST(config, load_config_file)
{
  const char* path = "route_engine_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"default_speed_kmh": 30, "max_improvement_iterations": 12})";
  }
  EngineConfig cfg;
  EXPECT_TRUE(load_config_file(path, cfg));
  EXPECT_DOUBLE_EQ(cfg.routing.default_speed_kmh, 30.0);
  EXPECT_EQ(cfg.max_improvement_iterations, 12);
  std::remove(path);

  EXPECT_FALSE(load_config_file("does_not_exist.json", cfg));
}

TEST(config, env_overrides)
{
  setenv("MAX_ROUTE_DISTANCE_KM", "75.5", 1);
  setenv("HIGH_PRIORITY_WEIGHT", "500", 1);
  setenv("MAX_IMPROVEMENT_ITERATIONS", "7", 1);

  EngineConfig cfg;
  apply_env_overrides(cfg);
  EXPECT_DOUBLE_EQ(cfg.routing.max_route_distance_km, 75.5);
  EXPECT_DOUBLE_EQ(cfg.priority.high_priority_weight, 500.0);
  EXPECT_EQ(cfg.max_improvement_iterations, 7);

  unsetenv("MAX_ROUTE_DISTANCE_KM");
  unsetenv("HIGH_PRIORITY_WEIGHT");
  unsetenv("MAX_IMPROVEMENT_ITERATIONS");
}

TEST(config, env_override_must_be_numeric)
{
  setenv("DEFAULT_SPEED_KMH", "fast", 1);
  EngineConfig cfg;
  EXPECT_THROW(apply_env_overrides(cfg), std::invalid_argument);
  unsetenv("DEFAULT_SPEED_KMH");
}

TEST(config, to_json)
{
  EngineConfig cfg;
  json j = config_to_json(cfg);
  EXPECT_DOUBLE_EQ(j["routing_config"]["buffer_time_minutes"].get<double>(), 15.0);
  EXPECT_DOUBLE_EQ(j["priority_config"]["medium_priority_weight"].get<double>(), 100.0);
  EXPECT_EQ(j["max_improvement_iterations"].get<int>(), 200);
}
