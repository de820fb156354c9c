#include "events.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using json = nlohmann::json;

namespace {

json run(const json& event, std::ostream& out)
{
  HeuristicSolver solver(EngineConfig{});
  return process_event(solver, event, out);
}

json run(const json& event)
{
  std::ostringstream out;
  return run(event, out);
}

}  // namespace

TEST(events, optimize_route)
{
  json result = run(json{{"id", 7}, {"type", "optimize_route"}, {"request", example_request()}});
  EXPECT_EQ(result["id"], 7);
  ASSERT_FALSE(result.contains("error")) << result.dump();
  ASSERT_TRUE(result["route"].is_array());
  EXPECT_GE(result["route"].size(), 2u);
  EXPECT_EQ(result["optimization_metrics"]["optimization_method"], "priority");
}

TEST(events, type_defaults_to_optimize_route)
{
  json result = run(json{{"id", "a"}, {"request", example_request()}});
  EXPECT_EQ(result["id"], "a");
  EXPECT_TRUE(result.contains("route")) << result.dump();
}

TEST(events, debug_route_prints_summary)
{
  std::ostringstream out;
  json result = run(json{{"id", 1}, {"type", "debug_route"}, {"request", example_request()}}, out);
  EXPECT_TRUE(result.contains("route")) << result.dump();
  EXPECT_NE(out.str().find("=== ROUTE ==="), std::string::npos);
  EXPECT_NE(out.str().find("Warehouse, Mumbai"), std::string::npos);
}

TEST(events, invalid_request_is_a_validation_error)
{
  json request = example_request();
  request["deliveries"][0]["lat"] = 95.0;
  json result = run(json{{"id", 2}, {"type", "optimize_route"}, {"request", request}});
  EXPECT_EQ(result["id"], 2);
  EXPECT_EQ(result["error"], "Validation failed");
  EXPECT_NE(result["details"].get<std::string>().find("deliveries[0].lat"), std::string::npos);
}

TEST(events, missing_request)
{
  json result = run(json{{"id", 3}, {"type", "debug_route"}});
  EXPECT_EQ(result["error"], "Validation failed");
  EXPECT_EQ(result["details"], "request is required");
}

TEST(events, distance_matrix)
{
  json event = json::parse(R"({"id": 4, "type": "distance_matrix", "speed_kmph": 60,
                               "points": [{"lat": 0, "lng": 0}, {"lat": 0, "lng": 0.1}]})");
  json result = run(event);
  ASSERT_FALSE(result.contains("error")) << result.dump();
  EXPECT_DOUBLE_EQ(result["distances"][0][0].get<double>(), 0.0);
  EXPECT_NEAR(result["distances"][0][1].get<double>(), 11.1195, 0.001);
  EXPECT_NEAR(result["times"][1][0].get<double>(), 11.1195, 0.001);
  EXPECT_EQ(result["points"].size(), 2u);
}

TEST(events, distance_matrix_rejects_bad_input)
{
  json event = json::parse(R"({"type": "distance_matrix", "speed_kmph": 0,
                               "points": [{"lat": 0, "lng": 0}, {"lat": 0, "lng": 0.1}]})");
  EXPECT_EQ(run(event)["error"], "Validation failed");

  event["speed_kmph"] = "fast";
  EXPECT_EQ(run(event)["error"], "Validation failed");

  event.erase("speed_kmph");
  event["points"] = json::array();
  EXPECT_EQ(run(event)["error"], "Validation failed");
}

TEST(events, config)
{
  json result = run(json{{"id", 5}, {"type", "config"}});
  EXPECT_DOUBLE_EQ(result["routing_config"]["default_speed_kmh"].get<double>(), 50.0);
  EXPECT_EQ(result["max_improvement_iterations"], 200);
}

TEST(events, example)
{
  json result = run(json{{"id", 6}, {"type", "example"}});
  EXPECT_EQ(result["request"], example_request());
}

TEST(events, unknown_type)
{
  json result = run(json{{"id", 8}, {"type", "reroute"}});
  EXPECT_EQ(result["id"], 8);
  EXPECT_EQ(result["error"], "unknown event type: reroute");
}

TEST(events, non_string_type_is_reported_not_thrown)
{
  json result;
  EXPECT_NO_THROW(result = run(json{{"id", 2}, {"type", 5}}));
  EXPECT_EQ(result["id"], 2);
  EXPECT_EQ(result["error"], "event type must be a string");
}

TEST(events, batch_continues_past_malformed_event)
{
  json events = json::parse(R"([{"id": 1, "type": "config"}, {"id": 2, "type": 5},
                                {"id": 3, "type": "example"}, 42])");
  HeuristicSolver solver(EngineConfig{});
  std::ostringstream out;

  json results = json::array();
  for (const auto& event : events) results.push_back(process_event(solver, event, out));

  ASSERT_EQ(results.size(), 4u);
  EXPECT_FALSE(results[0].contains("error"));
  EXPECT_TRUE(results[1].contains("error"));
  EXPECT_TRUE(results[2].contains("request"));
  EXPECT_EQ(results[3]["error"], "event must be an object");
}
