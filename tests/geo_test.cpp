#include "geo.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(geo, distance_is_zero_for_same_point)
{
  GeoPoint p{18.9356, 72.8376};
  EXPECT_DOUBLE_EQ(distance_km(p, p), 0.0);
}

TEST(geo, one_degree_of_longitude_on_equator)
{
  EXPECT_NEAR(distance_km(GeoPoint{0, 0}, GeoPoint{0, 1}), 111.195, 0.01);
}

TEST(geo, london_to_paris)
{
  GeoPoint london{51.5074, -0.1278};
  GeoPoint paris{48.8566, 2.3522};
  EXPECT_NEAR(distance_km(london, paris), 343.5, 1.0);
}

TEST(geo, distance_is_symmetric)
{
  GeoPoint a{18.9447, 72.8235};
  GeoPoint b{19.0158, 72.8438};
  EXPECT_DOUBLE_EQ(distance_km(a, b), distance_km(b, a));
}

TEST(geo, antipodal_points)
{
  EXPECT_NEAR(distance_km(GeoPoint{0, 0}, GeoPoint{0, 180}), 20015.1, 0.5);
}

TEST(geo, triangle_inequality)
{
  GeoPoint a{18.9356, 72.8376};
  GeoPoint b{18.9894, 72.8295};
  GeoPoint c{19.0158, 72.8438};
  EXPECT_LE(distance_km(a, c), distance_km(a, b) + distance_km(b, c) + 1e-9);
  EXPECT_LE(distance_km(a, b), distance_km(a, c) + distance_km(c, b) + 1e-9);
}

TEST(geo, travel_minutes_scales_with_speed)
{
  GeoPoint a{0, 0};
  GeoPoint b{0, 1};
  double km = distance_km(a, b);
  EXPECT_NEAR(travel_minutes(a, b, 60.0), km, 1e-9);
  EXPECT_NEAR(travel_minutes(a, b, 30.0), 2 * km, 1e-9);
}

TEST(geo, travel_minutes_rejects_non_positive_speed)
{
  GeoPoint a{0, 0};
  GeoPoint b{0, 1};
  EXPECT_THROW(travel_minutes(a, b, 0.0), std::invalid_argument);
  EXPECT_THROW(travel_minutes(a, b, -5.0), std::invalid_argument);
}

TEST(geo, coordinate_ranges)
{
  EXPECT_TRUE(is_valid_coordinate(90, 180));
  EXPECT_TRUE(is_valid_coordinate(-90, -180));
  EXPECT_FALSE(is_valid_coordinate(90.5, 0));
  EXPECT_FALSE(is_valid_coordinate(0, -180.1));
}

TEST(geo, matrices)
{
  std::vector<GeoPoint> points{{0, 0}, {0, 0.1}, {0.1, 0.1}};
  auto dist  = build_distance_matrix(points);
  auto times = build_time_matrix(points, 60.0);

  ASSERT_EQ(dist.size(), 3u);
  for (size_t i = 0; i < 3; i++) {
    EXPECT_DOUBLE_EQ(dist[i][i], 0.0);
    EXPECT_DOUBLE_EQ(times[i][i], 0.0);
    for (size_t j = 0; j < 3; j++) {
      EXPECT_DOUBLE_EQ(dist[i][j], dist[j][i]);
      EXPECT_NEAR(times[i][j], dist[i][j], 1e-9);
    }
  }
  EXPECT_NEAR(dist[0][1], 11.1195, 0.001);
}
