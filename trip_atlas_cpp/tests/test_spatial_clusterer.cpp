#include "trip_atlas/geo/geodesy.hpp"
#include "trip_atlas/trips/spatial_clusterer.hpp"

#include "capture_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using trip_atlas::Capture;
using trip_atlas::GeoPointList;
using Catch::Approx;
using namespace trip_atlas::testing;

namespace geo = trip_atlas::geo;
namespace trips = trip_atlas::trips;

TEST_CASE("nearby_captures_share_a_cluster_distant_ones_do_not") {
  std::vector<Capture> captures = {
      make_capture("Blue Jay", "a.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
      make_capture("Blue Jay", "b.jpg", "2024:01:05 07:50:00", 40.2, -74.1),
      make_capture("Robin", "c.jpg", "2024:01:05 09:00:00", 41.5, -75.5)};

  const auto clusters = trips::cluster_day("2024-01-05", timed_all(captures), 30.0);
  REQUIRE(clusters.size() == 2);
  REQUIRE(clusters[0].members.size() == 2);
  REQUIRE(clusters[0].members[0].capture->filename == "a.jpg");
  REQUIRE(clusters[0].members[1].capture->filename == "b.jpg");
  REQUIRE(clusters[1].members.size() == 1);
  REQUIRE(clusters[1].members[0].capture->filename == "c.jpg");
  REQUIRE(clusters[0].day_key == "2024-01-05");
}

TEST_CASE("membership_is_transitive_through_chains") {
  // Neighbours are ~22 km apart; the chain ends are ~44 km apart
  std::vector<Capture> captures = {
      make_capture("Gull", "p0.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
      make_capture("Gull", "p1.jpg", "2024:01:05 08:00:00", 40.2, -74.0),
      make_capture("Gull", "p2.jpg", "2024:01:05 09:00:00", 40.4, -74.0)};
  REQUIRE(geo::haversine_km(40.0, -74.0, 40.4, -74.0) > 30.0);

  const auto clusters = trips::cluster_day("2024-01-05", timed_all(captures), 30.0);
  REQUIRE(clusters.size() == 1);
  REQUIRE(clusters[0].members.size() == 3);
}

TEST_CASE("chain_order_does_not_matter") {
  // The bridging capture comes last in time
  std::vector<Capture> captures = {
      make_capture("Gull", "p0.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
      make_capture("Gull", "p2.jpg", "2024:01:05 08:00:00", 40.4, -74.0),
      make_capture("Gull", "p1.jpg", "2024:01:05 09:00:00", 40.2, -74.0)};

  const auto clusters = trips::cluster_day("2024-01-05", timed_all(captures), 30.0);
  REQUIRE(clusters.size() == 1);
  REQUIRE(clusters[0].members[2].capture->filename == "p1.jpg");
}

TEST_CASE("radius_is_inclusive") {
  GeoPointList pts(2, 2);
  pts << 40.0, -74.0,
         40.2, -74.1;
  const double d = geo::haversine_km(40.0, -74.0, 40.2, -74.1);

  const auto joined = trips::connected_components(pts, d);
  REQUIRE(joined[0] == joined[1]);

  const auto split = trips::connected_components(pts, d * 0.99);
  REQUIRE(split[0] == 0);
  REQUIRE(split[1] == 1);
}

TEST_CASE("clusters_are_ordered_by_earliest_member") {
  std::vector<Capture> captures = {
      make_capture("Heron", "north1.jpg", "2024:01:05 06:00:00", 42.0, -73.0),
      make_capture("Heron", "south1.jpg", "2024:01:05 07:00:00", 39.0, -75.0),
      make_capture("Heron", "north2.jpg", "2024:01:05 08:00:00", 42.01, -73.01)};

  const auto clusters = trips::cluster_day("2024-01-05", timed_all(captures), 30.0);
  REQUIRE(clusters.size() == 2);
  REQUIRE(clusters[0].members.front().capture->filename == "north1.jpg");
  REQUIRE(clusters[0].members.back().capture->filename == "north2.jpg");
  REQUIRE(clusters[1].members.front().capture->filename == "south1.jpg");
}

TEST_CASE("cluster_geometry_is_centroid_and_spread") {
  std::vector<Capture> captures = {
      make_capture("Blue Jay", "a.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
      make_capture("Blue Jay", "b.jpg", "2024:01:05 07:50:00", 40.2, -74.1)};

  const auto clusters = trips::cluster_day("2024-01-05", timed_all(captures), 30.0);
  REQUIRE(clusters.size() == 1);
  const auto &c = clusters[0];
  REQUIRE(c.centroid(0) == Approx(40.1));
  REQUIRE(c.centroid(1) == Approx(-74.05));
  REQUIRE(c.max_spread_km == Approx(geo::haversine_km(40.0, -74.0, 40.1, -74.05)));
}

TEST_CASE("captures_without_coordinates_and_empty_days_are_ignored") {
  std::vector<Capture> captures = {
      make_ungeotagged("Blue Jay", "a.jpg", "2024:01:05 07:00:00")};
  REQUIRE(trips::cluster_day("2024-01-05", timed_all(captures), 30.0).empty());
  REQUIRE(trips::cluster_day("2024-01-05", {}, 30.0).empty());
}
