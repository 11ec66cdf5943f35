#include "trip_atlas/trips/day_partitioner.hpp"

#include "capture_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

using trip_atlas::Capture;
using trip_atlas::TimePolicy;
using namespace trip_atlas::testing;

namespace trips = trip_atlas::trips;

TEST_CASE("partition_counts_geotagged_extras_and_untimed") {
  std::vector<Capture> captures = {
      make_capture("Blue Jay", "a.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
      make_ungeotagged("Robin", "b.jpg", "2024:01:05 08:00:00"),
      make_capture("Robin", "c.jpg", "", 40.0, -74.0),
      make_ungeotagged("Wren", "d.jpg", "garbage"),
      make_capture("Wren", "e.jpg", "2024:01:06 09:00:00", 40.0, -74.0)};

  const auto part = trips::partition_by_day(captures, TimePolicy{});
  REQUIRE(part.geotagged_count == 3);
  REQUIRE(part.non_geotagged_count == 2);
  REQUIRE(part.skipped_untimed == 2);

  REQUIRE(part.geotagged.size() == 2);
  REQUIRE(part.geotagged.at("2024-01-05").size() == 1);
  REQUIRE(part.geotagged.at("2024-01-06").size() == 1);
  REQUIRE(part.extras.size() == 1);
  REQUIRE(part.extras.at("2024-01-05").front().capture->filename == "b.jpg");
}

TEST_CASE("buckets_are_ascending_by_instant") {
  std::vector<Capture> captures = {
      make_capture("Blue Jay", "late.jpg", "2024:01:05 17:00:00", 40.0, -74.0),
      make_capture("Blue Jay", "early.jpg", "2024:01:05 06:00:00", 40.0, -74.0),
      make_capture("Blue Jay", "noon.jpg", "2024:01:05 12:00:00", 40.0, -74.0)};

  const auto part = trips::partition_by_day(captures, TimePolicy{});
  const auto &bucket = part.geotagged.at("2024-01-05");
  REQUIRE(bucket.size() == 3);
  REQUIRE(bucket[0].capture->filename == "early.jpg");
  REQUIRE(bucket[1].capture->filename == "noon.jpg");
  REQUIRE(bucket[2].capture->filename == "late.jpg");
}

TEST_CASE("equal_instants_keep_input_order") {
  std::vector<Capture> captures = {
      make_capture("Blue Jay", "first.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
      make_capture("Robin", "second.jpg", "2024:01:05 07:00:00", 40.0, -74.0)};

  const auto part = trips::partition_by_day(captures, TimePolicy{});
  const auto &bucket = part.geotagged.at("2024-01-05");
  REQUIRE(bucket[0].capture->filename == "first.jpg");
  REQUIRE(bucket[1].capture->filename == "second.jpg");
}

TEST_CASE("day_key_follows_local_clock_of_each_capture") {
  Capture evening = make_capture("Owl", "owl.jpg", "2024:01:05 22:30:00", 40.0, -74.0);
  evening.utc_offset = "-05:00";
  Capture morning = make_capture("Owl", "owl2.jpg", "2024-01-06T03:45:00Z", 40.0, -74.0);
  morning.utc_offset = "-05:00";

  std::vector<Capture> captures = {evening, morning};
  const auto part = trips::partition_by_day(captures, TimePolicy{});
  REQUIRE(part.geotagged.size() == 1);
  REQUIRE(part.geotagged.at("2024-01-05").size() == 2);
}

TEST_CASE("iso_field_is_used_when_raw_is_missing") {
  Capture c = make_capture("Blue Jay", "a.jpg", "", 40.0, -74.0);
  c.capture_date_iso = "2024-03-10T10:00:00";
  auto tc = trips::resolve_capture(c, TimePolicy{});
  REQUIRE(tc.has_value());
  REQUIRE(tc->day_key == "2024-03-10");
  REQUIRE(tc->capture == &c);
}
