#include "trip_atlas/core/errors.hpp"
#include "trip_atlas/engine/trip_engine.hpp"

#include "capture_fixtures.hpp"

#include <algorithm>
#include <limits>
#include <map>

#include <catch2/catch_test_macros.hpp>

using trip_atlas::Capture;
using trip_atlas::ExtraCapturePolicy;
using trip_atlas::FirstSeenMap;
using trip_atlas::Trip;
using trip_atlas::TripOptions;
using namespace trip_atlas::testing;

namespace engine = trip_atlas::engine;

namespace {

bool has_file(const Trip &trip, const std::string &filename) {
  const auto names = filenames_of(trip);
  return std::find(names.begin(), names.end(), filename) != names.end();
}

std::vector<Capture> blue_jay_morning() {
  return {make_capture("Blue Jay", "a.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
          make_capture("Blue Jay", "b.jpg", "2024:01:05 07:50:00", 40.2, -74.1)};
}

// Several days, several sites, some extras and an untimed capture
std::vector<Capture> busy_archive() {
  std::vector<Capture> captures;
  const char *days[] = {"2024:01:05", "2024:01:06", "2024:02:10", "2023:12:31", "2024:03:01"};
  const char *species[] = {"Blue Jay", "Robin", "Wren", "Osprey"};
  int n = 0;
  for (const char *day : days) {
    for (int site = 0; site < 3; ++site) {
      for (int k = 0; k < 3; ++k) {
        const std::string ts = std::string(day) + " 0" + std::to_string(6 + site) + ":" +
                               std::to_string(10 + k * 10) + ":00";
        Capture c = make_capture(species[(n + site) % 4], "img" + std::to_string(n) + ".jpg", ts,
                                 40.0 + site * 1.5 + k * 0.01, -74.0 - site * 0.5);
        c.park = site == 0 ? "Marsh Park" : (site == 1 ? "Ridge Park" : "");
        c.city = site == 2 ? "Hoboken" : "New York";
        captures.push_back(c);
        ++n;
      }
    }
    captures.push_back(make_ungeotagged("Heron", "extra" + std::to_string(n++) + ".jpg",
                                        std::string(day) + " 12:00:00"));
  }
  captures.push_back(make_capture("Gull", "untimed.jpg", "", 40.0, -74.0));
  return captures;
}

} // namespace

TEST_CASE("nearby_same_day_captures_form_one_trip") {
  const auto captures = blue_jay_morning();
  const auto result = engine::synthesize_trips(captures, FirstSeenMap{}, TripOptions{});

  REQUIRE(result.trips.size() == 1);
  const Trip &trip = result.trips[0];
  REQUIRE(trip.id == "trip-1");
  REQUIRE(trip.image_count == 2);
  REQUIRE(trip.species_count == 1);
  REQUIRE(trip.duration_label == "50m");
  REQUIRE(trip.day_key == "2024-01-05");
}

TEST_CASE("distant_capture_on_the_same_day_starts_a_second_trip") {
  auto captures = blue_jay_morning();
  captures.push_back(make_capture("Robin", "c.jpg", "2024:01:05 09:00:00", 41.5, -75.5));

  const auto result = engine::synthesize_trips(captures, FirstSeenMap{}, TripOptions{});
  REQUIRE(result.trips.size() == 2);
  REQUIRE(filenames_of(result.trips[0]) == std::vector<std::string>{"a.jpg", "b.jpg"});
  REQUIRE(filenames_of(result.trips[1]) == std::vector<std::string>{"c.jpg"});
  REQUIRE(result.trips[1].species == std::vector<std::string>{"Robin"});
  REQUIRE(result.stats.clusters == 2);
  REQUIRE(result.stats.days == 1);
}

TEST_CASE("extra_capture_policy_controls_where_ungeotagged_photos_go") {
  auto captures = blue_jay_morning();
  captures.push_back(make_capture("Robin", "c.jpg", "2024:01:05 09:00:00", 41.5, -75.5));
  captures.push_back(make_ungeotagged("Wren", "d.jpg", "2024:01:05 08:30:00"));

  TripOptions all;
  all.extra_capture_policy = ExtraCapturePolicy::ATTACH_ALL;
  const auto shared = engine::synthesize_trips(captures, FirstSeenMap{}, all);
  REQUIRE(shared.trips.size() == 2);
  REQUIRE(has_file(shared.trips[0], "d.jpg"));
  REQUIRE(has_file(shared.trips[1], "d.jpg"));

  TripOptions largest;
  largest.extra_capture_policy = ExtraCapturePolicy::LARGEST_CLUSTER;
  const auto single = engine::synthesize_trips(captures, FirstSeenMap{}, largest);
  REQUIRE(single.trips.size() == 2);
  REQUIRE(has_file(single.trips[0], "d.jpg"));
  REQUIRE_FALSE(has_file(single.trips[1], "d.jpg"));
  REQUIRE(single.trips[0].images.back().filename == "d.jpg");
  REQUIRE_FALSE(single.trips[0].images.back().lat.has_value());
}

TEST_CASE("days_without_geotagged_captures_yield_no_trip") {
  std::vector<Capture> captures = {make_ungeotagged("Wren", "d.jpg", "2024:01:05 08:30:00")};
  const auto result = engine::synthesize_trips(captures, FirstSeenMap{}, TripOptions{});
  REQUIRE(result.trips.empty());
  REQUIRE(result.stats.non_geotagged == 1);
  REQUIRE(result.stats.days == 0);
}

TEST_CASE("empty_archive_yields_no_trips") {
  const auto result = engine::synthesize_trips({}, FirstSeenMap{}, TripOptions{});
  REQUIRE(result.trips.empty());
  REQUIRE(result.stats.total_captures == 0);
  REQUIRE(result.stats.trips == 0);
}

TEST_CASE("trips_are_newest_day_first") {
  std::vector<Capture> captures = {
      make_capture("Blue Jay", "old.jpg", "2023:06:01 07:00:00", 40.0, -74.0),
      make_capture("Blue Jay", "new.jpg", "2024:06:01 07:00:00", 40.0, -74.0),
      make_capture("Blue Jay", "mid.jpg", "2024:01:01 07:00:00", 40.0, -74.0)};
  const auto result = engine::synthesize_trips(captures, FirstSeenMap{}, TripOptions{});
  REQUIRE(result.trips.size() == 3);
  REQUIRE(result.trips[0].day_key == "2024-06-01");
  REQUIRE(result.trips[1].day_key == "2024-01-01");
  REQUIRE(result.trips[2].day_key == "2023-06-01");
  REQUIRE(result.trips[2].id == "trip-3");
}

TEST_CASE("result_does_not_depend_on_worker_count") {
  const auto captures = busy_archive();
  const auto first_seen = engine::compute_first_seen_days(captures, trip_atlas::TimePolicy{});

  TripOptions serial;
  serial.parallel_workers = 1;
  TripOptions parallel;
  parallel.parallel_workers = 8;

  const auto a = engine::synthesize_trips(captures, first_seen, serial);
  const auto b = engine::synthesize_trips(captures, first_seen, parallel);
  const auto again = engine::synthesize_trips(captures, first_seen, parallel);

  REQUIRE(a.trips.size() == b.trips.size());
  REQUIRE(b.trips.size() == again.trips.size());
  for (size_t i = 0; i < a.trips.size(); ++i) {
    REQUIRE(a.trips[i].id == b.trips[i].id);
    REQUIRE(a.trips[i].location_title == b.trips[i].location_title);
    REQUIRE(filenames_of(a.trips[i]) == filenames_of(b.trips[i]));
    REQUIRE(filenames_of(b.trips[i]) == filenames_of(again.trips[i]));
  }
  REQUIRE(a.stats.clusters == b.stats.clusters);
}

TEST_CASE("every_timed_geotagged_capture_lands_in_exactly_one_trip") {
  const auto captures = busy_archive();
  TripOptions options;
  options.parallel_workers = 4;
  const auto result = engine::synthesize_trips(captures, FirstSeenMap{}, options);

  std::map<std::string, int> seen;
  for (const auto &trip : result.trips) {
    for (const auto &image : trip.images) {
      if (image.lat) ++seen[image.filename];
    }
    REQUIRE(trip.image_count == static_cast<int>(trip.images.size()));
    REQUIRE(trip.species_count == static_cast<int>(trip.species.size()));
    REQUIRE(trip.cover_index == trip.image_count - 1);
  }

  int expected = 0;
  for (const auto &c : captures) {
    if (c.is_geotagged() && !c.capture_date_raw.empty()) {
      ++expected;
      REQUIRE(seen[c.filename] == 1);
    }
  }
  REQUIRE(static_cast<int>(seen.size()) == expected);
  REQUIRE(result.stats.skipped_untimed == 1);
  REQUIRE(result.stats.total_captures == static_cast<int>(captures.size()));
  REQUIRE(result.stats.trips == static_cast<int>(result.trips.size()));
}

TEST_CASE("new_species_flag_matches_first_seen_days") {
  const auto captures = busy_archive();
  const auto first_seen = engine::compute_first_seen_days(captures, trip_atlas::TimePolicy{});
  const auto result = engine::synthesize_trips(captures, first_seen, TripOptions{});

  for (const auto &trip : result.trips) {
    bool expected = false;
    for (const auto &species : trip.species) {
      auto it = first_seen.find(species);
      if (it != first_seen.end() && it->second == trip.day_key) expected = true;
    }
    REQUIRE(trip.has_new_species == expected);
  }
}

TEST_CASE("first_seen_is_the_earliest_local_day_per_species") {
  std::vector<Capture> captures = {
      make_capture("Blue Jay", "1.jpg", "2024:01:05 07:00:00", 40.0, -74.0),
      make_ungeotagged("Blue Jay", "2.jpg", "2023:11:20 07:00:00"),
      make_capture("Robin", "3.jpg", "2024:02:01 07:00:00", 40.0, -74.0),
      make_capture("Robin", "4.jpg", "", 40.0, -74.0)};
  Capture late_evening = make_capture("Owl", "5.jpg", "2024:01:05 23:30:00", 40.0, -74.0);
  late_evening.utc_offset = "-05:00";
  captures.push_back(late_evening);
  captures.push_back(make_capture("Owl", "6.jpg", "2024-01-06T02:00:00Z", 40.0, -74.0));

  const auto first_seen = engine::compute_first_seen_days(captures, trip_atlas::TimePolicy{});
  REQUIRE(first_seen.size() == 3);
  REQUIRE(first_seen.at("Blue Jay") == "2023-11-20");
  REQUIRE(first_seen.at("Robin") == "2024-02-01");
  // 02:00Z is earlier than 23:30-05:00 (04:30Z)
  REQUIRE(first_seen.at("Owl") == "2024-01-06");
}

TEST_CASE("archive_summary_totals") {
  REQUIRE(engine::summarize_trips({}).largest_trip_label == "None yet");

  auto captures = blue_jay_morning();
  captures.push_back(make_capture("Robin", "c.jpg", "2024:01:05 09:00:00", 41.5, -75.5));
  captures.push_back(make_capture("Wren", "e.jpg", "2024:01:07 09:00:00", 41.5, -75.5));
  const auto result = engine::synthesize_trips(captures, FirstSeenMap{}, TripOptions{});

  const auto summary = engine::summarize_trips(result.trips);
  REQUIRE(summary.trip_count == 3);
  REQUIRE(summary.total_photos == 4);
  REQUIRE(summary.distinct_species == 3);
  REQUIRE(summary.trip_days == 2);
  REQUIRE(summary.largest_trip_label == "January 05, 2024 (2)");
}

TEST_CASE("invalid_trip_options_are_rejected") {
  const auto captures = blue_jay_morning();

  TripOptions zero_radius;
  zero_radius.cluster_radius_km = 0.0;
  REQUIRE_THROWS_AS(engine::synthesize_trips(captures, FirstSeenMap{}, zero_radius),
                    trip_atlas::ValidationError);

  TripOptions nan_radius;
  nan_radius.cluster_radius_km = std::numeric_limits<double>::quiet_NaN();
  REQUIRE_THROWS_AS(engine::synthesize_trips(captures, FirstSeenMap{}, nan_radius),
                    trip_atlas::ValidationError);

  TripOptions infinite_radius;
  infinite_radius.cluster_radius_km = std::numeric_limits<double>::infinity();
  REQUIRE_THROWS_AS(engine::validate_trip_options(infinite_radius), trip_atlas::ValidationError);

  TripOptions negative_dedup;
  negative_dedup.title_dedup_miles = -1.0;
  REQUIRE_THROWS_AS(engine::validate_trip_options(negative_dedup), trip_atlas::ValidationError);

  TripOptions anchors_over_labels;
  anchors_over_labels.max_park_anchors = 5;
  anchors_over_labels.max_title_labels = 4;
  REQUIRE_THROWS_AS(engine::validate_trip_options(anchors_over_labels), trip_atlas::ValidationError);

  REQUIRE_NOTHROW(engine::validate_trip_options(TripOptions{}));
}
