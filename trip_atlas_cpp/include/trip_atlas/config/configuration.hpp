#pragma once

#include "trip_atlas/core/types.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace trip_atlas::config {

namespace fs = std::filesystem;

struct TripsConfig {
  double cluster_radius_km = 30.0;
  double title_dedup_miles = 3.0;
  std::string extra_capture_policy = "attach_all"; // attach_all | largest_cluster
  int max_park_anchors = 2;
  int max_title_labels = 4;
};

struct TimeConfig {
  int default_utc_offset_minutes = 0; // used when a capture carries no offset
};

struct LinksConfig {
  std::string site_root = "birdopedia";
};

struct RuntimeConfig {
  int parallel_workers = 4;
};

struct OutputConfig {
  int json_indent = 2; // -1 = compact
};

struct Config {
  TripsConfig trips;
  TimeConfig time;
  LinksConfig links;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Engine parameters derived from a validated config
  TripOptions trip_options() const;
};

std::string get_schema_json();

} // namespace trip_atlas::config
