#include "trip_atlas/config/configuration.hpp"
#include "trip_atlas/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace trip_atlas::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top-level YAML node must be a mapping");
    }

    try {
        if (node["trips"]) {
            auto t = node["trips"];
            if (t["cluster_radius_km"]) cfg.trips.cluster_radius_km = t["cluster_radius_km"].as<double>();
            if (t["title_dedup_miles"]) cfg.trips.title_dedup_miles = t["title_dedup_miles"].as<double>();
            if (t["extra_capture_policy"]) cfg.trips.extra_capture_policy = t["extra_capture_policy"].as<std::string>();
            if (t["max_park_anchors"]) cfg.trips.max_park_anchors = t["max_park_anchors"].as<int>();
            if (t["max_title_labels"]) cfg.trips.max_title_labels = t["max_title_labels"].as<int>();
        }

        if (node["time"]) {
            auto tm = node["time"];
            if (tm["default_utc_offset_minutes"]) {
                cfg.time.default_utc_offset_minutes = tm["default_utc_offset_minutes"].as<int>();
            }
        }

        if (node["links"]) {
            auto l = node["links"];
            if (l["site_root"]) cfg.links.site_root = l["site_root"].as<std::string>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["json_indent"]) cfg.output.json_indent = o["json_indent"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    file << emitter.c_str() << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["trips"]["cluster_radius_km"] = trips.cluster_radius_km;
    node["trips"]["title_dedup_miles"] = trips.title_dedup_miles;
    node["trips"]["extra_capture_policy"] = trips.extra_capture_policy;
    node["trips"]["max_park_anchors"] = trips.max_park_anchors;
    node["trips"]["max_title_labels"] = trips.max_title_labels;

    node["time"]["default_utc_offset_minutes"] = time.default_utc_offset_minutes;

    node["links"]["site_root"] = links.site_root;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    node["output"]["json_indent"] = output.json_indent;

    return node;
}

void Config::validate() const {
    if (!std::isfinite(trips.cluster_radius_km) || trips.cluster_radius_km <= 0.0) {
        throw ValidationError("trips.cluster_radius_km must be > 0");
    }
    if (!std::isfinite(trips.title_dedup_miles) || trips.title_dedup_miles < 0.0) {
        throw ValidationError("trips.title_dedup_miles must be >= 0");
    }
    if (!string_to_extra_capture_policy(trips.extra_capture_policy)) {
        throw ValidationError("trips.extra_capture_policy must be 'attach_all' or 'largest_cluster'");
    }
    if (trips.max_park_anchors < 1) {
        throw ValidationError("trips.max_park_anchors must be >= 1");
    }
    if (trips.max_title_labels < trips.max_park_anchors) {
        throw ValidationError("trips.max_title_labels must be >= max_park_anchors");
    }

    if (time.default_utc_offset_minutes < -18 * 60 || time.default_utc_offset_minutes > 18 * 60) {
        throw ValidationError("time.default_utc_offset_minutes must be in [-1080,1080]");
    }

    if (links.site_root.empty()) {
        throw ValidationError("links.site_root must not be empty");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }

    if (output.json_indent < -1 || output.json_indent > 8) {
        throw ValidationError("output.json_indent must be in [-1,8]");
    }
}

TripOptions Config::trip_options() const {
    TripOptions opts;
    opts.cluster_radius_km = trips.cluster_radius_km;
    opts.title_dedup_miles = trips.title_dedup_miles;
    opts.extra_capture_policy =
        string_to_extra_capture_policy(trips.extra_capture_policy).value_or(ExtraCapturePolicy::ATTACH_ALL);
    opts.max_park_anchors = trips.max_park_anchors;
    opts.max_title_labels = trips.max_title_labels;
    opts.time.default_offset_minutes = time.default_utc_offset_minutes;
    opts.site_root = links.site_root;
    opts.parallel_workers = runtime.parallel_workers;
    return opts;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "trips": {
      "type": "object",
      "properties": {
        "cluster_radius_km": {"type": "number", "exclusiveMinimum": 0},
        "title_dedup_miles": {"type": "number", "minimum": 0},
        "extra_capture_policy": {"type": "string", "enum": ["attach_all", "largest_cluster"]},
        "max_park_anchors": {"type": "integer", "minimum": 1},
        "max_title_labels": {"type": "integer", "minimum": 1}
      }
    },
    "time": {
      "type": "object",
      "properties": {
        "default_utc_offset_minutes": {"type": "integer", "minimum": -1080, "maximum": 1080}
      }
    },
    "links": {
      "type": "object",
      "properties": {
        "site_root": {"type": "string", "minLength": 1}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "json_indent": {"type": "integer", "minimum": -1, "maximum": 8}
      }
    }
  }
})";
}

} // namespace trip_atlas::config
