#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trip_atlas {

// Geometry types (lat, lon in degrees)
using GeoPoint = Eigen::Vector2d;
using GeoPointList = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;

// Calendar date "YYYY-MM-DD" of a capture's local wall clock
using DayKey = std::string;

using FirstSeenMap = std::map<std::string, DayKey>;

// How non-geotagged captures of a day are attached to that day's clusters
enum class ExtraCapturePolicy {
    ATTACH_ALL,
    LARGEST_CLUSTER
};

inline std::string extra_capture_policy_to_string(ExtraCapturePolicy policy) {
    switch (policy) {
        case ExtraCapturePolicy::ATTACH_ALL: return "attach_all";
        case ExtraCapturePolicy::LARGEST_CLUSTER: return "largest_cluster";
        default: return "unknown";
    }
}

inline std::optional<ExtraCapturePolicy> string_to_extra_capture_policy(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "attach_all") return ExtraCapturePolicy::ATTACH_ALL;
    if (norm == "largest_cluster") return ExtraCapturePolicy::LARGEST_CLUSTER;
    return std::nullopt;
}

// One photographic observation as delivered by the metadata stage
struct Capture {
    std::string species;
    std::string filename;
    std::string src;
    std::string thumb_src;
    std::string species_href;
    std::string capture_date_raw;   // EXIF DateTimeOriginal or ISO-8601
    std::string capture_date_iso;
    std::string utc_offset;         // EXIF OffsetTimeOriginal, e.g. "-05:00"

    double lat = std::numeric_limits<double>::quiet_NaN();
    double lon = std::numeric_limits<double>::quiet_NaN();

    std::string camera;
    std::string lens;
    std::string exposure;
    std::string aperture;
    std::string iso;

    // Reverse-geocoding labels
    std::string park;
    std::string site;
    std::string city;
    std::string state;
    std::string country;
    std::string location_label;

    bool is_geotagged() const {
        return std::isfinite(lat) && std::isfinite(lon);
    }

    // Raw timestamp preferred over the ISO rendering
    const std::string& timestamp_text() const {
        return capture_date_raw.empty() ? capture_date_iso : capture_date_raw;
    }
};

// Resolved capture instant
struct CaptureTime {
    int64_t utc_seconds = 0;
    int offset_minutes = 0;

    int64_t local_seconds() const {
        return utc_seconds + static_cast<int64_t>(offset_minutes) * 60;
    }
};

// A capture paired with its resolved time. Does not own the capture.
struct TimedCapture {
    const Capture* capture = nullptr;
    CaptureTime time;
    DayKey day_key;
};

// Connected component of same-day geotagged captures
struct GeoCluster {
    DayKey day_key;
    std::vector<TimedCapture> members;  // ascending by time
    GeoPoint centroid = GeoPoint::Zero();
    double max_spread_km = 0.0;
};

// A cluster after the day's non-geotagged captures were attached
struct MergedCluster {
    GeoCluster geo;
    std::vector<TimedCapture> captures;  // geo members + extras, ascending by time
};

// Output of the location labeler
struct TripLocation {
    std::string title;
    std::vector<std::string> locations;
};

// Pass-through image record consumed by the renderer
struct TripImage {
    std::string src;
    std::string thumb_src;
    std::string species;
    std::string species_href;
    std::string filename;
    std::string capture_date;       // "January 05, 2024"
    std::string capture_date_iso;
    std::optional<double> lat;
    std::optional<double> lon;
};

struct Trip {
    std::string id;
    DayKey day_key;
    std::string location_title;
    std::string date_label;
    std::string duration_label;
    std::string time_range;
    int image_count = 0;
    int species_count = 0;
    std::string top_species_label;
    bool has_new_species = false;
    std::string new_species_label;
    std::string gear_label;
    std::vector<std::string> species;
    std::vector<std::string> locations;
    GeoPoint centroid = GeoPoint::Zero();
    double max_spread_km = 0.0;
    std::vector<TripImage> images;
    int cover_index = -1;
    TripImage cover;
    std::string map_href;

    // Instant of the first capture, used as a ranking tie-break
    int64_t start_utc_seconds = 0;
};

// Counters exposed alongside the trips
struct SynthesisStats {
    int total_captures = 0;
    int geotagged = 0;
    int non_geotagged = 0;
    int skipped_untimed = 0;   // no resolvable local day
    int days = 0;
    int clusters = 0;
    int trips = 0;
};

struct TripSynthesis {
    std::vector<Trip> trips;
    SynthesisStats stats;
};

// Archive-level facts shown above the trip list
struct TripArchiveSummary {
    int trip_count = 0;
    int total_photos = 0;
    int distinct_species = 0;
    int trip_days = 0;
    std::string largest_trip_label;
};

// Time zone policy for captures without an embedded offset
struct TimePolicy {
    int default_offset_minutes = 0;
};

struct TripOptions {
    double cluster_radius_km = 30.0;
    double title_dedup_miles = 3.0;
    ExtraCapturePolicy extra_capture_policy = ExtraCapturePolicy::ATTACH_ALL;
    int max_park_anchors = 2;
    int max_title_labels = 4;
    TimePolicy time;
    std::string site_root = "birdopedia";
    int parallel_workers = 1;
};

// CLI phase enumeration
enum class Phase {
    LOAD_INPUT = 0,
    FIRST_SEEN = 1,
    SYNTHESIZE = 2,
    WRITE_OUTPUT = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_INPUT: return "LOAD_INPUT";
        case Phase::FIRST_SEEN: return "FIRST_SEEN";
        case Phase::SYNTHESIZE: return "SYNTHESIZE";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace trip_atlas
