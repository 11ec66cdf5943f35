#pragma once

#include "trip_atlas/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace trip_atlas::trips {

// Trim, collapse whitespace, unify apostrophes, lower-case
std::string normalize_label(const std::string& label);

// Uppercase letters x 10 + length; favours fuller, capitalised spellings
int label_quality(const std::string& label);

// "town of ...", "city of ...", "... county", "... township"
bool is_generic_admin(const std::string& label);

struct LabelCandidate {
    std::string label;        // best-quality spelling within the group
    std::string normalized;
    int count = 0;
    GeoPoint centroid = GeoPoint::Zero();
};

using LabelField = std::function<std::string(const Capture&)>;

// Groups geotagged captures by normalized field value, ranked by
// (count desc, quality desc); ties keep first-appearance order.
std::vector<LabelCandidate> rank_label_candidates(const std::vector<TimedCapture>& captures,
                                                  const LabelField& field,
                                                  bool exclude_generic_admin);

// Park label, else site label
std::string park_or_site(const Capture& capture);

// locationLabel, else "city, state, country", else "lat, lon"
std::string best_location_detail(const Capture& capture);

struct LabelOptions {
    double dedup_miles = 3.0;
    int max_park_anchors = 2;
    int max_title_labels = 4;
};

TripLocation label_trip(const GeoCluster& cluster, const LabelOptions& options);

} // namespace trip_atlas::trips
