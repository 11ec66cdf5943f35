#include "trip_atlas/trips/location_labeler.hpp"
#include "trip_atlas/core/utils.hpp"
#include "trip_atlas/geo/geodesy.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace trip_atlas::trips {

namespace {

std::string unify_apostrophes(const std::string& s) {
    static const std::string kRightQuote = "\xE2\x80\x99";
    static const std::string kLeftQuote = "\xE2\x80\x98";

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        if (s.compare(i, kRightQuote.size(), kRightQuote) == 0 ||
            s.compare(i, kLeftQuote.size(), kLeftQuote) == 0) {
            out += '\'';
            i += kRightQuote.size();
        } else if (s[i] == '`') {
            out += '\'';
            ++i;
        } else {
            out += s[i];
            ++i;
        }
    }
    return out;
}

double min_distance_miles(const GeoPoint& p, const std::vector<GeoPoint>& centers) {
    double best = std::numeric_limits<double>::infinity();
    for (const auto& c : centers) {
        best = std::min(best, geo::km_to_miles(geo::haversine_km(p, c)));
    }
    return best;
}

std::string format_point(double lat, double lon) {
    return core::format_fixed(lat, 3) + ", " + core::format_fixed(lon, 3);
}

} // namespace

std::string normalize_label(const std::string& label) {
    return core::to_lower(core::collapse_whitespace(unify_apostrophes(label)));
}

int label_quality(const std::string& label) {
    int upper = 0;
    for (unsigned char c : label) {
        if (c >= 'A' && c <= 'Z') ++upper;
    }
    return upper * 10 + static_cast<int>(label.size());
}

bool is_generic_admin(const std::string& label) {
    const std::string token = normalize_label(label);
    return core::starts_with(token, "town of ") ||
           core::starts_with(token, "city of ") ||
           core::ends_with(token, " county") ||
           core::ends_with(token, " township");
}

std::string park_or_site(const Capture& capture) {
    std::string park = core::trim(capture.park);
    if (!park.empty()) return park;
    return core::trim(capture.site);
}

std::string best_location_detail(const Capture& capture) {
    std::string label = core::trim(capture.location_label);
    if (!label.empty()) return label;

    std::vector<std::string> parts;
    for (const auto* part : {&capture.city, &capture.state, &capture.country}) {
        std::string value = core::trim(*part);
        if (!value.empty()) parts.push_back(value);
    }
    if (!parts.empty()) return core::join(parts, ", ");

    if (capture.is_geotagged()) return format_point(capture.lat, capture.lon);
    return "";
}

std::vector<LabelCandidate> rank_label_candidates(const std::vector<TimedCapture>& captures,
                                                  const LabelField& field,
                                                  bool exclude_generic_admin) {
    std::vector<LabelCandidate> groups;
    std::unordered_map<std::string, size_t> index_of;

    for (const auto& tc : captures) {
        const Capture& capture = *tc.capture;
        if (!capture.is_geotagged()) continue;

        const std::string value = core::trim(field(capture));
        if (value.empty()) continue;
        const std::string key = normalize_label(value);
        if (key.empty()) continue;
        if (exclude_generic_admin && is_generic_admin(value)) continue;

        auto it = index_of.find(key);
        if (it == index_of.end()) {
            it = index_of.emplace(key, groups.size()).first;
            LabelCandidate fresh;
            fresh.label = value;
            fresh.normalized = key;
            groups.push_back(std::move(fresh));
        }
        LabelCandidate& group = groups[it->second];
        if (label_quality(value) > label_quality(group.label)) {
            group.label = value;
        }
        ++group.count;
        group.centroid += GeoPoint(capture.lat, capture.lon);
    }

    for (auto& group : groups) {
        group.centroid /= static_cast<double>(std::max(1, group.count));
    }

    std::stable_sort(groups.begin(), groups.end(),
                     [](const LabelCandidate& a, const LabelCandidate& b) {
                         if (a.count != b.count) return a.count > b.count;
                         return label_quality(a.label) > label_quality(b.label);
                     });
    return groups;
}

TripLocation label_trip(const GeoCluster& cluster, const LabelOptions& options) {
    TripLocation out;
    const auto& members = cluster.members;

    // Park/site anchors: the top one always, later ones only when far enough apart
    const auto parks = rank_label_candidates(members, park_or_site, false);
    std::vector<std::string> title_labels;
    std::vector<GeoPoint> title_centers;
    for (const auto& park : parks) {
        if (static_cast<int>(title_labels.size()) >= options.max_park_anchors) break;
        if (title_labels.empty() ||
            min_distance_miles(park.centroid, title_centers) >= options.dedup_miles) {
            title_labels.push_back(park.label);
            title_centers.push_back(park.centroid);
        }
    }

    const auto cities = rank_label_candidates(
        members, [](const Capture& c) { return c.city; }, true);

    if (!title_labels.empty()) {
        for (const auto& city : cities) {
            if (static_cast<int>(title_labels.size()) >= options.max_title_labels) break;
            const bool duplicate = std::any_of(
                title_labels.begin(), title_labels.end(),
                [&](const std::string& l) { return normalize_label(l) == city.normalized; });
            if (duplicate) continue;
            if (min_distance_miles(city.centroid, title_centers) >= options.dedup_miles) {
                title_labels.push_back(city.label);
                title_centers.push_back(city.centroid);
            }
        }

        std::vector<std::string> preferred;
        for (const auto& label : title_labels) {
            if (!is_generic_admin(label)) preferred.push_back(label);
        }
        out.title = core::join(preferred.empty() ? title_labels : preferred, ", ");
    } else {
        // No anchors: raw cities in capture order, then free-form labels, then coordinates
        std::vector<std::string> raw_cities;
        std::vector<std::string> free_form;
        for (const auto& tc : members) {
            const std::string city = core::trim(tc.capture->city);
            if (!city.empty() && std::find(raw_cities.begin(), raw_cities.end(), city) == raw_cities.end()) {
                raw_cities.push_back(city);
            }
            const std::string label = core::trim(tc.capture->location_label);
            if (!label.empty() && std::find(free_form.begin(), free_form.end(), label) == free_form.end()) {
                free_form.push_back(label);
            }
        }
        if (!raw_cities.empty()) {
            raw_cities.resize(std::min<size_t>(raw_cities.size(), 2));
            out.title = core::join(raw_cities, ", ");
        } else if (!free_form.empty()) {
            free_form.resize(std::min<size_t>(free_form.size(), 2));
            out.title = core::join(free_form, ", ");
        } else {
            out.title = format_point(cluster.centroid(0), cluster.centroid(1));
        }
    }

    std::unordered_set<std::string> seen;
    for (const auto& tc : members) {
        std::string detail = best_location_detail(*tc.capture);
        if (detail.empty()) continue;
        if (seen.insert(detail).second) {
            out.locations.push_back(std::move(detail));
        }
    }

    return out;
}

} // namespace trip_atlas::trips
