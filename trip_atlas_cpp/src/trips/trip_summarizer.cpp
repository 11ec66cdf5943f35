#include "trip_atlas/trips/trip_summarizer.hpp"
#include "trip_atlas/core/capture_time.hpp"
#include "trip_atlas/core/errors.hpp"
#include "trip_atlas/core/utils.hpp"
#include "trip_atlas/trips/aggregate.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace trip_atlas::trips {

namespace {

// encodeURIComponent keeps "'"; web paths must not
std::string encode_path_part(const std::string& part) {
    std::string encoded = core::encode_uri_component(part);
    std::string out;
    out.reserve(encoded.size());
    for (char c : encoded) {
        if (c == '\'') {
            out += "%27";
        } else {
            out += c;
        }
    }
    return out;
}

std::string known_gear_value(const std::string& value) {
    std::string v = core::trim(value);
    if (v == "Unknown") return "";
    return v;
}

} // namespace

std::string format_duration_minutes(int64_t minutes) {
    if (minutes <= 0) {
        return "0m";
    }
    const int64_t hours = minutes / 60;
    const int64_t rest = minutes % 60;
    if (hours == 0) {
        return std::to_string(rest) + "m";
    }
    if (rest == 0) {
        return std::to_string(hours) + "h";
    }
    return std::to_string(hours) + "h " + std::to_string(rest) + "m";
}

int64_t elapsed_minutes(const CaptureTime& first, const CaptureTime& last) {
    const double seconds = static_cast<double>(last.utc_seconds - first.utc_seconds);
    return std::max<int64_t>(0, static_cast<int64_t>(std::llround(seconds / 60.0)));
}

std::string species_href_for(const std::string& species, const std::string& site_root) {
    return "/" + encode_path_part(site_root) + "/" + encode_path_part(species) + "/index.html";
}

std::string map_href_for(const TripImage& cover, const std::string& site_root) {
    return "/" + encode_path_part(site_root) + "/map/index.html?species=" +
           core::encode_uri_component(cover.species) + "&focus=all&image=" +
           core::encode_uri_component(cover.filename);
}

TripImage to_trip_image(const TimedCapture& tc, const std::string& site_root) {
    const Capture& c = *tc.capture;
    TripImage image;
    image.src = c.src;
    image.thumb_src = c.thumb_src.empty() ? c.src : c.thumb_src;
    image.species = c.species;
    image.species_href = c.species_href.empty() ? species_href_for(c.species, site_root) : c.species_href;
    image.filename = c.filename;
    image.capture_date = core::format_display_date(tc.time);
    image.capture_date_iso = c.capture_date_iso;
    if (c.is_geotagged()) {
        image.lat = c.lat;
        image.lon = c.lon;
    }
    return image;
}

std::string top_species_label(const std::vector<TimedCapture>& captures) {
    auto top = top_by_count(captures, [](const TimedCapture& tc) { return tc.capture->species; });
    if (!top) return "Unknown";
    return top->key + " (" + std::to_string(top->count) + ")";
}

std::string gear_label(const std::vector<TimedCapture>& captures) {
    auto camera = top_by_count(captures, [](const TimedCapture& tc) {
        return known_gear_value(tc.capture->camera);
    });
    auto lens = top_by_count(captures, [](const TimedCapture& tc) {
        return known_gear_value(tc.capture->lens);
    });
    return (camera ? camera->key : std::string("Unknown camera")) + " + " +
           (lens ? lens->key : std::string("Unknown lens"));
}

std::vector<std::string> distinct_species(const std::vector<TimedCapture>& captures) {
    std::set<std::string> unique;
    for (const auto& tc : captures) {
        unique.insert(tc.capture->species);
    }
    std::vector<std::string> species(unique.begin(), unique.end());
    std::sort(species.begin(), species.end(), core::less_ci);
    return species;
}

std::vector<std::string> new_species_on(const std::vector<std::string>& species,
                                        const DayKey& day,
                                        const FirstSeenMap& first_seen) {
    std::vector<std::string> fresh;
    for (const auto& name : species) {
        auto it = first_seen.find(name);
        if (it != first_seen.end() && it->second == day) {
            fresh.push_back(name);
        }
    }
    return fresh;
}

Trip summarize_trip(const MergedCluster& cluster,
                    const TripLocation& location,
                    const FirstSeenMap& first_seen,
                    const std::string& site_root) {
    const auto& captures = cluster.captures;
    if (captures.empty()) {
        throw ValidationError("cannot summarize a trip without captures");
    }
    const TimedCapture& first = captures.front();
    const TimedCapture& last = captures.back();

    Trip trip;
    trip.day_key = cluster.geo.day_key;
    trip.location_title = location.title;
    trip.locations = location.locations;
    trip.centroid = cluster.geo.centroid;
    trip.max_spread_km = cluster.geo.max_spread_km;
    trip.start_utc_seconds = first.time.utc_seconds;

    trip.date_label = core::format_display_date(first.time);
    trip.time_range = core::format_clock(first.time) + "\xE2\x80\x93" + core::format_clock(last.time);
    trip.duration_label = format_duration_minutes(elapsed_minutes(first.time, last.time));

    trip.species = distinct_species(captures);
    trip.species_count = static_cast<int>(trip.species.size());
    trip.top_species_label = top_species_label(captures);

    const auto fresh = new_species_on(trip.species, trip.day_key, first_seen);
    trip.has_new_species = !fresh.empty();
    trip.new_species_label = trip.has_new_species ? core::join(fresh, ", ") : "None";

    trip.gear_label = gear_label(captures);

    trip.images.reserve(captures.size());
    for (const auto& tc : captures) {
        trip.images.push_back(to_trip_image(tc, site_root));
    }
    trip.image_count = static_cast<int>(trip.images.size());

    trip.cover_index = trip.image_count - 1;
    trip.cover = trip.images.back();
    trip.map_href = map_href_for(trip.cover, site_root);

    return trip;
}

} // namespace trip_atlas::trips
