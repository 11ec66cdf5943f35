#include "trip_atlas/io/capture_io.hpp"
#include "trip_atlas/core/errors.hpp"
#include "trip_atlas/core/events.hpp"
#include "trip_atlas/core/utils.hpp"
#include "trip_atlas/engine/trip_engine.hpp"

#include <cmath>
#include <limits>

namespace trip_atlas::io {

namespace {

std::string get_string(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    throw InputFormatError(where + ": field '" + key + "' must be a string");
}

double get_coordinate(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return it->get<double>();
}

json optional_number(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

Capture capture_from_json(const json& j, size_t index) {
    const std::string where = "captures[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        throw InputFormatError(where + " is not an object");
    }

    Capture c;
    c.species = get_string(j, "species", where);
    if (c.species.empty()) c.species = get_string(j, "bird", where);
    c.filename = get_string(j, "filename", where);
    c.src = get_string(j, "src", where);
    c.thumb_src = get_string(j, "thumbSrc", where);
    c.species_href = get_string(j, "speciesHref", where);
    c.capture_date_raw = get_string(j, "captureDateRaw", where);
    c.capture_date_iso = get_string(j, "captureDateIso", where);
    c.utc_offset = get_string(j, "utcOffset", where);
    c.camera = get_string(j, "camera", where);
    c.lens = get_string(j, "lens", where);
    c.exposure = get_string(j, "exposure", where);
    c.aperture = get_string(j, "aperture", where);
    c.iso = get_string(j, "iso", where);
    c.park = get_string(j, "park", where);
    c.site = get_string(j, "site", where);
    c.city = get_string(j, "city", where);
    c.state = get_string(j, "state", where);
    c.country = get_string(j, "country", where);
    c.location_label = get_string(j, "locationLabel", where);

    c.lat = get_coordinate(j, "lat");
    c.lon = get_coordinate(j, "lon");
    auto gps = j.find("gps");
    if (!c.is_geotagged() && gps != j.end() && gps->is_object()) {
        c.lat = get_coordinate(*gps, "lat");
        c.lon = get_coordinate(*gps, "lon");
    }

    if (core::trim(c.species).empty()) {
        throw InputFormatError(where + ": missing species");
    }
    if (core::trim(c.filename).empty()) {
        throw InputFormatError(where + ": missing filename");
    }
    return c;
}

CaptureArchive parse_capture_archive(const json& doc) {
    CaptureArchive archive;

    const json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object()) {
        auto it = doc.find("captures");
        if (it == doc.end() || !it->is_array()) {
            throw InputFormatError("object input needs a 'captures' array");
        }
        list = &*it;

        auto fs_it = doc.find("firstSeenDayBySpecies");
        if (fs_it != doc.end() && !fs_it->is_null()) {
            archive.first_seen = first_seen_from_json(*fs_it);
        }
    } else {
        throw InputFormatError("input must be a JSON array or object");
    }

    archive.captures.reserve(list->size());
    for (size_t i = 0; i < list->size(); ++i) {
        archive.captures.push_back(capture_from_json((*list)[i], i));
    }
    return archive;
}

FirstSeenMap first_seen_from_json(const json& j) {
    if (!j.is_object()) {
        throw InputFormatError("first-seen map must be an object");
    }
    FirstSeenMap first_seen;
    for (auto& [species, day] : j.items()) {
        if (!day.is_string()) {
            throw InputFormatError("first-seen day for '" + species + "' must be a string");
        }
        first_seen[species] = day.get<std::string>();
    }
    return first_seen;
}

FirstSeenSelection select_first_seen(const CaptureArchive& archive,
                                     const fs::path& override_path,
                                     const TimePolicy& policy) {
    FirstSeenSelection selection;
    if (!override_path.empty()) {
        selection.days = load_first_seen(override_path);
        selection.source = FirstSeenSource::OVERRIDE_FILE;
    } else if (archive.first_seen) {
        selection.days = *archive.first_seen;
        selection.source = FirstSeenSource::INPUT_MAP;
    } else {
        selection.days = engine::compute_first_seen_days(archive.captures, policy);
        selection.source = FirstSeenSource::DERIVED;
    }
    return selection;
}

json load_json(const fs::path& path) {
    const std::string text = core::read_text(path);
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw InputFormatError(path.string() + ": " + e.what());
    }
}

CaptureArchive load_capture_archive(const fs::path& path) {
    return parse_capture_archive(load_json(path));
}

FirstSeenMap load_first_seen(const fs::path& path) {
    return first_seen_from_json(load_json(path));
}

json trip_image_to_json(const TripImage& image) {
    return {
        {"src", image.src},
        {"thumbSrc", image.thumb_src},
        {"species", image.species},
        {"speciesHref", image.species_href},
        {"filename", image.filename},
        {"captureDate", image.capture_date},
        {"captureDateIso", image.capture_date_iso},
        {"lat", optional_number(image.lat)},
        {"lon", optional_number(image.lon)}
    };
}

json trip_to_json(const Trip& trip) {
    json images = json::array();
    for (const auto& image : trip.images) {
        images.push_back(trip_image_to_json(image));
    }

    json j;
    j["id"] = trip.id;
    j["dayKey"] = trip.day_key;
    j["locationTitle"] = trip.location_title;
    j["dateLabel"] = trip.date_label;
    j["durationLabel"] = trip.duration_label;
    j["timeRange"] = trip.time_range;
    j["imageCount"] = trip.image_count;
    j["speciesCount"] = trip.species_count;
    j["topSpeciesLabel"] = trip.top_species_label;
    j["hasNewSpecies"] = trip.has_new_species;
    j["newSpeciesLabel"] = trip.new_species_label;
    j["gearLabel"] = trip.gear_label;
    j["species"] = trip.species;
    j["locations"] = trip.locations;
    j["centroid"] = {{"lat", trip.centroid(0)}, {"lon", trip.centroid(1)}};
    j["maxSpreadKm"] = trip.max_spread_km;
    j["images"] = std::move(images);
    j["coverIndex"] = trip.cover_index;
    j["cover"] = trip_image_to_json(trip.cover);
    j["mapHref"] = trip.map_href;
    return j;
}

json summary_to_json(const TripArchiveSummary& summary) {
    return {
        {"tripCount", summary.trip_count},
        {"totalPhotos", summary.total_photos},
        {"distinctSpecies", summary.distinct_species},
        {"tripDays", summary.trip_days},
        {"largestTrip", summary.largest_trip_label}
    };
}

json first_seen_to_json(const FirstSeenMap& first_seen) {
    json j = json::object();
    for (const auto& [species, day] : first_seen) {
        j[species] = day;
    }
    return j;
}

json trips_document(const TripSynthesis& synthesis, const TripArchiveSummary& summary) {
    json trips = json::array();
    for (const auto& trip : synthesis.trips) {
        trips.push_back(trip_to_json(trip));
    }
    json doc;
    doc["trips"] = std::move(trips);
    doc["summary"] = summary_to_json(summary);
    doc["stats"] = core::stats_payload(synthesis.stats);
    return doc;
}

void write_json(const fs::path& path, const json& doc, int indent) {
    core::write_text(path, doc.dump(indent) + "\n");
}

} // namespace trip_atlas::io
