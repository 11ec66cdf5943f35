#pragma once

#include "trip_atlas/core/types.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace trip_atlas::io {

namespace fs = std::filesystem;
using json = nlohmann::json;

struct CaptureArchive {
    std::vector<Capture> captures;
    std::optional<FirstSeenMap> first_seen;
};

// Accepts a bare capture array or {"captures": [...], "firstSeenDayBySpecies": {...}}
CaptureArchive parse_capture_archive(const json& doc);
CaptureArchive load_capture_archive(const fs::path& path);

// {"Species": "YYYY-MM-DD", ...}
FirstSeenMap first_seen_from_json(const json& j);
FirstSeenMap load_first_seen(const fs::path& path);

enum class FirstSeenSource { OVERRIDE_FILE, INPUT_MAP, DERIVED };

inline std::string first_seen_source_to_string(FirstSeenSource source) {
    switch (source) {
        case FirstSeenSource::OVERRIDE_FILE: return "file";
        case FirstSeenSource::INPUT_MAP: return "input";
        case FirstSeenSource::DERIVED: return "derived";
    }
    return "unknown";
}

struct FirstSeenSelection {
    FirstSeenMap days;
    FirstSeenSource source = FirstSeenSource::DERIVED;
};

// A non-empty override_path wins, then the archive's own map, else the days
// are derived from the archive's captures under `policy`.
FirstSeenSelection select_first_seen(const CaptureArchive& archive,
                                     const fs::path& override_path,
                                     const TimePolicy& policy);

// Throws InputFormatError on malformed JSON, IOError when unreadable
json load_json(const fs::path& path);

Capture capture_from_json(const json& j, size_t index);

json trip_image_to_json(const TripImage& image);
json trip_to_json(const Trip& trip);
json summary_to_json(const TripArchiveSummary& summary);
json first_seen_to_json(const FirstSeenMap& first_seen);

// {"trips": [...], "summary": {...}, "stats": {...}}
json trips_document(const TripSynthesis& synthesis, const TripArchiveSummary& summary);

// indent < 0 writes compact JSON
void write_json(const fs::path& path, const json& doc, int indent);

} // namespace trip_atlas::io
