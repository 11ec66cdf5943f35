#pragma once

#include "trip_atlas/core/types.hpp"

#include <map>
#include <optional>
#include <vector>

namespace trip_atlas::trips {

using DayBuckets = std::map<DayKey, std::vector<TimedCapture>>;

struct DayPartition {
    DayBuckets geotagged;       // clustering input
    DayBuckets extras;          // non-geotagged, attached after clustering
    int geotagged_count = 0;
    int non_geotagged_count = 0;
    int skipped_untimed = 0;
};

// Resolves a capture's time and DayKey; nullopt when the timestamp is unusable
std::optional<TimedCapture> resolve_capture(const Capture& capture, const TimePolicy& policy);

// Buckets by DayKey; each bucket ascending by UTC instant, stable for ties
DayBuckets bucket_by_day(std::vector<TimedCapture> timed);

// Splits the archive into geotagged and non-geotagged day buckets.
// Captures without a resolvable day are counted in skipped_untimed and dropped.
DayPartition partition_by_day(const std::vector<Capture>& captures, const TimePolicy& policy);

} // namespace trip_atlas::trips
