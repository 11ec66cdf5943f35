#include "trip_atlas/trips/day_partitioner.hpp"
#include "trip_atlas/core/capture_time.hpp"

#include <algorithm>

namespace trip_atlas::trips {

std::optional<TimedCapture> resolve_capture(const Capture& capture, const TimePolicy& policy) {
    auto time = core::parse_capture_time(capture.timestamp_text(), capture.utc_offset, policy);
    if (!time) {
        return std::nullopt;
    }
    TimedCapture tc;
    tc.capture = &capture;
    tc.time = *time;
    tc.day_key = core::day_key(*time);
    return tc;
}

DayBuckets bucket_by_day(std::vector<TimedCapture> timed) {
    DayBuckets buckets;
    for (auto& tc : timed) {
        buckets[tc.day_key].push_back(std::move(tc));
    }
    for (auto& [day, bucket] : buckets) {
        std::stable_sort(bucket.begin(), bucket.end(),
                         [](const TimedCapture& a, const TimedCapture& b) {
                             return a.time.utc_seconds < b.time.utc_seconds;
                         });
    }
    return buckets;
}

DayPartition partition_by_day(const std::vector<Capture>& captures, const TimePolicy& policy) {
    DayPartition out;
    std::vector<TimedCapture> geo;
    std::vector<TimedCapture> extra;

    for (const auto& capture : captures) {
        const bool geotagged = capture.is_geotagged();
        if (geotagged) {
            ++out.geotagged_count;
        } else {
            ++out.non_geotagged_count;
        }

        auto tc = resolve_capture(capture, policy);
        if (!tc) {
            ++out.skipped_untimed;
            continue;
        }
        (geotagged ? geo : extra).push_back(std::move(*tc));
    }

    out.geotagged = bucket_by_day(std::move(geo));
    out.extras = bucket_by_day(std::move(extra));
    return out;
}

} // namespace trip_atlas::trips
