#include "trip_atlas/trips/capture_merger.hpp"

#include <algorithm>
#include <unordered_set>

namespace trip_atlas::trips {

std::string capture_identity(const Capture& capture) {
    return capture.species + "::" + capture.filename;
}

static void attach_extras(MergedCluster& merged, const std::vector<TimedCapture>& extras) {
    std::unordered_set<std::string> seen;
    for (const auto& tc : merged.captures) {
        seen.insert(capture_identity(*tc.capture));
    }
    for (const auto& tc : extras) {
        if (seen.insert(capture_identity(*tc.capture)).second) {
            merged.captures.push_back(tc);
        }
    }
}

std::vector<MergedCluster> merge_extra_captures(std::vector<GeoCluster> clusters,
                                                const std::vector<TimedCapture>& extras,
                                                ExtraCapturePolicy policy) {
    size_t largest = 0;
    for (size_t i = 1; i < clusters.size(); ++i) {
        if (clusters[i].members.size() > clusters[largest].members.size()) {
            largest = i;
        }
    }

    std::vector<MergedCluster> merged;
    merged.reserve(clusters.size());
    for (size_t i = 0; i < clusters.size(); ++i) {
        MergedCluster mc;
        mc.captures = clusters[i].members;
        mc.geo = std::move(clusters[i]);

        const bool receives_extras =
            policy == ExtraCapturePolicy::ATTACH_ALL || i == largest;
        if (receives_extras && !extras.empty()) {
            attach_extras(mc, extras);
        }

        std::stable_sort(mc.captures.begin(), mc.captures.end(),
                         [](const TimedCapture& a, const TimedCapture& b) {
                             return a.time.utc_seconds < b.time.utc_seconds;
                         });
        merged.push_back(std::move(mc));
    }
    return merged;
}

} // namespace trip_atlas::trips
