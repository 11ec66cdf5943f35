#pragma once

#include "trip_atlas/core/types.hpp"

#include <string>
#include <vector>

namespace trip_atlas::trips {

// Composite "species::filename" key used to deduplicate captures
std::string capture_identity(const Capture& capture);

/**
 * Attaches a day's non-geotagged captures to that day's clusters.
 *
 * ATTACH_ALL gives every cluster the full set of extras, so one extra capture
 * can end up in several trips. LARGEST_CLUSTER gives them only to the cluster
 * with the most geotagged members (earliest cluster on ties).
 *
 * Extras already present in a cluster by capture_identity() are skipped. Each
 * result is re-sorted ascending by time.
 */
std::vector<MergedCluster> merge_extra_captures(std::vector<GeoCluster> clusters,
                                                const std::vector<TimedCapture>& extras,
                                                ExtraCapturePolicy policy);

} // namespace trip_atlas::trips
