#pragma once

#include "trip_atlas/core/types.hpp"

#include <vector>

namespace trip_atlas::trips {

/**
 * Partitions one day's geotagged captures into connected components of the
 * graph whose edges join captures at most `radius_km` apart (haversine).
 * Membership is transitive: A and B share a cluster when any chain of
 * captures links them, even if A and B are farther than the radius.
 *
 * `captures` must be ascending by time. Clusters are returned in order of their
 * earliest member; members keep ascending time order.
 */
std::vector<GeoCluster> cluster_day(const DayKey& day,
                                    const std::vector<TimedCapture>& captures,
                                    double radius_km);

// Component label per capture index (labels count up from 0 in discovery order)
std::vector<int> connected_components(const GeoPointList& points, double radius_km);

} // namespace trip_atlas::trips
