#include "trip_atlas/trips/spatial_clusterer.hpp"
#include "trip_atlas/geo/geodesy.hpp"

#include <algorithm>
#include <deque>

namespace trip_atlas::trips {

std::vector<int> connected_components(const GeoPointList& points, double radius_km) {
    const Eigen::Index n = points.rows();
    std::vector<int> labels(static_cast<size_t>(n), -1);
    int next_label = 0;

    for (Eigen::Index seed = 0; seed < n; ++seed) {
        if (labels[static_cast<size_t>(seed)] >= 0) continue;

        // Breadth-first expansion over the implicit proximity graph
        std::deque<Eigen::Index> queue{seed};
        labels[static_cast<size_t>(seed)] = next_label;
        while (!queue.empty()) {
            const Eigen::Index cur = queue.front();
            queue.pop_front();
            for (Eigen::Index j = 0; j < n; ++j) {
                if (labels[static_cast<size_t>(j)] >= 0) continue;
                const double d = geo::haversine_km(points(cur, 0), points(cur, 1),
                                                   points(j, 0), points(j, 1));
                if (d <= radius_km) {
                    labels[static_cast<size_t>(j)] = next_label;
                    queue.push_back(j);
                }
            }
        }
        ++next_label;
    }
    return labels;
}

std::vector<GeoCluster> cluster_day(const DayKey& day,
                                    const std::vector<TimedCapture>& captures,
                                    double radius_km) {
    std::vector<TimedCapture> geo_captures;
    geo_captures.reserve(captures.size());
    for (const auto& tc : captures) {
        if (tc.capture && tc.capture->is_geotagged()) {
            geo_captures.push_back(tc);
        }
    }

    const GeoPointList points = geo::positions_of(geo_captures);
    const std::vector<int> labels = connected_components(points, radius_km);
    const int n_clusters = labels.empty()
        ? 0
        : *std::max_element(labels.begin(), labels.end()) + 1;

    std::vector<std::vector<size_t>> members(static_cast<size_t>(n_clusters));
    for (size_t i = 0; i < labels.size(); ++i) {
        members[static_cast<size_t>(labels[i])].push_back(i);
    }

    std::vector<GeoCluster> clusters;
    clusters.reserve(members.size());
    for (const auto& idx : members) {
        GeoCluster cluster;
        cluster.day_key = day;
        GeoPointList cluster_points(static_cast<Eigen::Index>(idx.size()), 2);
        for (size_t k = 0; k < idx.size(); ++k) {
            cluster.members.push_back(geo_captures[idx[k]]);
            cluster_points.row(static_cast<Eigen::Index>(k)) = points.row(static_cast<Eigen::Index>(idx[k]));
        }
        cluster.centroid = geo::centroid(cluster_points);
        cluster.max_spread_km = geo::max_spread_km(cluster_points, cluster.centroid);
        clusters.push_back(std::move(cluster));
    }
    return clusters;
}

} // namespace trip_atlas::trips
