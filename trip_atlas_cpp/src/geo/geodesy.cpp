#include "trip_atlas/geo/geodesy.hpp"

#include <algorithm>
#include <cmath>

namespace trip_atlas::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

inline double to_rad(double deg) { return deg * kPi / 180.0; }

} // namespace

double haversine_km(double lat1, double lon1, double lat2, double lon2) {
    const double d_lat = to_rad(lat2 - lat1);
    const double d_lon = to_rad(lon2 - lon1);
    const double a = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                     std::cos(to_rad(lat1)) * std::cos(to_rad(lat2)) *
                         std::sin(d_lon / 2) * std::sin(d_lon / 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return kEarthRadiusKm * c;
}

double haversine_km(const GeoPoint& a, const GeoPoint& b) {
    return haversine_km(a(0), a(1), b(0), b(1));
}

GeoPointList positions_of(const std::vector<TimedCapture>& captures) {
    size_t n = 0;
    for (const auto& tc : captures) {
        if (tc.capture && tc.capture->is_geotagged()) ++n;
    }

    GeoPointList points(static_cast<Eigen::Index>(n), 2);
    Eigen::Index row = 0;
    for (const auto& tc : captures) {
        if (!tc.capture || !tc.capture->is_geotagged()) continue;
        points(row, 0) = tc.capture->lat;
        points(row, 1) = tc.capture->lon;
        ++row;
    }
    return points;
}

GeoPoint centroid(const GeoPointList& points) {
    if (points.rows() == 0) {
        return GeoPoint::Zero();
    }
    return points.colwise().mean().transpose();
}

double max_spread_km(const GeoPointList& points, const GeoPoint& center) {
    double spread = 0.0;
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        spread = std::max(spread, haversine_km(points(i, 0), points(i, 1), center(0), center(1)));
    }
    return spread;
}

} // namespace trip_atlas::geo
