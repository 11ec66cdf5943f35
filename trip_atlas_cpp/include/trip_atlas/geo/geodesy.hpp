#pragma once

#include "trip_atlas/core/types.hpp"

#include <vector>

namespace trip_atlas::geo {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kKmPerMile = 1.609344;

// Great-circle distance on a sphere of radius kEarthRadiusKm
double haversine_km(double lat1, double lon1, double lat2, double lon2);
double haversine_km(const GeoPoint& a, const GeoPoint& b);

inline double km_to_miles(double km) { return km / kKmPerMile; }

// Rows are (lat, lon) of the geotagged captures, in input order
GeoPointList positions_of(const std::vector<TimedCapture>& captures);

// Arithmetic mean of lat and lon; zero for an empty list
GeoPoint centroid(const GeoPointList& points);

// Largest haversine distance from any row to `center`
double max_spread_km(const GeoPointList& points, const GeoPoint& center);

} // namespace trip_atlas::geo
