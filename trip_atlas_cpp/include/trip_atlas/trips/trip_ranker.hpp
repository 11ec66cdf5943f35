#pragma once

#include "trip_atlas/core/types.hpp"

#include <vector>

namespace trip_atlas::trips {

// Strict ordering: day desc, image count desc, start instant asc,
// centroid lon asc, centroid lat asc, title asc
bool trip_precedes(const Trip& a, const Trip& b);

// Sorts in place and assigns ids "trip-1", "trip-2", ... in final order
void rank_trips(std::vector<Trip>& trips);

} // namespace trip_atlas::trips
