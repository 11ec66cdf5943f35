#include "trip_atlas/trips/trip_ranker.hpp"

#include <algorithm>
#include <string>

namespace trip_atlas::trips {

bool trip_precedes(const Trip& a, const Trip& b) {
    if (a.day_key != b.day_key) return a.day_key > b.day_key;
    if (a.image_count != b.image_count) return a.image_count > b.image_count;
    if (a.start_utc_seconds != b.start_utc_seconds) return a.start_utc_seconds < b.start_utc_seconds;
    if (a.centroid(1) != b.centroid(1)) return a.centroid(1) < b.centroid(1);
    if (a.centroid(0) != b.centroid(0)) return a.centroid(0) < b.centroid(0);
    return a.location_title < b.location_title;
}

void rank_trips(std::vector<Trip>& trips) {
    std::stable_sort(trips.begin(), trips.end(), trip_precedes);
    for (size_t i = 0; i < trips.size(); ++i) {
        trips[i].id = "trip-" + std::to_string(i + 1);
    }
}

} // namespace trip_atlas::trips
