#pragma once

#include "trip_atlas/core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace trip_atlas::trips {

// "1h 30m", "2h", "45m"; anything <= 0 is "0m"
std::string format_duration_minutes(int64_t minutes);

// Whole minutes between two instants, rounded, never negative
int64_t elapsed_minutes(const CaptureTime& first, const CaptureTime& last);

// "/{site_root}/{species}/index.html" with each path part URI-encoded
std::string species_href_for(const std::string& species, const std::string& site_root);

// Map viewer deep link focused on one image
std::string map_href_for(const TripImage& cover, const std::string& site_root);

TripImage to_trip_image(const TimedCapture& tc, const std::string& site_root);

// "Name (count)" of the most photographed species, "Unknown" when empty
std::string top_species_label(const std::vector<TimedCapture>& captures);

// "{camera} + {lens}" from the most frequent known values
std::string gear_label(const std::vector<TimedCapture>& captures);

// Distinct species, case-insensitive alphabetical
std::vector<std::string> distinct_species(const std::vector<TimedCapture>& captures);

// Species of `species` whose archive-wide first sighting is on `day`
std::vector<std::string> new_species_on(const std::vector<std::string>& species,
                                        const DayKey& day,
                                        const FirstSeenMap& first_seen);

/**
 * Builds the trip record for one merged cluster. The id is left empty;
 * rank_trips() assigns it.
 */
Trip summarize_trip(const MergedCluster& cluster,
                    const TripLocation& location,
                    const FirstSeenMap& first_seen,
                    const std::string& site_root);

} // namespace trip_atlas::trips
