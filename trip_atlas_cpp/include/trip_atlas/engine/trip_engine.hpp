#pragma once

#include "trip_atlas/core/types.hpp"

#include <vector>

namespace trip_atlas::engine {

/**
 * Infers field trips from a capture archive.
 *
 * Pure function of its inputs: no I/O, no global state. Days are processed on
 * up to options.parallel_workers threads; the final ranking runs after all of
 * them finish, so the result does not depend on the worker count.
 *
 * `captures` must outlive the call only; returned trips own their data.
 *
 * Throws ValidationError when `options` fail validate_trip_options().
 */
// cluster_radius_km finite and > 0, title_dedup_miles finite and >= 0,
// 1 <= max_park_anchors <= max_title_labels
void validate_trip_options(const TripOptions& options);

TripSynthesis synthesize_trips(const std::vector<Capture>& captures,
                               const FirstSeenMap& first_seen,
                               const TripOptions& options);

// Species -> DayKey of its earliest capture instant across the whole archive
FirstSeenMap compute_first_seen_days(const std::vector<Capture>& captures,
                                     const TimePolicy& policy);

// Totals shown above the trip list
TripArchiveSummary summarize_trips(const std::vector<Trip>& trips);

} // namespace trip_atlas::engine
