#include "trip_atlas/engine/trip_engine.hpp"
#include "trip_atlas/core/errors.hpp"
#include "trip_atlas/trips/capture_merger.hpp"
#include "trip_atlas/trips/day_partitioner.hpp"
#include "trip_atlas/trips/location_labeler.hpp"
#include "trip_atlas/trips/spatial_clusterer.hpp"
#include "trip_atlas/trips/trip_ranker.hpp"
#include "trip_atlas/trips/trip_summarizer.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace trip_atlas::engine {

namespace {

int compute_worker_count(int requested, size_t task_count) {
    int workers = std::max(1, requested);
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(task_count));
    }
    return std::max(1, workers);
}

struct DayResult {
    std::vector<Trip> trips;
    int clusters = 0;
};

DayResult build_day(const DayKey& day,
                    const std::vector<TimedCapture>& geo_captures,
                    const std::vector<TimedCapture>& extras,
                    const FirstSeenMap& first_seen,
                    const TripOptions& options) {
    DayResult result;

    auto clusters = trips::cluster_day(day, geo_captures, options.cluster_radius_km);
    result.clusters = static_cast<int>(clusters.size());

    auto merged = trips::merge_extra_captures(std::move(clusters), extras,
                                              options.extra_capture_policy);

    trips::LabelOptions label_opts;
    label_opts.dedup_miles = options.title_dedup_miles;
    label_opts.max_park_anchors = options.max_park_anchors;
    label_opts.max_title_labels = options.max_title_labels;

    result.trips.reserve(merged.size());
    for (const auto& cluster : merged) {
        const TripLocation location = trips::label_trip(cluster.geo, label_opts);
        result.trips.push_back(
            trips::summarize_trip(cluster, location, first_seen, options.site_root));
    }
    return result;
}

} // namespace

void validate_trip_options(const TripOptions& options) {
    if (!std::isfinite(options.cluster_radius_km) || options.cluster_radius_km <= 0.0) {
        throw ValidationError("cluster radius must be a positive number of km, got " +
                              std::to_string(options.cluster_radius_km));
    }
    if (!std::isfinite(options.title_dedup_miles) || options.title_dedup_miles < 0.0) {
        throw ValidationError("title dedup distance must be >= 0 miles, got " +
                              std::to_string(options.title_dedup_miles));
    }
    if (options.max_park_anchors < 1 || options.max_title_labels < options.max_park_anchors) {
        throw ValidationError("need 1 <= max_park_anchors <= max_title_labels");
    }
}

TripSynthesis synthesize_trips(const std::vector<Capture>& captures,
                               const FirstSeenMap& first_seen,
                               const TripOptions& options) {
    validate_trip_options(options);

    TripSynthesis out;
    out.stats.total_captures = static_cast<int>(captures.size());

    const trips::DayPartition partition = trips::partition_by_day(captures, options.time);
    out.stats.geotagged = partition.geotagged_count;
    out.stats.non_geotagged = partition.non_geotagged_count;
    out.stats.skipped_untimed = partition.skipped_untimed;

    std::vector<const DayKey*> days;
    days.reserve(partition.geotagged.size());
    for (const auto& [day, bucket] : partition.geotagged) {
        days.push_back(&day);
    }
    out.stats.days = static_cast<int>(days.size());

    static const std::vector<TimedCapture> kNoExtras;
    std::vector<DayResult> results(days.size());

    std::atomic<size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto day_worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= days.size()) break;

            const DayKey& day = *days[i];
            auto extras_it = partition.extras.find(day);
            const auto& extras = extras_it == partition.extras.end() ? kNoExtras : extras_it->second;
            try {
                results[i] = build_day(day, partition.geotagged.at(day), extras, first_seen, options);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    };

    const int workers_n = compute_worker_count(options.parallel_workers, days.size());
    if (workers_n > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(workers_n));
        for (int w = 0; w < workers_n; ++w) {
            workers.emplace_back(day_worker);
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    } else {
        day_worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    for (auto& result : results) {
        out.stats.clusters += result.clusters;
        for (auto& trip : result.trips) {
            out.trips.push_back(std::move(trip));
        }
    }

    trips::rank_trips(out.trips);
    out.stats.trips = static_cast<int>(out.trips.size());
    return out;
}

FirstSeenMap compute_first_seen_days(const std::vector<Capture>& captures,
                                     const TimePolicy& policy) {
    std::map<std::string, TimedCapture> earliest;
    for (const auto& capture : captures) {
        if (capture.species.empty()) continue;
        auto tc = trips::resolve_capture(capture, policy);
        if (!tc) continue;

        auto it = earliest.find(capture.species);
        if (it == earliest.end()) {
            earliest.emplace(capture.species, *tc);
        } else if (tc->time.utc_seconds < it->second.time.utc_seconds) {
            it->second = *tc;
        }
    }

    FirstSeenMap first_seen;
    for (const auto& [species, tc] : earliest) {
        first_seen[species] = tc.day_key;
    }
    return first_seen;
}

TripArchiveSummary summarize_trips(const std::vector<Trip>& trips) {
    TripArchiveSummary summary;
    summary.trip_count = static_cast<int>(trips.size());

    std::set<std::string> species;
    std::set<DayKey> days;
    const Trip* largest = nullptr;
    for (const auto& trip : trips) {
        summary.total_photos += trip.image_count;
        species.insert(trip.species.begin(), trip.species.end());
        days.insert(trip.day_key);
        if (!largest || trip.image_count > largest->image_count) {
            largest = &trip;
        }
    }
    summary.distinct_species = static_cast<int>(species.size());
    summary.trip_days = static_cast<int>(days.size());
    summary.largest_trip_label = largest
        ? largest->date_label + " (" + std::to_string(largest->image_count) + ")"
        : "None yet";
    return summary;
}

} // namespace trip_atlas::engine
