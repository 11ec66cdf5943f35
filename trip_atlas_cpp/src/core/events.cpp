#include "trip_atlas/core/events.hpp"
#include "trip_atlas/core/utils.hpp"

#include <utility>

namespace trip_atlas::core {

json stats_payload(const SynthesisStats& stats) {
    return {
        {"total_captures", stats.total_captures},
        {"geotagged", stats.geotagged},
        {"non_geotagged", stats.non_geotagged},
        {"skipped_untimed", stats.skipped_untimed},
        {"days", stats.days},
        {"clusters", stats.clusters},
        {"trips", stats.trips}
    };
}

EventEmitter::EventEmitter(std::string run_id, std::ostream& out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

json EventEmitter::phase_event(const std::string& type, Phase phase) const {
    json event = base_event(type);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    return event;
}

void EventEmitter::emit(const json& event) {
    out_ << event.dump() << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    if (extra.is_object()) event.update(extra);
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_start(Phase phase) {
    emit(phase_event("phase_start", phase));
}

void EventEmitter::phase_end(Phase phase, const std::string& status, const json& extra) {
    json event = phase_event("phase_end", phase);
    if (extra.is_object()) event.update(extra);
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_failed(Phase phase, const std::string& message, const json& extra) {
    json payload = extra.is_object() ? extra : json::object();
    payload["error"] = message;
    phase_end(phase, "error", payload);
    run_end(false, "error");
}

void EventEmitter::synthesis_done(const SynthesisStats& stats) {
    if (stats.skipped_untimed > 0) {
        warning(std::to_string(stats.skipped_untimed) +
                " capture(s) without a usable timestamp were skipped");
    }
    phase_end(Phase::SYNTHESIZE, "ok", stats_payload(stats));
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

} // namespace trip_atlas::core
