#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace trip_atlas::core {

using json = nlohmann::json;

// {"total_captures": .., "geotagged": .., ..., "trips": ..}
json stats_payload(const SynthesisStats& stats);

/**
 * JSON-lines event stream for one synthesis run.
 *
 * Every line carries "type", "run_id" and "ts". Phase events also carry
 * "phase" (numeric) and "phase_name". A failed phase is always followed by a
 * run_end with success=false.
 */
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status);

    void phase_start(Phase phase);
    void phase_end(Phase phase, const std::string& status, const json& extra);

    // phase_end with status "error" and the message under "error", then run_end
    void phase_failed(Phase phase, const std::string& message, const json& extra = json::object());

    // Warns about skipped untimed captures, then closes SYNTHESIZE with the counts
    void synthesis_done(const SynthesisStats& stats);

    void warning(const std::string& message);

private:
    json base_event(const std::string& type) const;
    json phase_event(const std::string& type, Phase phase) const;
    void emit(const json& event);

    std::string run_id_;
    std::ostream& out_;
};

} // namespace trip_atlas::core
