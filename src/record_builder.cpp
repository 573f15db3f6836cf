// src/record_builder.cpp
// Event validation, timer resolution and attribute merging.

#include "record_builder.hpp"
#include "validation.hpp"

namespace datrack {

static BuildResult rejected(TrackerError error) {
    BuildResult result;
    result.rejection = std::move(error);
    return result;
}

BuildResult EventRecordBuilder::build(const EventInput& input, uint64_t now_ms) const {
    if (input.internal) {
        if (input.name.empty()) {
            return rejected(TrackerError::invalid_input("eventName", "is required"));
        }
    } else if (const char* reason = validation::check_event_name(input.name)) {
        return rejected(TrackerError::invalid_input("eventName", reason));
    }

    if (!validation::check_cost(input.cost_seconds)) {
        return rejected(TrackerError::invalid_input("costSeconds", "must be a non-negative number"));
    }
    if (input.location && !validation::check_location(*input.location)) {
        return rejected(TrackerError::invalid_input("location", "is out of range"));
    }

    auto session_id = sessions_.current_id(now_ms);
    if (input.require_session && !session_id) {
        return rejected(TrackerError::session_required(input.name));
    }

    EventRecord record;
    record.record_id = generate_uuid();
    record.name = input.name;
    record.timestamp = now_ms;
    record.session_id = session_id;
    record.location = input.location;
    record.categories = validation::truncate_categories(input.categories);

    if (input.cost_seconds > 0.0) {
        record.cost_seconds = input.cost_seconds;
    }

    // One-shot: the timer is consumed even when an explicit cost wins.
    if (auto started = overlay_.take_timer(input.name)) {
        uint64_t elapsed_ms = now_ms > *started ? now_ms - *started : 0;
        if (!record.cost_seconds) {
            record.cost_seconds = static_cast<double>(elapsed_ms) / 1000.0;
        }
    }

    record.attributes = overlay_.current();
    record.attributes.merge(input.attributes);

    BuildResult result;
    result.record = std::move(record);
    return result;
}

} // namespace datrack
