// src/record_builder.hpp
// Assembles canonical event records from call-site input and overlay state.

#pragma once

#include "overlay_store.hpp"
#include "record.hpp"
#include "session_tracker.hpp"
#include "datrack/error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace datrack {

struct EventInput {
    std::string name;
    double cost_seconds = 0.0;
    std::vector<std::string> categories;
    Props attributes;
    std::optional<GeoPoint> location;
    bool require_session = true;
    bool internal = false;  // tracker-emitted; may use the reserved prefix
};

// Either a record or the reason it was rejected.
struct BuildResult {
    std::optional<EventRecord> record;
    std::optional<TrackerError> rejection;

    explicit operator bool() const noexcept { return record.has_value(); }
};

class EventRecordBuilder {
public:
    EventRecordBuilder(OverlayStore& overlay, const SessionTracker& sessions)
        : overlay_(overlay), sessions_(sessions) {}

    // Validate the input, resolve any timer for the event name, merge super
    // properties under call-site attributes and tag the current session.
    // Consuming the timer is the only side effect, and it happens only for
    // accepted events.
    BuildResult build(const EventInput& input, uint64_t now_ms) const;

private:
    OverlayStore& overlay_;
    const SessionTracker& sessions_;
};

} // namespace datrack
