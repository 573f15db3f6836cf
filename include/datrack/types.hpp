// include/datrack/types.hpp
// Core enums, constants and plain option structs.

#pragma once

#include "props.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace datrack {

// Which logical queue a record belongs to; also the batch schema on the wire.
enum class RecordKind : uint8_t {
    Unknown = 0,
    Event   = 1,
    Profile = 2,
};

// Profile mutation carried by a profile update record.
enum class ProfileOp : uint8_t {
    None       = 0,
    Set        = 1,
    SetOnce    = 2,
    Unset      = 3,
    DeleteUser = 4,
    Charge     = 5,
};

// Current network condition as reported by the host's network probe.
enum class NetworkType : uint8_t {
    Unknown  = 0,
    None     = 1,
    Wifi     = 2,
    Cellular = 3,
};

// What to do when the durable queue is full.
enum class OverflowPolicy : uint8_t {
    DropOldest = 0,
    RejectNew  = 1,
};

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

// Event names starting with this prefix are reserved for the tracker itself.
static constexpr const char* RESERVED_EVENT_PREFIX = "da";

// Category paths deeper than this are truncated.
static constexpr size_t MAX_CATEGORY_DEPTH = 5;

// Internal events emitted by the tracker.
struct InternalEvents {
    static constexpr const char* SESSION_START = "da_session_start";
    static constexpr const char* SESSION_CLOSE = "da_session_close";
    static constexpr const char* USER_LOGIN    = "da_u_login";
    static constexpr const char* USER_LOGOUT   = "da_u_logout";
};

// Profile property that accumulates charges.
static constexpr const char* TRANSACTIONS_PROPERTY = "$transactions";

// Optional fields of a tracked event.
//
// Example:
//   EventOptions opts;
//   opts.categories = {"shop", "checkout"};
//   opts.attributes.add("btn", "ok");
//   tracker->track_event("click", opts);
struct EventOptions {
    double cost_seconds = 0.0;
    std::vector<std::string> categories;
    Props attributes;
    std::optional<GeoPoint> location;
    // Unset means "use TrackerConfig::require_session()".
    std::optional<bool> must_in_session;
};

// Diagnostic counters. Every silent drop is counted here.
struct TrackerStats {
    uint64_t enqueued = 0;
    uint64_t dropped_invalid = 0;
    uint64_t dropped_no_session = 0;
    uint64_t storage_failures = 0;
    uint64_t overflow_evictions = 0;
    uint64_t overflow_rejections = 0;
    uint64_t batches_sent = 0;
    uint64_t batches_failed = 0;
    uint64_t records_sent = 0;
};

} // namespace datrack
