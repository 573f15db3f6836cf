// src/record.hpp
// Record data model: built records, their immutable stored form, and queue
// entries wrapping them.

#pragma once

#include "uuid.hpp"
#include "datrack/props.hpp"
#include "datrack/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace datrack {

// A canonical event, as assembled by the EventRecordBuilder.
struct EventRecord {
    Uuid record_id{};
    std::string name;
    uint64_t timestamp = 0;               // capture time, ms since epoch
    std::optional<double> cost_seconds;
    std::vector<std::string> categories;  // at most MAX_CATEGORY_DEPTH
    Props attributes;                     // super properties overlaid by call-site attributes
    std::optional<GeoPoint> location;
    std::optional<Uuid> session_id;
};

// A mutation of the current user's profile.
struct ProfileUpdateRecord {
    Uuid record_id{};
    ProfileOp op = ProfileOp::None;
    std::string user_id;
    uint64_t timestamp = 0;
    Props properties;
    std::vector<std::string> unset_keys;
    std::optional<double> amount;         // CHARGE only
    std::optional<Uuid> session_id;
};

// Per-tracker metadata written into every event payload.
struct RecordContext {
    std::string user_id;
    std::string app_version;
    std::string app_channel;
};

// Serialized, immutable form of a record as held by the durable queue.
struct StoredRecord {
    RecordKind kind = RecordKind::Unknown;
    ProfileOp op = ProfileOp::None;
    Uuid record_id{};
    std::string name;
    uint64_t timestamp = 0;
    std::optional<Uuid> session_id;
    std::vector<uint8_t> payload;         // JSON object
};

// A stored record plus its queue bookkeeping.
struct QueueEntry {
    int64_t sequence = 0;
    StoredRecord record;
    uint32_t attempts = 0;
    uint64_t last_attempt_ms = 0;
    uint64_t enqueued_at = 0;
};

const char* profile_op_name(ProfileOp op);

StoredRecord to_stored(const EventRecord& event, const RecordContext& context);
StoredRecord to_stored(const ProfileUpdateRecord& update);

} // namespace datrack
