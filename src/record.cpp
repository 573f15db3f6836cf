// src/record.cpp
// JSON payloads for stored records.

#include "record.hpp"

#include <cstring>

namespace datrack {

static inline void append_lit(std::vector<uint8_t>& buf, const char* s) {
    buf.insert(buf.end(), reinterpret_cast<const uint8_t*>(s),
               reinterpret_cast<const uint8_t*>(s) + std::strlen(s));
}

// Append `,"key":` (or `"key":` for the first field).
static inline void append_key(std::vector<uint8_t>& buf, const char* key, bool& first) {
    if (!first) buf.push_back(',');
    first = false;
    Props::append_string(buf, key);
    buf.push_back(':');
}

const char* profile_op_name(ProfileOp op) {
    switch (op) {
        case ProfileOp::Set:        return "set";
        case ProfileOp::SetOnce:    return "set_once";
        case ProfileOp::Unset:      return "unset";
        case ProfileOp::DeleteUser: return "delete_user";
        case ProfileOp::Charge:     return "charge";
        case ProfileOp::None:       break;
    }
    return "none";
}

StoredRecord to_stored(const EventRecord& event, const RecordContext& context) {
    std::vector<uint8_t> buf;
    buf.reserve(128 + event.attributes.size() * 32);
    bool first = true;
    buf.push_back('{');

    if (event.cost_seconds) {
        append_key(buf, "cost", first);
        Props::append_number(buf, *event.cost_seconds);
    }

    if (!event.categories.empty()) {
        append_key(buf, "categories", first);
        buf.push_back('[');
        for (size_t i = 0; i < event.categories.size(); i++) {
            if (i > 0) buf.push_back(',');
            Props::append_string(buf, event.categories[i]);
        }
        buf.push_back(']');
    }

    if (event.location) {
        append_key(buf, "location", first);
        append_lit(buf, "{\"lat\":");
        Props::append_number(buf, event.location->latitude);
        append_lit(buf, ",\"lng\":");
        Props::append_number(buf, event.location->longitude);
        buf.push_back('}');
    }

    if (!context.user_id.empty()) {
        append_key(buf, "user_id", first);
        Props::append_string(buf, context.user_id);
    }
    if (!context.app_version.empty()) {
        append_key(buf, "app_version", first);
        Props::append_string(buf, context.app_version);
    }
    if (!context.app_channel.empty()) {
        append_key(buf, "app_channel", first);
        Props::append_string(buf, context.app_channel);
    }

    append_key(buf, "attributes", first);
    event.attributes.append_json(buf);
    buf.push_back('}');

    StoredRecord stored;
    stored.kind = RecordKind::Event;
    stored.record_id = event.record_id;
    stored.name = event.name;
    stored.timestamp = event.timestamp;
    stored.session_id = event.session_id;
    stored.payload = std::move(buf);
    return stored;
}

StoredRecord to_stored(const ProfileUpdateRecord& update) {
    std::vector<uint8_t> buf;
    buf.reserve(64 + update.properties.size() * 32);
    bool first = true;
    buf.push_back('{');

    append_key(buf, "user_id", first);
    Props::append_string(buf, update.user_id);

    switch (update.op) {
        case ProfileOp::Set:
        case ProfileOp::SetOnce:
            append_key(buf, "properties", first);
            update.properties.append_json(buf);
            break;
        case ProfileOp::Unset:
            append_key(buf, "keys", first);
            buf.push_back('[');
            for (size_t i = 0; i < update.unset_keys.size(); i++) {
                if (i > 0) buf.push_back(',');
                Props::append_string(buf, update.unset_keys[i]);
            }
            buf.push_back(']');
            break;
        case ProfileOp::Charge:
            append_key(buf, "amount", first);
            Props::append_number(buf, update.amount.value_or(0.0));
            append_key(buf, "time", first);
            Props::append_string(buf, Props::format_iso8601(static_cast<int64_t>(update.timestamp)));
            append_key(buf, "properties", first);
            update.properties.append_json(buf);
            break;
        case ProfileOp::DeleteUser:
        case ProfileOp::None:
            break;
    }
    buf.push_back('}');

    StoredRecord stored;
    stored.kind = RecordKind::Profile;
    stored.op = update.op;
    stored.record_id = update.record_id;
    stored.name = profile_op_name(update.op);
    stored.timestamp = update.timestamp;
    stored.session_id = update.session_id;
    stored.payload = std::move(buf);
    return stored;
}

} // namespace datrack
