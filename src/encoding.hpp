// src/encoding.hpp
// Hand-written FlatBuffer encoding for record batches.

#pragma once

#include "datrack/types.hpp"

#include <cstdint>
#include <cstring>
#include <vector>

namespace datrack {
namespace encoding {

static constexpr size_t APP_KEY_LENGTH = 16;
static constexpr size_t UUID_LENGTH = 16;
static constexpr uint8_t DEFAULT_VERSION = 1;

// Batch flags.
static constexpr uint8_t FLAG_GZIP      = 0x01;
static constexpr uint8_t FLAG_ENCRYPTED = 0x02;

// --- Helpers ---

inline void write_u16(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back(static_cast<uint8_t>(value));
    buf.push_back(static_cast<uint8_t>(value >> 8));
}

inline void write_u32(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>(value));
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value >> 16));
    buf.push_back(static_cast<uint8_t>(value >> 24));
}

inline void write_i32(std::vector<uint8_t>& buf, int32_t value) {
    write_u32(buf, static_cast<uint32_t>(value));
}

inline void write_u64(std::vector<uint8_t>& buf, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        buf.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline void align4(std::vector<uint8_t>& buf) {
    while (buf.size() % 4 != 0) buf.push_back(0);
}

// Write [u32 length][data] and return the start position.
inline size_t write_byte_vector(std::vector<uint8_t>& buf, const uint8_t* data, size_t len) {
    size_t start = buf.size();
    write_u32(buf, len > UINT32_MAX ? 0 : static_cast<uint32_t>(len));
    if (data && len > 0) buf.insert(buf.end(), data, data + len);
    return start;
}

// Write [u32 length][data][null] and return the start position.
inline size_t write_string(std::vector<uint8_t>& buf, const char* s, size_t len) {
    size_t start = buf.size();
    write_u32(buf, len > UINT32_MAX ? 0 : static_cast<uint32_t>(len));
    if (s && len > 0) {
        buf.insert(buf.end(), reinterpret_cast<const uint8_t*>(s),
                   reinterpret_cast<const uint8_t*>(s) + len);
    }
    buf.push_back(0);
    return start;
}

inline void patch_offset(std::vector<uint8_t>& buf, size_t offset_pos, size_t target) {
    uint32_t rel = static_cast<uint32_t>(target - offset_pos);
    std::memcpy(&buf[offset_pos], &rel, 4);
}

inline void patch_u32(std::vector<uint8_t>& buf, size_t pos, uint32_t value) {
    std::memcpy(&buf[pos], &value, 4);
}

inline uint32_t read_u32(const uint8_t* p) {
    uint32_t value;
    std::memcpy(&value, p, 4);
    return value;
}

// --- Record encoding ---

struct RecordParams {
    RecordKind kind = RecordKind::Unknown;
    ProfileOp op = ProfileOp::None;
    uint64_t timestamp = 0;               // capture time
    uint64_t enqueued_at = 0;             // durable write time; 0 omits the field
    const uint8_t* record_id = nullptr;   // 16 bytes
    const uint8_t* session_id = nullptr;  // 16 bytes or nullptr
    const char* name = nullptr;
    size_t name_len = 0;
    const uint8_t* payload = nullptr;
    size_t payload_len = 0;
};

// Encode a single record into buf (standalone FlatBuffer with root offset).
inline void encode_record_into(std::vector<uint8_t>& buf, const RecordParams& params) {
    bool has_record_id = params.record_id != nullptr;
    bool has_session_id = params.session_id != nullptr;
    bool has_name = params.name != nullptr;
    bool has_payload = params.payload != nullptr && params.payload_len > 0;
    bool has_enqueued_at = params.enqueued_at != 0;

    // VTable: size(u16) + table_size(u16) + 8 field slots = 20 bytes
    // Table: soffset(4) + 4 offsets(16) + timestamp(8) + enqueued_at(8)
    //        + kind(1) + op(1) + pad(2) = 40

    size_t root_pos = buf.size();
    buf.insert(buf.end(), 4, 0);

    size_t vtable_start = buf.size();
    write_u16(buf, 20);                          // vtable_size = 4 + 8*2
    write_u16(buf, 40);                          // table_size
    write_u16(buf, 36);                          // field 0: kind at +36
    write_u16(buf, 37);                          // field 1: op at +37
    write_u16(buf, 20);                          // field 2: timestamp at +20
    write_u16(buf, has_record_id ? 4 : 0);       // field 3: record_id
    write_u16(buf, has_session_id ? 8 : 0);      // field 4: session_id
    write_u16(buf, has_name ? 12 : 0);           // field 5: name
    write_u16(buf, has_payload ? 16 : 0);        // field 6: payload
    write_u16(buf, has_enqueued_at ? 28 : 0);    // field 7: enqueued_at at +28

    size_t table_start = buf.size();
    write_i32(buf, static_cast<int32_t>(table_start - vtable_start));

    size_t record_id_off_pos = buf.size();
    write_u32(buf, 0);
    size_t session_id_off_pos = buf.size();
    write_u32(buf, 0);
    size_t name_off_pos = buf.size();
    write_u32(buf, 0);
    size_t payload_off_pos = buf.size();
    write_u32(buf, 0);

    write_u64(buf, params.timestamp);
    write_u64(buf, params.enqueued_at);
    buf.push_back(static_cast<uint8_t>(params.kind));
    buf.push_back(static_cast<uint8_t>(params.op));
    buf.insert(buf.end(), 2, 0);

    align4(buf);

    size_t record_id_start = 0;
    if (has_record_id) {
        record_id_start = write_byte_vector(buf, params.record_id, UUID_LENGTH);
        align4(buf);
    }

    size_t session_id_start = 0;
    if (has_session_id) {
        session_id_start = write_byte_vector(buf, params.session_id, UUID_LENGTH);
        align4(buf);
    }

    size_t name_start = 0;
    if (has_name) {
        name_start = write_string(buf, params.name, params.name_len);
        align4(buf);
    }

    size_t payload_start = 0;
    if (has_payload) {
        payload_start = write_byte_vector(buf, params.payload, params.payload_len);
    }

    patch_u32(buf, root_pos, static_cast<uint32_t>(table_start - root_pos));

    if (has_record_id)  patch_offset(buf, record_id_off_pos, record_id_start);
    if (has_session_id) patch_offset(buf, session_id_off_pos, session_id_start);
    if (has_name)       patch_offset(buf, name_off_pos, name_start);
    if (has_payload)    patch_offset(buf, payload_off_pos, payload_start);
}

// Encode RecordData (vector of records) into buf. Returns start position.
inline size_t encode_record_data_into(std::vector<uint8_t>& buf, const std::vector<RecordParams>& records) {
    size_t data_start = buf.size();
    size_t count = records.size();

    size_t root_pos = buf.size();
    buf.insert(buf.end(), 4, 0);

    // VTable (6 bytes + 2 pad)
    size_t vtable_start = buf.size();
    write_u16(buf, 6);  // vtable_size
    write_u16(buf, 8);  // table_size
    write_u16(buf, 4);  // field 0: records at table+4
    buf.insert(buf.end(), 2, 0);

    size_t table_start = buf.size();
    write_i32(buf, static_cast<int32_t>(table_start - vtable_start));

    size_t records_off_pos = buf.size();
    write_u32(buf, 0);

    align4(buf);

    size_t records_vec_start = buf.size();
    write_u32(buf, static_cast<uint32_t>(count));

    size_t offsets_start = buf.size();
    for (size_t i = 0; i < count; i++) {
        write_u32(buf, 0);
    }

    std::vector<size_t> table_positions;
    table_positions.reserve(count);

    for (const auto& params : records) {
        align4(buf);
        size_t record_start = buf.size();
        encode_record_into(buf, params);
        table_positions.push_back(record_start + read_u32(&buf[record_start]));
    }

    for (size_t i = 0; i < count; i++) {
        patch_offset(buf, offsets_start + i * 4, table_positions[i]);
    }

    patch_offset(buf, records_off_pos, records_vec_start);
    patch_u32(buf, root_pos, static_cast<uint32_t>(table_start - data_start));

    return data_start;
}

// Number of records in an uncompressed RecordData buffer, or 0 if malformed.
inline size_t read_record_count(const uint8_t* data, size_t len) {
    if (len < 4) return 0;
    size_t table = read_u32(data);
    if (table + 8 > len) return 0;
    size_t vec = table + 4 + read_u32(data + table + 4);
    if (vec + 4 > len) return 0;
    return read_u32(data + vec);
}

// --- Batch encoding ---

struct BatchParams {
    const uint8_t* app_key = nullptr;   // 16 bytes
    RecordKind schema = RecordKind::Event;
    uint8_t version = DEFAULT_VERSION;
    uint64_t batch_id = 0;
    const char* device_id = nullptr;
    size_t device_id_len = 0;
    uint8_t flags = 0;
    const uint8_t* data = nullptr;
    size_t data_len = 0;
};

inline void encode_batch_into(std::vector<uint8_t>& buf, const BatchParams& params) {
    bool has_batch_id = params.batch_id != 0;
    bool has_device_id = params.device_id != nullptr;
    uint8_t version = params.version == 0 ? DEFAULT_VERSION : params.version;

    size_t base = buf.size();
    buf.insert(buf.end(), 4, 0);

    // VTable: 4 + 7*2 = 18 bytes (+ 2 pad)
    // Table: soffset(4) + 3 offsets(12) + batch_id(8) + schema(1) + version(1) + flags(1) + pad(1) = 28
    size_t vtable_start = buf.size();
    write_u16(buf, 18);                          // vtable_size
    write_u16(buf, 28);                          // table_size
    write_u16(buf, 4);                           // field 0: app_key at table+4
    write_u16(buf, 24);                          // field 1: schema at table+24
    write_u16(buf, 25);                          // field 2: version at table+25
    write_u16(buf, has_batch_id ? 16 : 0);       // field 3: batch_id at table+16
    write_u16(buf, 8);                           // field 4: data at table+8
    write_u16(buf, has_device_id ? 12 : 0);      // field 5: device_id at table+12
    write_u16(buf, 26);                          // field 6: flags at table+26
    buf.insert(buf.end(), 2, 0);

    size_t table_start = buf.size();
    write_i32(buf, static_cast<int32_t>(table_start - vtable_start));

    size_t app_key_off_pos = buf.size();
    write_u32(buf, 0);
    size_t data_off_pos = buf.size();
    write_u32(buf, 0);
    size_t device_id_off_pos = buf.size();
    write_u32(buf, 0);

    write_u64(buf, params.batch_id);

    buf.push_back(static_cast<uint8_t>(params.schema));
    buf.push_back(version);
    buf.push_back(params.flags);
    buf.push_back(0);

    align4(buf);

    size_t app_key_start = write_byte_vector(buf, params.app_key, APP_KEY_LENGTH);
    align4(buf);

    size_t device_id_start = 0;
    if (has_device_id) {
        device_id_start = write_string(buf, params.device_id, params.device_id_len);
        align4(buf);
    }

    size_t data_start = write_byte_vector(buf, params.data, params.data_len);

    patch_u32(buf, base, static_cast<uint32_t>(table_start - base));
    patch_offset(buf, app_key_off_pos, app_key_start);
    patch_offset(buf, data_off_pos, data_start);
    if (has_device_id) patch_offset(buf, device_id_off_pos, device_id_start);
}

} // namespace encoding
} // namespace datrack
