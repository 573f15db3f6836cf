// tests/encoding_test.cpp
// Unit tests for hand-written FlatBuffer encoding.

#include <gtest/gtest.h>
#include "encoding.hpp"
#include <cstring>
#include <string>

using namespace datrack;
using namespace datrack::encoding;

namespace {

// Locate field `index` of the table rooted at buf[0]; 0 if absent.
size_t field_position(const std::vector<uint8_t>& buf, size_t table, int index) {
    int32_t soffset;
    std::memcpy(&soffset, &buf[table], 4);
    size_t vtable = table - static_cast<size_t>(soffset);
    uint16_t vtable_size;
    std::memcpy(&vtable_size, &buf[vtable], 2);
    size_t slot = 4 + static_cast<size_t>(index) * 2;
    if (slot >= vtable_size) return 0;
    uint16_t field_offset;
    std::memcpy(&field_offset, &buf[vtable + slot], 2);
    return field_offset == 0 ? 0 : table + field_offset;
}

bool contains(const std::vector<uint8_t>& buf, const void* needle, size_t len) {
    for (size_t i = 0; i + len <= buf.size(); i++) {
        if (std::memcmp(&buf[i], needle, len) == 0) return true;
    }
    return false;
}

const uint8_t RECORD_ID[16] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};

} // namespace

TEST(EncodingTest, RecordBasicStructure) {
    RecordParams params;
    params.kind = RecordKind::Event;
    params.timestamp = 1706000000000;
    params.record_id = RECORD_ID;

    std::vector<uint8_t> buf;
    encode_record_into(buf, params);

    ASSERT_GE(buf.size(), 4u);
    uint32_t root = read_u32(buf.data());
    EXPECT_GT(root, 0u);
    EXPECT_LT(root, buf.size());

    size_t ts_pos = field_position(buf, root, 2);
    ASSERT_NE(ts_pos, 0u);
    uint64_t ts;
    std::memcpy(&ts, &buf[ts_pos], 8);
    EXPECT_EQ(ts, 1706000000000u);

    size_t kind_pos = field_position(buf, root, 0);
    ASSERT_NE(kind_pos, 0u);
    EXPECT_EQ(buf[kind_pos], static_cast<uint8_t>(RecordKind::Event));
}

TEST(EncodingTest, RecordWithoutSessionOmitsField) {
    RecordParams params;
    params.kind = RecordKind::Event;
    params.record_id = RECORD_ID;

    std::vector<uint8_t> buf;
    encode_record_into(buf, params);

    uint32_t root = read_u32(buf.data());
    EXPECT_EQ(field_position(buf, root, 4), 0u);
    EXPECT_NE(field_position(buf, root, 3), 0u);
}

TEST(EncodingTest, RecordCarriesEnqueueTime) {
    RecordParams params;
    params.kind = RecordKind::Event;
    params.timestamp = 1706000000000;
    params.enqueued_at = 1706000000250;
    params.record_id = RECORD_ID;

    std::vector<uint8_t> buf;
    encode_record_into(buf, params);

    uint32_t root = read_u32(buf.data());
    size_t pos = field_position(buf, root, 7);
    ASSERT_NE(pos, 0u);
    uint64_t enqueued_at;
    std::memcpy(&enqueued_at, &buf[pos], 8);
    EXPECT_EQ(enqueued_at, 1706000000250u);

    params.enqueued_at = 0;
    buf.clear();
    encode_record_into(buf, params);
    EXPECT_EQ(field_position(buf, read_u32(buf.data()), 7), 0u);
}

TEST(EncodingTest, RecordWithIds) {
    uint8_t session_id[16];
    std::memset(session_id, 0xAB, sizeof(session_id));

    RecordParams params;
    params.kind = RecordKind::Event;
    params.record_id = RECORD_ID;
    params.session_id = session_id;

    std::vector<uint8_t> buf;
    encode_record_into(buf, params);

    EXPECT_TRUE(contains(buf, RECORD_ID, 16)) << "record_id bytes not found";
    EXPECT_TRUE(contains(buf, session_id, 16)) << "session_id bytes not found";
}

TEST(EncodingTest, RecordWithNameAndPayload) {
    const char* json = "{\"attributes\":{\"btn\":\"ok\"}}";
    RecordParams params;
    params.kind = RecordKind::Event;
    params.name = "click";
    params.name_len = 5;
    params.payload = reinterpret_cast<const uint8_t*>(json);
    params.payload_len = std::strlen(json);

    std::vector<uint8_t> buf;
    encode_record_into(buf, params);

    std::string output(buf.begin(), buf.end());
    EXPECT_NE(output.find("click"), std::string::npos);
    EXPECT_NE(output.find("\"btn\":\"ok\""), std::string::npos);
}

TEST(EncodingTest, ProfileRecordCarriesOp) {
    RecordParams params;
    params.kind = RecordKind::Profile;
    params.op = ProfileOp::Charge;

    std::vector<uint8_t> buf;
    encode_record_into(buf, params);

    uint32_t root = read_u32(buf.data());
    size_t op_pos = field_position(buf, root, 1);
    ASSERT_NE(op_pos, 0u);
    EXPECT_EQ(buf[op_pos], static_cast<uint8_t>(ProfileOp::Charge));
}

TEST(EncodingTest, RecordDataCount) {
    std::vector<RecordParams> records(3);
    for (auto& r : records) {
        r.kind = RecordKind::Event;
        r.record_id = RECORD_ID;
        r.name = "click";
        r.name_len = 5;
    }

    std::vector<uint8_t> buf;
    size_t start = encode_record_data_into(buf, records);

    EXPECT_EQ(start, 0u);
    EXPECT_EQ(read_record_count(buf.data(), buf.size()), 3u);
}

TEST(EncodingTest, RecordDataAtOffset) {
    std::vector<uint8_t> buf = {0xFF, 0xFF, 0xFF, 0xFF};
    std::vector<RecordParams> records(2);
    size_t start = encode_record_data_into(buf, records);

    EXPECT_EQ(start, 4u);
    EXPECT_EQ(read_record_count(buf.data() + start, buf.size() - start), 2u);
}

TEST(EncodingTest, EmptyRecordData) {
    std::vector<uint8_t> buf;
    encode_record_data_into(buf, {});
    EXPECT_EQ(read_record_count(buf.data(), buf.size()), 0u);
}

TEST(EncodingTest, MalformedRecordDataCountIsZero) {
    uint8_t junk[] = {0xFF, 0xFF, 0xFF, 0x7F, 0, 0};
    EXPECT_EQ(read_record_count(junk, sizeof(junk)), 0u);
}

TEST(EncodingTest, BatchEncoding) {
    uint8_t app_key[16] = {0xa1, 0xb2, 0xc3, 0xd4, 0xe5, 0xf6, 0x07, 0x18,
                           0x29, 0x3a, 0x4b, 0x5c, 0x6d, 0x7e, 0x8f, 0x90};
    uint8_t data[] = {1, 2, 3, 4};
    std::string device = "device-42";

    BatchParams params;
    params.app_key = app_key;
    params.schema = RecordKind::Profile;
    params.version = 3;
    params.batch_id = 42;
    params.device_id = device.c_str();
    params.device_id_len = device.size();
    params.flags = FLAG_GZIP | FLAG_ENCRYPTED;
    params.data = data;
    params.data_len = 4;

    std::vector<uint8_t> buf;
    encode_batch_into(buf, params);

    EXPECT_TRUE(contains(buf, app_key, 16)) << "app_key bytes not found in batch output";
    EXPECT_TRUE(contains(buf, device.data(), device.size()));

    uint32_t root = read_u32(buf.data());
    EXPECT_EQ(buf[field_position(buf, root, 1)], static_cast<uint8_t>(RecordKind::Profile));
    EXPECT_EQ(buf[field_position(buf, root, 2)], 3u);
    EXPECT_EQ(buf[field_position(buf, root, 6)], FLAG_GZIP | FLAG_ENCRYPTED);

    uint64_t batch_id;
    std::memcpy(&batch_id, &buf[field_position(buf, root, 3)], 8);
    EXPECT_EQ(batch_id, 42u);

    size_t data_field = field_position(buf, root, 4);
    size_t data_vec = data_field + read_u32(&buf[data_field]);
    EXPECT_EQ(read_u32(&buf[data_vec]), 4u);
    EXPECT_EQ(std::memcmp(&buf[data_vec + 4], data, 4), 0);
}

TEST(EncodingTest, BatchDefaultVersion) {
    uint8_t app_key[16] = {};
    uint8_t data[] = {0};

    BatchParams params;
    params.app_key = app_key;
    params.schema = RecordKind::Event;
    params.version = 0;
    params.data = data;
    params.data_len = 1;

    std::vector<uint8_t> buf;
    encode_batch_into(buf, params);

    uint32_t root = read_u32(buf.data());
    EXPECT_EQ(buf[field_position(buf, root, 2)], DEFAULT_VERSION);
    EXPECT_EQ(field_position(buf, root, 5), 0u);
    EXPECT_EQ(field_position(buf, root, 3), 0u);
}
