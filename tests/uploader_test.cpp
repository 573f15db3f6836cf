// tests/uploader_test.cpp
// Lease/commit/release cycle, wifi gate, payload codecs and backoff.

#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include "temp_db.hpp"
#include "uploader.hpp"

#include <zlib.h>

#include <memory>
#include <new>
#include <stdexcept>

using namespace datrack;

namespace {

constexpr const char* APP_KEY = "a1b2c3d4e5f60718293a4b5c6d7e8f90";

StoredRecord make_record(const std::string& name, RecordKind kind = RecordKind::Event) {
    StoredRecord r;
    r.kind = kind;
    r.op = kind == RecordKind::Profile ? ProfileOp::Set : ProfileOp::None;
    r.record_id = generate_uuid();
    r.name = name;
    r.timestamp = 1706000000000;
    const char* json = "{\"attributes\":{\"btn\":\"ok\"}}";
    r.payload.assign(json, json + std::strlen(json));
    return r;
}

std::vector<uint8_t> gunzip(const std::vector<uint8_t>& compressed) {
    z_stream zs{};
    EXPECT_EQ(inflateInit2(&zs, 15 | 16), Z_OK);
    zs.next_in = const_cast<Bytef*>(compressed.data());
    zs.avail_in = static_cast<uInt>(compressed.size());
    std::vector<uint8_t> out;
    uint8_t chunk[4096];
    int ret;
    do {
        zs.next_out = chunk;
        zs.avail_out = sizeof(chunk);
        ret = inflate(&zs, Z_NO_FLUSH);
        out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
    } while (ret == Z_OK);
    EXPECT_EQ(ret, Z_STREAM_END);
    inflateEnd(&zs);
    return out;
}

class UploaderTest : public ::testing::Test {
protected:
    UploaderTest()
        : transport_(std::make_shared<FakeTransport>()),
          queue_(db_.path(), 1000, OverflowPolicy::DropOldest) {}

    // Builds the uploader; call after adjusting the config builder.
    Uploader& uploader() {
        if (!uploader_) {
            config_ = std::make_unique<TrackerConfig>(builder_.build());
            settings_ = std::make_unique<UploadSettings>(*config_);
            uploader_ = std::make_unique<Uploader>(*config_, queue_, transport_, *settings_,
                                                   stats_, "device-1");
        }
        return *uploader_;
    }

    void enqueue(int count, RecordKind kind = RecordKind::Event) {
        for (int i = 0; i < count; i++) {
            queue_.enqueue(make_record("click", kind), 1);
        }
    }

    TempDb db_;
    std::shared_ptr<FakeTransport> transport_;
    DurableQueue queue_;
    StatsCounters stats_;
    TrackerConfigBuilder builder_ = TrackerConfig::builder(APP_KEY).compress(false);
    std::unique_ptr<TrackerConfig> config_;
    std::unique_ptr<UploadSettings> settings_;
    std::unique_ptr<Uploader> uploader_;
};

} // namespace

TEST_F(UploaderTest, EmptyQueueSendsNothing) {
    auto result = uploader().run_once();
    EXPECT_EQ(result.status, UploadStatus::Empty);
    EXPECT_EQ(transport_->calls(), 0u);
}

TEST_F(UploaderTest, SuccessCommits) {
    enqueue(3);
    auto result = uploader().run_once();

    EXPECT_EQ(result.status, UploadStatus::Sent);
    EXPECT_EQ(result.records_sent, 3u);
    EXPECT_EQ(result.batches, 1u);
    EXPECT_EQ(queue_.size(), 0u);
    EXPECT_FALSE(queue_.lease_outstanding());

    auto batches = transport_->batches();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].schema, RecordKind::Event);
    EXPECT_EQ(batches[0].device_id, "device-1");
    EXPECT_EQ(batches[0].flags, 0u);
    EXPECT_EQ(batches[0].app_key.size(), 16u);
    EXPECT_EQ(batches[0].app_key[0], 0xa1);
    EXPECT_EQ(encoding::read_record_count(batches[0].data.data(), batches[0].data.size()), 3u);

    auto records = decode_records(batches[0].data);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].timestamp, 1706000000000u);
    EXPECT_EQ(records[0].enqueued_at, 1u);
}

TEST_F(UploaderTest, FailureReleases) {
    enqueue(2);
    transport_->set_result(SendResult::Failed);
    auto result = uploader().run_once();

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(queue_.size(), 2u);
    EXPECT_FALSE(queue_.lease_outstanding());

    auto again = queue_.lease_batch(RecordKind::Event, 10);
    ASSERT_EQ(again.size(), 2u);
    EXPECT_EQ(again[0].attempts, 1u);
}

TEST_F(UploaderTest, RejectionReleases) {
    enqueue(1);
    transport_->set_result(SendResult::Rejected);
    std::vector<ErrorKind> errors;
    builder_.on_error([&errors](const TrackerError& e) { errors.push_back(e.kind()); });

    EXPECT_EQ(uploader().run_once().status, UploadStatus::Failed);
    EXPECT_EQ(queue_.size(), 1u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::ServerRejected);
}

TEST_F(UploaderTest, RetrySucceedsAfterFailure) {
    enqueue(2);
    transport_->set_result(SendResult::Failed);
    uploader().run_once();
    transport_->set_result(SendResult::Accepted);
    auto result = uploader().run_once();
    EXPECT_EQ(result.status, UploadStatus::Sent);
    EXPECT_EQ(result.records_sent, 2u);
    EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(UploaderTest, TransportExceptionReleases) {
    enqueue(1);
    transport_->set_throw_on_send(true);
    std::vector<ErrorKind> errors;
    builder_.on_error([&errors](const TrackerError& e) { errors.push_back(e.kind()); });

    EXPECT_EQ(uploader().run_once().status, UploadStatus::Failed);
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_FALSE(queue_.lease_outstanding());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::Network);
}

TEST_F(UploaderTest, WifiOnlySkipsOnCellular) {
    enqueue(2);
    builder_.send_on_wifi(true).network_probe([] { return NetworkType::Cellular; });
    auto result = uploader().run_once();

    EXPECT_EQ(result.status, UploadStatus::Skipped);
    EXPECT_EQ(transport_->calls(), 0u);
    EXPECT_FALSE(queue_.lease_outstanding());
    EXPECT_EQ(queue_.size(), 2u);
    // Nothing was leased, so no attempt was recorded.
    EXPECT_EQ(queue_.lease_batch(RecordKind::Event, 10)[0].attempts, 0u);
}

TEST_F(UploaderTest, WifiOnlyWithoutProbeSkips) {
    enqueue(1);
    builder_.send_on_wifi(true);
    EXPECT_EQ(uploader().run_once().status, UploadStatus::Skipped);
    EXPECT_EQ(transport_->calls(), 0u);
}

TEST_F(UploaderTest, WifiOnlySendsOnWifi) {
    enqueue(1);
    builder_.send_on_wifi(true).network_probe([] { return NetworkType::Wifi; });
    EXPECT_EQ(uploader().run_once().status, UploadStatus::Sent);
}

TEST_F(UploaderTest, WifiGateFollowsRuntimeSetting) {
    enqueue(1);
    builder_.network_probe([] { return NetworkType::Cellular; });
    auto& up = uploader();
    settings_->send_on_wifi.store(true);
    EXPECT_EQ(up.run_once().status, UploadStatus::Skipped);
    settings_->send_on_wifi.store(false);
    EXPECT_EQ(up.run_once().status, UploadStatus::Sent);
}

TEST_F(UploaderTest, BulkSizeBatches) {
    builder_.bulk_size(2);
    enqueue(5);
    auto& up = uploader();

    size_t expected_sizes[] = {2, 2, 1};
    size_t expected_remaining[] = {3, 1, 0};
    for (int i = 0; i < 3; i++) {
        auto result = up.run_once();
        EXPECT_EQ(result.status, UploadStatus::Sent);
        EXPECT_EQ(result.records_sent, expected_sizes[i]);
        EXPECT_EQ(queue_.size(), expected_remaining[i]);
    }
    EXPECT_EQ(up.run_once().status, UploadStatus::Empty);

    auto batches = transport_->batches();
    ASSERT_EQ(batches.size(), 3u);
    EXPECT_LT(batches[0].batch_id, batches[1].batch_id);
    EXPECT_LT(batches[1].batch_id, batches[2].batch_id);
}

TEST_F(UploaderTest, EventsAndProfilesInSeparateBatches) {
    enqueue(2, RecordKind::Event);
    enqueue(1, RecordKind::Profile);
    auto result = uploader().run_once();

    EXPECT_EQ(result.batches, 2u);
    EXPECT_EQ(result.records_sent, 3u);
    auto batches = transport_->batches();
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].schema, RecordKind::Event);
    EXPECT_EQ(batches[1].schema, RecordKind::Profile);
}

TEST_F(UploaderTest, DrainSendsEverything) {
    builder_.bulk_size(2);
    enqueue(5);
    auto result = uploader().drain();
    EXPECT_EQ(result.status, UploadStatus::Sent);
    EXPECT_EQ(result.records_sent, 5u);
    EXPECT_EQ(result.batches, 3u);
    EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(UploaderTest, DrainStopsOnFailure) {
    builder_.bulk_size(2);
    enqueue(5);
    transport_->set_result(SendResult::Failed);
    auto result = uploader().drain();
    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(transport_->calls(), 1u);
    EXPECT_EQ(queue_.size(), 5u);
}

TEST_F(UploaderTest, GzipPayload) {
    builder_.compress(true);
    enqueue(4);
    uploader().run_once();

    auto batches = transport_->batches();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].flags, encoding::FLAG_GZIP);
    auto data = gunzip(batches[0].data);
    EXPECT_EQ(encoding::read_record_count(data.data(), data.size()), 4u);
}

TEST_F(UploaderTest, EncryptorAppliedAfterCompression) {
    std::vector<uint8_t> seen;
    builder_.compress(true).encryptor([&seen](const std::vector<uint8_t>& in) {
        seen = in;
        std::vector<uint8_t> out = in;
        for (auto& b : out) b ^= 0x5A;
        return out;
    });
    enqueue(1);
    uploader().run_once();

    auto batches = transport_->batches();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].flags, encoding::FLAG_GZIP | encoding::FLAG_ENCRYPTED);
    ASSERT_GE(seen.size(), 2u);
    EXPECT_EQ(seen[0], 0x1f);
    EXPECT_EQ(seen[1], 0x8b);
    ASSERT_EQ(batches[0].data.size(), seen.size());
    EXPECT_EQ(batches[0].data[0], 0x1f ^ 0x5A);
}

TEST_F(UploaderTest, EncryptorFailureReleases) {
    builder_.encryptor([](const std::vector<uint8_t>&) -> std::vector<uint8_t> {
        throw std::runtime_error("no key");
    });
    std::vector<ErrorKind> errors;
    builder_.on_error([&errors](const TrackerError& e) { errors.push_back(e.kind()); });
    enqueue(1);

    EXPECT_EQ(uploader().run_once().status, UploadStatus::Failed);
    EXPECT_EQ(transport_->calls(), 0u);
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_FALSE(queue_.lease_outstanding());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::Serialization);
}

TEST_F(UploaderTest, AllocationFailureDuringEncodingReleases) {
    builder_.encryptor([](const std::vector<uint8_t>&) -> std::vector<uint8_t> {
        throw std::bad_alloc();
    });
    std::vector<ErrorKind> errors;
    builder_.on_error([&errors](const TrackerError& e) { errors.push_back(e.kind()); });
    enqueue(2);

    EXPECT_EQ(uploader().run_once().status, UploadStatus::Failed);
    EXPECT_EQ(transport_->calls(), 0u);
    EXPECT_EQ(queue_.size(), 2u);
    EXPECT_FALSE(queue_.lease_outstanding());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::Serialization);
    EXPECT_EQ(stats_.snapshot().batches_failed, 1u);
}

TEST_F(UploaderTest, CommitFailureKeepsRecordsForRedelivery) {
    std::vector<ErrorKind> errors;
    builder_.on_error([&errors](const TrackerError& e) { errors.push_back(e.kind()); });
    enqueue(2);
    db_.fail_writes("DELETE");

    auto result = uploader().run_once();
    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(transport_->calls(), 1u);
    EXPECT_EQ(queue_.size(), 2u);
    EXPECT_FALSE(queue_.lease_outstanding());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorKind::Storage);
    EXPECT_EQ(stats_.snapshot().storage_failures, 1u);

    // drain() stops on the failed cycle instead of resending forever.
    EXPECT_EQ(uploader().drain().status, UploadStatus::Failed);
    EXPECT_EQ(transport_->calls(), 2u);

    db_.restore_writes("DELETE");
    EXPECT_EQ(uploader().run_once().status, UploadStatus::Sent);
    EXPECT_EQ(queue_.size(), 0u);
    EXPECT_EQ(transport_->batches().size(), 3u);
}

TEST_F(UploaderTest, ReleaseFailureEndsLease) {
    std::vector<ErrorKind> errors;
    builder_.on_error([&errors](const TrackerError& e) { errors.push_back(e.kind()); });
    enqueue(1);
    transport_->set_result(SendResult::Failed);
    db_.fail_writes("UPDATE");

    EXPECT_EQ(uploader().run_once().status, UploadStatus::Failed);
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_FALSE(queue_.lease_outstanding());
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], ErrorKind::Network);
    EXPECT_EQ(errors[1], ErrorKind::Storage);
    EXPECT_EQ(stats_.snapshot().storage_failures, 1u);

    db_.restore_writes("UPDATE");
    transport_->set_result(SendResult::Accepted);
    EXPECT_EQ(uploader().run_once().status, UploadStatus::Sent);
    EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(UploaderTest, StatsCounted) {
    enqueue(3);
    transport_->set_result(SendResult::Failed);
    uploader().run_once();
    transport_->set_result(SendResult::Accepted);
    uploader().run_once();

    auto s = stats_.snapshot();
    EXPECT_EQ(s.batches_failed, 1u);
    EXPECT_EQ(s.batches_sent, 1u);
    EXPECT_EQ(s.records_sent, 3u);
}

TEST(UploaderBackoffTest, DelayGrowsAndCaps) {
    using std::chrono::milliseconds;
    EXPECT_EQ(Uploader::backoff_delay(0, 0.0), milliseconds(0));
    EXPECT_EQ(Uploader::backoff_delay(1, 0.0), milliseconds(1000));
    EXPECT_EQ(Uploader::backoff_delay(2, 0.0), milliseconds(1500));
    EXPECT_EQ(Uploader::backoff_delay(3, 0.0), milliseconds(2250));
    EXPECT_EQ(Uploader::backoff_delay(3, 1.0), milliseconds(2700));
    EXPECT_EQ(Uploader::backoff_delay(30, 1.0), milliseconds(Uploader::MAX_BACKOFF_MS));
}

TEST_F(UploaderTest, ScheduledRunRespectsBackoff) {
    enqueue(1);
    transport_->set_result(SendResult::Failed);
    auto& up = uploader();
    EXPECT_EQ(up.run_once().status, UploadStatus::Failed);
    EXPECT_EQ(up.consecutive_failures(), 1u);
    size_t calls = transport_->calls();

    auto now = std::chrono::steady_clock::now();
    EXPECT_EQ(up.run_scheduled(now).status, UploadStatus::Skipped);
    EXPECT_EQ(transport_->calls(), calls);

    transport_->set_result(SendResult::Accepted);
    auto later = now + std::chrono::milliseconds(Uploader::MAX_BACKOFF_MS + 1);
    EXPECT_EQ(up.run_scheduled(later).status, UploadStatus::Sent);
    EXPECT_EQ(up.consecutive_failures(), 0u);
    EXPECT_EQ(queue_.size(), 0u);
}

TEST_F(UploaderTest, ExplicitRunIgnoresBackoff) {
    enqueue(1);
    transport_->set_result(SendResult::Failed);
    auto& up = uploader();
    up.run_once();

    transport_->set_result(SendResult::Accepted);
    EXPECT_EQ(up.run_once().status, UploadStatus::Sent);
}
