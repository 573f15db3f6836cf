// src/uploader.hpp
// Drains the durable queue to the collector, one leased batch at a time.

#pragma once

#include "durable_queue.hpp"
#include "stats.hpp"
#include "datrack/config.hpp"
#include "datrack/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace datrack {

// Upload settings that the host may change while the tracker runs.
struct UploadSettings {
    std::atomic<bool> auto_upload{true};
    std::atomic<bool> send_on_wifi{false};
    std::atomic<size_t> bulk_size{100};
    std::atomic<int64_t> interval_ms{15000};

    explicit UploadSettings(const TrackerConfig& config)
        : auto_upload(config.auto_upload()),
          send_on_wifi(config.send_on_wifi()),
          bulk_size(config.bulk_size()),
          interval_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
              config.upload_interval()).count()) {}
};

enum class UploadStatus : uint8_t {
    Skipped = 0,  // wifi-only and not on wifi, or backing off; no lease taken
    Empty   = 1,  // nothing pending
    Sent    = 2,  // at least one batch committed, none failed
    Failed  = 3,  // a batch was released for retry
};

struct UploadResult {
    UploadStatus status = UploadStatus::Empty;
    size_t records_sent = 0;
    size_t batches = 0;
};

// One upload cycle leases at most one batch per record kind (events first,
// then profile updates), encodes it, compresses and optionally encrypts the
// record data, and transmits it. Accepted batches are committed; anything
// else releases the batch for a later cycle. Nothing is ever dropped here.
class Uploader {
public:
    Uploader(const TrackerConfig& config, DurableQueue& queue,
             std::shared_ptr<Transport> transport, UploadSettings& settings,
             StatsCounters& stats, std::string device_id);

    Uploader(const Uploader&) = delete;
    Uploader& operator=(const Uploader&) = delete;

    // Explicit trigger. Ignores the failure backoff.
    UploadResult run_once();

    // Timer trigger. Returns Skipped without touching the queue while the
    // failure backoff has not elapsed.
    UploadResult run_scheduled(std::chrono::steady_clock::time_point now);

    // Run cycles until nothing was sent. Returns the accumulated result.
    UploadResult drain();

    uint32_t consecutive_failures() const noexcept {
        return consecutive_failures_.load(std::memory_order_relaxed);
    }

    // 1s * 1.5^(failures-1) plus up to 20% jitter, capped at 60s.
    static std::chrono::milliseconds backoff_delay(uint32_t failures, double jitter_fraction);

    static constexpr int64_t MAX_BACKOFF_MS = 60000;

private:
    UploadResult upload_kind(RecordKind kind, size_t bulk_size);
    bool network_allows_upload() const;
    void report(const TrackerError& error) const;
    void on_cycle_finished(const UploadResult& result, std::chrono::steady_clock::time_point now);

    const TrackerConfig& config_;
    DurableQueue& queue_;
    std::shared_ptr<Transport> transport_;
    UploadSettings& settings_;
    StatsCounters& stats_;
    std::string device_id_;

    // Reusable encoding buffers
    std::vector<uint8_t> data_buf_;
    std::vector<uint8_t> batch_buf_;

    std::atomic<uint64_t> batch_counter_{1};
    std::atomic<uint32_t> consecutive_failures_{0};
    std::chrono::steady_clock::time_point next_attempt_{};
};

} // namespace datrack
