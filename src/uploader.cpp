// src/uploader.cpp
// Lease -> encode -> compress -> encrypt -> send -> commit/release.

#include "uploader.hpp"
#include "codec.hpp"
#include "encoding.hpp"
#include "logging.hpp"
#include "datrack/error.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace datrack {

static const char* kind_name(RecordKind kind) {
    switch (kind) {
        case RecordKind::Event:   return "event";
        case RecordKind::Profile: return "profile";
        default:                  return "unknown";
    }
}

Uploader::Uploader(const TrackerConfig& config, DurableQueue& queue,
                   std::shared_ptr<Transport> transport, UploadSettings& settings,
                   StatsCounters& stats, std::string device_id)
    : config_(config),
      queue_(queue),
      transport_(std::move(transport)),
      settings_(settings),
      stats_(stats),
      device_id_(std::move(device_id)) {
    if (!transport_) {
        throw TrackerError::configuration("uploader requires a transport");
    }
    data_buf_.reserve(64 * 1024);
    batch_buf_.reserve(64 * 1024);
}

std::chrono::milliseconds Uploader::backoff_delay(uint32_t failures, double jitter_fraction) {
    if (failures == 0) return std::chrono::milliseconds(0);
    double base = 1000.0 * std::pow(1.5, static_cast<double>(failures - 1));
    double jitter = base * 0.2 * std::clamp(jitter_fraction, 0.0, 1.0);
    double delay = std::min(base + jitter, static_cast<double>(MAX_BACKOFF_MS));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool Uploader::network_allows_upload() const {
    if (!settings_.send_on_wifi.load(std::memory_order_relaxed)) return true;
    NetworkType network = NetworkType::Unknown;
    if (config_.network_probe()) {
        network = config_.network_probe()();
    }
    return network == NetworkType::Wifi;
}

void Uploader::report(const TrackerError& error) const {
    if (config_.on_error()) {
        config_.on_error()(error);
    }
}

UploadResult Uploader::run_once() {
    UploadResult result;
    if (!network_allows_upload()) {
        DATRACK_LOG_DEBUG("upload skipped, not on wifi");
        result.status = UploadStatus::Skipped;
        return result;
    }

    size_t bulk = settings_.bulk_size.load(std::memory_order_relaxed);
    bool failed = false;
    for (RecordKind kind : {RecordKind::Event, RecordKind::Profile}) {
        UploadResult part = upload_kind(kind, bulk);
        result.records_sent += part.records_sent;
        result.batches += part.batches;
        if (part.status == UploadStatus::Failed) failed = true;
    }

    if (failed) {
        result.status = UploadStatus::Failed;
    } else if (result.batches > 0) {
        result.status = UploadStatus::Sent;
    } else {
        result.status = UploadStatus::Empty;
    }
    on_cycle_finished(result, std::chrono::steady_clock::now());
    return result;
}

UploadResult Uploader::run_scheduled(std::chrono::steady_clock::time_point now) {
    if (consecutive_failures() > 0 && now < next_attempt_) {
        UploadResult skipped;
        skipped.status = UploadStatus::Skipped;
        return skipped;
    }
    return drain();
}

UploadResult Uploader::drain() {
    UploadResult total;
    total.status = UploadStatus::Empty;
    for (;;) {
        UploadResult cycle = run_once();
        total.records_sent += cycle.records_sent;
        total.batches += cycle.batches;
        if (cycle.status == UploadStatus::Sent) {
            total.status = UploadStatus::Sent;
            continue;
        }
        if (cycle.status != UploadStatus::Empty || total.batches == 0) {
            total.status = cycle.status;
        }
        return total;
    }
}

void Uploader::on_cycle_finished(const UploadResult& result,
                                 std::chrono::steady_clock::time_point now) {
    if (result.status == UploadStatus::Failed) {
        uint32_t failures = consecutive_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
        static thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        auto delay = backoff_delay(failures, dist(gen));
        next_attempt_ = now + delay;
        DATRACK_LOG_WARN("upload failed, backing off",
                         {logging::int_field("failures", failures),
                          logging::int_field("delay_ms", delay.count())});
    } else if (result.status == UploadStatus::Sent) {
        consecutive_failures_.store(0, std::memory_order_relaxed);
    }
}

UploadResult Uploader::upload_kind(RecordKind kind, size_t bulk_size) {
    UploadResult result;
    result.status = UploadStatus::Empty;

    std::vector<QueueEntry> entries;
    try {
        entries = queue_.lease_batch(kind, bulk_size);
    } catch (const TrackerError& e) {
        stats_.storage_failures.fetch_add(1, std::memory_order_relaxed);
        DATRACK_LOG_ERROR("lease failed", {logging::string_field("error", e.message())});
        report(e);
        result.status = UploadStatus::Failed;
        return result;
    }
    if (entries.empty()) return result;

    std::vector<int64_t> sequences;
    sequences.reserve(entries.size());
    for (const auto& entry : entries) {
        sequences.push_back(entry.sequence);
    }

    auto release = [&](const TrackerError& cause) {
        stats_.batches_failed.fetch_add(1, std::memory_order_relaxed);
        DATRACK_LOG_WARN("batch not delivered, keeping for retry",
                         {logging::string_field("kind", kind_name(kind)),
                          logging::int_field("records", static_cast<int64_t>(entries.size())),
                          logging::string_field("error", cause.message())});
        report(cause);
        try {
            queue_.release(sequences, static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count()));
        } catch (const TrackerError& e) {
            stats_.storage_failures.fetch_add(1, std::memory_order_relaxed);
            DATRACK_LOG_ERROR("release failed", {logging::string_field("error", e.message())});
            report(e);
        }
        result.status = UploadStatus::Failed;
        return result;
    };

    uint8_t flags = 0;
    try {
        std::vector<encoding::RecordParams> params;
        params.reserve(entries.size());
        for (const auto& entry : entries) {
            const StoredRecord& r = entry.record;
            encoding::RecordParams p;
            p.kind = r.kind;
            p.op = r.op;
            p.timestamp = r.timestamp;
            p.enqueued_at = entry.enqueued_at;
            p.record_id = r.record_id.data();
            p.session_id = r.session_id ? r.session_id->data() : nullptr;
            p.name = r.name.c_str();
            p.name_len = r.name.size();
            if (!r.payload.empty()) {
                p.payload = r.payload.data();
                p.payload_len = r.payload.size();
            }
            params.push_back(p);
        }

        data_buf_.clear();
        size_t data_start = encoding::encode_record_data_into(data_buf_, params);
        std::vector<uint8_t> data(data_buf_.begin() + static_cast<std::ptrdiff_t>(data_start),
                                  data_buf_.end());

        if (config_.compress()) {
            data = codec::gzip_compress(data.data(), data.size());
            flags |= encoding::FLAG_GZIP;
        }
        if (config_.encryptor()) {
            data = config_.encryptor()(data);
            flags |= encoding::FLAG_ENCRYPTED;
        }

        batch_buf_.clear();
        encoding::BatchParams bp;
        bp.app_key = config_.app_key_bytes().data();
        bp.schema = kind;
        bp.version = encoding::DEFAULT_VERSION;
        bp.batch_id = batch_counter_.fetch_add(1, std::memory_order_relaxed);
        bp.device_id = device_id_.c_str();
        bp.device_id_len = device_id_.size();
        bp.flags = flags;
        bp.data = data.data();
        bp.data_len = data.size();
        encoding::encode_batch_into(batch_buf_, bp);
    } catch (const TrackerError& e) {
        return release(e);
    } catch (const std::exception& e) {
        // Allocation failures and encryptor errors end up here.
        return release(TrackerError::serialization(
            std::string(kind_name(kind)) + " batch encoding failed: " + e.what()));
    }

    SendResult sent = SendResult::Failed;
    try {
        sent = transport_->send_batch(batch_buf_.data(), batch_buf_.size());
    } catch (const std::exception& e) {
        return release(TrackerError::network(std::string("transport threw: ") + e.what()));
    }

    if (sent == SendResult::Rejected) {
        return release(TrackerError::server_rejected(std::string(kind_name(kind)) + " batch"));
    }
    if (sent == SendResult::Failed) {
        return release(TrackerError::network(std::string(kind_name(kind)) + " batch not acknowledged"));
    }

    bool committed = true;
    try {
        queue_.commit(sequences);
    } catch (const TrackerError& e) {
        // Delivered but still on disk: it will be sent again and deduplicated
        // by record id on the collector.
        committed = false;
        stats_.storage_failures.fetch_add(1, std::memory_order_relaxed);
        DATRACK_LOG_ERROR("commit failed", {logging::string_field("error", e.message())});
        report(e);
    }

    stats_.batches_sent.fetch_add(1, std::memory_order_relaxed);
    stats_.records_sent.fetch_add(entries.size(), std::memory_order_relaxed);
    DATRACK_LOG_DEBUG("batch sent",
                      {logging::string_field("kind", kind_name(kind)),
                       logging::int_field("records", static_cast<int64_t>(entries.size())),
                       logging::int_field("bytes", static_cast<int64_t>(batch_buf_.size()))});

    result.status = committed ? UploadStatus::Sent : UploadStatus::Failed;
    result.records_sent = entries.size();
    result.batches = 1;
    return result;
}

} // namespace datrack
