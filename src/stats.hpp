// src/stats.hpp
// Lock-free diagnostic counters behind TrackerStats.

#pragma once

#include "datrack/types.hpp"

#include <atomic>
#include <cstdint>

namespace datrack {

struct StatsCounters {
    std::atomic<uint64_t> enqueued{0};
    std::atomic<uint64_t> dropped_invalid{0};
    std::atomic<uint64_t> dropped_no_session{0};
    std::atomic<uint64_t> storage_failures{0};
    std::atomic<uint64_t> overflow_evictions{0};
    std::atomic<uint64_t> overflow_rejections{0};
    std::atomic<uint64_t> batches_sent{0};
    std::atomic<uint64_t> batches_failed{0};
    std::atomic<uint64_t> records_sent{0};

    TrackerStats snapshot() const {
        TrackerStats s;
        s.enqueued = enqueued.load(std::memory_order_relaxed);
        s.dropped_invalid = dropped_invalid.load(std::memory_order_relaxed);
        s.dropped_no_session = dropped_no_session.load(std::memory_order_relaxed);
        s.storage_failures = storage_failures.load(std::memory_order_relaxed);
        s.overflow_evictions = overflow_evictions.load(std::memory_order_relaxed);
        s.overflow_rejections = overflow_rejections.load(std::memory_order_relaxed);
        s.batches_sent = batches_sent.load(std::memory_order_relaxed);
        s.batches_failed = batches_failed.load(std::memory_order_relaxed);
        s.records_sent = records_sent.load(std::memory_order_relaxed);
        return s;
    }
};

} // namespace datrack
