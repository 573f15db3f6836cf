// src/durable_queue.hpp
// SQLite-backed FIFO of pending records with single-lease draining.

#pragma once

#include "record.hpp"
#include "storage.hpp"
#include "datrack/types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace datrack {

struct EnqueueOutcome {
    int64_t sequence = 0;
    size_t evicted = 0;  // entries dropped by DropOldest to make room
};

// Append-only local store of pending event and profile records.
//
// - enqueue() commits to disk (synchronous=FULL) before returning.
// - Sequence numbers increase monotonically and never repeat, so draining in
//   sequence order is enqueue order. Each RecordKind drains independently.
// - At most one lease is outstanding. lease_batch() returns an empty batch
//   while another lease is held; commit() or release() ends the lease.
//   Leases are not persisted: after a restart every entry is pending again.
// - The queue holds at most `max_entries` entries. DropOldest evicts the
//   globally oldest unleased entries after an insert; when every older entry
//   is leased the insert is refused instead. RejectNew always refuses the
//   insert with a QueueOverflow error.
class DurableQueue {
public:
    // Throws TrackerError (Storage) if the database cannot be opened.
    DurableQueue(const std::string& database_path, size_t max_entries, OverflowPolicy policy);

    DurableQueue(const DurableQueue&) = delete;
    DurableQueue& operator=(const DurableQueue&) = delete;

    // Throws TrackerError (Storage or QueueOverflow).
    EnqueueOutcome enqueue(const StoredRecord& record, uint64_t now_ms);

    // Up to `max_count` entries of `kind`, oldest first.
    std::vector<QueueEntry> lease_batch(RecordKind kind, size_t max_count);

    // Delete delivered entries and end the lease.
    void commit(const std::vector<int64_t>& sequences);

    // Return entries to pending, counting the failed attempt, and end the lease.
    void release(const std::vector<int64_t>& sequences, uint64_t now_ms);

    size_t size() const;
    size_t size(RecordKind kind) const;
    bool lease_outstanding() const;

    size_t max_entries() const noexcept { return max_entries_; }
    OverflowPolicy overflow_policy() const noexcept { return policy_; }

private:
    size_t evict_oldest_locked(size_t count, int64_t inserted);
    void end_lease_locked(const std::vector<int64_t>& sequences);

    mutable std::mutex mutex_;
    mutable SqliteDb db_;
    size_t max_entries_;
    OverflowPolicy policy_;
    size_t count_ = 0;
    bool leased_ = false;
    std::vector<int64_t> leased_sequences_;
};

} // namespace datrack
