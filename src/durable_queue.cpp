// src/durable_queue.cpp
// Durable queue on SQLite.

#include "durable_queue.hpp"
#include "logging.hpp"
#include "datrack/error.hpp"

#include <algorithm>
#include <cstring>

namespace datrack {

static Uuid uuid_from_blob(const std::vector<uint8_t>& blob) {
    Uuid id{};
    if (blob.size() == id.size()) {
        std::memcpy(id.data(), blob.data(), id.size());
    }
    return id;
}

DurableQueue::DurableQueue(const std::string& database_path, size_t max_entries,
                           OverflowPolicy policy)
    : db_(database_path), max_entries_(max_entries), policy_(policy) {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS queue ("
        "  seq          INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  kind         INTEGER NOT NULL,"
        "  op           INTEGER NOT NULL,"
        "  record_id    BLOB NOT NULL,"
        "  name         TEXT NOT NULL,"
        "  timestamp    INTEGER NOT NULL,"
        "  session_id   BLOB,"
        "  payload      BLOB NOT NULL,"
        "  enqueued_at  INTEGER NOT NULL,"
        "  attempts     INTEGER NOT NULL DEFAULT 0,"
        "  last_attempt INTEGER NOT NULL DEFAULT 0);"
        "CREATE INDEX IF NOT EXISTS queue_kind_seq ON queue (kind, seq);");

    auto stmt = db_.prepare("SELECT COUNT(*) FROM queue;");
    if (stmt.step()) {
        count_ = static_cast<size_t>(stmt.column_int64(0));
    }
    if (count_ > 0) {
        DATRACK_LOG_INFO("restored pending records",
                         {logging::int_field("count", static_cast<int64_t>(count_))});
    }
}

EnqueueOutcome DurableQueue::enqueue(const StoredRecord& record, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (policy_ == OverflowPolicy::RejectNew && count_ >= max_entries_) {
        throw TrackerError::queue_overflow(
            "queue holds " + std::to_string(count_) + " entries, rejecting new record");
    }

    EnqueueOutcome outcome;
    Transaction tx(db_);

    auto stmt = db_.prepare(
        "INSERT INTO queue (kind, op, record_id, name, timestamp, session_id, payload, enqueued_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
    stmt.bind(1, static_cast<int64_t>(record.kind));
    stmt.bind(2, static_cast<int64_t>(record.op));
    stmt.bind_blob(3, record.record_id.data(), record.record_id.size());
    stmt.bind(4, record.name);
    stmt.bind(5, static_cast<int64_t>(record.timestamp));
    if (record.session_id) {
        stmt.bind_blob(6, record.session_id->data(), record.session_id->size());
    } else {
        stmt.bind_null(6);
    }
    stmt.bind_blob(7, record.payload.data(), record.payload.size());
    stmt.bind(8, static_cast<int64_t>(now_ms));
    stmt.step();
    outcome.sequence = db_.last_insert_rowid();

    size_t new_count = count_ + 1;
    if (new_count > max_entries_) {
        size_t before = new_count;
        new_count -= evict_oldest_locked(new_count - max_entries_, outcome.sequence);
        outcome.evicted = before - new_count;
    }

    tx.commit();
    count_ = new_count;
    return outcome;
}

// Called inside the enqueue transaction. Only entries older than `inserted`
// are candidates; if the lease covers all of them the insert is refused and
// rolled back by the caller's transaction.
size_t DurableQueue::evict_oldest_locked(size_t count, int64_t inserted) {
    auto select = db_.prepare("SELECT seq FROM queue WHERE seq < ?1 ORDER BY seq ASC;");
    select.bind(1, inserted);
    std::vector<int64_t> victims;
    victims.reserve(count);
    while (victims.size() < count && select.step()) {
        int64_t seq = select.column_int64(0);
        if (leased_ && std::find(leased_sequences_.begin(), leased_sequences_.end(), seq)
                           != leased_sequences_.end()) {
            continue;
        }
        victims.push_back(seq);
    }
    if (victims.size() < count) {
        throw TrackerError::queue_overflow(
            "queue holds " + std::to_string(count_) + " entries, all older entries are leased");
    }

    auto del = db_.prepare("DELETE FROM queue WHERE seq = ?1;");
    for (int64_t seq : victims) {
        del.bind(1, seq);
        del.step();
        del.reset();
    }
    return victims.size();
}

std::vector<QueueEntry> DurableQueue::lease_batch(RecordKind kind, size_t max_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueEntry> batch;
    if (leased_ || max_count == 0) return batch;

    auto stmt = db_.prepare(
        "SELECT seq, kind, op, record_id, name, timestamp, session_id, payload, "
        "       enqueued_at, attempts, last_attempt "
        "FROM queue WHERE kind = ?1 ORDER BY seq ASC LIMIT ?2;");
    stmt.bind(1, static_cast<int64_t>(kind));
    stmt.bind(2, static_cast<int64_t>(max_count));

    while (stmt.step()) {
        QueueEntry entry;
        entry.sequence = stmt.column_int64(0);
        entry.record.kind = static_cast<RecordKind>(stmt.column_int64(1));
        entry.record.op = static_cast<ProfileOp>(stmt.column_int64(2));
        entry.record.record_id = uuid_from_blob(stmt.column_blob(3));
        entry.record.name = stmt.column_text(4);
        entry.record.timestamp = static_cast<uint64_t>(stmt.column_int64(5));
        if (!stmt.column_is_null(6)) {
            entry.record.session_id = uuid_from_blob(stmt.column_blob(6));
        }
        entry.record.payload = stmt.column_blob(7);
        entry.enqueued_at = static_cast<uint64_t>(stmt.column_int64(8));
        entry.attempts = static_cast<uint32_t>(stmt.column_int64(9));
        entry.last_attempt_ms = static_cast<uint64_t>(stmt.column_int64(10));
        batch.push_back(std::move(entry));
    }

    if (!batch.empty()) {
        leased_ = true;
        leased_sequences_.clear();
        for (const auto& entry : batch) leased_sequences_.push_back(entry.sequence);
    }
    return batch;
}

void DurableQueue::end_lease_locked(const std::vector<int64_t>& sequences) {
    if (sequences != leased_sequences_) {
        DATRACK_LOG_WARN("lease ended with a different sequence set",
                         {logging::int_field("leased", static_cast<int64_t>(leased_sequences_.size())),
                          logging::int_field("ended", static_cast<int64_t>(sequences.size()))});
    }
    leased_ = false;
    leased_sequences_.clear();
}

void DurableQueue::commit(const std::vector<int64_t>& sequences) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    try {
        Transaction tx(db_);
        auto del = db_.prepare("DELETE FROM queue WHERE seq = ?1;");
        for (int64_t seq : sequences) {
            del.bind(1, seq);
            del.step();
            removed += static_cast<size_t>(db_.changes());
            del.reset();
        }
        tx.commit();
    } catch (const TrackerError&) {
        // The rows stay pending; a later lease picks them up again.
        end_lease_locked(sequences);
        throw;
    }

    count_ = count_ >= removed ? count_ - removed : 0;
    end_lease_locked(sequences);
}

void DurableQueue::release(const std::vector<int64_t>& sequences, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        Transaction tx(db_);
        auto upd = db_.prepare(
            "UPDATE queue SET attempts = attempts + 1, last_attempt = ?1 WHERE seq = ?2;");
        for (int64_t seq : sequences) {
            upd.bind(1, static_cast<int64_t>(now_ms));
            upd.bind(2, seq);
            upd.step();
            upd.reset();
        }
        tx.commit();
    } catch (const TrackerError&) {
        end_lease_locked(sequences);
        throw;
    }

    end_lease_locked(sequences);
}

size_t DurableQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

size_t DurableQueue::size(RecordKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = db_.prepare("SELECT COUNT(*) FROM queue WHERE kind = ?1;");
    stmt.bind(1, static_cast<int64_t>(kind));
    return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
}

bool DurableQueue::lease_outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leased_;
}

} // namespace datrack
