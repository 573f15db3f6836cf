// src/overlay_store.cpp
// Super property persistence and timer bookkeeping.

#include "overlay_store.hpp"
#include "datrack/error.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

namespace datrack {

namespace {

enum class ValueTag : int64_t {
    String = 0,
    Int    = 1,
    Double = 2,
    Bool   = 3,
    Date   = 4,
};

ValueTag tag_of(const Value& value) {
    return static_cast<ValueTag>(value.index());
}

std::string encode_value(const Value& value) {
    if (auto* s = std::get_if<std::string>(&value)) return *s;
    if (auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (auto* d = std::get_if<double>(&value)) {
        char tmp[64];
        int n = std::snprintf(tmp, sizeof(tmp), "%.17g", *d);
        return std::string(tmp, n > 0 ? static_cast<size_t>(n) : 0);
    }
    if (auto* b = std::get_if<bool>(&value)) return *b ? "1" : "0";
    if (auto* date = std::get_if<Date>(&value)) return std::to_string(date->epoch_ms);
    return {};
}

std::optional<Value> decode_value(int64_t tag, const std::string& text) {
    switch (static_cast<ValueTag>(tag)) {
        case ValueTag::String: return Value(text);
        case ValueTag::Int:    return Value(static_cast<int64_t>(std::strtoll(text.c_str(), nullptr, 10)));
        case ValueTag::Double: return Value(std::strtod(text.c_str(), nullptr));
        case ValueTag::Bool:   return Value(text == "1");
        case ValueTag::Date:   return Value(Date{static_cast<int64_t>(std::strtoll(text.c_str(), nullptr, 10))});
    }
    return std::nullopt;
}

} // namespace

OverlayStore::OverlayStore(const std::string& database_path)
    : db_(database_path) {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS super_properties ("
        "  key   TEXT PRIMARY KEY,"
        "  type  INTEGER NOT NULL,"
        "  value TEXT NOT NULL);"
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL);");
    load();
}

void OverlayStore::load() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto stmt = db_.prepare("SELECT key, type, value FROM super_properties;");
    Props loaded;
    while (stmt.step()) {
        auto value = decode_value(stmt.column_int64(1), stmt.column_text(2));
        if (value) loaded.add(stmt.column_text(0), *value);
    }
    std::unique_lock<std::shared_mutex> props_lock(props_mutex_);
    super_props_ = std::move(loaded);
}

void OverlayStore::upsert_locked(const std::string& key, const Value& value) {
    auto stmt = db_.prepare(
        "INSERT INTO super_properties (key, type, value) VALUES (?1, ?2, ?3) "
        "ON CONFLICT(key) DO UPDATE SET type = excluded.type, value = excluded.value;");
    stmt.bind(1, key);
    stmt.bind(2, static_cast<int64_t>(tag_of(value)));
    stmt.bind(3, encode_value(value));
    stmt.step();
}

// --- Super properties ---

void OverlayStore::set_super_properties(const Props& properties, bool overwrite) {
    if (properties.empty()) return;
    std::lock_guard<std::mutex> lock(db_mutex_);

    Props next = current();
    std::vector<const Props::Map::value_type*> writes;
    for (const auto& entry : properties.entries()) {
        if (!overwrite && next.contains(entry.first)) continue;
        writes.push_back(&entry);
    }
    if (writes.empty()) return;

    Transaction tx(db_);
    for (const auto* entry : writes) {
        upsert_locked(entry->first, entry->second);
        next.add(entry->first, entry->second);
    }
    tx.commit();

    std::unique_lock<std::shared_mutex> props_lock(props_mutex_);
    super_props_ = std::move(next);
}

void OverlayStore::set_super_properties_once(const Props& properties,
                                             const std::optional<Value>& default_value) {
    if (!default_value) {
        set_super_properties(properties, false);
        return;
    }
    if (properties.empty()) return;
    std::lock_guard<std::mutex> lock(db_mutex_);

    Props next = current();
    std::vector<const Props::Map::value_type*> writes;
    for (const auto& entry : properties.entries()) {
        const Value* existing = next.find(entry.first);
        if (existing && *existing != *default_value) continue;
        writes.push_back(&entry);
    }
    if (writes.empty()) return;

    Transaction tx(db_);
    for (const auto* entry : writes) {
        upsert_locked(entry->first, entry->second);
        next.add(entry->first, entry->second);
    }
    tx.commit();

    std::unique_lock<std::shared_mutex> props_lock(props_mutex_);
    super_props_ = std::move(next);
}

void OverlayStore::unregister(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto stmt = db_.prepare("DELETE FROM super_properties WHERE key = ?1;");
    stmt.bind(1, key);
    stmt.step();

    std::unique_lock<std::shared_mutex> props_lock(props_mutex_);
    super_props_.erase(key);
}

void OverlayStore::clear() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    db_.exec("DELETE FROM super_properties;");

    std::unique_lock<std::shared_mutex> props_lock(props_mutex_);
    super_props_.clear();
}

Props OverlayStore::current() const {
    std::shared_lock<std::shared_mutex> lock(props_mutex_);
    return super_props_;
}

// --- Timers ---

void OverlayStore::start_timer(const std::string& name, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    timers_[name] = now_ms;
}

std::optional<uint64_t> OverlayStore::take_timer(const std::string& name) {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    auto it = timers_.find(name);
    if (it == timers_.end()) return std::nullopt;
    uint64_t started = it->second;
    timers_.erase(it);
    return started;
}

void OverlayStore::clear_timers() {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    timers_.clear();
}

size_t OverlayStore::timer_count() const {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    return timers_.size();
}

// --- Metadata ---

std::optional<std::string> OverlayStore::get_meta(const std::string& key) const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto stmt = db_.prepare("SELECT value FROM meta WHERE key = ?1;");
    stmt.bind(1, key);
    if (!stmt.step()) return std::nullopt;
    return stmt.column_text(0);
}

void OverlayStore::set_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto stmt = db_.prepare(
        "INSERT INTO meta (key, value) VALUES (?1, ?2) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    stmt.bind(1, key);
    stmt.bind(2, value);
    stmt.step();
}

void OverlayStore::erase_meta(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    auto stmt = db_.prepare("DELETE FROM meta WHERE key = ?1;");
    stmt.bind(1, key);
    stmt.step();
}

} // namespace datrack
