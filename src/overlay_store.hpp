// src/overlay_store.hpp
// Super properties, event timers and small persisted metadata.

#pragma once

#include "storage.hpp"
#include "datrack/props.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace datrack {

// Holds the super-property overlay merged into every event and the active
// event timers. Super properties and metadata are written through to SQLite
// before the in-memory view changes; timers live in memory only.
//
// Thread-safe: writers are serialized, readers get snapshot copies.
class OverlayStore {
public:
    // Throws TrackerError (Storage) if the database cannot be opened.
    explicit OverlayStore(const std::string& database_path);

    OverlayStore(const OverlayStore&) = delete;
    OverlayStore& operator=(const OverlayStore&) = delete;

    // --- Super properties ---

    // Register `properties`. Existing keys are replaced only if `overwrite`.
    void set_super_properties(const Props& properties, bool overwrite);

    // Register keys that are absent, or whose current value equals
    // `default_value` when one is given.
    void set_super_properties_once(const Props& properties,
                                   const std::optional<Value>& default_value = std::nullopt);

    void unregister(const std::string& key);
    void clear();

    // Snapshot copy; later mutations never affect it.
    Props current() const;

    // --- Timers ---

    void start_timer(const std::string& name, uint64_t now_ms);

    // Remove and return the start time of `name`'s timer, if any.
    std::optional<uint64_t> take_timer(const std::string& name);

    void clear_timers();
    size_t timer_count() const;

    // --- Metadata ---

    std::optional<std::string> get_meta(const std::string& key) const;
    void set_meta(const std::string& key, const std::string& value);
    void erase_meta(const std::string& key);

private:
    void load();
    void upsert_locked(const std::string& key, const Value& value);

    mutable std::mutex db_mutex_;
    mutable SqliteDb db_;

    mutable std::shared_mutex props_mutex_;
    Props super_props_;

    mutable std::mutex timers_mutex_;
    std::map<std::string, uint64_t> timers_;
};

} // namespace datrack
