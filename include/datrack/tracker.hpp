// include/datrack/tracker.hpp
// The datrack analytics tracker.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "people.hpp"
#include "props.hpp"
#include "types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datrack {

// Captures events and profile updates into a durable local queue and uploads
// them to the collector in batches from a background thread.
//
// Created via Tracker::create(config). Ready to use immediately. Capture
// calls only touch local storage; they never wait on the network and never
// throw. Rejected input is dropped, counted in stats() and reported through
// the config's on_error callback.
//
// Example:
//   auto tracker = Tracker::create(TrackerConfig::production("a1b2c3...f90"));
//   tracker->enter_foreground();
//   tracker->track_event("click", Props().add("btn", "ok"));
//   tracker->close();
class Tracker {
public:
    // Open the local store, restore persisted state and start the uploader.
    // Throws TrackerError on invalid configuration or an unusable store.
    static std::unique_ptr<Tracker> create(TrackerConfig config);

    ~Tracker();

    Tracker(const Tracker&) = delete;
    Tracker& operator=(const Tracker&) = delete;

    // --- Events ---

    // Track an event. Names starting with "da" are reserved.
    // Do not call this in tight loops; every call is a durable write.
    void track_event(const std::string& name, const Props& attributes = Props());
    void track_event(const std::string& name, const EventOptions& options);

    // Start timing `name`; the next event with that name records the
    // elapsed time as its cost and consumes the timer.
    void track_timer(const std::string& name);

    // Drop every running timer.
    void clear_track_timers();

    // --- Super properties ---

    // Merged into every subsequent event; overwrites existing keys.
    void register_super_properties(const Props& properties);

    // Like register_super_properties(), but keeps existing keys.
    void register_super_properties_once(const Props& properties);

    // Keeps existing keys unless their current value equals default_value.
    void register_super_properties_once(const Props& properties, const Value& default_value);

    void unregister_super_property(const std::string& key);
    void clear_super_properties();

    // Snapshot copy of the registered super properties.
    Props current_super_properties() const;

    // --- Identity ---

    void login_user(const std::string& user_id);
    void logout_user();

    // Default location for events tracked without one.
    void set_location(double latitude, double longitude);

    std::string device_id() const;

    // --- Profile ---

    People& people();

    // --- Session (process lifecycle signals) ---

    void enter_foreground();
    void enter_background();
    bool in_session() const;

    // --- Upload ---

    void set_auto_upload(bool enabled);
    void set_send_on_wifi(bool enabled);
    void set_upload_interval(std::chrono::seconds interval);
    void set_upload_bulk_size(size_t size);

    // Ask the background uploader to drain the queue now. Returns immediately.
    void upload();

    // Drain the queue, blocking up to the configured close timeout.
    void flush();

    // Records still waiting for delivery.
    size_t pending_count() const;

    TrackerStats stats() const;

    // --- Lifecycle ---

    // Stop the uploader and discard running timers. Undelivered records stay
    // on disk and are uploaded after the next create().
    void close();

private:
    friend class People;

    explicit Tracker(TrackerConfig config);
    void enqueue_profile(ProfileOp op, const Props& properties,
                         std::vector<std::string> unset_keys, std::optional<double> amount);

    struct Inner;
    std::unique_ptr<Inner> inner_;
    People people_;
};

} // namespace datrack
