// src/tracker.cpp
// Tracker implementation: capture front-end over the overlay, session
// tracker and durable queue, with the upload worker behind it.

#include "datrack/tracker.hpp"
#include "durable_queue.hpp"
#include "logging.hpp"
#include "overlay_store.hpp"
#include "record.hpp"
#include "record_builder.hpp"
#include "session_tracker.hpp"
#include "stats.hpp"
#include "tcp_transport.hpp"
#include "uploader.hpp"
#include "uuid.hpp"
#include "validation.hpp"
#include "worker.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <mutex>
#include <shared_mutex>

namespace datrack {

static constexpr const char* META_DEVICE_ID = "device_id";
static constexpr const char* META_LOGIN_USER = "login_user";

static uint64_t now_ms() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

static std::shared_ptr<Transport> make_transport(const TrackerConfig& config) {
    if (config.transport()) return config.transport();
    return std::make_shared<TcpTransport>(config.endpoint(), config.network_timeout());
}

struct Tracker::Inner {
    TrackerConfig config;
    StatsCounters stats;
    UploadSettings settings;
    OverlayStore overlay;
    SessionTracker sessions;
    DurableQueue queue;
    EventRecordBuilder builder;
    std::shared_ptr<Transport> transport;
    std::string device_id;

    mutable std::shared_mutex identity_mutex;
    std::string login_user_id;
    std::optional<GeoPoint> default_location;

    // Held shared by calls that reach the worker, exclusively by close().
    mutable std::shared_mutex lifecycle_mutex;
    std::atomic<bool> closed{false};

    std::unique_ptr<Uploader> uploader;
    std::unique_ptr<Worker> worker;  // declared last: stopped first

    explicit Inner(TrackerConfig cfg)
        : config(std::move(cfg)),
          settings(config),
          overlay(config.database_path()),
          sessions(config.session_timeout()),
          queue(config.database_path(), config.max_queue_entries(), config.overflow_policy()),
          builder(overlay, sessions),
          transport(make_transport(config)) {
        if (!config.custom_device_id().empty()) {
            device_id = config.custom_device_id();
        } else if (auto stored = overlay.get_meta(META_DEVICE_ID)) {
            device_id = *stored;
        } else {
            device_id = uuid_to_string(generate_uuid());
            overlay.set_meta(META_DEVICE_ID, device_id);
        }
        login_user_id = overlay.get_meta(META_LOGIN_USER).value_or("");

        uploader = std::make_unique<Uploader>(config, queue, transport, settings, stats, device_id);
        worker = std::make_unique<Worker>(*uploader, settings);

        DATRACK_LOG_INFO("tracker started",
                         {logging::string_field("device_id", device_id),
                          logging::string_field("database", config.database_path()),
                          logging::int_field("pending", static_cast<int64_t>(queue.size()))});
    }

    void report_error(const TrackerError& err) const {
        if (config.on_error()) {
            config.on_error()(err);
        }
    }

    // Count, log and report a record that will never be queued.
    void drop(const TrackerError& err) {
        switch (err.kind()) {
            case ErrorKind::SessionRequired:
                stats.dropped_no_session.fetch_add(1, std::memory_order_relaxed);
                break;
            case ErrorKind::Storage:
                stats.storage_failures.fetch_add(1, std::memory_order_relaxed);
                break;
            case ErrorKind::QueueOverflow:
                stats.overflow_rejections.fetch_add(1, std::memory_order_relaxed);
                break;
            case ErrorKind::Closed:
                break;
            default:
                stats.dropped_invalid.fetch_add(1, std::memory_order_relaxed);
                break;
        }
        if (err.kind() == ErrorKind::Storage) {
            DATRACK_LOG_ERROR("record dropped", {logging::string_field("error", err.message())});
        } else {
            DATRACK_LOG_WARN("record dropped", {logging::string_field("error", err.message())});
        }
        report_error(err);
    }

    void store(const StoredRecord& record, uint64_t now) {
        try {
            EnqueueOutcome outcome = queue.enqueue(record, now);
            stats.enqueued.fetch_add(1, std::memory_order_relaxed);
            if (outcome.evicted > 0) {
                stats.overflow_evictions.fetch_add(outcome.evicted, std::memory_order_relaxed);
                DATRACK_LOG_WARN("queue full, evicted oldest records",
                                 {logging::int_field("evicted", static_cast<int64_t>(outcome.evicted))});
                report_error(TrackerError::queue_overflow(
                    "evicted " + std::to_string(outcome.evicted) + " oldest record(s)"));
            }
        } catch (const TrackerError& e) {
            drop(e);
        }
    }

    std::string current_login() const {
        std::shared_lock<std::shared_mutex> lock(identity_mutex);
        return login_user_id;
    }

    // Profile updates target the logged-in user, else the device.
    std::string profile_target() const {
        std::shared_lock<std::shared_mutex> lock(identity_mutex);
        return login_user_id.empty() ? device_id : login_user_id;
    }

    std::optional<GeoPoint> location_or_default(const std::optional<GeoPoint>& location) const {
        if (location) return location;
        std::shared_lock<std::shared_mutex> lock(identity_mutex);
        return default_location;
    }

    void capture(const EventInput& input, uint64_t now,
                 const std::optional<Uuid>& session_override = std::nullopt) {
        if (closed.load()) {
            drop(TrackerError::closed());
            return;
        }
        BuildResult result = builder.build(input, now);
        if (!result) {
            drop(*result.rejection);
            return;
        }
        if (session_override) {
            result.record->session_id = session_override;
        }

        RecordContext context;
        context.user_id = current_login();
        context.app_version = config.app_version();
        context.app_channel = config.app_channel();
        store(to_stored(*result.record, context), now);
    }

    void capture_internal(const char* name, double cost_seconds, uint64_t now,
                          const std::optional<Uuid>& session_override = std::nullopt) {
        EventInput input;
        input.name = name;
        input.cost_seconds = cost_seconds;
        input.require_session = false;
        input.internal = true;
        input.location = location_or_default(std::nullopt);
        capture(input, now, session_override);
    }

    // Reject the whole map if any key is unusable.
    bool check_keys(const Props& properties) {
        for (const auto& [key, value] : properties.entries()) {
            (void)value;
            if (!validation::check_property_key(key)) {
                drop(TrackerError::invalid_input("propertyKey",
                    key.empty() ? "is required" : "must be at most 256 characters"));
                return false;
            }
        }
        return true;
    }

    // Super property writes go to disk first; a failed write leaves the
    // overlay unchanged.
    template <typename Fn>
    void mutate_overlay(Fn&& fn) {
        try {
            fn();
        } catch (const TrackerError& e) {
            stats.storage_failures.fetch_add(1, std::memory_order_relaxed);
            DATRACK_LOG_ERROR("super property update failed",
                              {logging::string_field("error", e.message())});
            report_error(e);
        }
    }

    void persist_login(const std::string& user_id) {
        try {
            if (user_id.empty()) {
                overlay.erase_meta(META_LOGIN_USER);
            } else {
                overlay.set_meta(META_LOGIN_USER, user_id);
            }
        } catch (const TrackerError& e) {
            stats.storage_failures.fetch_add(1, std::memory_order_relaxed);
            DATRACK_LOG_ERROR("login state not persisted",
                              {logging::string_field("error", e.message())});
            report_error(e);
        }
    }
};

Tracker::Tracker(TrackerConfig config)
    : inner_(std::make_unique<Inner>(std::move(config))), people_(*this) {}

Tracker::~Tracker() {
    close();
}

std::unique_ptr<Tracker> Tracker::create(TrackerConfig config) {
    logging::init_logging(config.log_level());
    return std::unique_ptr<Tracker>(new Tracker(std::move(config)));
}

// --- Events ---

void Tracker::track_event(const std::string& name, const Props& attributes) {
    EventOptions options;
    options.attributes = attributes;
    track_event(name, options);
}

void Tracker::track_event(const std::string& name, const EventOptions& options) {
    EventInput input;
    input.name = name;
    input.cost_seconds = options.cost_seconds;
    input.categories = options.categories;
    input.attributes = options.attributes;
    input.location = inner_->location_or_default(options.location);
    input.require_session = options.must_in_session.value_or(inner_->config.require_session());
    inner_->capture(input, now_ms());
}

void Tracker::track_timer(const std::string& name) {
    if (const char* reason = validation::check_event_name(name)) {
        inner_->drop(TrackerError::invalid_input("eventName", reason));
        return;
    }
    inner_->overlay.start_timer(name, now_ms());
}

void Tracker::clear_track_timers() {
    inner_->overlay.clear_timers();
}

// --- Super properties ---

void Tracker::register_super_properties(const Props& properties) {
    if (properties.empty() || !inner_->check_keys(properties)) return;
    inner_->mutate_overlay([&] { inner_->overlay.set_super_properties(properties, true); });
}

void Tracker::register_super_properties_once(const Props& properties) {
    if (properties.empty() || !inner_->check_keys(properties)) return;
    inner_->mutate_overlay([&] { inner_->overlay.set_super_properties_once(properties); });
}

void Tracker::register_super_properties_once(const Props& properties, const Value& default_value) {
    if (properties.empty() || !inner_->check_keys(properties)) return;
    inner_->mutate_overlay([&] {
        inner_->overlay.set_super_properties_once(properties, default_value);
    });
}

void Tracker::unregister_super_property(const std::string& key) {
    inner_->mutate_overlay([&] { inner_->overlay.unregister(key); });
}

void Tracker::clear_super_properties() {
    inner_->mutate_overlay([&] { inner_->overlay.clear(); });
}

Props Tracker::current_super_properties() const {
    return inner_->overlay.current();
}

// --- Identity ---

void Tracker::login_user(const std::string& user_id) {
    if (!validation::check_user_id(user_id)) {
        inner_->drop(TrackerError::invalid_input("userId",
            user_id.empty() ? "is required" : "must be at most 256 characters"));
        return;
    }
    {
        std::unique_lock<std::shared_mutex> lock(inner_->identity_mutex);
        inner_->login_user_id = user_id;
    }
    inner_->persist_login(user_id);
    inner_->capture_internal(InternalEvents::USER_LOGIN, 0.0, now_ms());
}

void Tracker::logout_user() {
    if (inner_->current_login().empty()) return;
    // Emitted while still logged in, so the event carries the departing user.
    inner_->capture_internal(InternalEvents::USER_LOGOUT, 0.0, now_ms());
    {
        std::unique_lock<std::shared_mutex> lock(inner_->identity_mutex);
        inner_->login_user_id.clear();
    }
    inner_->persist_login("");
}

void Tracker::set_location(double latitude, double longitude) {
    GeoPoint point{latitude, longitude};
    if (!validation::check_location(point)) {
        inner_->drop(TrackerError::invalid_input("location", "is out of range"));
        return;
    }
    std::unique_lock<std::shared_mutex> lock(inner_->identity_mutex);
    inner_->default_location = point;
}

std::string Tracker::device_id() const {
    return inner_->device_id;
}

// --- Profile ---

People& Tracker::people() {
    return people_;
}

void Tracker::enqueue_profile(ProfileOp op, const Props& properties,
                              std::vector<std::string> unset_keys,
                              std::optional<double> amount) {
    if (inner_->closed.load()) {
        inner_->drop(TrackerError::closed());
        return;
    }
    if (!inner_->check_keys(properties)) return;
    for (const auto& key : unset_keys) {
        if (!validation::check_property_key(key)) {
            inner_->drop(TrackerError::invalid_input("propertyKey", "is required"));
            return;
        }
    }
    if (amount && !std::isfinite(*amount)) {
        inner_->drop(TrackerError::invalid_input("amount", "must be a finite number"));
        return;
    }

    uint64_t now = now_ms();
    ProfileUpdateRecord update;
    update.record_id = generate_uuid();
    update.op = op;
    update.user_id = inner_->profile_target();
    update.timestamp = now;
    update.properties = properties;
    update.unset_keys = std::move(unset_keys);
    update.amount = amount;
    update.session_id = inner_->sessions.current_id(now);
    inner_->store(to_stored(update), now);
}

// --- Session ---

void Tracker::enter_foreground() {
    uint64_t now = now_ms();
    auto transition = inner_->sessions.enter_foreground(now);
    if (transition.ended) {
        const Session& ended = *transition.ended;
        uint64_t end = ended.background_at != 0 ? ended.background_at : now;
        double length = end > ended.started_at
            ? static_cast<double>(end - ended.started_at) / 1000.0 : 0.0;
        inner_->capture_internal(InternalEvents::SESSION_CLOSE, length, now, ended.id);
    }
    if (transition.started) {
        DATRACK_LOG_DEBUG("session started",
                          {logging::string_field("session_id", uuid_to_string(transition.started->id))});
        inner_->capture_internal(InternalEvents::SESSION_START, 0.0, now);
    }
}

void Tracker::enter_background() {
    inner_->sessions.enter_background(now_ms());
}

bool Tracker::in_session() const {
    return inner_->sessions.is_active(now_ms());
}

// --- Upload ---

void Tracker::set_auto_upload(bool enabled) {
    inner_->settings.auto_upload.store(enabled);
}

void Tracker::set_send_on_wifi(bool enabled) {
    inner_->settings.send_on_wifi.store(enabled);
}

void Tracker::set_upload_interval(std::chrono::seconds interval) {
    if (interval.count() <= 0) {
        inner_->drop(TrackerError::invalid_input("uploadInterval", "must be positive"));
        return;
    }
    inner_->settings.interval_ms.store(
        std::chrono::duration_cast<std::chrono::milliseconds>(interval).count());
    std::shared_lock<std::shared_mutex> lock(inner_->lifecycle_mutex);
    if (inner_->worker) inner_->worker->reschedule();
}

void Tracker::set_upload_bulk_size(size_t size) {
    if (size == 0) {
        inner_->drop(TrackerError::invalid_input("bulkSize", "must be positive"));
        return;
    }
    inner_->settings.bulk_size.store(size);
}

void Tracker::upload() {
    std::shared_lock<std::shared_mutex> lock(inner_->lifecycle_mutex);
    if (!inner_->worker) {
        inner_->report_error(TrackerError::closed());
        return;
    }
    inner_->worker->request_upload();
}

void Tracker::flush() {
    std::shared_lock<std::shared_mutex> lock(inner_->lifecycle_mutex);
    if (!inner_->worker) {
        inner_->report_error(TrackerError::closed());
        return;
    }
    auto f = inner_->worker->send_flush();
    if (f.wait_for(inner_->config.close_timeout()) == std::future_status::timeout) {
        DATRACK_LOG_WARN("flush timed out",
                         {logging::int_field("pending", static_cast<int64_t>(inner_->queue.size()))});
    }
}

size_t Tracker::pending_count() const {
    return inner_->queue.size();
}

TrackerStats Tracker::stats() const {
    return inner_->stats.snapshot();
}

// --- Lifecycle ---

void Tracker::close() {
    if (inner_->closed.exchange(true)) return;

    inner_->overlay.clear_timers();

    std::unique_lock<std::shared_mutex> lock(inner_->lifecycle_mutex);
    auto f = inner_->worker->send_close();
    if (f.wait_for(inner_->config.close_timeout()) == std::future_status::timeout) {
        DATRACK_LOG_WARN("upload in flight at close, waiting for it to finish");
    }
    inner_->worker.reset();
    inner_->transport->close_connection();

    DATRACK_LOG_INFO("tracker closed",
                     {logging::int_field("pending", static_cast<int64_t>(inner_->queue.size()))});
}

} // namespace datrack
