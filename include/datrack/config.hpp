// include/datrack/config.hpp
// Flat configuration struct with builder pattern and presets.

#pragma once

#include "error.hpp"
#include "transport.hpp"
#include "types.hpp"

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace datrack {

class TrackerConfigBuilder;

// Configuration for the tracker. Built once at startup; the upload settings
// can be changed later through the Tracker's runtime setters.
class TrackerConfig {
public:
    using ErrorCallback = std::function<void(const TrackerError&)>;
    using Encryptor = std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)>;
    using NetworkProbe = std::function<NetworkType()>;

    static TrackerConfigBuilder builder(const std::string& app_key);

    static TrackerConfig production(const std::string& app_key);
    static TrackerConfig development(const std::string& app_key);

    const std::array<uint8_t, 16>& app_key_bytes() const noexcept { return app_key_bytes_; }
    const std::string& app_version() const noexcept { return app_version_; }
    const std::string& app_channel() const noexcept { return app_channel_; }
    const std::string& endpoint() const noexcept { return endpoint_; }
    bool auto_upload() const noexcept { return auto_upload_; }
    bool send_on_wifi() const noexcept { return send_on_wifi_; }
    const std::string& custom_device_id() const noexcept { return custom_device_id_; }
    std::chrono::seconds upload_interval() const noexcept { return upload_interval_; }
    size_t bulk_size() const noexcept { return bulk_size_; }
    const std::string& database_path() const noexcept { return database_path_; }
    size_t max_queue_entries() const noexcept { return max_queue_entries_; }
    OverflowPolicy overflow_policy() const noexcept { return overflow_policy_; }
    std::chrono::milliseconds session_timeout() const noexcept { return session_timeout_; }
    bool require_session() const noexcept { return require_session_; }
    bool compress() const noexcept { return compress_; }
    const Encryptor& encryptor() const noexcept { return encryptor_; }
    const NetworkProbe& network_probe() const noexcept { return network_probe_; }
    const std::shared_ptr<Transport>& transport() const noexcept { return transport_; }
    std::chrono::milliseconds network_timeout() const noexcept { return network_timeout_; }
    std::chrono::milliseconds close_timeout() const noexcept { return close_timeout_; }
    const std::string& log_level() const noexcept { return log_level_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }

private:
    friend class TrackerConfigBuilder;

    std::array<uint8_t, 16> app_key_bytes_{};
    std::string app_version_;
    std::string app_channel_;
    std::string endpoint_ = "collect.datrack.io:50000";
    bool auto_upload_ = true;
    bool send_on_wifi_ = false;
    std::string custom_device_id_;
    std::chrono::seconds upload_interval_{15};
    size_t bulk_size_ = 100;
    std::string database_path_ = "datrack.db";
    size_t max_queue_entries_ = 10000;
    OverflowPolicy overflow_policy_ = OverflowPolicy::DropOldest;
    std::chrono::milliseconds session_timeout_{30000};
    bool require_session_ = true;
    bool compress_ = true;
    Encryptor encryptor_;
    NetworkProbe network_probe_;
    std::shared_ptr<Transport> transport_;
    std::chrono::milliseconds network_timeout_{30000};
    std::chrono::milliseconds close_timeout_{5000};
    std::string log_level_ = "warn";
    ErrorCallback on_error_;
};

// Fluent builder for TrackerConfig.
class TrackerConfigBuilder {
public:
    explicit TrackerConfigBuilder(const std::string& app_key);

    TrackerConfigBuilder& app_version(std::string version);
    TrackerConfigBuilder& app_channel(std::string channel);
    TrackerConfigBuilder& endpoint(std::string endpoint);
    TrackerConfigBuilder& auto_upload(bool enabled);
    TrackerConfigBuilder& send_on_wifi(bool enabled);
    TrackerConfigBuilder& custom_device_id(std::string device_id);
    TrackerConfigBuilder& upload_interval(std::chrono::seconds interval);
    TrackerConfigBuilder& bulk_size(size_t size);
    TrackerConfigBuilder& database_path(std::string path);
    TrackerConfigBuilder& max_queue_entries(size_t entries);
    TrackerConfigBuilder& overflow_policy(OverflowPolicy policy);
    TrackerConfigBuilder& session_timeout(std::chrono::milliseconds timeout);
    TrackerConfigBuilder& require_session(bool required);
    TrackerConfigBuilder& compress(bool enabled);
    TrackerConfigBuilder& encryptor(TrackerConfig::Encryptor encryptor);
    TrackerConfigBuilder& network_probe(TrackerConfig::NetworkProbe probe);
    TrackerConfigBuilder& transport(std::shared_ptr<Transport> transport);
    TrackerConfigBuilder& network_timeout(std::chrono::milliseconds timeout);
    TrackerConfigBuilder& close_timeout(std::chrono::milliseconds timeout);
    TrackerConfigBuilder& log_level(std::string level);
    TrackerConfigBuilder& on_error(TrackerConfig::ErrorCallback callback);

    // Build the config. Throws TrackerError on an invalid app key or
    // out-of-range setting.
    TrackerConfig build() const;

private:
    std::string app_key_;
    TrackerConfig config_;
};

} // namespace datrack
