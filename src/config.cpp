// src/config.cpp
// Configuration builder and presets.

#include "datrack/config.hpp"
#include "validation.hpp"

namespace datrack {

// --- TrackerConfig presets ---

TrackerConfigBuilder TrackerConfig::builder(const std::string& app_key) {
    return TrackerConfigBuilder(app_key);
}

TrackerConfig TrackerConfig::production(const std::string& app_key) {
    return TrackerConfig::builder(app_key).build();
}

TrackerConfig TrackerConfig::development(const std::string& app_key) {
    return TrackerConfig::builder(app_key)
        .endpoint("localhost:50000")
        .bulk_size(10)
        .upload_interval(std::chrono::seconds(2))
        .log_level("info")
        .build();
}

// --- TrackerConfigBuilder ---

TrackerConfigBuilder::TrackerConfigBuilder(const std::string& app_key)
    : app_key_(app_key) {}

TrackerConfigBuilder& TrackerConfigBuilder::app_version(std::string version) {
    config_.app_version_ = std::move(version);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::app_channel(std::string channel) {
    config_.app_channel_ = std::move(channel);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::endpoint(std::string endpoint) {
    config_.endpoint_ = std::move(endpoint);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::auto_upload(bool enabled) {
    config_.auto_upload_ = enabled;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::send_on_wifi(bool enabled) {
    config_.send_on_wifi_ = enabled;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::custom_device_id(std::string device_id) {
    config_.custom_device_id_ = std::move(device_id);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::upload_interval(std::chrono::seconds interval) {
    config_.upload_interval_ = interval;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::bulk_size(size_t size) {
    config_.bulk_size_ = size;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::database_path(std::string path) {
    config_.database_path_ = std::move(path);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::max_queue_entries(size_t entries) {
    config_.max_queue_entries_ = entries;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::overflow_policy(OverflowPolicy policy) {
    config_.overflow_policy_ = policy;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::session_timeout(std::chrono::milliseconds timeout) {
    config_.session_timeout_ = timeout;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::require_session(bool required) {
    config_.require_session_ = required;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::compress(bool enabled) {
    config_.compress_ = enabled;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::encryptor(TrackerConfig::Encryptor encryptor) {
    config_.encryptor_ = std::move(encryptor);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::network_probe(TrackerConfig::NetworkProbe probe) {
    config_.network_probe_ = std::move(probe);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::transport(std::shared_ptr<Transport> transport) {
    config_.transport_ = std::move(transport);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::network_timeout(std::chrono::milliseconds timeout) {
    config_.network_timeout_ = timeout;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::close_timeout(std::chrono::milliseconds timeout) {
    config_.close_timeout_ = timeout;
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::log_level(std::string level) {
    config_.log_level_ = std::move(level);
    return *this;
}

TrackerConfigBuilder& TrackerConfigBuilder::on_error(TrackerConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

TrackerConfig TrackerConfigBuilder::build() const {
    TrackerConfig result = config_;
    result.app_key_bytes_ = validation::validate_and_decode_app_key(app_key_);

    if (result.bulk_size_ == 0) {
        throw TrackerError::configuration("bulkSize must be greater than 0");
    }
    if (result.upload_interval_.count() <= 0) {
        throw TrackerError::configuration("uploadInterval must be greater than 0");
    }
    if (result.max_queue_entries_ == 0) {
        throw TrackerError::configuration("maxQueueEntries must be greater than 0");
    }
    if (result.database_path_.empty()) {
        throw TrackerError::configuration("databasePath is required");
    }
    if (result.custom_device_id_.size() > validation::MAX_NAME_LENGTH) {
        throw TrackerError::configuration("customDeviceId must be at most 256 characters");
    }
    if (result.session_timeout_.count() < 0) {
        throw TrackerError::configuration("sessionTimeout must not be negative");
    }
    return result;
}

} // namespace datrack
