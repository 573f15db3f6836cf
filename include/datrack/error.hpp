// include/datrack/error.hpp
// Single error class with kind enum, shared by every component.

#pragma once

#include <stdexcept>
#include <string>

namespace datrack {

enum class ErrorKind {
    Configuration,    // Invalid config at construction (fatal)
    InvalidInput,     // Bad event name / payload (dropped)
    SessionRequired,  // Event needs a session and none is active (dropped)
    Storage,          // Durable write or read failed
    QueueOverflow,    // Queue at capacity (oldest evicted or new rejected)
    Network,          // Transport failure (retried)
    ServerRejected,   // Collector refused the batch (retried)
    Serialization,    // Encoding / compression failure
    Closed            // Tracker already closed
};

class TrackerError : public std::exception {
public:
    TrackerError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    TrackerError(ErrorKind kind, const std::string& field, const std::string& reason)
        : kind_(kind), message_("invalid input: " + field + " " + reason),
          field_(field), reason_(reason) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& reason() const noexcept { return reason_; }

    static TrackerError configuration(std::string msg) {
        return TrackerError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static TrackerError invalid_input(std::string field, std::string reason) {
        return TrackerError(ErrorKind::InvalidInput, field, reason);
    }

    static TrackerError session_required(const std::string& event_name) {
        return TrackerError(ErrorKind::SessionRequired,
            "no active session for event '" + event_name + "'");
    }

    static TrackerError storage(std::string msg) {
        return TrackerError(ErrorKind::Storage, "storage error: " + msg);
    }

    static TrackerError queue_overflow(std::string msg) {
        return TrackerError(ErrorKind::QueueOverflow, "queue overflow: " + msg);
    }

    static TrackerError network(std::string msg) {
        return TrackerError(ErrorKind::Network, "network error: " + msg);
    }

    static TrackerError server_rejected(std::string msg) {
        return TrackerError(ErrorKind::ServerRejected, "server rejected batch: " + msg);
    }

    static TrackerError serialization(std::string msg) {
        return TrackerError(ErrorKind::Serialization, "serialization error: " + msg);
    }

    static TrackerError closed() {
        return TrackerError(ErrorKind::Closed, "tracker is closed");
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string field_;
    std::string reason_;
};

} // namespace datrack
