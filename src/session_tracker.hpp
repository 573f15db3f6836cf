// src/session_tracker.hpp
// Foreground session state machine: NoSession -> Active -> NoSession.

#pragma once

#include "uuid.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace datrack {

struct Session {
    Uuid id{};
    uint64_t started_at = 0;
    uint64_t background_at = 0;  // 0 while in foreground
};

// Tracks the current session from process lifecycle signals.
//
// A session starts when the application enters the foreground with no live
// session. Backgrounding does not end it immediately: it stays active until
// the application has been in the background for longer than `timeout`.
// Returning to the foreground within the timeout resumes the same session.
//
// All timestamps are milliseconds since the epoch, supplied by the caller.
class SessionTracker {
public:
    struct Transition {
        std::optional<Session> ended;    // expired session being replaced
        std::optional<Session> started;  // newly created session
    };

    explicit SessionTracker(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    Transition enter_foreground(uint64_t now_ms);
    void enter_background(uint64_t now_ms);

    bool is_active(uint64_t now_ms) const;
    std::optional<Uuid> current_id(uint64_t now_ms) const;
    std::optional<Session> current(uint64_t now_ms) const;

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    bool live_locked(uint64_t now_ms) const;

    std::chrono::milliseconds timeout_;
    mutable std::mutex mutex_;
    std::optional<Session> session_;
};

} // namespace datrack
