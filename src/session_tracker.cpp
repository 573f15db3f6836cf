// src/session_tracker.cpp
// Session state transitions.

#include "session_tracker.hpp"

namespace datrack {

bool SessionTracker::live_locked(uint64_t now_ms) const {
    if (!session_) return false;
    if (session_->background_at == 0) return true;
    uint64_t idle = now_ms > session_->background_at ? now_ms - session_->background_at : 0;
    return idle <= static_cast<uint64_t>(timeout_.count());
}

SessionTracker::Transition SessionTracker::enter_foreground(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transition transition;

    if (live_locked(now_ms)) {
        session_->background_at = 0;
        return transition;
    }

    if (session_) {
        transition.ended = session_;
    }

    Session fresh;
    fresh.id = generate_uuid();
    fresh.started_at = now_ms;
    session_ = fresh;
    transition.started = fresh;
    return transition;
}

void SessionTracker::enter_background(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || session_->background_at != 0) return;
    session_->background_at = now_ms == 0 ? 1 : now_ms;
}

bool SessionTracker::is_active(uint64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_locked(now_ms);
}

std::optional<Uuid> SessionTracker::current_id(uint64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!live_locked(now_ms)) return std::nullopt;
    return session_->id;
}

std::optional<Session> SessionTracker::current(uint64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!live_locked(now_ms)) return std::nullopt;
    return session_;
}

} // namespace datrack
