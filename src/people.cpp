// src/people.cpp
// Profile mutations, forwarded to the tracker's queue.

#include "datrack/people.hpp"
#include "datrack/tracker.hpp"

namespace datrack {

void People::set(const Props& properties) {
    if (properties.empty()) return;
    tracker_.enqueue_profile(ProfileOp::Set, properties, {}, std::nullopt);
}

void People::set(const std::string& property, const Value& value) {
    set(Props().add(property, value));
}

void People::set_once(const Props& properties) {
    if (properties.empty()) return;
    tracker_.enqueue_profile(ProfileOp::SetOnce, properties, {}, std::nullopt);
}

void People::set_once(const std::string& property, const Value& value) {
    set_once(Props().add(property, value));
}

void People::unset(const std::string& property) {
    tracker_.enqueue_profile(ProfileOp::Unset, Props(), {property}, std::nullopt);
}

void People::delete_user() {
    tracker_.enqueue_profile(ProfileOp::DeleteUser, Props(), {}, std::nullopt);
}

void People::track_charge(double amount, const Props& properties) {
    tracker_.enqueue_profile(ProfileOp::Charge, properties, {}, amount);
}

void People::clear_charges() {
    tracker_.enqueue_profile(ProfileOp::Unset, Props(), {TRANSACTIONS_PROPERTY}, std::nullopt);
}

} // namespace datrack
