// include/datrack/people.hpp
// Profile mutation surface, reached through Tracker::people().

#pragma once

#include "props.hpp"
#include <string>

namespace datrack {

class Tracker;

// Appends profile update records for the current user (the logged-in user,
// or the device id when nobody is logged in). Never blocks, never throws.
//
// Do not construct this yourself; use Tracker::people().
class People {
public:
    People(const People&) = delete;
    People& operator=(const People&) = delete;

    // Set properties on the user's profile, overwriting existing values.
    void set(const Props& properties);
    void set(const std::string& property, const Value& value);

    // Like set(), but never overwrites a value already on the profile.
    void set_once(const Props& properties);
    void set_once(const std::string& property, const Value& value);

    // Remove a property from the profile.
    void unset(const std::string& property);

    // Delete the user's profile.
    void delete_user();

    // Record money spent by the user, optionally with charge properties.
    void track_charge(double amount, const Props& properties = Props());

    // Delete the user's revenue history.
    void clear_charges();

private:
    friend class Tracker;
    explicit People(Tracker& tracker) : tracker_(tracker) {}

    Tracker& tracker_;
};

} // namespace datrack
