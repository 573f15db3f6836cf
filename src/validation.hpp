// src/validation.hpp
// Internal input validation functions.

#pragma once

#include "datrack/error.hpp"
#include "datrack/types.hpp"

#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace datrack {
namespace validation {

static constexpr size_t MAX_NAME_LENGTH = 256;

// Validate and decode a 32-character hex app key to 16 bytes.
inline std::array<uint8_t, 16> validate_and_decode_app_key(const std::string& app_key) {
    if (app_key.size() != 32) {
        throw TrackerError::configuration(
            "appKey must be 32 hex characters, got " + std::to_string(app_key.size()));
    }

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < 16; i++) {
        auto hex_val = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        int hi = hex_val(app_key[i * 2]);
        int lo = hex_val(app_key[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw TrackerError::configuration(
                std::string("appKey contains non-hex character '") + app_key[hi < 0 ? i*2 : i*2+1] + "'");
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return bytes;
}

inline bool has_reserved_prefix(const std::string& name) {
    return name.compare(0, std::char_traits<char>::length(RESERVED_EVENT_PREFIX),
                        RESERVED_EVENT_PREFIX) == 0;
}

// Validate a caller-supplied event name: non-empty, at most 256 chars and
// outside the reserved "da" namespace. Returns the reason, or nullptr if valid.
inline const char* check_event_name(const std::string& name) {
    if (name.empty()) return "is required";
    if (name.size() > MAX_NAME_LENGTH) return "must be at most 256 characters";
    if (has_reserved_prefix(name)) return "must not start with the reserved prefix 'da'";
    return nullptr;
}

inline bool check_user_id(const std::string& user_id) {
    return !user_id.empty() && user_id.size() <= MAX_NAME_LENGTH;
}

inline bool check_property_key(const std::string& key) {
    return !key.empty() && key.size() <= MAX_NAME_LENGTH;
}

inline bool check_cost(double cost_seconds) {
    return std::isfinite(cost_seconds) && cost_seconds >= 0.0;
}

inline bool check_location(const GeoPoint& point) {
    return std::isfinite(point.latitude) && std::isfinite(point.longitude)
        && point.latitude >= -90.0 && point.latitude <= 90.0
        && point.longitude >= -180.0 && point.longitude <= 180.0;
}

// Keep the first MAX_CATEGORY_DEPTH entries, in order.
inline std::vector<std::string> truncate_categories(const std::vector<std::string>& categories) {
    if (categories.size() <= MAX_CATEGORY_DEPTH) return categories;
    return std::vector<std::string>(categories.begin(),
        categories.begin() + static_cast<std::ptrdiff_t>(MAX_CATEGORY_DEPTH));
}

} // namespace validation
} // namespace datrack
