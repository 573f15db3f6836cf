// include/datrack/props.hpp
// Attribute values and the Props builder used for events, super properties
// and profile updates.

#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace datrack {

// A point in time, carried as milliseconds since the Unix epoch.
struct Date {
    int64_t epoch_ms = 0;

    bool operator==(const Date& other) const noexcept { return epoch_ms == other.epoch_ms; }
    bool operator!=(const Date& other) const noexcept { return epoch_ms != other.epoch_ms; }
};

// Scalar attribute value. Nested containers are intentionally not supported.
using Value = std::variant<std::string, int64_t, double, bool, Date>;

// Ordered string -> Value map with a fluent builder.
//
// Adding an existing key replaces its value.
//
// Example:
//   auto props = Props().add("url", "/home").add("status", 200);
class Props {
public:
    using Map = std::map<std::string, Value>;

    Props() = default;

    Props& add(const std::string& key, const std::string& value) {
        entries_[key] = value;
        return *this;
    }

    Props& add(const std::string& key, const char* value) {
        entries_[key] = std::string(value ? value : "");
        return *this;
    }

    Props& add(const std::string& key, int64_t value) {
        entries_[key] = value;
        return *this;
    }

    Props& add(const std::string& key, int value) {
        entries_[key] = static_cast<int64_t>(value);
        return *this;
    }

    Props& add(const std::string& key, double value) {
        entries_[key] = value;
        return *this;
    }

    Props& add(const std::string& key, bool value) {
        entries_[key] = value;
        return *this;
    }

    Props& add(const std::string& key, Date value) {
        entries_[key] = value;
        return *this;
    }

    Props& add(const std::string& key, const Value& value) {
        entries_[key] = value;
        return *this;
    }

    // Copy every entry of `other` into this map; `other` wins on collisions.
    Props& merge(const Props& other) {
        for (const auto& [key, value] : other.entries_) {
            entries_[key] = value;
        }
        return *this;
    }

    bool erase(const std::string& key) { return entries_.erase(key) > 0; }
    void clear() noexcept { entries_.clear(); }

    const Value* find(const std::string& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& key) const { return entries_.count(key) > 0; }

    bool empty() const noexcept { return entries_.empty(); }
    size_t size() const noexcept { return entries_.size(); }
    const Map& entries() const noexcept { return entries_; }

    bool operator==(const Props& other) const { return entries_ == other.entries_; }
    bool operator!=(const Props& other) const { return entries_ != other.entries_; }

    // Serialize as a JSON object "{...}".
    std::vector<uint8_t> to_json_bytes() const {
        std::vector<uint8_t> result;
        result.reserve(16 + entries_.size() * 24);
        append_json(result);
        return result;
    }

    // Append this map as a JSON object to `buf`.
    void append_json(std::vector<uint8_t>& buf) const {
        buf.push_back('{');
        bool first = true;
        for (const auto& [key, value] : entries_) {
            if (!first) buf.push_back(',');
            first = false;
            append_string(buf, key);
            buf.push_back(':');
            append_value(buf, value);
        }
        buf.push_back('}');
    }

    // Append a quoted, escaped JSON string.
    static void append_string(std::vector<uint8_t>& buf, const std::string& s) {
        buf.push_back('"');
        write_escaped(buf, s.data(), s.size());
        buf.push_back('"');
    }

    static void append_value(std::vector<uint8_t>& buf, const Value& value) {
        if (auto* s = std::get_if<std::string>(&value)) {
            append_string(buf, *s);
        } else if (auto* i = std::get_if<int64_t>(&value)) {
            char tmp[24];
            int n = std::snprintf(tmp, sizeof(tmp), "%lld", static_cast<long long>(*i));
            if (n > 0) buf.insert(buf.end(), tmp, tmp + n);
        } else if (auto* d = std::get_if<double>(&value)) {
            append_number(buf, *d);
        } else if (auto* b = std::get_if<bool>(&value)) {
            const char* lit = *b ? "true" : "false";
            buf.insert(buf.end(), lit, lit + std::strlen(lit));
        } else if (auto* date = std::get_if<Date>(&value)) {
            append_string(buf, format_iso8601(date->epoch_ms));
        }
    }

    // Non-finite numbers have no JSON form and are written as null.
    static void append_number(std::vector<uint8_t>& buf, double value) {
        if (!std::isfinite(value)) {
            const char* lit = "null";
            buf.insert(buf.end(), lit, lit + 4);
            return;
        }
        char tmp[64];
        int n = std::snprintf(tmp, sizeof(tmp), "%.15g", value);
        if (n > 0) buf.insert(buf.end(), tmp, tmp + n);
    }

    // "2024-01-23T08:53:20.000Z"
    static std::string format_iso8601(int64_t epoch_ms) {
        int64_t secs = epoch_ms / 1000;
        int64_t millis = epoch_ms % 1000;
        if (millis < 0) {
            millis += 1000;
            secs -= 1;
        }
        std::time_t t = static_cast<std::time_t>(secs);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char out[32];
        std::snprintf(out, sizeof(out), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
        return out;
    }

private:
    Map entries_;

    static bool needs_escape(char c) {
        return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
    }

    static void write_escaped(std::vector<uint8_t>& buf, const char* s, size_t len) {
        // Fast path: bulk-copy runs of safe characters.
        size_t i = 0;
        while (i < len) {
            size_t run_start = i;
            while (i < len && !needs_escape(s[i])) ++i;

            if (i > run_start) {
                buf.insert(buf.end(),
                    reinterpret_cast<const uint8_t*>(s + run_start),
                    reinterpret_cast<const uint8_t*>(s + i));
            }

            if (i < len) {
                char c = s[i];
                switch (c) {
                    case '"':  buf.push_back('\\'); buf.push_back('"'); break;
                    case '\\': buf.push_back('\\'); buf.push_back('\\'); break;
                    case '\b': buf.push_back('\\'); buf.push_back('b'); break;
                    case '\f': buf.push_back('\\'); buf.push_back('f'); break;
                    case '\n': buf.push_back('\\'); buf.push_back('n'); break;
                    case '\r': buf.push_back('\\'); buf.push_back('r'); break;
                    case '\t': buf.push_back('\\'); buf.push_back('t'); break;
                    default: {
                        char hex[7];
                        std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                        buf.insert(buf.end(), hex, hex + 6);
                        break;
                    }
                }
                ++i;
            }
        }
    }
};

} // namespace datrack
