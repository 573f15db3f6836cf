// src/uuid.hpp
// Random v4 identifiers for records, sessions and devices.

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <random>
#include <string>

namespace datrack {

using Uuid = std::array<uint8_t, 16>;

inline Uuid generate_uuid() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    Uuid out{};
    uint64_t a = dist(gen);
    uint64_t b = dist(gen);
    std::memcpy(out.data(), &a, 8);
    std::memcpy(out.data() + 8, &b, 8);

    out[6] = (out[6] & 0x0F) | 0x40; // version 4
    out[8] = (out[8] & 0x3F) | 0x80; // variant 1
    return out;
}

// "8-4-4-4-12" lowercase hex.
inline std::string uuid_to_string(const Uuid& id) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(HEX[(id[i] >> 4) & 0x0F]);
        out.push_back(HEX[id[i] & 0x0F]);
    }
    return out;
}

} // namespace datrack
