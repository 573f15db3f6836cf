// bench/bench_common.hpp
// Shared benchmark scenarios.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace datrack_bench {

struct BenchScenario {
    const char* name;
    size_t records_per_batch;
    size_t payload_size;

    size_t total_bytes() const { return records_per_batch * payload_size; }
};

constexpr BenchScenario SCENARIOS[] = {
    {"small_batch", 10, 100},
    {"typical", 100, 200},
    {"bulk", 500, 200},
    {"large_records", 100, 1000},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// Event payload JSON of approximately `size` bytes.
inline std::vector<uint8_t> generate_payload(size_t size) {
    std::string base = R"({"cost":1.25,"attributes":{"btn":"ok"}})";

    if (base.size() >= size) {
        return std::vector<uint8_t>(base.begin(), base.end());
    }

    // Pad inside the attributes object: ...,"pad":"xxx"}}
    base.resize(base.size() - 2);
    base += R"(,"pad":")";
    size_t remaining = size > base.size() + 3 ? size - base.size() - 3 : 0;
    base.append(remaining, 'x');
    base += "\"}}";

    return std::vector<uint8_t>(base.begin(), base.end());
}

} // namespace datrack_bench
