// include/datrack/transport.hpp
// Pluggable network transport for encoded batches.

#pragma once

#include <cstddef>
#include <cstdint>

namespace datrack {

// Outcome of one batch transmission.
enum class SendResult : uint8_t {
    Accepted = 0,  // Collector acknowledged the batch
    Rejected = 1,  // Collector answered but refused the batch
    Failed   = 2,  // No usable answer: connect, write, read or timeout failure
};

// Sends one encoded batch and reports how the collector answered.
//
// Implementations are called from the uploader thread only, one batch at a
// time, and must bound every call by their own timeout.
class Transport {
public:
    virtual ~Transport() = default;

    virtual SendResult send_batch(const uint8_t* data, size_t len) = 0;

    // Drop any open connection. Called on tracker shutdown.
    virtual void close_connection() {}
};

} // namespace datrack
