// src/codec.hpp
// Batch payload compression.

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace datrack {
namespace codec {

// Deflate `data` into a gzip stream. Throws TrackerError (Serialization).
std::vector<uint8_t> gzip_compress(const uint8_t* data, size_t len);

} // namespace codec
} // namespace datrack
