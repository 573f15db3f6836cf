// src/codec.cpp
// zlib deflate with a gzip wrapper.

#include "codec.hpp"
#include "datrack/error.hpp"

#include <zlib.h>

#include <cstring>
#include <string>

namespace datrack {
namespace codec {

std::vector<uint8_t> gzip_compress(const uint8_t* data, size_t len) {
    if (len > UINT32_MAX) {
        throw TrackerError::serialization("batch too large to compress");
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    // windowBits 15 | 16 selects the gzip header and trailer.
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 | 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw TrackerError::serialization("deflateInit2 failed");
    }

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(len)));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);

    int ret;
    do {
        if (zs.total_out >= out.size()) {
            out.resize(out.size() * 2 + 64);
        }
        zs.next_out = reinterpret_cast<Bytef*>(out.data() + zs.total_out);
        zs.avail_out = static_cast<uInt>(out.size() - zs.total_out);
        ret = deflate(&zs, Z_FINISH);
    } while (ret == Z_OK || (ret == Z_BUF_ERROR && zs.avail_out == 0));

    size_t produced = zs.total_out;
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw TrackerError::serialization("deflate failed (" + std::to_string(ret) + ")");
    }

    out.resize(produced);
    return out;
}

} // namespace codec
} // namespace datrack
