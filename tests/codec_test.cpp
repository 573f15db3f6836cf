// tests/codec_test.cpp
// gzip compression of batch payloads.

#include <gtest/gtest.h>
#include "codec.hpp"

#include <zlib.h>

#include <string>
#include <vector>

using namespace datrack;

namespace {

std::string gunzip(const std::vector<uint8_t>& compressed) {
    z_stream zs{};
    EXPECT_EQ(inflateInit2(&zs, 15 | 16), Z_OK);
    zs.next_in = const_cast<Bytef*>(compressed.data());
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::string out;
    char chunk[4096];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);
        ret = inflate(&zs, Z_NO_FLUSH);
        out.append(chunk, sizeof(chunk) - zs.avail_out);
    } while (ret == Z_OK);
    EXPECT_EQ(ret, Z_STREAM_END);
    inflateEnd(&zs);
    return out;
}

} // namespace

TEST(CodecTest, GzipHeader) {
    std::string text = "{\"btn\":\"ok\"}";
    auto out = codec::gzip_compress(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    ASSERT_GE(out.size(), 10u);
    EXPECT_EQ(out[0], 0x1f);
    EXPECT_EQ(out[1], 0x8b);
}

TEST(CodecTest, InflatesToInput) {
    std::string text;
    for (int i = 0; i < 500; i++) text += "{\"name\":\"click\",\"btn\":\"ok\"}";
    auto out = codec::gzip_compress(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    EXPECT_LT(out.size(), text.size());
    EXPECT_EQ(gunzip(out), text);
}

TEST(CodecTest, EmptyInput) {
    auto out = codec::gzip_compress(nullptr, 0);
    EXPECT_FALSE(out.empty());
    EXPECT_EQ(gunzip(out), "");
}
