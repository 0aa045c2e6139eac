#include "../src/encoding/gzip.hpp"

#include <xmit-cpp/types.hpp>

#include <gtest/gtest.h>

using namespace xmit_cpp;
using namespace xmit_cpp::encoding;

TEST(Gzip, output_carries_gzip_magic) {
    auto compressed = gzip_compress(to_bytes("hello"));
    ASSERT_TRUE(compressed.has_value());
    ASSERT_GE(compressed->size(), 10u);
    EXPECT_EQ((*compressed)[0], std::byte{0x1f});
    EXPECT_EQ((*compressed)[1], std::byte{0x8b});
}

TEST(Gzip, round_trip_restores_input) {
    auto input = to_bytes("the quick brown fox jumps over the lazy dog");
    auto compressed = gzip_compress(input);
    ASSERT_TRUE(compressed.has_value());
    auto restored = gzip_decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, input);
}

TEST(Gzip, highly_compressible_input_grows_output_buffer) {
    auto input = Bytes(1024 * 1024, std::byte{'a'});
    auto compressed = gzip_compress(input);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_LT(compressed->size(), input.size() / 100);
    auto restored = gzip_decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->size(), input.size());
}

TEST(Gzip, empty_input_compresses) {
    auto compressed = gzip_compress(Bytes{});
    ASSERT_TRUE(compressed.has_value());
    auto restored = gzip_decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored->empty());
}

TEST(Gzip, decompress_rejects_garbage) {
    EXPECT_FALSE(gzip_decompress(to_bytes("not gzip at all")).has_value());
    EXPECT_FALSE(gzip_decompress(Bytes{}).has_value());
}

TEST(Gzip, decompress_rejects_truncated_stream) {
    auto compressed = gzip_compress(to_bytes("truncate me please, truncate me"));
    ASSERT_TRUE(compressed.has_value());
    compressed->resize(compressed->size() - 6);
    EXPECT_FALSE(gzip_decompress(*compressed).has_value());
}

TEST(Gzip, decompress_enforces_output_limit) {
    auto compressed = gzip_compress(Bytes(64 * 1024, std::byte{0}));
    ASSERT_TRUE(compressed.has_value());
    EXPECT_FALSE(gzip_decompress(*compressed, 1024).has_value());
}

// -- Sliced input ---------------------------------------------------------------

TEST(Gzip, compress_consumes_every_slice) {
    auto input = Bytes{};
    for (int i = 0; i < 5000; ++i) input.push_back(static_cast<std::byte>(i * 31 % 251));

    // Slices far smaller than the input stand in for buffers over 4 GiB
    auto compressed = gzip_compress(input, 7);
    ASSERT_TRUE(compressed.has_value());
    auto restored = gzip_decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, input);
}

TEST(Gzip, decompress_consumes_every_slice) {
    auto input = Bytes(200 * 1024, std::byte{'x'});
    auto compressed = gzip_compress(input);
    ASSERT_TRUE(compressed.has_value());
    auto restored = gzip_decompress(*compressed, max_inflated_size, 3);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, input);
}

TEST(Gzip, sliced_truncated_stream_is_rejected) {
    auto compressed = gzip_compress(to_bytes("truncate me please, truncate me"));
    ASSERT_TRUE(compressed.has_value());
    compressed->resize(compressed->size() - 6);
    EXPECT_FALSE(gzip_decompress(*compressed, max_inflated_size, 4).has_value());
}
