#include <xmit-cpp/types.hpp>

#include <gtest/gtest.h>

#include <unordered_set>

using namespace xmit_cpp;

// -- BLAKE3 content hashing ---------------------------------------------------

TEST(HashContent, empty_input_matches_reference_vector) {
    auto h = hash_content(Bytes{});
    EXPECT_EQ(h.to_hex(), "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(HashContent, abc_matches_reference_vector) {
    auto h = hash_content(to_bytes("abc"));
    EXPECT_EQ(h.to_hex(), "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

TEST(HashContent, is_deterministic) {
    auto data = to_bytes("<h1>hello</h1>");
    EXPECT_EQ(hash_content(data), hash_content(data));
}

TEST(HashContent, differs_for_different_content) {
    EXPECT_NE(hash_content(to_bytes("a")), hash_content(to_bytes("b")));
}

TEST(HashContent, large_input_spanning_many_chunks) {
    // BLAKE3 chunks are 1 KiB; exercise the tree mode
    auto data = Bytes(64 * 1024 + 17, std::byte{0x5a});
    auto h1 = hash_content(data);
    data.back() = std::byte{0x5b};
    EXPECT_NE(h1, hash_content(data));
}

// -- ContentHash --------------------------------------------------------------

TEST(ContentHash, default_constructed_is_all_zeros) {
    const auto h = ContentHash{};
    EXPECT_EQ(h.to_hex(), std::string(64, '0'));
}

TEST(ContentHash, hex_round_trip) {
    auto h = hash_content(to_bytes("index.html"));
    auto parsed = ContentHash::from_hex(h.to_hex());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, h);
}

TEST(ContentHash, from_hex_accepts_uppercase) {
    auto parsed = ContentHash::from_hex(
        "AF1349B9F5F9A1A6A0404DEA36DCC9499BCB25C9ADC112B7CC9A93CAE41F3262");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, hash_content(Bytes{}));
}

TEST(ContentHash, from_hex_rejects_bad_input) {
    EXPECT_FALSE(ContentHash::from_hex("abc").has_value());
    EXPECT_FALSE(ContentHash::from_hex(std::string(64, 'g')).has_value());
    EXPECT_FALSE(ContentHash::from_hex(std::string(66, '0')).has_value());
}

TEST(ContentHash, from_bytes_requires_exactly_32_bytes) {
    EXPECT_TRUE(ContentHash::from_bytes(Bytes(32)).has_value());
    EXPECT_FALSE(ContentHash::from_bytes(Bytes(31)).has_value());
    EXPECT_FALSE(ContentHash::from_bytes(Bytes(33)).has_value());
}

TEST(ContentHash, constructed_from_raw_bytes) {
    std::uint8_t raw[32] = {};
    raw[0] = 0xab;
    raw[31] = 0x01;
    const auto h = ContentHash{raw};
    EXPECT_EQ(h.bytes[0], std::byte{0xab});
    EXPECT_EQ(h.bytes[31], std::byte{0x01});
    EXPECT_TRUE(h.to_hex().starts_with("ab"));
    EXPECT_TRUE(h.to_hex().ends_with("01"));
}

TEST(ContentHash, ordering_is_lexicographic_on_bytes) {
    std::uint8_t low[32] = {};
    std::uint8_t high[32] = {};
    low[31] = 1;
    high[0] = 1;
    EXPECT_LT(ContentHash{low}, ContentHash{high});
}

TEST(ContentHash, hashable_and_usable_in_unordered_set) {
    auto set = std::unordered_set<ContentHash>{};
    set.insert(hash_content(to_bytes("a")));
    set.insert(hash_content(to_bytes("b")));
    set.insert(hash_content(to_bytes("a")));
    EXPECT_EQ(set.size(), 2u);
}

// -- Byte helpers -------------------------------------------------------------

TEST(Bytes, to_hex_renders_lowercase) {
    auto data = Bytes{std::byte{0x00}, std::byte{0x7f}, std::byte{0xff}};
    EXPECT_EQ(to_hex(data), "007fff");
}

TEST(Bytes, to_bytes_copies_characters) {
    auto data = to_bytes("hi");
    ASSERT_EQ(data.size(), 2u);
    EXPECT_EQ(data[0], std::byte{'h'});
    EXPECT_EQ(data[1], std::byte{'i'});
}
