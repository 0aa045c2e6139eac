#include "../src/encoding/cbor.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>

using namespace xmit_cpp;
using namespace xmit_cpp::cbor;

namespace {

auto bytes(std::initializer_list<int> values) -> Bytes {
    auto result = Bytes{};
    for (auto v : values) result.push_back(static_cast<std::byte>(v));
    return result;
}

}  // namespace

// -- Encoding: RFC 8949 Appendix A vectors ------------------------------------

TEST(CborEncode, small_unsigned_fits_in_initial_byte) {
    EXPECT_EQ(encode(Value{std::uint64_t{0}}), bytes({0x00}));
    EXPECT_EQ(encode(Value{std::uint64_t{23}}), bytes({0x17}));
}

TEST(CborEncode, unsigned_argument_widths) {
    EXPECT_EQ(encode(Value{std::uint64_t{24}}), bytes({0x18, 0x18}));
    EXPECT_EQ(encode(Value{std::uint64_t{1000}}), bytes({0x19, 0x03, 0xe8}));
    EXPECT_EQ(encode(Value{std::uint64_t{1000000}}), bytes({0x1a, 0x00, 0x0f, 0x42, 0x40}));
    EXPECT_EQ(encode(Value{std::uint64_t{1000000000000}}),
              bytes({0x1b, 0x00, 0x00, 0x00, 0xe8, 0xd4, 0xa5, 0x10, 0x00}));
}

TEST(CborEncode, negative_integers) {
    EXPECT_EQ(encode(Value{-1}), bytes({0x20}));
    EXPECT_EQ(encode(Value{-100}), bytes({0x38, 0x63}));
    EXPECT_EQ(encode(Value{std::int64_t{-1000}}), bytes({0x39, 0x03, 0xe7}));
}

TEST(CborEncode, simple_values) {
    EXPECT_EQ(encode(Value{false}), bytes({0xf4}));
    EXPECT_EQ(encode(Value{true}), bytes({0xf5}));
    EXPECT_EQ(encode(Value{Null{}}), bytes({0xf6}));
}

TEST(CborEncode, strings) {
    EXPECT_EQ(encode(Value{""}), bytes({0x60}));
    EXPECT_EQ(encode(Value{"IETF"}), bytes({0x64, 0x49, 0x45, 0x54, 0x46}));
    EXPECT_EQ(encode(Value{Bytes{std::byte{1}, std::byte{2}}}), bytes({0x42, 0x01, 0x02}));
}

TEST(CborEncode, map_with_integer_keys_keeps_insertion_order) {
    auto map = Value{Value::Map{
        {Value{std::uint64_t{5}}, Value{"example.com"}},
        {Value{std::uint64_t{1}}, Value{"k"}},
    }};
    auto encoded = encode(map);
    ASSERT_GE(encoded.size(), 2u);
    EXPECT_EQ(encoded[0], std::byte{0xa2});
    EXPECT_EQ(encoded[1], std::byte{0x05});
}

TEST(CborEncode, nested_array) {
    auto v = Value{Value::Array{Value{1}, Value{Value::Array{Value{2}, Value{3}}}}};
    EXPECT_EQ(encode(v), bytes({0x82, 0x01, 0x82, 0x02, 0x03}));
}

TEST(CborEncode, double_is_written_at_full_width) {
    EXPECT_EQ(encode(Value{1.5}), bytes({0xfb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0}));
}

// -- Decoding -----------------------------------------------------------------

TEST(CborDecode, round_trips_a_response_shaped_map) {
    auto original = Value{Value::Map{
        {Value{std::uint64_t{1}}, Value{true}},
        {Value{std::uint64_t{2}}, Value{Value::Array{Value{"bad"}}}},
        {Value{std::uint64_t{6}}, Value{Value::Array{Value{Bytes(32, std::byte{7})}}}},
    }};
    auto decoded = decode(encode(original));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, original);
    EXPECT_EQ(decoded->find(std::uint64_t{1})->as_bool(), true);
    EXPECT_EQ(decoded->find(std::uint64_t{6})->as_array()->front().as_bytes()->size(), 32u);
}

TEST(CborDecode, find_by_text_key) {
    auto v = decode(bytes({0xa1, 0x61, 0x61, 0x01}));
    ASSERT_TRUE(v.has_value());
    ASSERT_NE(v->find("a"), nullptr);
    EXPECT_EQ(v->find("a")->as_uint(), 1u);
    EXPECT_EQ(v->find("b"), nullptr);
    EXPECT_EQ(v->find(std::uint64_t{1}), nullptr);
}

TEST(CborDecode, half_and_single_precision_floats) {
    auto half = decode(bytes({0xf9, 0x3c, 0x00}));
    ASSERT_TRUE(half.has_value());
    EXPECT_EQ(std::get<double>(half->storage()), 1.0);

    auto single = decode(bytes({0xfa, 0x47, 0xc3, 0x50, 0x00}));
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(std::get<double>(single->storage()), 100000.0);

    auto inf = decode(bytes({0xf9, 0x7c, 0x00}));
    ASSERT_TRUE(inf.has_value());
    EXPECT_TRUE(std::isinf(std::get<double>(inf->storage())));
}

TEST(CborDecode, tags_are_skipped) {
    // 1(1363896240)
    auto v = decode(bytes({0xc1, 0x1a, 0x51, 0x4b, 0x67, 0xb0}));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->as_uint(), 1363896240u);
}

TEST(CborDecode, undefined_reads_as_null) {
    auto v = decode(bytes({0xf7}));
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(v->is_null());
}

TEST(CborDecode, rejects_truncated_input) {
    EXPECT_FALSE(decode(bytes({})).has_value());
    EXPECT_FALSE(decode(bytes({0x19, 0x03})).has_value());
    EXPECT_FALSE(decode(bytes({0x64, 0x49, 0x45})).has_value());
    EXPECT_FALSE(decode(bytes({0x82, 0x01})).has_value());
}

TEST(CborDecode, rejects_trailing_bytes) {
    EXPECT_FALSE(decode(bytes({0x01, 0x02})).has_value());
}

TEST(CborDecode, rejects_indefinite_lengths) {
    EXPECT_FALSE(decode(bytes({0x9f, 0x01, 0xff})).has_value());
    EXPECT_FALSE(decode(bytes({0x5f, 0x41, 0x01, 0xff})).has_value());
}

TEST(CborDecode, rejects_length_larger_than_input) {
    // Array claiming 2^32 items in a five-byte buffer
    EXPECT_FALSE(decode(bytes({0x9a, 0xff, 0xff, 0xff, 0xff})).has_value());
    EXPECT_FALSE(decode(bytes({0xba, 0xff, 0xff, 0xff, 0xff})).has_value());
}

TEST(CborDecode, rejects_excessive_nesting) {
    auto deep = Bytes(max_depth + 2, std::byte{0x81});
    deep.push_back(std::byte{0x01});
    EXPECT_FALSE(decode(deep).has_value());

    auto shallow = Bytes(8, std::byte{0x81});
    shallow.push_back(std::byte{0x01});
    EXPECT_TRUE(decode(shallow).has_value());
}

TEST(CborValue, typed_accessors_return_nothing_on_mismatch) {
    auto v = Value{"text"};
    EXPECT_FALSE(v.as_bool().has_value());
    EXPECT_FALSE(v.as_uint().has_value());
    EXPECT_EQ(v.as_bytes(), nullptr);
    EXPECT_EQ(v.as_array(), nullptr);
    EXPECT_EQ(v.find(std::uint64_t{1}), nullptr);
    ASSERT_NE(v.as_text(), nullptr);
    EXPECT_EQ(*v.as_text(), "text");
}
