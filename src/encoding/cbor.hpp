#pragma once

// Minimal CBOR (RFC 8949) value model, encoder and decoder.
//
// Covers the subset the publication protocol uses: unsigned and negative
// integers, byte strings, text strings, arrays, maps, booleans, null and
// floats. Only definite-length items are produced or accepted. Tags are
// skipped on decode. Map entries keep their encounter order, so encoding
// is deterministic for a given value.
//
// Internal header — not installed.

#include <xmit-cpp/types.hpp>

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace xmit_cpp::cbor {

// Nesting limit for decoded arrays and maps.
inline constexpr std::size_t max_depth = 64;

enum class MajorType : std::uint8_t {
    unsigned_int = 0,
    negative_int = 1,
    byte_string  = 2,
    text_string  = 3,
    array        = 4,
    map          = 5,
    tag          = 6,
    simple       = 7,
};

struct Null {
    auto operator==(const Null&) const -> bool = default;
};

// A negative integer stored as its CBOR argument: the value is -1 - arg.
struct Negative {
    std::uint64_t arg{0};
    auto operator==(const Negative&) const -> bool = default;
};

class Value {
public:
    using Array = std::vector<Value>;
    using Map = std::vector<std::pair<Value, Value>>;
    using Storage = std::variant<Null, bool, std::uint64_t, Negative, double,
                                 Bytes, std::string, Array, Map>;

    Value() : storage_{Null{}} {}
    Value(Null) : storage_{Null{}} {}
    Value(bool b) : storage_{b} {}
    Value(std::uint64_t u) : storage_{u} {}
    Value(int i) : Value(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i)
        : storage_{i >= 0 ? Storage{static_cast<std::uint64_t>(i)}
                          : Storage{Negative{static_cast<std::uint64_t>(-(i + 1))}}} {}
    Value(Negative n) : storage_{n} {}
    Value(double d) : storage_{d} {}
    Value(Bytes b) : storage_{std::move(b)} {}
    Value(std::string s) : storage_{std::move(s)} {}
    Value(const char* s) : storage_{std::string{s}} {}
    Value(std::string_view s) : storage_{std::string{s}} {}
    Value(Array a) : storage_{std::move(a)} {}
    Value(Map m) : storage_{std::move(m)} {}

    auto storage() const -> const Storage& { return storage_; }

    auto is_null() const -> bool { return std::holds_alternative<Null>(storage_); }
    auto is_map() const -> bool { return std::holds_alternative<Map>(storage_); }
    auto is_array() const -> bool { return std::holds_alternative<Array>(storage_); }

    auto as_bool() const -> std::optional<bool> {
        if (const auto* b = std::get_if<bool>(&storage_)) return *b;
        return std::nullopt;
    }

    auto as_uint() const -> std::optional<std::uint64_t> {
        if (const auto* u = std::get_if<std::uint64_t>(&storage_)) return *u;
        return std::nullopt;
    }

    auto as_text() const -> const std::string* { return std::get_if<std::string>(&storage_); }
    auto as_bytes() const -> const Bytes* { return std::get_if<Bytes>(&storage_); }
    auto as_array() const -> const Array* { return std::get_if<Array>(&storage_); }
    auto as_map() const -> const Map* { return std::get_if<Map>(&storage_); }

    // Look up an entry in a map keyed by small unsigned integers.
    auto find(std::uint64_t key) const -> const Value* {
        const auto* m = as_map();
        if (!m) return nullptr;
        for (const auto& [k, v] : *m) {
            if (auto u = k.as_uint(); u && *u == key) return &v;
        }
        return nullptr;
    }

    // Look up an entry in a map keyed by text.
    auto find(std::string_view key) const -> const Value* {
        const auto* m = as_map();
        if (!m) return nullptr;
        for (const auto& [k, v] : *m) {
            if (const auto* t = k.as_text(); t && *t == key) return &v;
        }
        return nullptr;
    }

    auto operator==(const Value& other) const -> bool = default;

private:
    Storage storage_;
};

// -- Encoding -----------------------------------------------------------------

class Writer {
public:
    void write_head(MajorType type, std::uint64_t arg) {
        auto mt = static_cast<std::uint8_t>(static_cast<std::uint8_t>(type) << 5);
        if (arg < 24) {
            write_u8(mt | static_cast<std::uint8_t>(arg));
        } else if (arg <= 0xFF) {
            write_u8(mt | 24);
            write_u8(static_cast<std::uint8_t>(arg));
        } else if (arg <= 0xFFFF) {
            write_u8(mt | 25);
            write_be(arg, 2);
        } else if (arg <= 0xFFFFFFFFULL) {
            write_u8(mt | 26);
            write_be(arg, 4);
        } else {
            write_u8(mt | 27);
            write_be(arg, 8);
        }
    }

    void write(const Value& value) {
        std::visit([this](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                write_u8(0xF6);
            } else if constexpr (std::is_same_v<T, bool>) {
                write_u8(v ? 0xF5 : 0xF4);
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                write_head(MajorType::unsigned_int, v);
            } else if constexpr (std::is_same_v<T, Negative>) {
                write_head(MajorType::negative_int, v.arg);
            } else if constexpr (std::is_same_v<T, double>) {
                write_u8(0xFB);
                write_be(std::bit_cast<std::uint64_t>(v), 8);
            } else if constexpr (std::is_same_v<T, Bytes>) {
                write_head(MajorType::byte_string, v.size());
                data_.insert(data_.end(), v.begin(), v.end());
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_head(MajorType::text_string, v.size());
                for (auto c : v) data_.push_back(static_cast<std::byte>(c));
            } else if constexpr (std::is_same_v<T, Value::Array>) {
                write_head(MajorType::array, v.size());
                for (const auto& item : v) write(item);
            } else if constexpr (std::is_same_v<T, Value::Map>) {
                write_head(MajorType::map, v.size());
                for (const auto& [k, item] : v) {
                    write(k);
                    write(item);
                }
            }
        }, value.storage());
    }

    auto data() const -> const Bytes& { return data_; }
    auto take() -> Bytes { return std::move(data_); }

private:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_be(std::uint64_t v, int width) {
        for (int i = width - 1; i >= 0; --i) {
            data_.push_back(static_cast<std::byte>(v >> (i * 8)));
        }
    }

    Bytes data_;
};

inline auto encode(const Value& value) -> Bytes {
    auto w = Writer{};
    w.write(value);
    return w.take();
}

// -- Decoding -----------------------------------------------------------------

class Reader {
public:
    explicit Reader(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read(std::size_t depth = 0) -> std::optional<Value> {
        if (depth > max_depth) return std::nullopt;

        auto initial = read_u8();
        if (!initial) return std::nullopt;
        auto type = static_cast<MajorType>(*initial >> 5);
        auto info = static_cast<std::uint8_t>(*initial & 0x1F);

        if (type == MajorType::simple) return read_simple(info);

        auto arg = read_arg(info);
        if (!arg) return std::nullopt;

        switch (type) {
            case MajorType::unsigned_int:
                return Value{*arg};
            case MajorType::negative_int:
                return Value{Negative{*arg}};
            case MajorType::byte_string: {
                auto bytes = read_span(*arg);
                if (!bytes) return std::nullopt;
                return Value{Bytes{bytes->begin(), bytes->end()}};
            }
            case MajorType::text_string: {
                auto bytes = read_span(*arg);
                if (!bytes) return std::nullopt;
                return Value{std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()}};
            }
            case MajorType::array: {
                // Each item takes at least one byte
                if (*arg > remaining()) return std::nullopt;
                auto items = Value::Array{};
                items.reserve(static_cast<std::size_t>(*arg));
                for (std::uint64_t i = 0; i < *arg; ++i) {
                    auto item = read(depth + 1);
                    if (!item) return std::nullopt;
                    items.push_back(std::move(*item));
                }
                return Value{std::move(items)};
            }
            case MajorType::map: {
                if (*arg > remaining() / 2) return std::nullopt;
                auto entries = Value::Map{};
                entries.reserve(static_cast<std::size_t>(*arg));
                for (std::uint64_t i = 0; i < *arg; ++i) {
                    auto key = read(depth + 1);
                    if (!key) return std::nullopt;
                    auto item = read(depth + 1);
                    if (!item) return std::nullopt;
                    entries.emplace_back(std::move(*key), std::move(*item));
                }
                return Value{std::move(entries)};
            }
            case MajorType::tag:
                // Tag number already consumed; the tagged item follows.
                return read(depth + 1);
            case MajorType::simple:
                break;
        }
        return std::nullopt;
    }

private:
    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_be(int width) -> std::optional<std::uint64_t> {
        if (remaining() < static_cast<std::size_t>(width)) return std::nullopt;
        auto v = std::uint64_t{0};
        for (int i = 0; i < width; ++i) {
            v = (v << 8) | static_cast<std::uint8_t>(data_[pos_++]);
        }
        return v;
    }

    auto read_arg(std::uint8_t info) -> std::optional<std::uint64_t> {
        if (info < 24) return info;
        switch (info) {
            case 24: return read_be(1);
            case 25: return read_be(2);
            case 26: return read_be(4);
            case 27: return read_be(8);
            default: return std::nullopt;  // reserved or indefinite length
        }
    }

    auto read_span(std::uint64_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, static_cast<std::size_t>(n));
        pos_ += static_cast<std::size_t>(n);
        return result;
    }

    auto read_simple(std::uint8_t info) -> std::optional<Value> {
        switch (info) {
            case 20: return Value{false};
            case 21: return Value{true};
            case 22:
            case 23: return Value{Null{}};
            case 25: {
                auto half = read_be(2);
                if (!half) return std::nullopt;
                return Value{half_to_double(static_cast<std::uint16_t>(*half))};
            }
            case 26: {
                auto bits = read_be(4);
                if (!bits) return std::nullopt;
                return Value{static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(*bits)))};
            }
            case 27: {
                auto bits = read_be(8);
                if (!bits) return std::nullopt;
                return Value{std::bit_cast<double>(*bits)};
            }
            default:
                return std::nullopt;
        }
    }

    static auto half_to_double(std::uint16_t half) -> double {
        auto exp = (half >> 10) & 0x1F;
        auto mant = static_cast<double>(half & 0x3FF);
        auto val = 0.0;
        if (exp == 0) {
            val = std::ldexp(mant, -24);
        } else if (exp != 31) {
            val = std::ldexp(mant + 1024.0, exp - 25);
        } else {
            val = mant == 0 ? INFINITY : NAN;
        }
        return (half & 0x8000) ? -val : val;
    }

    std::span<const std::byte> data_;
    std::size_t pos_;
};

// Decode exactly one item spanning the whole input.
inline auto decode(std::span<const std::byte> data) -> std::optional<Value> {
    auto r = Reader{data};
    auto value = r.read();
    if (!value || !r.at_end()) return std::nullopt;
    return value;
}

}  // namespace xmit_cpp::cbor
