#include <xmit-cpp/types.hpp>

#include "crypto/blake3.hpp"

#include <cstring>

namespace xmit_cpp {

namespace {

auto hex_char_to_nibble(char c) -> std::optional<std::uint8_t> {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

}  // namespace

auto to_hex(std::span<const std::byte> bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        auto val = static_cast<std::uint8_t>(b);
        result.push_back(hex_chars[val >> 4]);
        result.push_back(hex_chars[val & 0x0F]);
    }
    return result;
}

auto to_bytes(std::string_view s) -> Bytes {
    auto result = Bytes(s.size());
    if (!s.empty()) std::memcpy(result.data(), s.data(), s.size());
    return result;
}

auto ContentHash::to_hex() const -> std::string {
    return xmit_cpp::to_hex(bytes);
}

auto ContentHash::from_hex(std::string_view hex) -> std::optional<ContentHash> {
    if (hex.size() != size * 2) return std::nullopt;
    auto h = ContentHash{};
    for (std::size_t i = 0; i < size; ++i) {
        auto hi = hex_char_to_nibble(hex[i * 2]);
        auto lo = hex_char_to_nibble(hex[i * 2 + 1]);
        if (!hi || !lo) return std::nullopt;
        h.bytes[i] = static_cast<std::byte>((*hi << 4) | *lo);
    }
    return h;
}

auto ContentHash::from_bytes(std::span<const std::byte> raw) -> std::optional<ContentHash> {
    if (raw.size() != size) return std::nullopt;
    auto h = ContentHash{};
    std::memcpy(h.bytes.data(), raw.data(), size);
    return h;
}

auto hash_content(std::span<const std::byte> content) -> ContentHash {
    return ContentHash{crypto::blake3(content)};
}

}  // namespace xmit_cpp
