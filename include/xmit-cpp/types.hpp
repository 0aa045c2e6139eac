/// @file types.hpp
/// @brief Core identity types: ContentHash and byte helpers.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xmit_cpp {

/// A byte buffer, used for file contents and encoded bodies.
using Bytes = std::vector<std::byte>;

/// A 32-byte BLAKE3 digest identifying file or bundle content.
///
/// Content is addressed by hash alone: identical bytes stored at two
/// different paths produce the same ContentHash. This is the basis of
/// deduplication during a publish.
struct ContentHash {
    static constexpr std::size_t size = 32;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw digest bytes.

    constexpr ContentHash() = default;

    /// Construct from a byte array.
    explicit constexpr ContentHash(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array.
    explicit ContentHash(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const ContentHash&) const = default;
    auto operator==(const ContentHash&) const -> bool = default;

    /// Lowercase hexadecimal rendering (64 characters).
    auto to_hex() const -> std::string;

    /// Parse 64 hex characters. Returns nullopt on bad length or characters.
    static auto from_hex(std::string_view hex) -> std::optional<ContentHash>;

    /// Build from exactly 32 raw bytes, or nullopt on a size mismatch.
    static auto from_bytes(std::span<const std::byte> raw) -> std::optional<ContentHash>;
};

/// Hash arbitrary content. Deterministic across calls and paths.
auto hash_content(std::span<const std::byte> content) -> ContentHash;

/// Render bytes as lowercase hexadecimal.
auto to_hex(std::span<const std::byte> bytes) -> std::string;

/// Copy a string's characters into a byte buffer.
auto to_bytes(std::string_view s) -> Bytes;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const TeamSelected& s) { use(s.team_id); },
///     [](const TeamSelectionCancelled&) { stop(); },
///     [](auto&&) { refetch(); },
/// }, result);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace xmit_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<xmit_cpp::ContentHash> {
    auto operator()(const xmit_cpp::ContentHash& h) const noexcept -> std::size_t {
        // First 8 bytes of a BLAKE3 digest are already well-distributed
        auto result = std::size_t{0};
        const auto* p = reinterpret_cast<const unsigned char*>(h.bytes.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

/// @endcond
