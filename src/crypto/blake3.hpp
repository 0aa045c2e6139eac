#pragma once

// Thin wrapper over the BLAKE3 reference C library.
// Produces the 32-byte default-length digest used for content addressing.
// Internal header — not installed.

#include <blake3.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace xmit_cpp::crypto {

inline constexpr std::size_t blake3_digest_size = BLAKE3_OUT_LEN;

// Compute the BLAKE3 digest of the input bytes.
inline auto blake3(std::span<const std::byte> input) -> std::array<std::byte, blake3_digest_size> {
    auto hasher = blake3_hasher{};
    ::blake3_hasher_init(&hasher);
    if (!input.empty()) {
        ::blake3_hasher_update(&hasher, input.data(), input.size());
    }
    auto result = std::array<std::byte, blake3_digest_size>{};
    ::blake3_hasher_finalize(&hasher, reinterpret_cast<std::uint8_t*>(result.data()),
                             result.size());
    return result;
}

// Convenience: hash a vector of bytes.
inline auto blake3(const std::vector<std::byte>& input) -> std::array<std::byte, blake3_digest_size> {
    return blake3(std::span<const std::byte>{input});
}

}  // namespace xmit_cpp::crypto
