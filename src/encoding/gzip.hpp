#pragma once

// gzip compression/decompression for request and response bodies.
//
// Bodies travel as application/cbor+gzip: a CBOR item wrapped in a gzip
// member (RFC 1952). windowBits of 15 + 16 selects the gzip wrapper.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace xmit_cpp::encoding {

// Upper bound on decompressed response bodies.
inline constexpr std::size_t max_inflated_size = std::size_t{256} * 1024 * 1024;

// zlib counts available input in uInt; larger buffers are fed in slices.
inline constexpr std::size_t max_zlib_slice = std::numeric_limits<uInt>::max();

namespace detail {

inline constexpr std::size_t zlib_buffer_size = 64 * 1024;

// Point the stream at the next slice of remaining and advance past it.
inline void feed(z_stream& stream, std::span<const std::byte>& remaining, std::size_t max_slice) {
    auto slice = std::min(remaining.size(), max_slice);
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(remaining.data()));
    stream.avail_in = static_cast<uInt>(slice);
    remaining = remaining.subspan(slice);
}

}  // namespace detail

inline auto gzip_compress(std::span<const std::byte> input,
                          std::size_t max_slice = max_zlib_slice)
    -> std::optional<std::vector<std::byte>> {

    auto stream = z_stream{};
    auto ret = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              15 + 16, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto output = std::vector<std::byte>{};
    output.reserve(::deflateBound(&stream, static_cast<uLong>(input.size())));
    auto buffer = std::vector<std::byte>(detail::zlib_buffer_size);

    auto remaining = input;
    auto flush = Z_NO_FLUSH;
    do {
        detail::feed(stream, remaining, max_slice);
        flush = remaining.empty() ? Z_FINISH : Z_NO_FLUSH;
        do {
            stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
            stream.avail_out = static_cast<uInt>(buffer.size());
            ret = ::deflate(&stream, flush);
            if (ret == Z_STREAM_ERROR) {
                ::deflateEnd(&stream);
                return std::nullopt;
            }
            auto produced = buffer.size() - stream.avail_out;
            output.insert(output.end(), buffer.begin(),
                          buffer.begin() + static_cast<std::ptrdiff_t>(produced));
        } while (stream.avail_out == 0);
    } while (flush != Z_FINISH);

    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;
    return output;
}

// max_output_size limits decompressed output to prevent memory bombs.
inline auto gzip_decompress(std::span<const std::byte> input,
                            std::size_t max_output_size = max_inflated_size,
                            std::size_t max_slice = max_zlib_slice)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::nullopt;

    auto stream = z_stream{};
    auto ret = ::inflateInit2(&stream, 15 + 16);
    if (ret != Z_OK) return std::nullopt;

    auto output = std::vector<std::byte>{};
    auto buffer = std::vector<std::byte>(detail::zlib_buffer_size);
    auto remaining = input;

    while (ret != Z_STREAM_END) {
        if (stream.avail_in == 0 && !remaining.empty()) {
            detail::feed(stream, remaining, max_slice);
        }
        stream.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());
        ret = ::inflate(&stream, Z_NO_FLUSH);

        // Z_BUF_ERROR: input exhausted before the end of the stream
        if (ret != Z_OK && ret != Z_STREAM_END) {
            ::inflateEnd(&stream);
            return std::nullopt;
        }
        auto produced = buffer.size() - stream.avail_out;
        if (produced > max_output_size - output.size()) {
            ::inflateEnd(&stream);
            return std::nullopt;
        }
        output.insert(output.end(), buffer.begin(),
                      buffer.begin() + static_cast<std::ptrdiff_t>(produced));
    }

    ::inflateEnd(&stream);
    return output;
}

}  // namespace xmit_cpp::encoding
