/// @file chunked_uploader.hpp
/// @brief Size-bounded, largest-first delivery of missing content.

#pragma once

#include <xmit-cpp/bundle.hpp>
#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/client.hpp>
#include <xmit-cpp/launch_step.hpp>

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace xmit_cpp {

/// Default upper bound on the summed blob size of one chunk (10 MiB).
inline constexpr std::size_t default_chunk_budget = std::size_t{10} * 1024 * 1024;

/// Partition blobs into chunks.
///
/// Blobs are taken largest first; a chunk is closed when the next blob
/// would push it past budget. A blob larger than budget sits alone in its
/// chunk. Returns, per chunk, indices into sizes. Every index appears
/// exactly once.
auto plan_chunks(std::span<const std::size_t> sizes,
                 std::size_t budget = default_chunk_budget)
    -> std::vector<std::vector<std::size_t>>;

/// Upload the content behind missing, one chunk at a time.
///
/// Progress lines go to the active step of tracker. Cancellation is checked
/// before each chunk, so a cancel observed mid-upload lets the current chunk
/// finish and starts no other.
///
/// @throws PublishError{invariant_violation} if a hash has no entry in
///         contents (nothing is uploaded in that case); transport, decoding
///         and cancelled errors propagate from the client.
/// @returns the number of chunks sent.
auto upload_missing_parts(ProtocolClient& client,
                          std::string_view domain,
                          std::span<const ContentHash> missing,
                          const ContentTable& contents,
                          StepTracker& tracker,
                          const CancellationToken& token,
                          std::size_t budget = default_chunk_budget) -> std::size_t;

}  // namespace xmit_cpp
