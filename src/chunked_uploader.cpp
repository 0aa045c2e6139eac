#include <xmit-cpp/chunked_uploader.hpp>

#include <xmit-cpp/error.hpp>

#include "step_log.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace xmit_cpp {

auto plan_chunks(std::span<const std::size_t> sizes, std::size_t budget)
    -> std::vector<std::vector<std::size_t>> {

    auto order = std::vector<std::size_t>(sizes.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
        [&](std::size_t a, std::size_t b) { return sizes[a] > sizes[b]; });

    auto chunks = std::vector<std::vector<std::size_t>>{};
    auto current = std::vector<std::size_t>{};
    auto current_size = std::size_t{0};

    for (auto index : order) {
        if (!current.empty() && current_size + sizes[index] > budget) {
            chunks.push_back(std::move(current));
            current = {};
            current_size = 0;
        }
        current.push_back(index);
        current_size += sizes[index];
    }
    if (!current.empty()) chunks.push_back(std::move(current));
    return chunks;
}

auto upload_missing_parts(ProtocolClient& client,
                          std::string_view domain,
                          std::span<const ContentHash> missing,
                          const ContentTable& contents,
                          StepTracker& tracker,
                          const CancellationToken& token,
                          std::size_t budget) -> std::size_t {

    // Resolve every hash before sending anything
    auto blobs = std::vector<const Bytes*>{};
    blobs.reserve(missing.size());
    for (const auto& hash : missing) {
        const auto* content = contents.find(hash);
        if (!content) {
            throw PublishError{ErrorKind::invariant_violation,
                "Missing content for hash: " + hash.to_hex() +
                ". This indicates a bug in bundle creation."};
        }
        blobs.push_back(content);
    }

    if (blobs.empty()) {
        tracker.log("No missing parts to upload");
        return 0;
    }

    auto sizes = std::vector<std::size_t>{};
    sizes.reserve(blobs.size());
    for (const auto* blob : blobs) sizes.push_back(blob->size());
    auto chunks = plan_chunks(sizes, budget);

    tracker.log("Uploading " + std::to_string(blobs.size()) + " parts in " +
                std::to_string(chunks.size()) + " chunk(s)");

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        token.throw_if_cancelled();

        auto parts = std::vector<const Bytes*>{};
        auto chunk_bytes = std::size_t{0};
        for (auto index : chunks[i]) {
            parts.push_back(blobs[index]);
            chunk_bytes += sizes[index];
        }

        tracker.log("Uploading chunk " + std::to_string(i + 1) + "/" +
                    std::to_string(chunks.size()) + " (" +
                    std::to_string(parts.size()) + " parts)");
        spdlog::debug("chunk {}/{}: {} parts, {} bytes",
                      i + 1, chunks.size(), parts.size(), chunk_bytes);

        auto response = client.upload_missing(domain, parts, token);
        detail::log_diagnostics(tracker, response.diagnostics);
    }

    tracker.log("All missing parts uploaded");
    return chunks.size();
}

}  // namespace xmit_cpp
