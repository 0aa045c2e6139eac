#pragma once

// Internal header — not installed.
// Split an index range across short-lived std::jthreads, used to read and
// hash bundle files concurrently.

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace xmit_cpp::detail {

/// Call fn(i) for every i in [0, count) on up to num_threads threads, each
/// taking one contiguous chunk. Blocks until every chunk is done. The first
/// exception thrown by fn is rethrown here; the chunk that threw stops early.
template <typename Fn>
void parallel_for(unsigned int num_threads, std::size_t count, Fn&& fn) {
    if (count == 0) return;

    auto chunks = std::min(static_cast<std::size_t>(std::max(num_threads, 1u)), count);
    auto failure = std::exception_ptr{};
    auto failure_mutex = std::mutex{};

    auto run_chunk = [&](std::size_t begin, std::size_t end) {
        try {
            for (auto i = begin; i < end; ++i) fn(i);
        } catch (...) {
            auto lock = std::scoped_lock{failure_mutex};
            if (!failure) failure = std::current_exception();
        }
    };

    {
        auto workers = std::vector<std::jthread>{};
        workers.reserve(chunks - 1);
        for (std::size_t c = 1; c < chunks; ++c) {
            workers.emplace_back(run_chunk, c * count / chunks, (c + 1) * count / chunks);
        }
        // The calling thread takes the first chunk
        run_chunk(0, count / chunks);
    }

    if (failure) std::rethrow_exception(failure);
}

}  // namespace xmit_cpp::detail
