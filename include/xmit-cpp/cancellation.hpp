/// @file cancellation.hpp
/// @brief Cooperative cancellation: CancellationToken and LaunchRegistry.

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace xmit_cpp {

/// A copyable handle to a shared cancellation flag.
///
/// Copies observe the same flag. Every blocking step of a publish polls
/// its token and stops with ErrorKind::cancelled once the flag is set.
class CancellationToken {
public:
    CancellationToken() : flag_{std::make_shared<std::atomic<bool>>(false)} {}

    /// Request cancellation. Idempotent.
    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

    auto is_cancelled() const noexcept -> bool {
        return flag_->load(std::memory_order_acquire);
    }

    /// Throw PublishError{cancelled} if cancellation was requested.
    void throw_if_cancelled() const;

    /// True if both tokens observe the same flag.
    auto shares_flag_with(const CancellationToken& other) const noexcept -> bool {
        return flag_ == other.flag_;
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class LaunchRegistry;

/// RAII registration of an in-flight launch. Removes the entry on destruction.
class LaunchHandle {
public:
    LaunchHandle(LaunchHandle&& other) noexcept;
    auto operator=(LaunchHandle&&) -> LaunchHandle& = delete;
    LaunchHandle(const LaunchHandle&) = delete;
    auto operator=(const LaunchHandle&) -> LaunchHandle& = delete;
    ~LaunchHandle();

    auto token() const -> const CancellationToken& { return token_; }
    auto launch_id() const -> const std::string& { return launch_id_; }

private:
    friend class LaunchRegistry;
    LaunchHandle(LaunchRegistry* registry, std::string launch_id, CancellationToken token)
        : registry_{registry}, launch_id_{std::move(launch_id)}, token_{std::move(token)} {}

    LaunchRegistry* registry_;
    std::string launch_id_;
    CancellationToken token_;
};

/// Tracks in-flight launches by identity so another thread can cancel them.
///
/// The registry is owned by the host; there is no process-wide instance.
///
/// @code
/// auto registry = xmit_cpp::LaunchRegistry{};
/// auto handle = registry.begin(xmit_cpp::launch_id(project, site));
/// publisher.publish(request, channel, handle.token());
/// // elsewhere: registry.cancel(id);
/// @endcode
class LaunchRegistry {
public:
    LaunchRegistry() = default;
    LaunchRegistry(const LaunchRegistry&) = delete;
    auto operator=(const LaunchRegistry&) -> LaunchRegistry& = delete;

    /// Register a launch with a fresh token. Starting a launch that is
    /// already registered replaces the previous token.
    auto begin(const std::string& launch_id) -> LaunchHandle;

    /// Cancel the launch if it is in flight. Returns false if it is not.
    auto cancel(const std::string& launch_id) -> bool;

    auto is_running(const std::string& launch_id) const -> bool;

    auto size() const -> std::size_t;

private:
    friend class LaunchHandle;
    void finish(const std::string& launch_id, const CancellationToken& token);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CancellationToken> tokens_;
};

}  // namespace xmit_cpp
