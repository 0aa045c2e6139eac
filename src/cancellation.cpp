#include <xmit-cpp/cancellation.hpp>

#include <xmit-cpp/error.hpp>

namespace xmit_cpp {

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw PublishError{ErrorKind::cancelled, "cancelled"};
    }
}

// -- LaunchHandle -------------------------------------------------------------

LaunchHandle::LaunchHandle(LaunchHandle&& other) noexcept
    : registry_{other.registry_},
      launch_id_{std::move(other.launch_id_)},
      token_{other.token_} {
    other.registry_ = nullptr;
}

LaunchHandle::~LaunchHandle() {
    if (registry_) registry_->finish(launch_id_, token_);
}

// -- LaunchRegistry -----------------------------------------------------------

auto LaunchRegistry::begin(const std::string& launch_id) -> LaunchHandle {
    auto token = CancellationToken{};
    {
        auto lock = std::scoped_lock{mutex_};
        tokens_.insert_or_assign(launch_id, token);
    }
    return LaunchHandle{this, launch_id, token};
}

auto LaunchRegistry::cancel(const std::string& launch_id) -> bool {
    auto lock = std::scoped_lock{mutex_};
    auto it = tokens_.find(launch_id);
    if (it == tokens_.end()) return false;
    it->second.cancel();
    return true;
}

auto LaunchRegistry::is_running(const std::string& launch_id) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return tokens_.contains(launch_id);
}

auto LaunchRegistry::size() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return tokens_.size();
}

void LaunchRegistry::finish(const std::string& launch_id, const CancellationToken& token) {
    auto lock = std::scoped_lock{mutex_};
    auto it = tokens_.find(launch_id);
    // A newer launch with the same id may have replaced this entry
    if (it != tokens_.end() && it->second.shares_flag_with(token)) {
        tokens_.erase(it);
    }
}

}  // namespace xmit_cpp
