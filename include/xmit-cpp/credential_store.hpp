/// @file credential_store.hpp
/// @brief API keys keyed by hosting-service identity.

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace xmit_cpp {

/// Source of bearer credentials, keyed by service (e.g. "xmit.co").
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual auto get(std::string_view service) const -> std::optional<std::string> = 0;
    virtual void set(std::string_view service, std::string key) = 0;
    virtual void erase(std::string_view service) = 0;
};

/// Process-local store. Thread safe.
class MemoryCredentialStore : public CredentialStore {
public:
    auto get(std::string_view service) const -> std::optional<std::string> override {
        auto lock = std::scoped_lock{mutex_};
        auto it = keys_.find(std::string{service});
        if (it == keys_.end()) return std::nullopt;
        return it->second;
    }

    void set(std::string_view service, std::string key) override {
        auto lock = std::scoped_lock{mutex_};
        keys_.insert_or_assign(std::string{service}, std::move(key));
    }

    void erase(std::string_view service) override {
        auto lock = std::scoped_lock{mutex_};
        keys_.erase(std::string{service});
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> keys_;
};

}  // namespace xmit_cpp
