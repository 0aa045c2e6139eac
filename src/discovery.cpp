#include <xmit-cpp/discovery.hpp>

#include <xmit-cpp/error.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace xmit_cpp {

namespace {

auto join(const std::vector<std::string>& items, std::string_view sep) -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += sep;
        result += items[i];
    }
    return result;
}

}  // namespace

auto ProtocolInfo::supports(std::string_view protocol) const -> bool {
    return std::ranges::find(protocols, protocol) != protocols.end();
}

auto normalize_service_url(std::string_view service) -> std::string {
    if (service.starts_with("http://") || service.starts_with("https://")) {
        return std::string{service};
    }
    return "https://" + std::string{service};
}

auto parse_protocol_document(std::string_view json_text,
                             std::string_view required) -> ProtocolInfo {
    auto json = nlohmann::json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        throw PublishError{ErrorKind::discovery,
            "Failed to parse protocol discovery response: not a JSON object"};
    }

    auto info = ProtocolInfo{};
    if (auto it = json.find("protocols"); it != json.end() && it->is_array()) {
        for (const auto& p : *it) {
            info.protocols.push_back(p.is_string() ? p.get<std::string>() : p.dump());
        }
    }
    if (info.protocols.empty()) {
        throw PublishError{ErrorKind::discovery,
            "Protocols field missing or empty in discovery response"};
    }
    if (!info.supports(required)) {
        throw PublishError{ErrorKind::discovery,
            "Unknown protocols: " + join(info.protocols, ", ") +
            ". Expected " + std::string{required}};
    }

    if (auto it = json.find("url"); it != json.end() && it->is_string()) {
        info.url = it->get<std::string>();
    }
    if (info.url.empty()) {
        throw PublishError{ErrorKind::discovery,
            "URL field missing or empty in discovery response"};
    }

    if (auto it = json.find("apiKeyManagementUrl"); it != json.end() && it->is_string()) {
        if (auto url = it->get<std::string>(); !url.empty()) {
            info.api_key_management_url = std::move(url);
        }
    }
    return info;
}

auto discover_protocol(Transport& transport,
                       std::string_view service,
                       std::chrono::milliseconds timeout,
                       const CancellationToken& token,
                       std::string_view required) -> ProtocolInfo {
    auto url = normalize_service_url(service) + std::string{well_known_path};
    spdlog::debug("discovering protocol at {}", url);

    auto response = HttpResponse{};
    try {
        response = transport.get(url, timeout, token);
    } catch (const PublishError& e) {
        if (e.kind() == ErrorKind::cancelled) throw;
        throw PublishError{ErrorKind::discovery, e.what()};
    }
    if (response.status != 200) {
        throw PublishError{ErrorKind::discovery,
            "Failed to discover protocol: HTTP " + std::to_string(response.status)};
    }
    auto info = parse_protocol_document(response.text(), required);
    spdlog::info("{} speaks {} at {}", service, join(info.protocols, ", "), info.url);
    return info;
}

// -- DiscoveryCache -----------------------------------------------------------

auto DiscoveryCache::discover(std::string_view service,
                              const CancellationToken& token) -> ProtocolInfo {
    auto key = std::string{service};
    {
        auto lock = std::scoped_lock{mutex_};
        if (auto it = entries_.find(key); it != entries_.end()) return it->second;
    }
    // Not holding the lock across the request; concurrent misses both fetch
    auto info = discover_protocol(transport_, service, timeout_, token);
    auto lock = std::scoped_lock{mutex_};
    return entries_.insert_or_assign(key, std::move(info)).first->second;
}

auto DiscoveryCache::api_key_management_url(std::string_view service,
                                            const CancellationToken& token) -> std::string {
    auto info = discover(service, token);
    if (!info.api_key_management_url) {
        throw PublishError{ErrorKind::discovery,
            "Service " + std::string{service} + " does not publish an API key management URL"};
    }
    return *info.api_key_management_url;
}

void DiscoveryCache::clear() {
    auto lock = std::scoped_lock{mutex_};
    entries_.clear();
}

auto DiscoveryCache::size() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return entries_.size();
}

}  // namespace xmit_cpp
