/// @file discovery.hpp
/// @brief Protocol discovery via the well-known web publication document.

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/transport.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xmit_cpp {

/// The protocol version this client speaks.
inline constexpr std::string_view protocol_version = "xmit/0";

/// Path of the discovery document relative to the service URL.
inline constexpr std::string_view well_known_path = "/.well-known/web-publication-protocol";

/// What a hosting service advertises about itself.
struct ProtocolInfo {
    std::vector<std::string> protocols;              ///< Supported protocol versions.
    std::string url;                                 ///< Base URL for API calls.
    std::optional<std::string> api_key_management_url;

    auto supports(std::string_view protocol) const -> bool;
};

/// Prefix https:// unless the service already carries a scheme.
auto normalize_service_url(std::string_view service) -> std::string;

/// Parse and validate the discovery document.
///
/// @throws PublishError{discovery} if the text is not a JSON object, the
///         protocol list is empty or lacks required, or the url is missing.
auto parse_protocol_document(std::string_view json_text,
                             std::string_view required = protocol_version) -> ProtocolInfo;

/// Fetch and validate the discovery document of a service.
///
/// @throws PublishError{discovery} if the document is unreachable, not
///         200, or invalid; PublishError{cancelled} if token is set.
auto discover_protocol(Transport& transport,
                       std::string_view service,
                       std::chrono::milliseconds timeout = default_request_timeout,
                       const CancellationToken& token = {},
                       std::string_view required = protocol_version) -> ProtocolInfo;

/// Thread-safe memo of successful discoveries keyed by service.
class DiscoveryCache {
public:
    explicit DiscoveryCache(Transport& transport,
                            std::chrono::milliseconds timeout = default_request_timeout)
        : transport_{transport}, timeout_{timeout} {}

    /// Cached result for service, discovering it on first use.
    auto discover(std::string_view service, const CancellationToken& token = {}) -> ProtocolInfo;

    /// Where users manage API keys for service.
    ///
    /// @throws PublishError{discovery} if the service publishes none.
    auto api_key_management_url(std::string_view service,
                                const CancellationToken& token = {}) -> std::string;

    void clear();
    auto size() const -> std::size_t;

private:
    Transport& transport_;
    std::chrono::milliseconds timeout_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProtocolInfo> entries_;
};

}  // namespace xmit_cpp
