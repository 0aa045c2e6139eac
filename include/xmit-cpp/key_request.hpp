/// @file key_request.hpp
/// @brief Browser-approved API key request against a hosting service.

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/transport.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace xmit_cpp {

/// Deadline of one long-poll for an approved key. The server holds the
/// request open for up to this long.
inline constexpr auto default_key_poll_timeout = std::chrono::milliseconds{90'000};

/// An outstanding key request, ready to be polled.
struct KeyTicket {
    std::string base_url;     ///< Normalized service URL.
    std::string browser_url;  ///< Where the user approves the request.
    std::string poll_url;     ///< Path under base_url.
    std::string secret;
    std::string request_id;
};

struct KeyRequestOptions {
    std::chrono::milliseconds request_timeout{default_request_timeout};
    std::chrono::milliseconds poll_timeout{default_key_poll_timeout};
    std::chrono::milliseconds poll_interval{2'000};
    int max_attempts{30};
};

/// Called once the request is open, before polling starts.
using KeyPollStart = std::function<void(std::string_view browser_url, std::string_view request_id)>;

/// Obtains an API key by having the user approve a request in a browser.
///
/// @code
/// auto keys = xmit_cpp::KeyRequestClient{transport};
/// auto key = keys.request_and_await_key("xmit.co", "xmit",
///     [](auto url, auto) { spdlog::info("Approve at {}", url); }, token);
/// @endcode
class KeyRequestClient {
public:
    explicit KeyRequestClient(Transport& transport, KeyRequestOptions options = {})
        : transport_{transport}, options_{options} {}

    /// Open a key request labelled "<application> on <host>".
    ///
    /// @throws PublishError{protocol} if the server refuses or omits the
    ///         browser url, poll url or secret.
    auto request_key(std::string_view service,
                     std::string_view application,
                     const CancellationToken& token = {}) -> KeyTicket;

    /// One long-poll for the approved key.
    ///
    /// @throws PublishError{timeout} when the poll times out, either at the
    ///         transport or with HTTP 408; PublishError{protocol} for any
    ///         other non-200 answer.
    auto await_key(const KeyTicket& ticket, const CancellationToken& token = {}) -> std::string;

    /// request_key, then on_start, then await_key until the user approves.
    /// Only timeouts are retried.
    auto request_and_await_key(std::string_view service,
                               std::string_view application,
                               const KeyPollStart& on_start,
                               const CancellationToken& token = {}) -> std::string;

private:
    Transport& transport_;
    KeyRequestOptions options_;
};

/// Name of this machine, or "unknown" if it cannot be read.
auto local_hostname() -> std::string;

}  // namespace xmit_cpp
