/// @file transport.hpp
/// @brief HTTP transport seam: Transport interface and the cpr-backed HttpTransport.

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/types.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xmit_cpp {

/// Default deadline for protocol requests.
inline constexpr auto default_request_timeout = std::chrono::milliseconds{30'000};

/// Ordered request headers.
using Headers = std::vector<std::pair<std::string, std::string>>;

/// A completed HTTP exchange. Any status is reported; callers decide.
struct HttpResponse {
    long status{0};
    Bytes body;

    /// The body interpreted as text.
    auto text() const -> std::string {
        return std::string{reinterpret_cast<const char*>(body.data()), body.size()};
    }
};

/// Abstract HTTP client used by every network step.
///
/// Implementations raise PublishError with ErrorKind::transport on
/// connection failure, ErrorKind::timeout when the deadline passes and
/// ErrorKind::cancelled when the token is set before or during the call.
class Transport {
public:
    virtual ~Transport() = default;

    virtual auto get(const std::string& url,
                     std::chrono::milliseconds timeout,
                     const CancellationToken& token) -> HttpResponse = 0;

    virtual auto post(const std::string& url,
                      const Headers& headers,
                      const Bytes& body,
                      std::chrono::milliseconds timeout,
                      const CancellationToken& token) -> HttpResponse = 0;
};

/// Transport over libcurl via cpr.
///
/// Cancellation is cooperative: the transfer progress callback polls the
/// token and aborts the transfer once it is set, tearing down the
/// connection.
class HttpTransport : public Transport {
public:
    HttpTransport() = default;

    auto get(const std::string& url,
             std::chrono::milliseconds timeout,
             const CancellationToken& token) -> HttpResponse override;

    auto post(const std::string& url,
              const Headers& headers,
              const Bytes& body,
              std::chrono::milliseconds timeout,
              const CancellationToken& token) -> HttpResponse override;
};

/// Percent-encode a string for use in a URL query component.
auto url_encode(std::string_view value) -> std::string;

}  // namespace xmit_cpp
