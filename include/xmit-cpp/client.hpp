/// @file client.hpp
/// @brief ProtocolClient: the xmit/0 endpoints over a Transport.

#pragma once

#include <xmit-cpp/cancellation.hpp>
#include <xmit-cpp/transport.hpp>
#include <xmit-cpp/wire.hpp>

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xmit_cpp {

/// Path prefix of the xmit/0 API under the discovered base URL.
inline constexpr std::string_view default_api_prefix = "/api/0";

/// Typed calls to one service's protocol endpoints.
///
/// Each call encodes its request, gzips it, POSTs it with the
/// application/cbor+gzip content type and decodes the reply. A non-200
/// status raises ErrorKind::transport; an undecodable body raises
/// ErrorKind::decoding. Diagnostics in the body are returned, not thrown.
class ProtocolClient {
public:
    ProtocolClient(Transport& transport,
                   std::string base_url,
                   Auth auth,
                   std::chrono::milliseconds timeout = default_request_timeout,
                   std::string api_prefix = std::string{default_api_prefix});

    auto auth() const -> const Auth& { return auth_; }

    /// Scope subsequent calls to a team. An empty id removes the scope.
    void set_team_id(std::string team_id) { auth_.team_id = std::move(team_id); }

    /// Full URL of an endpoint, e.g. endpoint("suggest").
    auto endpoint(std::string_view name) const -> std::string;

    auto suggest(std::string_view domain, const ContentHash& bundle_hash,
                 const CancellationToken& token) -> SuggestResponse;

    auto upload_bundle(std::string_view domain, std::span<const std::byte> bundle,
                       const CancellationToken& token) -> BundleUploadResponse;

    auto upload_missing(std::string_view domain, const std::vector<const Bytes*>& parts,
                        const CancellationToken& token) -> StatusResponse;

    auto finalize(std::string_view domain, std::span<const std::byte> bundle_id,
                  const CancellationToken& token) -> StatusResponse;

    /// Teams visible to the credential. Sent without a team scope.
    auto list_teams(const CancellationToken& token) -> TeamList;

private:
    auto call(std::string_view name, const Bytes& request,
              const CancellationToken& token) -> Bytes;

    Transport& transport_;
    std::string base_url_;
    Auth auth_;
    std::chrono::milliseconds timeout_;
    std::string api_prefix_;
};

}  // namespace xmit_cpp
