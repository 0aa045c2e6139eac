/// @file wire.hpp
/// @brief Request and response bodies of the xmit protocol (CBOR + gzip).
///
/// Every request is a map keyed by small integers. Key 1 carries the
/// credential and key 2 the team id when one is set. Responses share keys
/// 1 (success), 2 (errors), 3 (warnings) and 4 (messages); the remaining
/// keys are endpoint specific.

#pragma once

#include <xmit-cpp/team.hpp>
#include <xmit-cpp/types.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xmit_cpp {

/// Media type of request and response bodies.
inline constexpr std::string_view cbor_gzip_media_type = "application/cbor+gzip";

/// Marker the server places in an error when the domain needs a team scope.
inline constexpr std::string_view team_required_marker = "requires a team ID";

/// Credential plus optional team scope attached to every request.
struct Auth {
    std::string credential;
    std::string team_id;   ///< Empty when no team scope is set.
};

/// Advisory lists carried by every response.
struct Diagnostics {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> messages;

    /// True if any error contains the team-required marker.
    auto requires_team() const -> bool;

    /// Errors other than the team-required marker.
    auto other_errors() const -> std::vector<std::string>;
};

struct SuggestResponse {
    bool present{false};
    std::vector<ContentHash> missing;
    Diagnostics diagnostics;
};

struct BundleUploadResponse {
    bool success{false};
    Bytes id;
    std::vector<ContentHash> missing;
    Diagnostics diagnostics;
};

/// Response of the missing-parts and finalize endpoints.
struct StatusResponse {
    bool success{false};
    Diagnostics diagnostics;
};

/// Response of the request-key endpoint. Text fields are empty when absent.
struct KeyRequestResponse {
    bool success{false};
    std::vector<std::string> errors;
    std::string browser_url;
    std::string poll_url;
    std::string secret;
    std::string request_id;
};

// -- Request bodies (CBOR, uncompressed) --------------------------------------

auto encode_suggest_request(const Auth& auth, std::string_view domain,
                            const ContentHash& bundle_hash) -> Bytes;

auto encode_bundle_request(const Auth& auth, std::string_view domain,
                           std::span<const std::byte> bundle) -> Bytes;

auto encode_missing_request(const Auth& auth, std::string_view domain,
                            const std::vector<const Bytes*>& parts) -> Bytes;

auto encode_finalize_request(const Auth& auth, std::string_view domain,
                             std::span<const std::byte> bundle_id) -> Bytes;

auto encode_teams_request(const Auth& auth) -> Bytes;

/// Unauthenticated; label names the requesting application and host.
auto encode_key_request(std::string_view label) -> Bytes;

// -- Response bodies (CBOR, uncompressed) -------------------------------------
// Each returns nullopt if the body is not a CBOR map or a listed hash is not
// 32 bytes. Absent or mistyped fields take their defaults; non-text entries
// of the diagnostic lists are dropped.

auto decode_suggest_response(std::span<const std::byte> body) -> std::optional<SuggestResponse>;
auto decode_bundle_response(std::span<const std::byte> body) -> std::optional<BundleUploadResponse>;
auto decode_status_response(std::span<const std::byte> body) -> std::optional<StatusResponse>;
auto decode_teams_response(std::span<const std::byte> body) -> std::optional<TeamList>;
auto decode_key_request_response(std::span<const std::byte> body) -> std::optional<KeyRequestResponse>;

// -- Framing ------------------------------------------------------------------

/// gzip-compress an encoded request body.
auto frame_body(std::span<const std::byte> encoded) -> Bytes;

/// gunzip a response body. nullopt if it is not valid gzip.
auto unframe_body(std::span<const std::byte> body) -> std::optional<Bytes>;

}  // namespace xmit_cpp
