#include <xmit-cpp/client.hpp>

#include <xmit-cpp/error.hpp>

#include <spdlog/spdlog.h>

namespace xmit_cpp {

namespace {

template <typename T>
auto require(std::optional<T> decoded, std::string_view name) -> T {
    if (!decoded) {
        throw PublishError{ErrorKind::decoding,
            "Malformed " + std::string{name} + " response"};
    }
    return std::move(*decoded);
}

}  // namespace

ProtocolClient::ProtocolClient(Transport& transport,
                               std::string base_url,
                               Auth auth,
                               std::chrono::milliseconds timeout,
                               std::string api_prefix)
    : transport_{transport},
      base_url_{std::move(base_url)},
      auth_{std::move(auth)},
      timeout_{timeout},
      api_prefix_{std::move(api_prefix)} {
    while (base_url_.ends_with('/')) base_url_.pop_back();
}

auto ProtocolClient::endpoint(std::string_view name) const -> std::string {
    return base_url_ + api_prefix_ + "/" + std::string{name};
}

auto ProtocolClient::call(std::string_view name, const Bytes& request,
                          const CancellationToken& token) -> Bytes {
    auto url = endpoint(name);
    auto headers = Headers{
        {"Content-Type", std::string{cbor_gzip_media_type}},
        {"Accept", std::string{cbor_gzip_media_type}},
    };
    auto response = transport_.post(url, headers, frame_body(request), timeout_, token);
    if (response.status != 200) {
        throw PublishError{ErrorKind::transport,
            "Request to " + std::string{name} + " failed: HTTP " + std::to_string(response.status)};
    }
    auto body = unframe_body(response.body);
    if (!body) {
        throw PublishError{ErrorKind::decoding,
            "Failed to decompress " + std::string{name} + " response"};
    }
    return std::move(*body);
}

auto ProtocolClient::suggest(std::string_view domain, const ContentHash& bundle_hash,
                             const CancellationToken& token) -> SuggestResponse {
    spdlog::debug("suggest {} for {}", bundle_hash.to_hex(), domain);
    auto body = call("suggest", encode_suggest_request(auth_, domain, bundle_hash), token);
    return require(decode_suggest_response(body), "suggest");
}

auto ProtocolClient::upload_bundle(std::string_view domain, std::span<const std::byte> bundle,
                                   const CancellationToken& token) -> BundleUploadResponse {
    spdlog::debug("upload bundle ({} bytes) for {}", bundle.size(), domain);
    auto body = call("bundle", encode_bundle_request(auth_, domain, bundle), token);
    return require(decode_bundle_response(body), "bundle");
}

auto ProtocolClient::upload_missing(std::string_view domain, const std::vector<const Bytes*>& parts,
                                    const CancellationToken& token) -> StatusResponse {
    auto body = call("missing", encode_missing_request(auth_, domain, parts), token);
    return require(decode_status_response(body), "missing");
}

auto ProtocolClient::finalize(std::string_view domain, std::span<const std::byte> bundle_id,
                              const CancellationToken& token) -> StatusResponse {
    spdlog::debug("finalize {} for {}", to_hex(bundle_id), domain);
    auto body = call("finalize", encode_finalize_request(auth_, domain, bundle_id), token);
    return require(decode_status_response(body), "finalize");
}

auto ProtocolClient::list_teams(const CancellationToken& token) -> TeamList {
    auto unscoped = Auth{auth_.credential, {}};
    auto body = call("teams", encode_teams_request(unscoped), token);
    return require(decode_teams_response(body), "teams");
}

}  // namespace xmit_cpp
