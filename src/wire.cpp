#include <xmit-cpp/wire.hpp>

#include <xmit-cpp/error.hpp>

#include "encoding/cbor.hpp"
#include "encoding/gzip.hpp"

#include <algorithm>
#include <iterator>

namespace xmit_cpp {

namespace {

namespace key {
constexpr std::uint64_t credential = 1;
constexpr std::uint64_t team_id = 2;
constexpr std::uint64_t domain = 5;
constexpr std::uint64_t payload = 6;
constexpr std::uint64_t parts = 7;

constexpr std::uint64_t success = 1;
constexpr std::uint64_t errors = 2;
constexpr std::uint64_t warnings = 3;
constexpr std::uint64_t messages = 4;
constexpr std::uint64_t field5 = 5;
constexpr std::uint64_t field6 = 6;
}  // namespace key

auto request(const Auth& auth, cbor::Value::Map fields) -> Bytes {
    auto entries = cbor::Value::Map{};
    entries.emplace_back(cbor::Value{key::credential}, cbor::Value{auth.credential});
    if (!auth.team_id.empty()) {
        entries.emplace_back(cbor::Value{key::team_id}, cbor::Value{auth.team_id});
    }
    for (auto& field : fields) entries.push_back(std::move(field));
    return cbor::encode(cbor::Value{std::move(entries)});
}

auto bytes_of(std::span<const std::byte> data) -> cbor::Value {
    return cbor::Value{Bytes{data.begin(), data.end()}};
}

auto flag(const cbor::Value& map, std::uint64_t k) -> bool {
    const auto* v = map.find(k);
    return v && v->as_bool().value_or(false);
}

auto text_list(const cbor::Value& map, std::uint64_t k) -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    const auto* v = map.find(k);
    if (!v || !v->as_array()) return result;
    for (const auto& item : *v->as_array()) {
        if (const auto* t = item.as_text(); t && !t->empty()) result.push_back(*t);
    }
    return result;
}

auto hash_list(const cbor::Value& map, std::uint64_t k) -> std::optional<std::vector<ContentHash>> {
    auto result = std::vector<ContentHash>{};
    const auto* v = map.find(k);
    if (!v || !v->as_array()) return result;
    for (const auto& item : *v->as_array()) {
        const auto* b = item.as_bytes();
        if (!b) continue;
        auto hash = ContentHash::from_bytes(*b);
        if (!hash) return std::nullopt;
        result.push_back(*hash);
    }
    return result;
}

auto diagnostics(const cbor::Value& map) -> Diagnostics {
    return Diagnostics{
        text_list(map, key::errors),
        text_list(map, key::warnings),
        text_list(map, key::messages),
    };
}

auto decode_map(std::span<const std::byte> body) -> std::optional<cbor::Value> {
    auto value = cbor::decode(body);
    if (!value || !value->is_map()) return std::nullopt;
    return value;
}

}  // namespace

// -- Diagnostics --------------------------------------------------------------

auto Diagnostics::requires_team() const -> bool {
    return std::ranges::any_of(errors, [](const std::string& e) {
        return e.find(team_required_marker) != std::string::npos;
    });
}

auto Diagnostics::other_errors() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    std::ranges::copy_if(errors, std::back_inserter(result), [](const std::string& e) {
        return e.find(team_required_marker) == std::string::npos;
    });
    return result;
}

// -- Requests -----------------------------------------------------------------

auto encode_suggest_request(const Auth& auth, std::string_view domain,
                            const ContentHash& bundle_hash) -> Bytes {
    auto fields = cbor::Value::Map{};
    fields.emplace_back(cbor::Value{key::domain}, cbor::Value{domain});
    fields.emplace_back(cbor::Value{key::payload}, bytes_of(bundle_hash.bytes));
    return request(auth, std::move(fields));
}

auto encode_bundle_request(const Auth& auth, std::string_view domain,
                           std::span<const std::byte> bundle) -> Bytes {
    auto fields = cbor::Value::Map{};
    fields.emplace_back(cbor::Value{key::domain}, cbor::Value{domain});
    fields.emplace_back(cbor::Value{key::payload}, bytes_of(bundle));
    return request(auth, std::move(fields));
}

auto encode_missing_request(const Auth& auth, std::string_view domain,
                            const std::vector<const Bytes*>& parts) -> Bytes {
    auto blobs = cbor::Value::Array{};
    blobs.reserve(parts.size());
    for (const auto* part : parts) blobs.emplace_back(*part);

    auto fields = cbor::Value::Map{};
    fields.emplace_back(cbor::Value{key::domain}, cbor::Value{domain});
    fields.emplace_back(cbor::Value{key::parts}, cbor::Value{std::move(blobs)});
    return request(auth, std::move(fields));
}

auto encode_finalize_request(const Auth& auth, std::string_view domain,
                             std::span<const std::byte> bundle_id) -> Bytes {
    auto fields = cbor::Value::Map{};
    fields.emplace_back(cbor::Value{key::domain}, cbor::Value{domain});
    fields.emplace_back(cbor::Value{key::payload}, bytes_of(bundle_id));
    return request(auth, std::move(fields));
}

auto encode_teams_request(const Auth& auth) -> Bytes {
    return request(auth, {});
}

auto encode_key_request(std::string_view label) -> Bytes {
    auto entries = cbor::Value::Map{};
    entries.emplace_back(cbor::Value{std::uint64_t{1}}, cbor::Value{std::string{label}});
    return cbor::encode(cbor::Value{std::move(entries)});
}

// -- Responses ----------------------------------------------------------------

auto decode_suggest_response(std::span<const std::byte> body) -> std::optional<SuggestResponse> {
    auto map = decode_map(body);
    if (!map) return std::nullopt;
    auto missing = hash_list(*map, key::field6);
    if (!missing) return std::nullopt;
    return SuggestResponse{flag(*map, key::field5), std::move(*missing), diagnostics(*map)};
}

auto decode_bundle_response(std::span<const std::byte> body) -> std::optional<BundleUploadResponse> {
    auto map = decode_map(body);
    if (!map) return std::nullopt;
    auto missing = hash_list(*map, key::field6);
    if (!missing) return std::nullopt;

    auto response = BundleUploadResponse{};
    response.success = flag(*map, key::success);
    if (const auto* id = map->find(key::field5); id && id->as_bytes()) {
        response.id = *id->as_bytes();
    }
    response.missing = std::move(*missing);
    response.diagnostics = diagnostics(*map);
    return response;
}

auto decode_status_response(std::span<const std::byte> body) -> std::optional<StatusResponse> {
    auto map = decode_map(body);
    if (!map) return std::nullopt;
    return StatusResponse{flag(*map, key::success), diagnostics(*map)};
}

auto decode_teams_response(std::span<const std::byte> body) -> std::optional<TeamList> {
    auto map = decode_map(body);
    if (!map) return std::nullopt;

    auto list = TeamList{};
    if (const auto* url = map->find(key::field6); url && url->as_text()) {
        list.manage_url = *url->as_text();
    }
    const auto* teams = map->find(key::field5);
    if (!teams || !teams->as_array()) return list;

    for (const auto& item : *teams->as_array()) {
        if (!item.is_map()) continue;
        const auto* id = item.find(std::uint64_t{1});
        if (!id || !id->as_text() || id->as_text()->empty()) continue;
        auto team = Team{*id->as_text(), std::nullopt};
        if (const auto* name = item.find(std::uint64_t{2}); name && name->as_text()) {
            team.name = *name->as_text();
        }
        list.teams.push_back(std::move(team));
    }
    return list;
}

auto decode_key_request_response(std::span<const std::byte> body)
    -> std::optional<KeyRequestResponse> {
    auto map = decode_map(body);
    if (!map) return std::nullopt;

    auto text = [&](std::uint64_t k) -> std::string {
        const auto* v = map->find(k);
        return v && v->as_text() ? *v->as_text() : std::string{};
    };
    auto response = KeyRequestResponse{};
    response.success = flag(*map, key::success);
    response.errors = text_list(*map, key::errors);
    response.browser_url = text(5);
    response.poll_url = text(6);
    response.secret = text(7);
    response.request_id = text(8);
    return response;
}

// -- Framing ------------------------------------------------------------------

auto frame_body(std::span<const std::byte> encoded) -> Bytes {
    auto compressed = encoding::gzip_compress(encoded);
    if (!compressed) {
        throw PublishError{ErrorKind::invariant_violation, "Failed to compress request body"};
    }
    return std::move(*compressed);
}

auto unframe_body(std::span<const std::byte> body) -> std::optional<Bytes> {
    return encoding::gzip_decompress(body);
}

}  // namespace xmit_cpp
