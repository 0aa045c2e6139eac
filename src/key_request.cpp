#include <xmit-cpp/key_request.hpp>

#include <xmit-cpp/discovery.hpp>
#include <xmit-cpp/error.hpp>
#include <xmit-cpp/wire.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <thread>
#include <vector>

#include <unistd.h>

namespace xmit_cpp {

namespace {

auto join(const std::vector<std::string>& items) -> std::string {
    auto out = std::string{};
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

// Sleep in short slices so cancellation is noticed promptly.
void wait_for(std::chrono::milliseconds interval, const CancellationToken& token) {
    constexpr auto slice = std::chrono::milliseconds{50};
    auto deadline = std::chrono::steady_clock::now() + interval;
    while (std::chrono::steady_clock::now() < deadline) {
        token.throw_if_cancelled();
        std::this_thread::sleep_for(slice);
    }
    token.throw_if_cancelled();
}

}  // namespace

auto local_hostname() -> std::string {
    auto buffer = std::array<char, 256>{};
    if (::gethostname(buffer.data(), buffer.size() - 1) != 0 || buffer[0] == '\0') {
        return "unknown";
    }
    return buffer.data();
}

auto KeyRequestClient::request_key(std::string_view service,
                                   std::string_view application,
                                   const CancellationToken& token) -> KeyTicket {
    auto base = normalize_service_url(service);
    auto host = local_hostname();
    auto label = application.empty() ? host : std::string{application} + " on " + host;

    auto headers = Headers{
        {"Content-Type", std::string{cbor_gzip_media_type}},
        {"Accept", std::string{cbor_gzip_media_type}},
    };
    auto response = transport_.post(base + "/api/0/request-key", headers,
                                     frame_body(encode_key_request(label)),
                                     options_.request_timeout, token);
    if (response.status != 200) {
        throw PublishError{ErrorKind::protocol,
            "Failed to request key: HTTP " + std::to_string(response.status)};
    }

    auto body = unframe_body(response.body);
    if (!body) {
        throw PublishError{ErrorKind::decoding, "Failed to decompress request-key response"};
    }
    auto decoded = decode_key_request_response(*body);
    if (!decoded) {
        throw PublishError{ErrorKind::decoding, "Malformed request-key response"};
    }
    if (!decoded->success) {
        throw PublishError{ErrorKind::protocol,
            "Failed to request key: " + join(decoded->errors)};
    }
    if (decoded->browser_url.empty() || decoded->poll_url.empty() || decoded->secret.empty()) {
        throw PublishError{ErrorKind::protocol,
            "Failed to request key: missing required fields"};
    }

    spdlog::debug("key request {} opened at {}", decoded->request_id, base);
    return KeyTicket{std::move(base), std::move(decoded->browser_url),
                     std::move(decoded->poll_url), std::move(decoded->secret),
                     std::move(decoded->request_id)};
}

auto KeyRequestClient::await_key(const KeyTicket& ticket, const CancellationToken& token)
    -> std::string {
    auto url = ticket.base_url + ticket.poll_url + "?secret=" + url_encode(ticket.secret);
    auto response = transport_.get(url, options_.poll_timeout, token);

    switch (response.status) {
        case 200: return response.text();
        case 404: throw PublishError{ErrorKind::protocol, "Key request not found or expired"};
        case 401: throw PublishError{ErrorKind::protocol, "Invalid secret"};
        case 408: throw PublishError{ErrorKind::timeout, "Request timeout - please try again"};
        default:
            throw PublishError{ErrorKind::protocol,
                "Failed to get key: HTTP " + std::to_string(response.status)};
    }
}

auto KeyRequestClient::request_and_await_key(std::string_view service,
                                             std::string_view application,
                                             const KeyPollStart& on_start,
                                             const CancellationToken& token) -> std::string {
    auto ticket = request_key(service, application, token);
    token.throw_if_cancelled();
    if (on_start) on_start(ticket.browser_url, ticket.request_id);

    for (auto attempt = 0; attempt < options_.max_attempts; ++attempt) {
        token.throw_if_cancelled();
        try {
            return await_key(ticket, token);
        } catch (const PublishError& e) {
            if (e.kind() != ErrorKind::timeout || attempt + 1 >= options_.max_attempts) throw;
            spdlog::debug("key poll {} timed out, retrying", attempt + 1);
        }
        wait_for(options_.poll_interval, token);
    }
    throw PublishError{ErrorKind::timeout,
        "Key request timeout - maximum poll attempts exceeded"};
}

}  // namespace xmit_cpp
