#include <xmit-cpp/transport.hpp>

#include <xmit-cpp/error.hpp>

#include <cpr/cpr.h>
#include <cpr/util.h>
#include <spdlog/spdlog.h>

#include <cstdint>

namespace xmit_cpp {

namespace {

auto abort_on_cancel(const CancellationToken& token) -> cpr::ProgressCallback {
    return cpr::ProgressCallback{
        [token](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t,
                std::intptr_t) -> bool {
            // Returning false makes libcurl abort the transfer
            return !token.is_cancelled();
        }};
}

auto to_response(const cpr::Response& r, const std::string& url,
                 const CancellationToken& token) -> HttpResponse {
    token.throw_if_cancelled();

    if (r.error) {
        if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            throw PublishError{ErrorKind::timeout, "Request to " + url + " timed out"};
        }
        throw PublishError{ErrorKind::transport,
            "Request to " + url + " failed: " + r.error.message};
    }

    spdlog::debug("{} -> HTTP {} ({} bytes)", url, r.status_code, r.text.size());
    auto response = HttpResponse{};
    response.status = r.status_code;
    response.body = to_bytes(r.text);
    return response;
}

}  // namespace

auto HttpTransport::get(const std::string& url,
                        std::chrono::milliseconds timeout,
                        const CancellationToken& token) -> HttpResponse {
    token.throw_if_cancelled();
    spdlog::debug("GET {}", url);
    auto r = cpr::Get(cpr::Url{url},
                      cpr::Timeout{timeout},
                      abort_on_cancel(token));
    return to_response(r, url, token);
}

auto HttpTransport::post(const std::string& url,
                         const Headers& headers,
                         const Bytes& body,
                         std::chrono::milliseconds timeout,
                         const CancellationToken& token) -> HttpResponse {
    token.throw_if_cancelled();
    spdlog::debug("POST {} ({} bytes)", url, body.size());

    auto header = cpr::Header{};
    for (const auto& [name, value] : headers) header[name] = value;

    auto payload = std::string{reinterpret_cast<const char*>(body.data()), body.size()};
    auto r = cpr::Post(cpr::Url{url},
                       header,
                       cpr::Body{std::move(payload)},
                       cpr::Timeout{timeout},
                       abort_on_cancel(token));
    return to_response(r, url, token);
}

auto url_encode(std::string_view value) -> std::string {
    return cpr::util::urlEncode(std::string{value});
}

}  // namespace xmit_cpp
