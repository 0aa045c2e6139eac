#pragma once

// Scripted Transport for exercising network steps without sockets.

#include <xmit-cpp/error.hpp>
#include <xmit-cpp/transport.hpp>
#include <xmit-cpp/wire.hpp>

#include "../src/encoding/cbor.hpp"
#include "../src/encoding/gzip.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xmit_cpp::test_support {

struct RecordedCall {
    std::string method;
    std::string url;
    Headers headers;
    std::optional<cbor::Value> request;   ///< Decoded body of a POST.
    std::chrono::milliseconds timeout{0};

    // Text field of the request map, or empty.
    auto text(std::uint64_t key) const -> std::string {
        if (!request) return {};
        const auto* v = request->find(key);
        return v && v->as_text() ? *v->as_text() : std::string{};
    }

    auto has(std::uint64_t key) const -> bool {
        return request && request->find(key) != nullptr;
    }
};

using Responder = std::function<HttpResponse(const RecordedCall&)>;

// A 200 response carrying a gzipped CBOR body.
inline auto cbor_response(const cbor::Value& value, long status = 200) -> HttpResponse {
    auto compressed = encoding::gzip_compress(cbor::encode(value));
    return HttpResponse{status, compressed.value_or(Bytes{})};
}

inline auto text_response(std::string_view text, long status = 200) -> HttpResponse {
    return HttpResponse{status, to_bytes(text)};
}

inline auto status_response(long status) -> HttpResponse {
    return HttpResponse{status, {}};
}

// The standard discovery document for a base URL.
inline auto discovery_document(std::string_view base_url) -> HttpResponse {
    return text_response(R"({"protocols":["xmit/0"],"url":")" + std::string{base_url} +
                         R"(","apiKeyManagementUrl":"https://xmit.co/keys"})");
}

inline auto hash_bytes(const ContentHash& h) -> cbor::Value {
    return cbor::Value{Bytes{h.bytes.begin(), h.bytes.end()}};
}

inline auto hash_array(const std::vector<ContentHash>& hashes) -> cbor::Value {
    auto items = cbor::Value::Array{};
    for (const auto& h : hashes) items.push_back(hash_bytes(h));
    return cbor::Value{std::move(items)};
}

inline auto text_array(const std::vector<std::string>& items) -> cbor::Value {
    auto values = cbor::Value::Array{};
    for (const auto& s : items) values.emplace_back(s);
    return cbor::Value{std::move(values)};
}

// Routes requests by URL suffix. Each route holds a queue of responders;
// the last one is reused once the others are consumed. Unrouted URLs fail
// with ErrorKind::transport, as an unreachable host would.
class FakeTransport : public Transport {
public:
    void route(std::string suffix, Responder responder) {
        auto lock = std::scoped_lock{mutex_};
        routes_[std::move(suffix)].push_back(std::move(responder));
    }

    void route(std::string suffix, HttpResponse response) {
        route(std::move(suffix), [response](const RecordedCall&) { return response; });
    }

    // Drop any responders queued for suffix, then route it.
    template <typename R>
    void replace(const std::string& suffix, R&& responder) {
        {
            auto lock = std::scoped_lock{mutex_};
            routes_.erase(suffix);
        }
        route(suffix, std::forward<R>(responder));
    }

    auto get(const std::string& url,
             std::chrono::milliseconds timeout,
             const CancellationToken& token) -> HttpResponse override {
        return dispatch(RecordedCall{"GET", url, {}, std::nullopt, timeout}, token);
    }

    auto post(const std::string& url,
              const Headers& headers,
              const Bytes& body,
              std::chrono::milliseconds timeout,
              const CancellationToken& token) -> HttpResponse override {
        auto call = RecordedCall{"POST", url, headers, std::nullopt, timeout};
        if (auto inflated = encoding::gzip_decompress(body)) {
            call.request = cbor::decode(*inflated);
        }
        return dispatch(std::move(call), token);
    }

    auto calls() const -> std::vector<RecordedCall> {
        auto lock = std::scoped_lock{mutex_};
        return calls_;
    }

    // Calls whose URL ends with suffix, in order.
    auto calls_to(std::string_view suffix) const -> std::vector<RecordedCall> {
        auto lock = std::scoped_lock{mutex_};
        auto result = std::vector<RecordedCall>{};
        for (const auto& c : calls_) {
            if (path_of(c.url).ends_with(suffix)) result.push_back(c);
        }
        return result;
    }

private:
    static auto path_of(std::string_view url) -> std::string_view {
        return url.substr(0, url.find('?'));
    }

    auto dispatch(RecordedCall call, const CancellationToken& token) -> HttpResponse {
        token.throw_if_cancelled();

        auto responder = Responder{};
        {
            auto lock = std::scoped_lock{mutex_};
            calls_.push_back(call);
            auto path = path_of(call.url);
            for (auto& [suffix, queue] : routes_) {
                if (!path.ends_with(suffix) || queue.empty()) continue;
                responder = queue.front();
                if (queue.size() > 1) queue.pop_front();
                break;
            }
        }
        if (!responder) {
            throw PublishError{ErrorKind::transport, "no route to " + call.url};
        }
        return responder(call);
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Responder>> routes_;
    std::vector<RecordedCall> calls_;
};

}  // namespace xmit_cpp::test_support
