#include <xmit-cpp/error.hpp>
#include <xmit-cpp/key_request.hpp>

#include "fake_transport.hpp"

#include <gtest/gtest.h>

using namespace xmit_cpp;
using namespace xmit_cpp::test_support;
using cbor::Value;

namespace {

auto ticket_body() -> HttpResponse {
    return cbor_response(Value{Value::Map{
        {Value{std::uint64_t{1}}, Value{true}},
        {Value{std::uint64_t{5}}, Value{"https://xmit.co/approve/r1"}},
        {Value{std::uint64_t{6}}, Value{"/api/0/poll/r1"}},
        {Value{std::uint64_t{7}}, Value{"a b&c"}},
        {Value{std::uint64_t{8}}, Value{"r1"}},
    }});
}

auto fast_options() -> KeyRequestOptions {
    auto options = KeyRequestOptions{};
    options.poll_interval = std::chrono::milliseconds{1};
    options.max_attempts = 3;
    return options;
}

auto kind_of(const std::function<void()>& fn) -> std::optional<ErrorKind> {
    try {
        fn();
    } catch (const PublishError& e) {
        return e.kind();
    }
    return std::nullopt;
}

}  // namespace

TEST(KeyRequest, request_key_posts_label_to_service) {
    auto transport = FakeTransport{};
    transport.route("/api/0/request-key", ticket_body());
    auto keys = KeyRequestClient{transport};

    auto ticket = keys.request_key("xmit.co", "xmit");

    EXPECT_EQ(ticket.base_url, "https://xmit.co");
    EXPECT_EQ(ticket.browser_url, "https://xmit.co/approve/r1");
    EXPECT_EQ(ticket.request_id, "r1");

    auto calls = transport.calls_to("/api/0/request-key");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].url, "https://xmit.co/api/0/request-key");
    EXPECT_EQ(calls[0].text(1), "xmit on " + local_hostname());
    EXPECT_FALSE(calls[0].has(2));
}

TEST(KeyRequest, refused_request_lists_server_errors) {
    auto transport = FakeTransport{};
    transport.route("/api/0/request-key", cbor_response(Value{Value::Map{
        {Value{std::uint64_t{1}}, Value{false}},
        {Value{std::uint64_t{2}}, text_array({"rate limited", "try later"})},
    }}));
    auto keys = KeyRequestClient{transport};
    try {
        keys.request_key("xmit.co", "xmit");
        FAIL() << "expected PublishError";
    } catch (const PublishError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::protocol);
        EXPECT_NE(std::string{e.what()}.find("rate limited, try later"), std::string::npos);
    }
}

TEST(KeyRequest, missing_fields_are_protocol_error) {
    auto transport = FakeTransport{};
    transport.route("/api/0/request-key", cbor_response(Value{Value::Map{
        {Value{std::uint64_t{1}}, Value{true}},
        {Value{std::uint64_t{5}}, Value{"https://xmit.co/approve/r1"}},
    }}));
    auto keys = KeyRequestClient{transport};
    EXPECT_EQ(kind_of([&] { keys.request_key("xmit.co", "xmit"); }), ErrorKind::protocol);
}

TEST(KeyRequest, await_key_polls_with_encoded_secret) {
    auto transport = FakeTransport{};
    transport.route("/api/0/poll/r1", text_response("xk_live_123"));
    auto keys = KeyRequestClient{transport};
    auto ticket = KeyTicket{"https://xmit.co", "", "/api/0/poll/r1", "a b&c", "r1"};

    EXPECT_EQ(keys.await_key(ticket), "xk_live_123");

    auto calls = transport.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].method, "GET");
    EXPECT_EQ(calls[0].url, "https://xmit.co/api/0/poll/r1?secret=a%20b%26c");
    EXPECT_EQ(calls[0].timeout, default_key_poll_timeout);
}

TEST(KeyRequest, await_key_maps_status_codes) {
    auto ticket = KeyTicket{"https://xmit.co", "", "/poll", "s", "r"};
    for (auto [status, kind] : std::vector<std::pair<long, ErrorKind>>{
             {404, ErrorKind::protocol},
             {401, ErrorKind::protocol},
             {408, ErrorKind::timeout},
             {500, ErrorKind::protocol}}) {
        auto transport = FakeTransport{};
        transport.route("/poll", status_response(status));
        auto keys = KeyRequestClient{transport};
        EXPECT_EQ(kind_of([&] { keys.await_key(ticket); }), kind) << "status " << status;
    }
}

TEST(KeyRequest, request_and_await_retries_timeouts) {
    auto transport = FakeTransport{};
    transport.route("/api/0/request-key", ticket_body());
    transport.route("/api/0/poll/r1", status_response(408));
    transport.route("/api/0/poll/r1", text_response("xk_live_456"));
    auto keys = KeyRequestClient{transport, fast_options()};

    auto opened = std::string{};
    auto key = keys.request_and_await_key("xmit.co", "xmit",
        [&](std::string_view url, std::string_view id) {
            opened = std::string{url} + " " + std::string{id};
        });

    EXPECT_EQ(key, "xk_live_456");
    EXPECT_EQ(opened, "https://xmit.co/approve/r1 r1");
    EXPECT_EQ(transport.calls_to("/api/0/poll/r1").size(), 2u);
}

TEST(KeyRequest, request_and_await_does_not_retry_other_errors) {
    auto transport = FakeTransport{};
    transport.route("/api/0/request-key", ticket_body());
    transport.route("/api/0/poll/r1", status_response(404));
    auto keys = KeyRequestClient{transport, fast_options()};

    EXPECT_EQ(kind_of([&] { keys.request_and_await_key("xmit.co", "xmit", {}); }),
              ErrorKind::protocol);
    EXPECT_EQ(transport.calls_to("/api/0/poll/r1").size(), 1u);
}

TEST(KeyRequest, request_and_await_gives_up_after_max_attempts) {
    auto transport = FakeTransport{};
    transport.route("/api/0/request-key", ticket_body());
    transport.route("/api/0/poll/r1", status_response(408));
    auto keys = KeyRequestClient{transport, fast_options()};

    EXPECT_EQ(kind_of([&] { keys.request_and_await_key("xmit.co", "xmit", {}); }),
              ErrorKind::timeout);
    EXPECT_EQ(transport.calls_to("/api/0/poll/r1").size(), 3u);
}

TEST(KeyRequest, cancellation_stops_polling) {
    auto transport = FakeTransport{};
    auto token = CancellationToken{};
    transport.route("/api/0/request-key", ticket_body());
    transport.route("/api/0/poll/r1", [&](const RecordedCall&) {
        token.cancel();
        return status_response(408);
    });
    auto keys = KeyRequestClient{transport, fast_options()};

    EXPECT_EQ(kind_of([&] { keys.request_and_await_key("xmit.co", "xmit", {}, token); }),
              ErrorKind::cancelled);
    EXPECT_EQ(transport.calls_to("/api/0/poll/r1").size(), 1u);
}
