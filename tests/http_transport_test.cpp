#include <xmit-cpp/error.hpp>
#include <xmit-cpp/transport.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace xmit_cpp;

namespace {

// Loopback listener on an ephemeral port. Connections complete in the
// backlog and are never answered unless serve_once() is used.
class LoopbackServer {
public:
    LoopbackServer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        auto addr = sockaddr_in{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 8);
        auto len = socklen_t{sizeof(addr)};
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackServer() { ::close(fd_); }

    LoopbackServer(const LoopbackServer&) = delete;
    auto operator=(const LoopbackServer&) -> LoopbackServer& = delete;

    auto url(const std::string& path = "/") const -> std::string {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    // Accept one connection, read the request head and send raw_response.
    auto serve_once(std::string raw_response) -> std::jthread {
        return std::jthread{[this, response = std::move(raw_response)] {
            auto client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) return;
            auto request = std::string{};
            char buffer[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                auto n = ::read(client, buffer, sizeof(buffer));
                if (n <= 0) break;
                request.append(buffer, static_cast<std::size_t>(n));
            }
            static_cast<void>(::write(client, response.data(), response.size()));
            ::close(client);
        }};
    }

private:
    int fd_{-1};
    int port_{0};
};

// A port with nothing listening on it.
auto closed_port_url() -> std::string {
    auto fd = ::socket(AF_INET, SOCK_STREAM, 0);
    auto addr = sockaddr_in{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    auto len = socklen_t{sizeof(addr)};
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return "http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port)) + "/";
}

auto kind_of(const std::function<void()>& call) -> std::optional<ErrorKind> {
    try {
        call();
    } catch (const PublishError& e) {
        return e.kind();
    }
    return std::nullopt;
}

}  // namespace

// -- Responses ----------------------------------------------------------------

TEST(HttpTransport, reports_non_200_status_with_body) {
    auto server = LoopbackServer{};
    auto serving = server.serve_once(
        "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\nConnection: close\r\n\r\nnot found");

    auto transport = HttpTransport{};
    auto response = transport.get(server.url("/missing"), std::chrono::seconds{10}, {});
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.text(), "not found");
}

TEST(HttpTransport, post_returns_body_bytes) {
    auto server = LoopbackServer{};
    auto serving = server.serve_once(
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok");

    auto transport = HttpTransport{};
    auto response = transport.post(server.url("/api/0/suggest"),
                                   Headers{{"Content-Type", "application/cbor+gzip"}},
                                   to_bytes("body"), std::chrono::seconds{10}, {});
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.text(), "ok");
}

// -- Failures -----------------------------------------------------------------

TEST(HttpTransport, connection_refused_is_transport_error) {
    auto transport = HttpTransport{};
    auto kind = kind_of([&] {
        transport.get(closed_port_url(), std::chrono::seconds{10}, {});
    });
    EXPECT_EQ(kind, ErrorKind::transport);
}

TEST(HttpTransport, silent_server_times_out) {
    auto server = LoopbackServer{};
    auto transport = HttpTransport{};
    auto kind = kind_of([&] {
        transport.get(server.url(), std::chrono::milliseconds{300}, {});
    });
    EXPECT_EQ(kind, ErrorKind::timeout);
}

// -- Cancellation -------------------------------------------------------------

TEST(HttpTransport, cancel_aborts_in_flight_get) {
    auto server = LoopbackServer{};
    auto transport = HttpTransport{};
    auto token = CancellationToken{};
    auto canceller = std::jthread{[&] {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        token.cancel();
    }};

    auto started = std::chrono::steady_clock::now();
    auto kind = kind_of([&] {
        transport.get(server.url(), std::chrono::seconds{30}, token);
    });
    EXPECT_EQ(kind, ErrorKind::cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{5});
}

TEST(HttpTransport, cancel_aborts_in_flight_post) {
    auto server = LoopbackServer{};
    auto transport = HttpTransport{};
    auto token = CancellationToken{};
    auto canceller = std::jthread{[&] {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});
        token.cancel();
    }};

    auto started = std::chrono::steady_clock::now();
    auto kind = kind_of([&] {
        transport.post(server.url("/api/0/bundle"), Headers{}, Bytes(1024, std::byte{1}),
                       std::chrono::seconds{30}, token);
    });
    EXPECT_EQ(kind, ErrorKind::cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{5});
}

TEST(HttpTransport, cancelled_token_sends_nothing) {
    auto transport = HttpTransport{};
    auto token = CancellationToken{};
    token.cancel();
    auto kind = kind_of([&] {
        transport.get(closed_port_url(), std::chrono::seconds{10}, token);
    });
    EXPECT_EQ(kind, ErrorKind::cancelled);
}

// -- url_encode ---------------------------------------------------------------

TEST(UrlEncode, escapes_reserved_and_non_ascii_bytes) {
    EXPECT_EQ(url_encode("abc-_.~XYZ019"), "abc-_.~XYZ019");
    EXPECT_EQ(url_encode("a b&c=d/e+f"), "a%20b%26c%3Dd%2Fe%2Bf");
    EXPECT_EQ(url_encode("\xC3\xA9"), "%C3%A9");
}
