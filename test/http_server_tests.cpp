/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "ska/internal/http_low.hpp"
#include "ska/internal/http_parser.hpp"
#include "ska/internal/http_server.hpp"
#include "ska/internal/utils.hpp"
#include "ska/server.hpp"
#include "ska/shared_key_stage.hpp"
#include "test_helpers.hpp"

using ::testing::HasSubstr;

class HttpServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ska::SharedKeyStageConfig sc;
        sc.resolver = ska_test::test_resolver();
        sc.now = ska_test::clock_at(ska_test::fixed_now());
        pipeline.add(std::make_shared<ska::SharedKeyStage>(sc));
        cfg.ka_timeout_sec = 2;
    }

    ska::HttpResponse route(const ska::HttpRequest& r)
    {
        return ska::internal::route_request(cfg, pipeline, r);
    }

    // Feeds `wire` to the connection handler over a socket pair and returns
    // everything it wrote back before closing.
    std::string exchange(const std::string& wire)
    {
        int sv[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) != 0) return {};
        std::thread server([&]() {
            ska::internal::handle_connection_plain(sv[1], cfg, "test", pipeline);
            ::close(sv[1]);
        });
        std::size_t off = 0;
        while (off < wire.size()) {
            const ssize_t n = ::send(sv[0], wire.data() + off, wire.size() - off, MSG_NOSIGNAL);
            if (n <= 0) break;
            off += static_cast<std::size_t>(n);
        }
        std::string out;
        char buf[4096];
        for (;;) {
            const ssize_t n = ::recv(sv[0], buf, sizeof(buf), 0);
            if (n <= 0) break;
            out.append(buf, buf + n);
        }
        server.join();
        ::close(sv[0]);
        return out;
    }

    ska::ServerConfig cfg;
    ska::Pipeline pipeline;
};

TEST_F(HttpServerTest, HealthBypassesAuthentication)
{
    const ska::HttpResponse resp = route(ska_test::make_request("GET", "/health"));
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, R"({"status":"OK"})");
}

TEST_F(HttpServerTest, UnsignedRequestIsRejected)
{
    ska::HttpRequest r = ska_test::make_request("GET", "/whoami");
    r.headers.emplace_back("X-SKA-Date", "Mon, 01 Jan 2024 00:00:00 GMT");
    r.headers.emplace_back("Authorization", "SharedKey alice:bm90IGEgc2lnbmF0dXJl");
    EXPECT_EQ(route(r).status_code, 401);
}

TEST_F(HttpServerTest, WhoamiReturnsIdentity)
{
    const ska::HttpResponse resp = route(
        ska_test::sign_as(ska_test::make_request("GET", "/whoami"), "bob", ska_test::bob_secret()));
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_THAT(resp.body, HasSubstr(R"("account":"bob")"));
    EXPECT_THAT(resp.body, HasSubstr(R"({"name":"authmethod","value":"SharedKey"})"));
}

TEST_F(HttpServerTest, EchoReportsBodySize)
{
    const ska::HttpResponse resp = route(ska_test::sign_as(
        ska_test::make_request("POST", "/echo", "", "12345"), "alice", ska_test::alice_secret()));
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, R"({"status":"OK","echo_size":5})");
}

TEST_F(HttpServerTest, UnknownPathIs404OnlyAfterAuthentication)
{
    EXPECT_EQ(route(ska_test::make_request("GET", "/nope")).status_code, 412);
    EXPECT_EQ(route(ska_test::sign_as(ska_test::make_request("GET", "/nope"),
                                      "alice", ska_test::alice_secret())).status_code, 404);
}

TEST_F(HttpServerTest, OtherMethodsAreRefused)
{
    EXPECT_EQ(route(ska_test::make_request("DELETE", "/whoami")).status_code, 405);
}

TEST_F(HttpServerTest, SerializesStatusHeadersAndLength)
{
    ska::HttpResponse resp = ska::make_response(401, "Unauthorized", "{}");
    resp.headers.emplace_back("WWW-Authenticate", "SharedKey");
    const std::string wire = ska::internal::serialize_response(cfg, resp, false);
    EXPECT_EQ(wire.rfind("HTTP/1.1 401 Unauthorized\r\n", 0), 0u);
    EXPECT_THAT(wire, HasSubstr("WWW-Authenticate: SharedKey\r\n"));
    EXPECT_THAT(wire, HasSubstr("Content-Length: 2\r\n"));
    EXPECT_THAT(wire, HasSubstr("Connection: close\r\n"));
    EXPECT_EQ(wire.substr(wire.size() - 6), "\r\n\r\n{}");
}

TEST_F(HttpServerTest, ConnectionRoundTripOverSocket)
{
    ska::HttpRequest r = ska_test::sign_as(
        ska_test::make_request("POST", "/echo", "b=2&a=1", R"({"x":1})"), "alice", ska_test::alice_secret());
    r.headers.emplace_back("Connection", "close");
    const std::string out = exchange(ska::internal::serialize_request(r, "localhost"));

    std::size_t body_off = 0;
    int status = 0;
    std::string text;
    ska::HeaderList headers;
    ASSERT_TRUE(ska::internal::parse_http_response(out, body_off, status, text, headers));
    EXPECT_EQ(status, 200);
    EXPECT_EQ(ska::internal::hdr_ci(headers, "Connection"), "close");
    EXPECT_EQ(out.substr(body_off), R"({"status":"OK","echo_size":7})");
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests)
{
    const ska::HttpRequest first = ska_test::sign_as(
        ska_test::make_request("GET", "/whoami"), "alice", ska_test::alice_secret());
    ska::HttpRequest second = ska_test::sign_as(
        ska_test::make_request("GET", "/whoami"), "bob", ska_test::bob_secret());
    second.headers.emplace_back("Connection", "close");

    const std::string out = exchange(ska::internal::serialize_request(first, "localhost") +
                                     ska::internal::serialize_request(second, "localhost"));
    EXPECT_THAT(out, HasSubstr(R"("account":"alice")"));
    EXPECT_THAT(out, HasSubstr(R"("account":"bob")"));
    EXPECT_THAT(out, HasSubstr("Connection: keep-alive\r\n"));
}

TEST_F(HttpServerTest, OversizedBodyClosesConnection)
{
    cfg.max_body = 4;
    const ska::HttpRequest r = ska_test::sign_as(
        ska_test::make_request("POST", "/echo", "", "too large"), "alice", ska_test::alice_secret());
    EXPECT_EQ(exchange(ska::internal::serialize_request(r, "localhost")), "");
}

namespace {

// Polls `cond` for up to two seconds.
template <typename Cond>
bool wait_for(Cond cond)
{
    for (int i = 0; i < 200; ++i) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

int connect_local(uint16_t port)
{
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST(ServerLifetimeTest, DestructorDrainsOpenConnections)
{
    const std::string& s = ska_test::alice_secret();
    ska_test::KeyFile keys("alice " + ska::internal::bytes_to_hex(
        reinterpret_cast<const unsigned char*>(s.data()), s.size()) + "\n");

    ska::ServerConfig cfg;
    cfg.port = 0;
    cfg.auth_file = keys.path();
    cfg.ka_timeout_sec = 30;

    auto server = std::make_unique<ska::Server>(cfg);
    std::thread runner([&]() { server->run(); });
    const int client = wait_for([&]() { return server->port() != 0; })
                           ? connect_local(server->port()) : -1;
    if (client < 0) {
        server->stop();
        runner.join();
        FAIL() << "server did not accept connections";
    }
    // An idle keep-alive client parks its handler in recv().
    EXPECT_TRUE(wait_for([&]() { return server->active_connections() == 1; }));

    const auto started = std::chrono::steady_clock::now();
    server->stop();
    runner.join();
    server.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));

    char buf[16];
    EXPECT_EQ(::recv(client, buf, sizeof(buf), 0), 0);
    ::close(client);
}
