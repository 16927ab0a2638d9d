//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_websocket_transport.cpp
// Purpose: WebSocketTransport and Connection against a loopback Beast websocket server
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/system/system_error.hpp>

#include "wsio/Connection.hpp"
#include "wsio/WebSocketTransport.hpp"
#include "wsio/errors/Errors.h"
#include "wsio/version.h"
#include "support/TestSupport.hpp"

using namespace wsio;
using wsio::test::RunCoroutine;
namespace net = boost::asio;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

// Serves a single websocket session on 127.0.0.1 from a background thread.
struct MiniServer {
    enum class Mode { Echo, CloseAfterFirst, TextThenEcho, BurstThenRead };
    static constexpr int kBurst = 4;

    net::io_context io;
    tcp::acceptor acceptor{io};
    std::thread thr;
    unsigned short port{0};
    std::promise<std::string> userAgent;
    std::promise<std::string> firstClientMessage;

    explicit MiniServer(Mode mode) {
        tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        thr = std::thread([this, mode]() { serveOne(mode); });
    }

    ~MiniServer() {
        // Unblocks accept() when no client ever connected.
        boost::system::error_code ec;
        tcp::socket poke{io};
        poke.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port}, ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
    }

    std::string address() const { return "127.0.0.1:" + std::to_string(port); }

    void serveOne(Mode mode) {
        boost::system::error_code ec;
        tcp::socket socket{io};
        acceptor.accept(socket, ec);
        if (ec) {
            return;
        }
        websocket::stream<tcp::socket> ws{std::move(socket)};
        boost::beast::flat_buffer upgradeBuffer;
        http::request<http::string_body> upgrade;
        http::read(ws.next_layer(), upgradeBuffer, upgrade, ec);
        if (ec) {
            return;
        }
        userAgent.set_value(std::string(upgrade[http::field::user_agent]));
        ws.accept(upgrade, ec);
        if (ec) {
            return;
        }
        if (mode == Mode::BurstThenRead) {
            ws.binary(true);
            for (int i = 0; i < kBurst && !ec; ++i) {
                ws.write(net::buffer("frame-" + std::to_string(i)), ec);
            }
            boost::beast::flat_buffer in;
            while (!ec) {
                ws.read(in, ec);
                if (!ec) {
                    firstClientMessage.set_value(boost::beast::buffers_to_string(in.data()));
                    break;
                }
            }
            // Drain until the client closes.
            while (!ec) {
                in.clear();
                ws.read(in, ec);
            }
            return;
        }
        bool first = true;
        for (;;) {
            boost::beast::flat_buffer buffer;
            ws.read(buffer, ec);
            if (ec) {
                return;
            }
            if (mode == Mode::TextThenEcho && first) {
                ws.text(true);
                ws.write(net::buffer(std::string("not for the byte stream")), ec);
            }
            ws.binary(true);
            ws.write(buffer.data(), ec);
            if (ec) {
                return;
            }
            first = false;
            if (mode == Mode::CloseAfterFirst) {
                ws.close(websocket::close_code::normal, ec);
                boost::beast::flat_buffer drain;
                while (!ec) {
                    ws.read(drain, ec);
                }
                return;
            }
        }
    }
};

ConnectOptions quickOptions() {
    ConnectOptions opts;
    opts.openTimeoutMs = 5000;
    opts.transportConfig = "connectTimeoutMs=2000;handshakeTimeoutMs=2000";
    return opts;
}

template <typename Awaitable>
net::awaitable<void> expectConnectError(Awaitable op, errc expected) {
    try {
        co_await std::move(op);
        ADD_FAILURE() << "connect unexpectedly succeeded";
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(expected)) << e.what();
    }
}

} // namespace

TEST(WebSocketTransport, ReadUntilOverEchoServer) {
    MiniServer srv(MiniServer::Mode::Echo);
    RunCoroutine([&srv]() -> net::awaitable<void> {
        auto conn = co_await Connection::Connect(srv.address(), quickOptions());
        EXPECT_EQ(conn.State(), TransportState::Open);
        auto [reader, writer] = std::move(conn).Split();

        const std::string request = "[1,2,3]";
        const std::size_t n = co_await net::async_write(writer, net::buffer(request), net::use_awaitable);
        EXPECT_EQ(n, request.size());

        std::string line;
        const std::size_t upto =
            co_await net::async_read_until(reader, net::dynamic_buffer(line), ']', net::use_awaitable);
        EXPECT_EQ(upto, request.size());
        EXPECT_EQ(line.substr(0, upto), request);
        co_await writer.async_close(net::use_awaitable);
    });
    EXPECT_EQ(srv.userAgent.get_future().get(), "wsio/" + getVersionString());
}

TEST(WebSocketTransport, WritesReachServerWhileReaderIsBehind) {
    MiniServer srv(MiniServer::Mode::BurstThenRead);
    auto received = srv.firstClientMessage.get_future();
    RunCoroutine([&srv, &received]() -> net::awaitable<void> {
        auto opts = quickOptions();
        opts.queueCapacity = 1;
        auto conn = co_await Connection::Connect(srv.address(), opts);
        auto [reader, writer] = std::move(conn).Split();

        // Let the burst fill the queue before anything is read.
        net::steady_timer timer(co_await net::this_coro::executor);
        timer.expires_after(std::chrono::milliseconds(100));
        co_await timer.async_wait(net::use_awaitable);

        co_await net::async_write(writer, net::buffer(std::string("hello")), net::use_awaitable);
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (received.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready &&
               std::chrono::steady_clock::now() < deadline) {
            timer.expires_after(std::chrono::milliseconds(10));
            co_await timer.async_wait(net::use_awaitable);
        }
        EXPECT_EQ(received.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);

        char buf[32];
        for (int i = 0; i < MiniServer::kBurst; ++i) {
            const std::size_t got = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
            EXPECT_EQ(std::string(buf, got), "frame-" + std::to_string(i));
        }
    });
    ASSERT_EQ(received.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(received.get(), "hello");
}

TEST(WebSocketTransport, EachMessageArrivesAsItsOwnChunk) {
    MiniServer srv(MiniServer::Mode::Echo);
    RunCoroutine([&srv]() -> net::awaitable<void> {
        auto conn = co_await Connection::Connect(srv.address(), quickOptions());
        auto [reader, writer] = std::move(conn).Split();

        char buf[64];
        for (const std::string msg : {"alpha", "be", "gamma!"}) {
            co_await net::async_write(writer, net::buffer(msg), net::use_awaitable);
            const std::size_t got = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
            EXPECT_EQ(std::string(buf, got), msg);
        }
    });
}

TEST(WebSocketTransport, ServerCloseEndsStreamAfterData) {
    MiniServer srv(MiniServer::Mode::CloseAfterFirst);
    RunCoroutine([&srv]() -> net::awaitable<void> {
        auto conn = co_await Connection::Connect(srv.address(), quickOptions());
        auto [reader, writer] = std::move(conn).Split();
        co_await net::async_write(writer, net::buffer(std::string("bye")), net::use_awaitable);

        char buf[16];
        const std::size_t got = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        EXPECT_EQ(std::string(buf, got), "bye");

        boost::system::error_code ec;
        (void)co_await reader.async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
        EXPECT_EQ(ec, net::error::eof);
    });
}

TEST(WebSocketTransport, TextFramesAreNotPartOfTheStream) {
    MiniServer srv(MiniServer::Mode::TextThenEcho);
    RunCoroutine([&srv]() -> net::awaitable<void> {
        auto conn = co_await Connection::Connect(srv.address(), quickOptions());
        auto [reader, writer] = std::move(conn).Split();
        co_await net::async_write(writer, net::buffer(std::string("bin")), net::use_awaitable);

        char buf[64];
        const std::size_t got = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        EXPECT_EQ(std::string(buf, got), "bin");
    });
}

TEST(WebSocketTransport, RefusedConnectionFails) {
    unsigned short port = 0;
    {
        net::io_context io;
        tcp::acceptor scratch{io, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}};
        port = scratch.local_endpoint().port();
    }
    RunCoroutine([port]() -> net::awaitable<void> {
        co_await expectConnectError(Connection::Connect("127.0.0.1:" + std::to_string(port), quickOptions()),
                                    errc::connection_failed);
    });
}

TEST(WebSocketTransport, TlsAgainstPlainServerFails) {
    MiniServer srv(MiniServer::Mode::Echo);
    RunCoroutine([&srv]() -> net::awaitable<void> {
        co_await expectConnectError(Connection::ConnectSecure(srv.address(), quickOptions()),
                                    errc::connection_failed);
    });
}

TEST(WebSocketTransport, OpenRejectsBadUrls) {
    WebSocketTransport::Options opts;
    EXPECT_EQ(WebSocketTransport(opts).Open("http://127.0.0.1:80/"), make_error_code(errc::invalid_url));
    EXPECT_EQ(WebSocketTransport(opts).Open("ws://:80"), make_error_code(errc::invalid_url));
    EXPECT_EQ(WebSocketTransport(opts).Open("ws://localhost:0"), make_error_code(errc::invalid_url));
    EXPECT_EQ(WebSocketTransport(opts).Open("ws://localhost:70000"), make_error_code(errc::invalid_url));
}

TEST(WebSocketTransport, SendBeforeOpenIsNotOpen) {
    WebSocketTransport t(WebSocketTransport::Options{});
    const std::uint8_t b[] = {1, 2, 3};
    EXPECT_EQ(t.Send(b, sizeof(b)), make_error_code(errc::not_open));
    EXPECT_EQ(t.State(), TransportState::Connecting);
    t.Close();
    t.Close();
}

TEST(WebSocketTransportFactory, ParsesOptions) {
    const auto opts = WebSocketTransportFactory::ParseOptions(
        "serverName=example.org; caFile=/etc/ca.pem; caPath=/etc/certs; connectTimeoutMs=1500;"
        "handshakeTimeoutMs=abc; userAgent=tester; other=1");
    EXPECT_EQ(opts.serverName, "example.org");
    EXPECT_EQ(opts.caFile, "/etc/ca.pem");
    EXPECT_EQ(opts.caPath, "/etc/certs");
    EXPECT_EQ(opts.connectTimeoutMs, 1500u);
    EXPECT_EQ(opts.handshakeTimeoutMs, 10000u);
    EXPECT_EQ(opts.userAgent, "tester");

    WebSocketTransportFactory factory;
    EXPECT_TRUE(factory.CreateTransport("") != nullptr);
}
