//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection.cpp
// Purpose: Connection bootstrap (open, timeout, early failure) and split halves over in-memory transports
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/system/system_error.hpp>

#include "wsio/Connection.hpp"
#include "wsio/InMemoryTransport.hpp"
#include "wsio/errors/Errors.h"
#include "support/TestSupport.hpp"

using namespace wsio;
using wsio::test::B;
using wsio::test::RunCoroutine;
using wsio::test::ScriptedTransport;
namespace net = boost::asio;

namespace {

ConnectOptions quickOptions(unsigned int timeoutMs = 2000) {
    ConnectOptions opts;
    opts.openTimeoutMs = timeoutMs;
    return opts;
}

// Opens the server end of a pair and echoes every binary message back.
struct EchoPeer {
    std::unique_ptr<InMemoryTransport> transport;

    explicit EchoPeer(std::unique_ptr<InMemoryTransport> t) : transport(std::move(t)) {
        auto* self = transport.get();
        transport->SetMessageHandler([self](IncomingMessage msg) {
            Bytes bytes = msg.payload.Take();
            (void)self->Send(bytes.data(), bytes.size());
        });
        (void)transport->Open("memory://server");
    }
};

// Opens a peer endpoint and waits for its open event so it can send right away.
void openPeer(InMemoryTransport& t) {
    ASSERT_FALSE(t.Open("memory://server"));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (t.State() != TransportState::Open && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_EQ(t.State(), TransportState::Open);
}

// Expects the awaited operation to throw system_error with the given code.
template <typename Awaitable>
net::awaitable<void> expectConnectError(Awaitable op, errc expected) {
    try {
        co_await std::move(op);
        ADD_FAILURE() << "connect unexpectedly succeeded";
    } catch (const boost::system::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(expected)) << e.what();
        EXPECT_EQ(errors::errorKindFromCode(e.code()), errors::ErrorKind::Connection);
    }
}

} // namespace

TEST(Connection, OpenSucceedsWhenTransportReportsOpen) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto t = std::make_unique<ScriptedTransport>();
        auto* raw = t.get();
        auto conn = co_await Connection::Open("ws://example.test/", std::move(t), quickOptions());
        EXPECT_EQ(raw->Url(), "ws://example.test/");
        EXPECT_EQ(conn.State(), TransportState::Open);
        EXPECT_EQ(conn.SessionId(), "scripted");
    });
}

TEST(Connection, TimesOutWithoutOpenEvent) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto t = std::make_unique<ScriptedTransport>(ScriptedTransport::OnOpen::Nothing);
        co_await expectConnectError(Connection::Open("ws://example.test/", std::move(t), quickOptions(50)),
                                    errc::connect_timeout);
    });
}

TEST(Connection, ErrorBeforeOpenFailsImmediately) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto t = std::make_unique<ScriptedTransport>(ScriptedTransport::OnOpen::Error);
        const auto start = std::chrono::steady_clock::now();
        co_await expectConnectError(Connection::Open("ws://example.test/", std::move(t), quickOptions(5000)),
                                    errc::connection_failed);
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(2000));
    });
}

TEST(Connection, CloseBeforeOpenFailsImmediately) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto t = std::make_unique<ScriptedTransport>(ScriptedTransport::OnOpen::Close);
        co_await expectConnectError(Connection::Open("ws://example.test/", std::move(t), quickOptions(5000)),
                                    errc::connection_closed_before_open);
    });
}

TEST(Connection, ImmediateOpenFailureClosesTransport) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto t = std::make_unique<ScriptedTransport>();
        t->openResult = make_error_code(errc::invalid_url);
        co_await expectConnectError(Connection::Open("nope", std::move(t), quickOptions()), errc::invalid_url);
    });
}

TEST(Connection, ConnectRejectsMalformedAddress) {
    RunCoroutine([]() -> net::awaitable<void> {
        co_await expectConnectError(Connection::Connect("", quickOptions()), errc::invalid_url);
        co_await expectConnectError(Connection::ConnectSecure("host:notaport", quickOptions()), errc::invalid_url);
    });
}

TEST(Connection, OpenFailsWhenPeerIsGone) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto [client, server] = InMemoryTransport::CreatePair();
        server.reset();
        co_await expectConnectError(Connection::Open("memory://client", std::move(client), quickOptions()),
                                    errc::connection_failed);
    });
}

// Three delimited records come back intact through an echo peer that re-chunks every message.
TEST(Connection, ReadUntilScenarioOverRechunkingTransport) {
    std::unique_ptr<EchoPeer> peer;
    InMemoryTransportFactory factory([&](std::unique_ptr<InMemoryTransport> server) {
        peer = std::make_unique<EchoPeer>(std::move(server));
    });
    RunCoroutine([&]() -> net::awaitable<void> {
        auto opts = ConnectOptions::FromConfig("openTimeoutMs=2000;frameSize=2;deferredPayloads=1");
        EXPECT_EQ(opts.transportConfig, "frameSize=2;deferredPayloads=1");
        auto conn = co_await Connection::Open("memory://echo", factory, opts);
        auto [reader, writer] = std::move(conn).Split();

        const std::vector<Bytes> records{B({0, 1, 2, 3, 93}), B({42, 34, 93}), B({0, 0, 1, 2, 93})};
        for (const auto& r : records) {
            co_await net::async_write(writer, net::buffer(r), net::use_awaitable);
        }

        std::vector<std::uint8_t> buf;
        for (const auto& expected : records) {
            std::size_t n = co_await net::async_read_until(reader, net::dynamic_buffer(buf), static_cast<char>(93),
                                                           net::use_awaitable);
            EXPECT_EQ(Bytes(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n)), expected);
            buf.erase(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
        }
        co_await writer.async_close(net::use_awaitable);
    });
}

// With boundaries preserved, each read into a large buffer returns exactly one message.
TEST(Connection, ReadScenarioPreservesMessageBoundaries) {
    std::unique_ptr<EchoPeer> peer;
    InMemoryTransportFactory factory([&](std::unique_ptr<InMemoryTransport> server) {
        peer = std::make_unique<EchoPeer>(std::move(server));
    });
    RunCoroutine([&]() -> net::awaitable<void> {
        auto conn = co_await Connection::Open("memory://echo", factory, quickOptions());
        auto [reader, writer] = std::move(conn).Split();

        const std::vector<Bytes> messages{B({0, 1, 2, 3}), B({42, 34}), B({0, 0, 1, 2})};
        for (const auto& m : messages) {
            co_await net::async_write(writer, net::buffer(m), net::use_awaitable);
        }
        co_await writer.async_flush(net::use_awaitable);

        std::vector<std::uint8_t> buf(1024);
        for (const auto& expected : messages) {
            std::size_t n = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
            EXPECT_EQ(Bytes(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n)), expected);
        }
    });
}

TEST(Connection, PeerCloseIsEndOfStreamAfterData) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto [client, server] = InMemoryTransport::CreatePair();
        auto* srv = server.get();
        openPeer(*srv);
        auto conn = co_await Connection::Open("memory://client", std::move(client), quickOptions());
        auto [reader, writer] = std::move(conn).Split();

        const Bytes payload = B({1, 2, 3});
        EXPECT_FALSE(srv->Send(payload.data(), payload.size()));
        srv->Close();

        std::vector<std::uint8_t> buf(8);
        std::size_t n = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        EXPECT_EQ(n, 3u);
        boost::system::error_code ec;
        n = co_await reader.async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
        EXPECT_EQ(ec, net::error::eof);
        EXPECT_EQ(n, 0u);
    });
}

TEST(Connection, TransportErrorSurfacesAfterBufferedData) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto [client, server] = InMemoryTransport::CreatePair();
        auto* srv = server.get();
        openPeer(*srv);
        auto conn = co_await Connection::Open("memory://client", std::move(client), quickOptions());
        auto [reader, writer] = std::move(conn).Split();

        const Bytes payload = B({9, 8});
        EXPECT_FALSE(srv->Send(payload.data(), payload.size()));
        srv->InjectError("link reset");

        std::vector<std::uint8_t> buf(8);
        std::size_t n = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        EXPECT_EQ(n, 2u);
        boost::system::error_code ec;
        co_await reader.async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
        EXPECT_EQ(ec, make_error_code(errc::transport_error));
        EXPECT_EQ(errors::errorKindFromCode(ec), errors::ErrorKind::Transport);
    });
}

TEST(Connection, TextMessagesAreIgnored) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto [client, server] = InMemoryTransport::CreatePair();
        auto* srv = server.get();
        openPeer(*srv);
        auto conn = co_await Connection::Open("memory://client", std::move(client), quickOptions());
        auto [reader, writer] = std::move(conn).Split();

        EXPECT_FALSE(srv->SendText("hello"));
        const Bytes payload = B({4});
        EXPECT_FALSE(srv->Send(payload.data(), payload.size()));

        std::vector<std::uint8_t> buf(8);
        std::size_t n = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        EXPECT_EQ(n, 1u);
        EXPECT_EQ(buf[0], 4);
    });
}

TEST(Connection, LastHalfClosesTransport) {
    auto [client, server] = InMemoryTransport::CreatePair();
    auto* srv = server.get();
    std::atomic<bool> serverSawClose{false};
    srv->SetCloseHandler([&]() { serverSawClose = true; });
    openPeer(*srv);

    RunCoroutine([&, c = std::move(client)]() mutable -> net::awaitable<void> {
        auto conn = co_await Connection::Open("memory://client", std::move(c), quickOptions());
        auto halves = std::move(conn).Split();
        {
            ReadHalf reader = std::move(halves.first);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        EXPECT_FALSE(serverSawClose.load());

        const Bytes payload = B({1});
        std::size_t n = co_await net::async_write(halves.second, net::buffer(payload), net::use_awaitable);
        EXPECT_EQ(n, 1u);
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!serverSawClose.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(serverSawClose.load());
}

TEST(Connection, WriteAfterCloseIsNotOpen) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto t = std::make_unique<ScriptedTransport>();
        auto conn = co_await Connection::Open("ws://example.test/", std::move(t), quickOptions());
        auto [reader, writer] = std::move(conn).Split();
        co_await writer.async_close(net::use_awaitable);

        const Bytes payload = B({1});
        boost::system::error_code ec;
        std::size_t n = co_await writer.async_write_some(net::buffer(payload),
                                                          net::redirect_error(net::use_awaitable, ec));
        EXPECT_EQ(ec, make_error_code(errc::not_open));
        EXPECT_EQ(n, 0u);
    });
}

TEST(Connection, DropNewestPolicyIsApplied) {
    RunCoroutine([]() -> net::awaitable<void> {
        auto t = std::make_unique<ScriptedTransport>();
        auto* raw = t.get();
        auto opts = ConnectOptions::FromConfig("queueCapacity=2;overflow=drop-newest");
        auto conn = co_await Connection::Open("ws://example.test/", std::move(t), opts);
        auto [reader, writer] = std::move(conn).Split();

        raw->FireMessage(B({1}));
        raw->FireMessage(B({2}));
        raw->FireMessage(B({3}));
        EXPECT_EQ(reader.dropped_chunks(), 1u);

        std::vector<std::uint8_t> buf(8);
        co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        EXPECT_EQ(buf[0], 1);
        co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        EXPECT_EQ(buf[0], 2);
    });
}

TEST(Connection, DeferredPayloadsStayWithinBlockingCapacity) {
    RunCoroutine([]() -> net::awaitable<void> {
        InMemoryTransport::Options topts;
        topts.deferredPayloads = true;
        auto [client, server] = InMemoryTransport::CreatePair(topts);
        auto* srv = server.get();
        openPeer(*srv);
        auto opts = quickOptions();
        opts.queueCapacity = 2;
        auto conn = co_await Connection::Open("memory://client", std::move(client), opts);
        auto [reader, writer] = std::move(conn).Split();

        constexpr int kMessages = 12;
        for (int i = 0; i < kMessages; ++i) {
            const Bytes m{static_cast<std::uint8_t>(i), static_cast<std::uint8_t>(i)};
            EXPECT_FALSE(srv->Send(m.data(), m.size()));
        }
        // Everything is sent before the first read; the client holds back instead of buffering it all.
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        std::vector<std::uint8_t> buf(8);
        for (int i = 0; i < kMessages; ++i) {
            std::size_t n = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
            EXPECT_EQ(n, 2u);
            EXPECT_EQ(buf[0], static_cast<std::uint8_t>(i));
        }
        EXPECT_EQ(reader.dropped_chunks(), 0u);
    });
}
