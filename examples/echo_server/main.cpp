//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: WebSocket echo server used by the read_write example (plain TCP, binary and text frames)
//==========================================================================================================

#include <csignal>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

//==========================================================================================================
// Parses --key=value command-line options.
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static net::awaitable<void> echoSession(tcp::socket socket) {
    const auto remote = socket.remote_endpoint();
    websocket::stream<beast::tcp_stream> ws(std::move(socket));
    try {
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        co_await ws.async_accept(net::use_awaitable);
        LOG_INFO("echo: session from {}:{}", remote.address().to_string(), remote.port());
        beast::flat_buffer buffer;
        for (;;) {
            buffer.clear();
            co_await ws.async_read(buffer, net::use_awaitable);
            ws.text(ws.got_text());
            LOG_DEBUG("echo: {} bytes", buffer.size());
            co_await ws.async_write(buffer.data(), net::use_awaitable);
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() == websocket::error::closed) {
            LOG_INFO("echo: session closed by peer");
        } else {
            LOG_WARN("echo: session ended: {}", e.code().message());
        }
    }
}

static net::awaitable<void> acceptLoop(tcp::acceptor& acceptor) {
    for (;;) {
        boost::system::error_code ec;
        tcp::socket socket = co_await acceptor.async_accept(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != net::error::operation_aborted) {
                LOG_ERROR("echo: accept failed: {}", ec.message());
            }
            co_return;
        }
        net::co_spawn(acceptor.get_executor(), echoSession(std::move(socket)), net::detached);
    }
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();

    std::uint16_t port = 8000;
    if (auto p = getArgValue(argc, argv, "--port")) {
        try {
            port = static_cast<std::uint16_t>(std::stoul(*p));
        } catch (const std::exception&) {
            LOG_ERROR("echo: invalid --port value '{}'", *p);
            return 1;
        }
    }
    const std::string address = getArgValue(argc, argv, "--address").value_or("127.0.0.1");

    try {
        net::io_context ioc;
        tcp::endpoint ep(net::ip::make_address(address), port);
        tcp::acceptor acceptor(ioc);
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            LOG_INFO("echo: shutting down");
            boost::system::error_code ignored;
            acceptor.close(ignored);
            ioc.stop();
        });

        LOG_INFO("echo: listening on ws://{}:{}", address, port);
        net::co_spawn(ioc, acceptLoop(acceptor), net::detached);
        ioc.run();
    } catch (const std::exception& e) {
        LOG_ERROR("echo: {}", e.what());
        return 1;
    }
    return 0;
}
