//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Reads and writes a WebSocket connection as a byte stream (run echo_server first)
//==========================================================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "wsio/Connection.hpp"
#include "wsio/errors/Errors.h"
#include "wsio/version.h"

namespace net = boost::asio;

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

static std::string toString(const std::uint8_t* data, std::size_t n) {
    std::string s = "[";
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) { s += ", "; }
        s += std::to_string(data[i]);
    }
    return s + "]";
}

// Delimited reads: each read_until returns one 93-terminated record regardless of transport chunking.
static net::awaitable<void> runReadUntil(const std::string& address) {
    auto conn = co_await wsio::Connection::Connect(address);
    auto [reader, writer] = std::move(conn).Split();

    {
        std::vector<std::uint8_t> msg1{0, 1, 2, 3, 93};
        co_await net::async_write(writer, net::buffer(msg1), net::use_awaitable);
    }
    {
        std::vector<std::uint8_t> msg2{42, 34, 93};
        co_await net::async_write(writer, net::buffer(msg2), net::use_awaitable);
    }
    {
        std::vector<std::uint8_t> msg3{0, 0, 1, 2, 93};
        co_await net::async_write(writer, net::buffer(msg3), net::use_awaitable);
    }

    std::vector<std::uint8_t> buf;
    for (int i = 0; i < 3; ++i) {
        const std::size_t n = co_await net::async_read_until(reader, net::dynamic_buffer(buf), static_cast<char>(93),
                                                             net::use_awaitable);
        LOG_INFO("read_until: {}", toString(buf.data(), n));
        buf.erase(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
    }
    co_await writer.async_close(net::use_awaitable);
}

// Plain reads into a large buffer: one echoed message per read.
static net::awaitable<void> runRead(const std::string& address) {
    auto conn = co_await wsio::Connection::Connect(address);
    auto [reader, writer] = std::move(conn).Split();

    {
        std::vector<std::uint8_t> msg1{0, 1, 2, 3};
        co_await net::async_write(writer, net::buffer(msg1), net::use_awaitable);
    }
    {
        std::vector<std::uint8_t> msg2{42, 34};
        co_await net::async_write(writer, net::buffer(msg2), net::use_awaitable);
    }
    {
        std::vector<std::uint8_t> msg3{0, 0, 1, 2};
        co_await net::async_write(writer, net::buffer(msg3), net::use_awaitable);
    }
    co_await writer.async_flush(net::use_awaitable);

    std::vector<std::uint8_t> buf(1024);
    for (int i = 0; i < 3; ++i) {
        const std::size_t n = co_await reader.async_read_some(net::buffer(buf), net::use_awaitable);
        LOG_INFO("read: {}", toString(buf.data(), n));
    }
    co_await writer.async_close(net::use_awaitable);
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();
    const std::string address = getArgValue(argc, argv, "--address").value_or("localhost:8000");
    LOG_INFO("wsio {} read_write against ws://{}", wsio::getVersionString(), address);

    net::io_context ioc;
    int rc = 0;
    net::co_spawn(ioc, [&]() -> net::awaitable<void> {
        LOG_INFO("async_read_until:");
        co_await runReadUntil(address);
        LOG_INFO("async_read_some:");
        co_await runRead(address);
    }, [&](std::exception_ptr ep) {
        if (!ep) {
            return;
        }
        try {
            std::rethrow_exception(ep);
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("read_write failed: {} ({})", e.what(), wsio::errors::errorKindName(wsio::errors::errorKindFromCode(e.code())));
        } catch (const std::exception& e) {
            LOG_ERROR("read_write failed: {}", e.what());
        }
        rc = 1;
    });
    ioc.run();
    return rc;
}
