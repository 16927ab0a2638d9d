//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.hpp
// Purpose: Connection bootstrap: open a message transport and expose it as a splittable byte stream
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "wsio/ConnectOptions.hpp"
#include "wsio/InboundBridge.hpp"
#include "wsio/ReadHalf.hpp"
#include "wsio/Transport.h"
#include "wsio/TransportLease.hpp"
#include "wsio/WriteHalf.hpp"

namespace wsio {

//==========================================================================================================
// Connection
// Purpose: An opened transport wired to an inbound chunk queue. Obtained from one of the Connect/Open
//          coroutines and turned into a reader and a writer with Split().
// Notes:
//   - The returned halves complete their operations on the executor of the coroutine that connected.
//   - Both halves share the transport; it is closed when the writer closes it or when the last half
//     (or an unsplit Connection) is destroyed.
//==========================================================================================================
class Connection {
public:
    using executor_type = boost::asio::any_io_executor;

    //==========================================================================================================
    // Connect
    // Purpose: Opens "ws://" + address with WebSocketTransport.
    // Args:
    //   address: host[:port][/path], e.g. "localhost:8000".
    //   options: Queue, overflow and open-timeout settings; transportConfig goes to the transport factory.
    // Returns:
    //   The open connection.
    // Throws:
    //   boost::system::system_error with a connection error code (errc::connection_failed,
    //   errc::connect_timeout, errc::connection_closed_before_open, errc::invalid_url).
    //==========================================================================================================
    static boost::asio::awaitable<Connection> Connect(std::string address,
                                                      ConnectOptions options = ConnectOptions::FromEnv());

    // Same as Connect() over "wss://" + address.
    static boost::asio::awaitable<Connection> ConnectSecure(std::string address,
                                                            ConnectOptions options = ConnectOptions::FromEnv());

    // General form: the factory builds the transport from options.transportConfig.
    static boost::asio::awaitable<Connection> Open(std::string url, ITransportFactory& factory,
                                                   ConnectOptions options = ConnectOptions::FromEnv());

    //==========================================================================================================
    // Open
    // Purpose: Registers the event sinks on a not yet opened transport, starts it, and suspends until it
    //          reports open, fails, closes, or options.openTimeoutMs elapses. The transport is closed on
    //          failure.
    //==========================================================================================================
    static boost::asio::awaitable<Connection> Open(std::string url, std::unique_ptr<IMessageTransport> transport,
                                                   ConnectOptions options = ConnectOptions::FromEnv());

    Connection(Connection&&) noexcept = default;
    Connection& operator=(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    // Consumes the connection.
    std::pair<ReadHalf, WriteHalf> Split() &&;

    executor_type get_executor() const noexcept { return ex_; }
    std::string SessionId() const;
    TransportState State() const;

private:
    Connection(executor_type ex, std::shared_ptr<InboundBridge> bridge, std::shared_ptr<TransportLease> lease);

    void release();

    executor_type ex_;
    std::shared_ptr<InboundBridge> bridge_;
    std::shared_ptr<TransportLease> lease_;
};

} // namespace wsio
