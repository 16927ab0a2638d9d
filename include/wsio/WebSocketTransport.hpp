//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.hpp
// Purpose: WebSocket (ws:// and wss://) client message transport using Boost.Beast coroutines
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "wsio/Transport.h"

namespace wsio {

//==========================================================================================================
// WebSocketTransport
// Purpose: IMessageTransport over a Beast websocket stream. Runs its own io_context on a dedicated thread and
//          invokes every handler, in event order, from a separate delivery thread.
// Notes:
//   - Open() accepts ws://host[:port][/path] (port 80) and wss://host[:port][/path] (port 443, TLS 1.3 only,
//     SNI and peer verification).
//   - Outgoing messages are binary frames sent in Send() call order.
//   - The next frame is read only after the message handler for the previous one returned, so a blocking
//     handler throttles the socket while sends and the close handshake proceed.
//==========================================================================================================
class WebSocketTransport : public IMessageTransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   serverName: TLS SNI and hostname verification name (defaults to the URL host)
    //   caFile/caPath: Optional CA bundle/path for the trust store; system defaults otherwise
    //   connectTimeoutMs: TCP connect timeout in milliseconds
    //   handshakeTimeoutMs: TLS plus WebSocket handshake timeout in milliseconds
    //   userAgent: User-Agent header of the upgrade request ("wsio/<version>" when empty)
    //==========================================================================================================
    struct Options {
        std::string serverName;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
        unsigned int handshakeTimeoutMs{10000};
        std::string userAgent;
    };

    explicit WebSocketTransport(const Options& opts);
    ~WebSocketTransport() override;

    ////////////////////////////////////////// IMessageTransport //////////////////////////////////////////
    boost::system::error_code Open(const std::string& url) override;
    void Close() override;
    TransportState State() const override;
    std::string GetSessionId() const override;
    boost::system::error_code Send(const std::uint8_t* data, std::size_t len) override;

    void SetOpenHandler(OpenHandler handler) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// WebSocketTransportFactory
// Purpose: Builds a WebSocketTransport from "serverName=..;caFile=..;caPath=..;connectTimeoutMs=..;
//          handshakeTimeoutMs=..;userAgent=..". Unknown keys are ignored.
//==========================================================================================================
class WebSocketTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<IMessageTransport> CreateTransport(const std::string& config) override;

    static WebSocketTransport::Options ParseOptions(const std::string& config);
};

} // namespace wsio
