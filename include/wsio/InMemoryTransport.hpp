//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process message transport pair for tests and embedding
//==========================================================================================================
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "wsio/Transport.h"

namespace wsio {

//==========================================================================================================
// InMemoryTransport
// Purpose: One endpoint of a connected pair. Messages sent on one endpoint are delivered, in order, to the
//          other endpoint's message handler on that endpoint's delivery thread. All handlers of an endpoint
//          run on its delivery thread.
//==========================================================================================================
class InMemoryTransport : public IMessageTransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   frameSize: 0 keeps message boundaries; otherwise every send is re-chunked into messages of at most
    //              frameSize bytes.
    //   deferredPayloads: Deliver payloads as deferred decodes that finish on other threads after a short
    //                     random delay, so they may complete out of order.
    //==========================================================================================================
    struct Options {
        std::size_t frameSize{0};
        bool deferredPayloads{false};
    };

    explicit InMemoryTransport() : InMemoryTransport(Options()) {}
    explicit InMemoryTransport(const Options& opts);
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two endpoints wired to each other.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair() {
        return CreatePair(Options());
    }
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair(
        const Options& opts);

    ////////////////////////////////////////// IMessageTransport //////////////////////////////////////////
    // Succeeds (open event) while the peer exists and is not closed; otherwise an error event with
    // errc::connection_failed. The url is only logged.
    boost::system::error_code Open(const std::string& url) override;

    // Closes both endpoints: the peer sees a close event, and so does this endpoint after pending deliveries.
    void Close() override;

    TransportState State() const override;
    std::string GetSessionId() const override;
    boost::system::error_code Send(const std::uint8_t* data, std::size_t len) override;

    void SetOpenHandler(OpenHandler handler) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    // Raises an error event (followed by a close event) on the peer.
    void InjectError(const std::string& message);

    // Delivers a text message to the peer.
    boost::system::error_code SendText(const std::string& text);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

//==========================================================================================================
// InMemoryTransportFactory
// Purpose: Creates connected pairs from "frameSize=..;deferredPayloads=1". The client endpoint is returned;
//          the server endpoint is handed to the accept callback before that.
//==========================================================================================================
class InMemoryTransportFactory : public ITransportFactory {
public:
    using AcceptHandler = std::function<void(std::unique_ptr<InMemoryTransport>)>;

    explicit InMemoryTransportFactory(AcceptHandler onAccept);

    std::unique_ptr<IMessageTransport> CreateTransport(const std::string& config) override;

    static InMemoryTransport::Options ParseOptions(const std::string& config);

private:
    AcceptHandler onAccept_;
};

} // namespace wsio
