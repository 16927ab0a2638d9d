//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Message transport interfaces consumed by the byte-stream bridge (open/message/error/close events)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/system/error_code.hpp>

namespace wsio {

using Bytes = std::vector<std::uint8_t>;

enum class MessageType {
    Binary,
    Text
};

enum class TransportState {
    Connecting,
    Open,
    Closing,
    Closed
};

inline const char* TransportStateString(TransportState s) {
    switch (s) {
        case TransportState::Connecting: return "connecting";
        case TransportState::Open: return "open";
        case TransportState::Closing: return "closing";
        case TransportState::Closed: return "closed";
        default: return "unknown";
    }
}

//==========================================================================================================
// Payload
// Purpose: Bytes carried by one message event. Either available immediately or produced by a decode step
//          that finishes later (e.g. a transport that hands out an opaque blob first).
//==========================================================================================================
class Payload {
public:
    static Payload Ready(Bytes bytes) {
        Payload p;
        p.ready_ = std::move(bytes);
        return p;
    }

    static Payload Deferred(std::future<Bytes> decode) {
        Payload p;
        p.deferred_ = std::move(decode);
        return p;
    }

    bool IsReady() const { return ready_.has_value(); }

    //==========================================================================================================
    // Take
    // Purpose: Moves the bytes out. For deferred payloads this waits for the decode and rethrows its failure.
    //==========================================================================================================
    Bytes Take() {
        if (ready_) {
            Bytes out = std::move(*ready_);
            ready_.reset();
            return out;
        }
        if (deferred_.valid()) {
            return deferred_.get();
        }
        return Bytes{};
    }

private:
    Payload() = default;

    std::optional<Bytes> ready_;
    std::future<Bytes> deferred_;
};

struct IncomingMessage {
    MessageType type{MessageType::Binary};
    Payload payload{Payload::Ready({})};
};

//==========================================================================================================
// IMessageTransport
// Purpose: Event-driven, message-oriented connection. Handlers run on a thread owned by the transport and
//          are never invoked concurrently with each other for one transport instance.
//==========================================================================================================
class IMessageTransport {
public:
    virtual ~IMessageTransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Begins connecting to url. Completion is reported through the open handler (success) or the error
    // handler (failure).
    // Args:
    //   url: Transport URL, e.g. "ws://localhost:8000/".
    // Returns:
    //   A failed error_code only when the attempt cannot even start (malformed url, already opened).
    //==========================================================================================================
    virtual boost::system::error_code Open(const std::string& url) = 0;

    //==========================================================================================================
    // Initiates teardown. Idempotent; errors raised while closing are not reported to the caller.
    //==========================================================================================================
    virtual void Close() = 0;

    virtual TransportState State() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Hands one message to the transport. Does not wait for the bytes to reach the network.
    // Args:
    //   data/len: Message bytes, copied before return.
    // Returns:
    //   errc::not_open when the transport is connecting or closed; success otherwise.
    //==========================================================================================================
    virtual boost::system::error_code Send(const std::uint8_t* data, std::size_t len) = 0;

    /////////////////////////////////////////// Event registration ///////////////////////////////////////////
    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(IncomingMessage)>;
    using ErrorHandler = std::function<void(const boost::system::error_code& ec, const std::string& what)>;
    using CloseHandler = std::function<void()>;

    // Handlers must be registered before Open().
    virtual void SetOpenHandler(OpenHandler handler) = 0;
    virtual void SetMessageHandler(MessageHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - wsio/WebSocketTransport.hpp
//  - wsio/InMemoryTransport.hpp

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific "key=value;key=value" configuration string. May be empty.
    // Returns:
    //   A unique_ptr to a newly created, not yet opened IMessageTransport.
    //==========================================================================================================
    virtual std::unique_ptr<IMessageTransport> CreateTransport(const std::string& config) = 0;
};

} // namespace wsio
