//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.cpp
// Purpose: Transport bootstrap sequence (sink registration, open, readiness wait) and split
//==========================================================================================================

#include <chrono>
#include <stdexcept>
#include <utility>

#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

#include "logging/Logger.h"
#include "wsio/Connection.hpp"
#include "wsio/PayloadSequencer.hpp"
#include "wsio/ReadinessSignal.hpp"
#include "wsio/WebSocketTransport.hpp"
#include "wsio/errors/Errors.h"

namespace wsio {
namespace net = boost::asio;

namespace {

// Errors raised before open are reported as connection errors; keep the transport's code when it is one.
boost::system::error_code connectionErrorFrom(const boost::system::error_code& ec) {
    if (errors::errorKindFromCode(ec) == errors::ErrorKind::Connection) {
        return ec;
    }
    return make_error_code(errc::connection_failed);
}

} // namespace

Connection::Connection(executor_type ex, std::shared_ptr<InboundBridge> bridge, std::shared_ptr<TransportLease> lease)
    : ex_(std::move(ex)), bridge_(std::move(bridge)), lease_(std::move(lease)) {}

Connection::~Connection() {
    release();
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        release();
        ex_ = std::move(other.ex_);
        bridge_ = std::move(other.bridge_);
        lease_ = std::move(other.lease_);
    }
    return *this;
}

void Connection::release() {
    if (bridge_) {
        bridge_->Shutdown();
        bridge_.reset();
    }
    lease_.reset();
}

net::awaitable<Connection> Connection::Connect(std::string address, ConnectOptions options) {
    WebSocketTransportFactory factory;
    co_return co_await Open("ws://" + address, factory, std::move(options));
}

net::awaitable<Connection> Connection::ConnectSecure(std::string address, ConnectOptions options) {
    WebSocketTransportFactory factory;
    co_return co_await Open("wss://" + address, factory, std::move(options));
}

net::awaitable<Connection> Connection::Open(std::string url, ITransportFactory& factory, ConnectOptions options) {
    auto transport = factory.CreateTransport(options.transportConfig);
    co_return co_await Open(std::move(url), std::move(transport), std::move(options));
}

net::awaitable<Connection> Connection::Open(std::string url, std::unique_ptr<IMessageTransport> transport,
                                            ConnectOptions options) {
    FUNC_SCOPE();
    if (!transport) {
        throw boost::system::system_error(make_error_code(errc::connection_failed), "no transport for " + url);
    }
    auto ex = co_await net::this_coro::executor;

    auto queue = std::make_shared<ChunkQueue>(options.queueCapacity, options.overflowPolicy);
    auto sequencer = std::make_shared<PayloadSequencer>(queue);
    auto bridge = std::make_shared<InboundBridge>(queue);
    auto ready = std::make_shared<ReadinessSignal>();

    transport->SetMessageHandler([sequencer](IncomingMessage message) { sequencer->Submit(std::move(message)); });

    transport->SetErrorHandler([ready, sequencer, url](const boost::system::error_code& ec, const std::string& what) {
        if (ready->Fail(connectionErrorFrom(ec))) {
            LOG_ERROR("Connection: {} failed before open: {} ({})", url, what, ec.message());
            return;
        }
        if (ready->GetState() == ReadinessSignal::State::Fired) {
            LOG_ERROR("Connection: transport error on {}: {} ({})", url, what, ec.message());
            sequencer->Finish(make_error_code(errc::transport_error));
        }
    });

    transport->SetCloseHandler([ready, sequencer, url]() {
        if (ready->Fail(make_error_code(errc::connection_closed_before_open))) {
            LOG_WARN("Connection: {} closed before open", url);
            return;
        }
        if (ready->GetState() == ReadinessSignal::State::Fired) {
            LOG_INFO("Connection: {} closed by peer", url);
            sequencer->Finish({});
        }
    });

    transport->SetOpenHandler([ready, url]() {
        if (ready->Set()) {
            LOG_INFO("Connection: {} open", url);
        }
    });

    LOG_INFO("Connection: opening {} (queueCapacity={}, overflow={}, openTimeoutMs={})", url, queue->Capacity(),
             OverflowPolicyString(queue->Policy()), options.openTimeoutMs);

    auto ec = transport->Open(url);
    if (ec) {
        ready->Fail(ec);
    } else {
        ec = co_await ready->Wait(std::chrono::milliseconds(options.openTimeoutMs));
    }
    if (ec) {
        ec = connectionErrorFrom(ec);
        try {
            transport->Close();
        } catch (const std::exception& e) {
            LOG_WARN("Connection: close after failed open reported: {}", e.what());
        }
        throw boost::system::system_error(ec, "connect " + url);
    }

    auto lease = std::make_shared<TransportLease>(std::move(transport));
    co_return Connection(ex, std::move(bridge), std::move(lease));
}

std::pair<ReadHalf, WriteHalf> Connection::Split() && {
    if (!lease_) {
        throw std::logic_error("Connection::Split on a moved-from connection");
    }
    std::pair<ReadHalf, WriteHalf> halves{ReadHalf(ex_, std::move(bridge_), lease_), WriteHalf(ex_, lease_)};
    lease_.reset();
    return halves;
}

std::string Connection::SessionId() const {
    return lease_ ? lease_->Transport().GetSessionId() : std::string();
}

TransportState Connection::State() const {
    return lease_ ? lease_->Transport().State() : TransportState::Closed;
}

} // namespace wsio
