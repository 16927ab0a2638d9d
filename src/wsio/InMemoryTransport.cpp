//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "wsio/InMemoryTransport.hpp"
#include "wsio/errors/Errors.h"
#include "KeyValueConfig.hpp"

namespace wsio {

class InMemoryTransport::Impl {
public:
    InMemoryTransport::Options opts;
    std::atomic<TransportState> state{TransportState::Connecting};
    std::atomic<bool> opened{false};
    std::atomic<bool> closeCalled{false};
    std::atomic<bool> closeNotified{false};
    std::string sessionId;
    IMessageTransport::OpenHandler openHandler;
    IMessageTransport::MessageHandler messageHandler;
    IMessageTransport::ErrorHandler errorHandler;
    IMessageTransport::CloseHandler closeHandler;
    std::weak_ptr<InMemoryTransport::Impl> peer;
    std::mutex peerMutex;
    std::queue<std::function<void()>> eventQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;
    std::unique_ptr<boost::asio::thread_pool> decodePool;

    explicit Impl(const InMemoryTransport::Options& o) : opts(o) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
        if (opts.deferredPayloads) {
            decodePool = std::make_unique<boost::asio::thread_pool>(1);
        }
        startProcessing();
    }

    ~Impl() {
        if (processingThread.joinable()) {
            processingThread.request_stop();
            { std::lock_guard<std::mutex> lock(queueMutex); }
            queueCondition.notify_all();
            processingThread.join();
        }
        // Pending decodes still complete so nobody waits on an abandoned promise.
        if (decodePool) {
            decodePool->join();
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            std::unique_lock<std::mutex> lock(queueMutex);
            while (!st.stop_requested()) {
                queueCondition.wait(lock, [this, &st]() { return !eventQueue.empty() || st.stop_requested(); });
                while (!eventQueue.empty() && !st.stop_requested()) {
                    auto event = std::move(eventQueue.front());
                    eventQueue.pop();
                    lock.unlock();
                    event();
                    lock.lock();
                }
            }
        });
    }

    void enqueue(std::function<void()> event) {
        std::lock_guard<std::mutex> lock(queueMutex);
        eventQueue.push(std::move(event));
        queueCondition.notify_one();
    }

    std::shared_ptr<Impl> livePeer() {
        std::lock_guard<std::mutex> lock(peerMutex);
        auto p = peer.lock();
        if (p && p->state.load() == TransportState::Closed) {
            return nullptr;
        }
        return p;
    }

    // ------------------------------------------------------------------------------------------------------
    // Delivery (own thread)
    // ------------------------------------------------------------------------------------------------------
    Payload makePayload(Bytes bytes) {
        if (!opts.deferredPayloads) {
            return Payload::Ready(std::move(bytes));
        }
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> jitter(0, 3);
        const auto delay = std::chrono::milliseconds(jitter(gen));
        std::promise<Bytes> decoded;
        auto future = decoded.get_future();
        boost::asio::post(*decodePool, [p = std::move(decoded), b = std::move(bytes), delay]() mutable {
            std::this_thread::sleep_for(delay);
            p.set_value(std::move(b));
        });
        return Payload::Deferred(std::move(future));
    }

    void deliverMessage(MessageType type, Bytes bytes) {
        if (state.load() == TransportState::Closed) {
            LOG_DEBUG("InMemoryTransport[{}]: message after close dropped", sessionId);
            return;
        }
        if (!messageHandler) {
            return;
        }
        IncomingMessage msg;
        msg.type = type;
        msg.payload = makePayload(std::move(bytes));
        messageHandler(std::move(msg));
    }

    void deliverClose() {
        const TransportState prev = state.exchange(TransportState::Closed);
        if (prev == TransportState::Connecting) {
            // The pending open event reports the failure.
            LOG_DEBUG("InMemoryTransport[{}]: closed before open", sessionId);
            return;
        }
        if (closeNotified.exchange(true)) {
            return;
        }
        LOG_INFO("InMemoryTransport[{}]: closed", sessionId);
        if (closeHandler) { closeHandler(); }
    }

    void deliverError(const boost::system::error_code& ec, const std::string& what) {
        if (state.load() == TransportState::Closed) {
            return;
        }
        LOG_ERROR("InMemoryTransport[{}]: {}", sessionId, what);
        if (errorHandler) { errorHandler(ec, what); }
        deliverClose();
    }

    void notifyPeerClosed() {
        if (auto p = livePeer()) {
            auto* target = p.get();
            p->enqueue([target]() { target->deliverClose(); });
        }
    }

    boost::system::error_code sendToPeer(MessageType type, const std::uint8_t* data, std::size_t len) {
        if (state.load() != TransportState::Open) {
            return make_error_code(errc::not_open);
        }
        auto p = livePeer();
        if (!p) {
            LOG_WARN("InMemoryTransport[{}]: peer not connected; dropping message", sessionId);
            return make_error_code(errc::send_failed);
        }
        const std::size_t frame = opts.frameSize == 0 ? std::max<std::size_t>(len, 1) : opts.frameSize;
        std::size_t offset = 0;
        do {
            const std::size_t n = std::min(frame, len - offset);
            Bytes chunk(data + offset, data + offset + n);
            auto* target = p.get();
            p->enqueue([target, type, c = std::move(chunk)]() mutable { target->deliverMessage(type, std::move(c)); });
            offset += n;
        } while (offset < len);
        LOG_DEBUG("InMemoryTransport[{}]: sent {} bytes", sessionId, len);
        return {};
    }
};

InMemoryTransport::InMemoryTransport(const Options& opts) : pImpl(std::make_shared<Impl>(opts)) { FUNC_SCOPE(); }
InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    // A vanished endpoint looks like a closed connection to its peer.
    if (!pImpl->closeCalled.exchange(true)) {
        pImpl->notifyPeerClosed();
    }
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair(
    const Options& opts) {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>(opts);
    auto transport2 = std::make_unique<InMemoryTransport>(opts);
    transport1->pImpl->peer = transport2->pImpl;
    transport2->pImpl->peer = transport1->pImpl;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

boost::system::error_code InMemoryTransport::Open(const std::string& url) {
    FUNC_SCOPE();
    if (pImpl->opened.exchange(true)) {
        return boost::asio::error::already_started;
    }
    LOG_INFO("Opening InMemoryTransport[{}] ({})", pImpl->sessionId, url);
    auto* impl = pImpl.get();
    pImpl->enqueue([impl]() {
        if (impl->state.load() == TransportState::Closing) {
            return;
        }
        TransportState expected = TransportState::Connecting;
        if (!impl->livePeer() || !impl->state.compare_exchange_strong(expected, TransportState::Open)) {
            impl->state = TransportState::Closed;
            LOG_ERROR("InMemoryTransport[{}]: peer unavailable", impl->sessionId);
            if (impl->errorHandler) { impl->errorHandler(make_error_code(errc::connection_failed), "peer unavailable"); }
            return;
        }
        if (impl->openHandler) { impl->openHandler(); }
    });
    return {};
}

void InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closeCalled.exchange(true)) {
        return;
    }
    LOG_INFO("Closing InMemoryTransport[{}]", pImpl->sessionId);
    const bool wasOpened = pImpl->opened.load();
    pImpl->notifyPeerClosed();
    if (!wasOpened) {
        pImpl->state = TransportState::Closed;
        return;
    }
    pImpl->state = TransportState::Closing;
    auto* impl = pImpl.get();
    pImpl->enqueue([impl]() { impl->deliverClose(); });
}

TransportState InMemoryTransport::State() const { return pImpl->state.load(); }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

boost::system::error_code InMemoryTransport::Send(const std::uint8_t* data, std::size_t len) {
    return pImpl->sendToPeer(MessageType::Binary, data, len);
}

boost::system::error_code InMemoryTransport::SendText(const std::string& text) {
    return pImpl->sendToPeer(MessageType::Text, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

void InMemoryTransport::InjectError(const std::string& message) {
    FUNC_SCOPE();
    auto p = pImpl->livePeer();
    if (!p) {
        LOG_WARN("InMemoryTransport[{}]: no peer to inject error into", pImpl->sessionId);
        return;
    }
    auto* target = p.get();
    p->enqueue([target, message]() {
        target->deliverError(boost::asio::error::connection_reset, message);
    });
}

void InMemoryTransport::SetOpenHandler(OpenHandler handler) { pImpl->openHandler = std::move(handler); }
void InMemoryTransport::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void InMemoryTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void InMemoryTransport::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }

InMemoryTransportFactory::InMemoryTransportFactory(AcceptHandler onAccept) : onAccept_(std::move(onAccept)) {}

InMemoryTransport::Options InMemoryTransportFactory::ParseOptions(const std::string& cfg) {
    InMemoryTransport::Options opts;
    for (const auto& [key, val] : config::ParseKeyValues(cfg)) {
        unsigned long long n = 0;
        if (key == "frameSize") {
            if (config::ParseUnsigned(val, n)) { opts.frameSize = static_cast<std::size_t>(n); }
        } else if (key == "deferredPayloads") {
            opts.deferredPayloads = (val == "1" || val == "true" || val == "yes" || val == "on");
        }
    }
    return opts;
}

std::unique_ptr<IMessageTransport> InMemoryTransportFactory::CreateTransport(const std::string& config) {
    auto [client, server] = InMemoryTransport::CreatePair(ParseOptions(config));
    if (onAccept_) {
        onAccept_(std::move(server));
    }
    return std::move(client);
}

} // namespace wsio
