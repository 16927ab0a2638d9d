//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/wsio/WebSocketTransport.cpp
// Purpose: WebSocket client transport using Boost.Beast coroutines (TLS 1.3 only for wss)
//==========================================================================================================

//==========================================================================================================
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <random>
#include <stop_token>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "logging/Logger.h"
#include "wsio/WebSocketTransport.hpp"
#include "wsio/errors/Errors.h"
#include "wsio/version.h"
#include "KeyValueConfig.hpp"

#include <openssl/ssl.h>

namespace wsio {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

class WebSocketTransport::Impl {
public:
    using PlainWs = websocket::stream<beast::tcp_stream>;
    using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    WebSocketTransport::Options opts;
    std::string sessionId;
    std::atomic<TransportState> state{TransportState::Connecting};
    std::atomic<bool> opened{false};
    std::atomic<bool> everOpen{false};
    std::atomic<bool> closeCalled{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<ssl::context> sslCtx; // present for wss

    // Touched only on the io thread.
    std::unique_ptr<PlainWs> plainWs;
    std::unique_ptr<TlsWs> tlsWs;
    std::deque<Bytes> outbox;
    bool writing{false};
    bool closeRequested{false};
    bool closeSent{false};

    WebSocketTransport::OpenHandler openHandler;
    WebSocketTransport::MessageHandler messageHandler;
    WebSocketTransport::ErrorHandler errorHandler;
    WebSocketTransport::CloseHandler closeHandler;

    // Handlers run on the delivery thread, in event order, so a handler that blocks never stalls the io
    // thread (writes, close handshake and control frames keep flowing).
    std::queue<std::function<void()>> events;
    std::mutex eventMutex;
    std::condition_variable eventCondition;
    std::jthread deliveryThread;

    explicit Impl(const WebSocketTransport::Options& o) : opts(o) {
        std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "ws-" + std::to_string(dis(gen));
        startDelivery();
    }

    ~Impl() {
        if (ioThread.joinable()) {
            workGuard.reset();
            ioc.stop();
            ioThread.join();
        }
        if (deliveryThread.joinable()) {
            deliveryThread.request_stop();
            { std::lock_guard<std::mutex> lock(eventMutex); }
            eventCondition.notify_all();
            deliveryThread.join();
        }
        plainWs.reset();
        tlsWs.reset();
    }

    void startDelivery() {
        deliveryThread = std::jthread([this](std::stop_token st) {
            std::unique_lock<std::mutex> lock(eventMutex);
            while (!st.stop_requested()) {
                eventCondition.wait(lock, [this, &st]() { return !events.empty() || st.stop_requested(); });
                while (!events.empty() && !st.stop_requested()) {
                    auto event = std::move(events.front());
                    events.pop();
                    lock.unlock();
                    event();
                    lock.lock();
                }
            }
        });
    }

    void deliver(std::function<void()> event) {
        std::lock_guard<std::mutex> lock(eventMutex);
        events.push(std::move(event));
        eventCondition.notify_one();
    }

    // ------------------------------------------------------------------------------------------------------
    // URL parsing (ws[s]://host[:port][/path])
    // ------------------------------------------------------------------------------------------------------
    struct UrlParts {
        std::string scheme;
        std::string host;
        std::string port;
        std::string path;
    };

    static bool parseUrl(const std::string& url, UrlParts& parts) {
        std::size_t schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos) {
            return false;
        }
        parts.scheme = url.substr(0, schemeEnd);
        if (parts.scheme != "ws" && parts.scheme != "wss") {
            return false;
        }
        const std::size_t pos = schemeEnd + 3;

        std::size_t slash = url.find('/', pos);
        std::string hostPort;
        if (slash == std::string::npos) {
            hostPort = url.substr(pos);
            parts.path = std::string("/");
        } else {
            hostPort = url.substr(pos, slash - pos);
            parts.path = url.substr(slash);
        }

        std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
            parts.port = parts.scheme == "wss" ? std::string("443") : std::string("80");
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
            unsigned long long port = 0;
            if (!config::ParseUnsigned(parts.port, port) || port == 0 || port > 65535) {
                return false;
            }
        }
        return !parts.host.empty();
    }

    bool initTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
        boost::system::error_code ec;
        if (userProvidedCA) {
            if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile, ec); }
            if (!ec && !opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath, ec); }
            if (ec) {
                LOG_ERROR("WebSocketTransport: failed to load CA file/path: {}", ec.message());
                return false;
            }
        } else {
            sslCtx->set_default_verify_paths(ec);
            if (ec) {
                LOG_DEBUG("WebSocketTransport: set_default_verify_paths failed: {}", ec.message());
            }
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
        return true;
    }

    // ------------------------------------------------------------------------------------------------------
    // Event delivery (io thread)
    // ------------------------------------------------------------------------------------------------------
    void reportFailure(const boost::system::error_code& ec, const std::string& what) {
        const bool wasOpen = everOpen.load();
        state = TransportState::Closed;
        if (closeRequested) {
            LOG_DEBUG("WebSocketTransport[{}]: stopped after local close ({})", sessionId, ec.message());
            if (wasOpen) {
                deliver([this]() { if (closeHandler) { closeHandler(); } });
            }
            return;
        }
        LOG_ERROR("WebSocketTransport[{}]: {}: {}", sessionId, what, ec.message());
        deliver([this, ec, what, wasOpen]() {
            if (errorHandler) { errorHandler(ec, what); }
            if (wasOpen && closeHandler) { closeHandler(); }
        });
    }

    void reportClosed() {
        state = TransportState::Closed;
        LOG_INFO("WebSocketTransport[{}]: closed", sessionId);
        deliver([this]() { if (closeHandler) { closeHandler(); } });
    }

    // ------------------------------------------------------------------------------------------------------
    // Connection coroutines
    // ------------------------------------------------------------------------------------------------------
    template <typename Ws>
    net::awaitable<void> coHandshake(Ws& ws, const UrlParts& u) {
        beast::get_lowest_layer(ws).expires_never();
        websocket::stream_base::timeout timeouts{};
        timeouts.handshake_timeout = std::chrono::milliseconds(opts.handshakeTimeoutMs);
        timeouts.idle_timeout = websocket::stream_base::none();
        timeouts.keep_alive_pings = false;
        ws.set_option(timeouts);
        const std::string ua = opts.userAgent.empty() ? "wsio/" + getVersionString() : opts.userAgent;
        ws.set_option(websocket::stream_base::decorator([ua](websocket::request_type& req) {
            req.set(http::field::user_agent, ua);
        }));
        co_await ws.async_handshake(u.host + ":" + u.port, u.path, net::use_awaitable);
        ws.binary(true);
    }

    template <typename Ws>
    net::awaitable<void> coSession(Ws& ws) {
        everOpen = true;
        state = closeRequested ? TransportState::Closing : TransportState::Open;
        LOG_INFO("WebSocketTransport[{}]: open", sessionId);
        deliver([this]() { if (openHandler) { openHandler(); } });
        if (closeRequested || !outbox.empty()) {
            startWriter();
        }

        beast::flat_buffer buffer;
        for (;;) {
            boost::system::error_code ec;
            buffer.clear();
            co_await ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
            if (ec == websocket::error::closed) {
                reportClosed();
                co_return;
            }
            if (ec) {
                reportFailure(ec, "read failed");
                co_return;
            }
            Bytes bytes(buffer.size());
            net::buffer_copy(net::buffer(bytes), buffer.data());
            const MessageType type = ws.got_binary() ? MessageType::Binary : MessageType::Text;
            LOG_DEBUG("WebSocketTransport[{}]: received {} frame of {} bytes", sessionId,
                      type == MessageType::Binary ? "binary" : "text", bytes.size());

            // The next frame is read only after the handler accepted this one; a handler blocked on a full
            // queue therefore pushes back on the socket instead of on the io thread.
            auto handled = std::make_shared<net::steady_timer>(ioc, net::steady_timer::time_point::max());
            deliver([this, type, b = std::move(bytes), handled]() mutable {
                if (messageHandler) {
                    IncomingMessage msg;
                    msg.type = type;
                    msg.payload = Payload::Ready(std::move(b));
                    messageHandler(std::move(msg));
                }
                net::post(ioc, [handled]() { handled->expires_at(net::steady_timer::time_point::min()); });
            });
            boost::system::error_code waitEc;
            co_await handled->async_wait(net::redirect_error(net::use_awaitable, waitEc));
        }
    }

    net::awaitable<void> coRun(UrlParts u) {
        try {
            auto ex = co_await net::this_coro::executor;
            tcp::resolver resolver(ex);
            auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
            if (closeRequested) {
                throw boost::system::system_error(net::error::operation_aborted);
            }

            if (u.scheme == "wss") {
                tlsWs = std::make_unique<TlsWs>(ex, *sslCtx);
                auto& tcpLayer = beast::get_lowest_layer(*tlsWs);
                const std::string serverName = opts.serverName.empty() ? u.host : opts.serverName;
                if (!::SSL_set_tlsext_host_name(tlsWs->next_layer().native_handle(), serverName.c_str())) {
                    throw boost::system::system_error(make_error_code(errc::connection_failed),
                                                      "failed to set SNI hostname");
                }
                if (!::SSL_set1_host(tlsWs->next_layer().native_handle(), serverName.c_str())) {
                    throw boost::system::system_error(make_error_code(errc::connection_failed),
                                                      "failed to set verification hostname");
                }
                tcpLayer.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
                co_await tcpLayer.async_connect(results, net::use_awaitable);
                tcpLayer.expires_after(std::chrono::milliseconds(opts.handshakeTimeoutMs));
                co_await tlsWs->next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
                co_await coHandshake(*tlsWs, u);
                co_await coSession(*tlsWs);
            } else {
                plainWs = std::make_unique<PlainWs>(ex);
                auto& tcpLayer = beast::get_lowest_layer(*plainWs);
                tcpLayer.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
                co_await tcpLayer.async_connect(results, net::use_awaitable);
                co_await coHandshake(*plainWs, u);
                co_await coSession(*plainWs);
            }
        } catch (const boost::system::system_error& e) {
            reportFailure(e.code(), "connect failed");
        }
    }

    template <typename Ws>
    net::awaitable<void> coWriter(Ws& ws) {
        while (!outbox.empty()) {
            Bytes message = std::move(outbox.front());
            outbox.pop_front();
            boost::system::error_code ec;
            co_await ws.async_write(net::buffer(message), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                outbox.clear();
                writing = false;
                if (!closeRequested) {
                    LOG_ERROR("WebSocketTransport[{}]: write failed: {}", sessionId, ec.message());
                    deliver([this, what = "write failed: " + ec.message()]() {
                        if (errorHandler) { errorHandler(make_error_code(errc::send_failed), what); }
                    });
                }
                co_return;
            }
            LOG_DEBUG("WebSocketTransport[{}]: sent {} bytes", sessionId, message.size());
        }
        if (closeRequested && !closeSent) {
            closeSent = true;
            boost::system::error_code ec;
            co_await ws.async_close(websocket::close_code::normal, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_DEBUG("WebSocketTransport[{}]: close handshake: {}", sessionId, ec.message());
            }
        }
        writing = false;
    }

    // Starts the writer coroutine unless one is running (io thread).
    void startWriter() {
        if (writing || !everOpen) {
            return;
        }
        writing = true;
        if (tlsWs) {
            net::co_spawn(ioc, coWriter(*tlsWs), net::detached);
        } else if (plainWs) {
            net::co_spawn(ioc, coWriter(*plainWs), net::detached);
        } else {
            writing = false;
        }
    }

    // Aborts an in-progress connect (io thread).
    void cancelConnect() {
        if (tlsWs) {
            beast::get_lowest_layer(*tlsWs).cancel();
        } else if (plainWs) {
            beast::get_lowest_layer(*plainWs).cancel();
        }
    }
};

WebSocketTransport::WebSocketTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) { FUNC_SCOPE(); }

WebSocketTransport::~WebSocketTransport() { FUNC_SCOPE(); }

boost::system::error_code WebSocketTransport::Open(const std::string& url) {
    FUNC_SCOPE();
    if (pImpl->opened.exchange(true)) {
        return net::error::already_started;
    }
    Impl::UrlParts parts;
    if (!Impl::parseUrl(url, parts)) {
        LOG_ERROR("WebSocketTransport: invalid url '{}'", url);
        pImpl->state = TransportState::Closed;
        return make_error_code(errc::invalid_url);
    }
    if (parts.scheme == "wss" && !pImpl->initTls()) {
        pImpl->state = TransportState::Closed;
        return make_error_code(errc::connection_failed);
    }
    LOG_INFO("WebSocketTransport[{}]: connecting to {}", pImpl->sessionId, url);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    net::co_spawn(pImpl->ioc, pImpl->coRun(std::move(parts)), net::detached);
    pImpl->ioThread = std::thread([this]() { pImpl->ioc.run(); });
    return {};
}

void WebSocketTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->closeCalled.exchange(true)) {
        return;
    }
    if (!pImpl->opened.load()) {
        pImpl->state = TransportState::Closed;
        return;
    }
    if (pImpl->state != TransportState::Closed) {
        pImpl->state = TransportState::Closing;
    }
    LOG_INFO("WebSocketTransport[{}]: closing", pImpl->sessionId);
    net::post(pImpl->ioc, [impl = pImpl.get()]() {
        impl->closeRequested = true;
        if (impl->everOpen) {
            impl->startWriter();
        } else {
            impl->cancelConnect();
        }
    });
}

TransportState WebSocketTransport::State() const { return pImpl->state.load(); }

std::string WebSocketTransport::GetSessionId() const { return pImpl->sessionId; }

boost::system::error_code WebSocketTransport::Send(const std::uint8_t* data, std::size_t len) {
    if (pImpl->state.load() != TransportState::Open) {
        return make_error_code(errc::not_open);
    }
    Bytes message(data, data + len);
    net::post(pImpl->ioc, [impl = pImpl.get(), m = std::move(message)]() mutable {
        if (impl->closeRequested) {
            LOG_DEBUG("WebSocketTransport[{}]: dropping send queued after close", impl->sessionId);
            return;
        }
        impl->outbox.push_back(std::move(m));
        impl->startWriter();
    });
    return {};
}

void WebSocketTransport::SetOpenHandler(OpenHandler handler) { pImpl->openHandler = std::move(handler); }
void WebSocketTransport::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void WebSocketTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void WebSocketTransport::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }

//==========================================================================================================
// WebSocketTransportFactory::ParseOptions
// Purpose: Parse semicolon-delimited key=value config into Options.
//==========================================================================================================
WebSocketTransport::Options WebSocketTransportFactory::ParseOptions(const std::string& cfg) {
    WebSocketTransport::Options opts;
    for (const auto& [key, val] : config::ParseKeyValues(cfg)) {
        unsigned long long n = 0;
        if (key == "serverName") {
            opts.serverName = val;
        }
        else if (key == "caFile") {
            opts.caFile = val;
        }
        else if (key == "caPath") {
            opts.caPath = val;
        }
        else if (key == "userAgent") {
            opts.userAgent = val;
        }
        else if (key == "connectTimeoutMs") {
            if (config::ParseUnsigned(val, n)) { opts.connectTimeoutMs = static_cast<unsigned int>(n); }
        }
        else if (key == "handshakeTimeoutMs") {
            if (config::ParseUnsigned(val, n)) { opts.handshakeTimeoutMs = static_cast<unsigned int>(n); }
        }
    }
    return opts;
}

std::unique_ptr<IMessageTransport> WebSocketTransportFactory::CreateTransport(const std::string& config) {
    return std::make_unique<WebSocketTransport>(ParseOptions(config));
}

} // namespace wsio
