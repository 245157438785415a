//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketChannel.cpp
// Purpose: Boost.Beast WebSocket channel (plain and TLS) with coroutine read loop and queued writes
//==========================================================================================================

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolwire/Url.h"
#include "toolwire/WebSocketChannel.hpp"
#include "toolwire/errors/Errors.h"
#include "toolwire/version.h"

namespace toolwire {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

//==========================================================================================================
// Impl: stream-independent state. Everything except the atomics and handlers is touched only on executor.
//==========================================================================================================
class WebSocketChannel::Impl : public std::enable_shared_from_this<WebSocketChannel::Impl> {
public:
    explicit Impl(net::any_io_executor ex) : executor(std::move(ex)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        channelId = "ws-" + std::to_string(dis(gen));
        closedFuture = closedPromise.get_future().share();
    }
    virtual ~Impl() = default;

    net::any_io_executor executor;
    std::string channelId;
    std::atomic<bool> started{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> finished{false};
    std::mutex handlerMutex;
    IChannel::FrameHandler frameHandler;
    IChannel::CloseHandler closeHandler;
    std::deque<std::string> writeQueue;
    bool writing{false};
    std::promise<void> closedPromise;
    std::shared_future<void> closedFuture;

    virtual void startReading() = 0;
    virtual void startWriting() = 0;
    virtual void startClosing() = 0;
    virtual void abortSocket() = 0;

    bool isOpen() const {
        return started.load() && !closing.load() && !finished.load();
    }

    bool send(std::string frame) {
        if (closing.load() || finished.load()) {
            return false;
        }
        auto self = shared_from_this();
        net::post(executor, [self, frame = std::move(frame)]() mutable {
            if (self->finished.load()) {
                return;
            }
            self->writeQueue.push_back(std::move(frame));
            if (!self->writing) {
                self->writing = true;
                self->startWriting();
            }
        });
        return true;
    }

    void close() {
        if (closing.exchange(true)) {
            return;
        }
        auto self = shared_from_this();
        net::post(executor, [self]() {
            if (self->finished.load()) {
                return;
            }
            if (!self->started.load()) {
                self->abortSocket();
                self->finish("Connection closed");
                return;
            }
            self->startClosing();
        });
    }

    void deliver(const std::string& frame) {
        IChannel::FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = frameHandler;
        }
        if (!handler) {
            return;
        }
        try {
            handler(frame);
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketChannel {}: frame handler exception: {}", channelId, e.what());
        }
    }

    void finish(const std::string& reason) {
        if (finished.exchange(true)) {
            return;
        }
        IChannel::CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = closeHandler;
        }
        LOG_DEBUG("WebSocketChannel {} closed: {}", channelId, reason);
        closedPromise.set_value();
        if (handler) {
            handler(reason);
        }
    }
};

namespace {

template <class Stream>
class StreamImpl final : public WebSocketChannel::Impl {
public:
    StreamImpl(Stream&& s, std::shared_ptr<ssl::context> ctx)
        : WebSocketChannel::Impl(s.get_executor()), sslCtx(std::move(ctx)), ws(std::move(s)) {}

    std::shared_ptr<ssl::context> sslCtx;  // client TLS context; must outlive ws
    Stream ws;

    std::shared_ptr<StreamImpl> self() {
        return std::static_pointer_cast<StreamImpl>(shared_from_this());
    }

    void startReading() override {
        net::co_spawn(executor, readLoop(self()), net::detached);
    }

    void startWriting() override {
        net::co_spawn(executor, writeLoop(self()), net::detached);
    }

    void startClosing() override {
        net::co_spawn(executor, closeOp(self()), net::detached);
    }

    void abortSocket() override {
        boost::system::error_code ec;
        beast::get_lowest_layer(ws).socket().close(ec);
    }

    static net::awaitable<void> readLoop(std::shared_ptr<StreamImpl> s) {
        std::string reason = "Connection closed";
        try {
            for (;;) {
                beast::flat_buffer buffer;
                co_await s->ws.async_read(buffer, net::use_awaitable);
                s->deliver(beast::buffers_to_string(buffer.data()));
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == websocket::error::closed) {
                reason = s->closing.load() ? "Connection closed" : "Connection closed by peer";
            } else if (e.code() == websocket::error::message_too_big) {
                LOG_WARN("WebSocketChannel {}: frame exceeds {} bytes; closing", s->channelId,
                         WebSocketChannel::MaxFrameBytes);
                reason = "Frame too large";
            } else {
                reason = e.code().message();
                if (!s->closing.load()) {
                    LOG_WARN("WebSocketChannel {}: read error: {}", s->channelId, reason);
                }
            }
        }
        s->abortSocket();
        s->finish(reason);
        co_return;
    }

    static net::awaitable<void> writeLoop(std::shared_ptr<StreamImpl> s) {
        try {
            while (!s->writeQueue.empty() && !s->finished.load()) {
                s->ws.text(true);
                co_await s->ws.async_write(net::buffer(s->writeQueue.front()), net::use_awaitable);
                s->writeQueue.pop_front();
            }
        } catch (const boost::system::system_error& e) {
            LOG_WARN("WebSocketChannel {}: write error: {}", s->channelId, e.code().message());
            s->writeQueue.clear();
            s->abortSocket();
        }
        s->writing = false;
        co_return;
    }

    static net::awaitable<void> closeOp(std::shared_ptr<StreamImpl> s) {
        try {
            co_await s->ws.async_close(websocket::close_code::normal, net::use_awaitable);
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("WebSocketChannel {}: close handshake failed: {}", s->channelId, e.code().message());
            s->abortSocket();
        }
        co_return;
    }
};

void setUserAgent(websocket::request_type& req) {
    req.set(http::field::user_agent, std::string("toolwire-client/") + getVersionString());
}

template <class Stream>
void configureClientStream(Stream& ws) {
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(websocket::stream_base::decorator(&setUserAgent));
    ws.read_message_max(WebSocketChannel::MaxFrameBytes);
}

template <class Stream>
void configureServerStream(Stream& ws) {
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, std::string("toolwire/") + getVersionString());
    }));
    ws.read_message_max(WebSocketChannel::MaxFrameBytes);
}

std::shared_ptr<ssl::context> makeClientContext(const std::string& caFile) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    // TLS 1.3 only
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::ERR_clear_error();
    if (!caFile.empty()) {
        ctx->load_verify_file(caFile);
    } else {
        boost::system::error_code ec;
        ctx->set_default_verify_paths(ec);
        if (ec) {
            LOG_DEBUG("WSS: set_default_verify_paths failed: {}", ec.message());
        }
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

net::awaitable<std::shared_ptr<WebSocketChannel::Impl>> connectPlain(UrlParts u, std::chrono::milliseconds timeout) {
    auto ex = co_await net::this_coro::executor;
    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
    WebSocketChannel::PlainStream ws(ex);
    beast::get_lowest_layer(ws).expires_after(timeout);
    co_await beast::get_lowest_layer(ws).async_connect(results, net::use_awaitable);
    configureClientStream(ws);
    co_await ws.async_handshake(u.host + ":" + u.port, u.target, net::use_awaitable);
    co_return std::make_shared<StreamImpl<WebSocketChannel::PlainStream>>(std::move(ws), nullptr);
}

net::awaitable<std::shared_ptr<WebSocketChannel::Impl>> connectTls(UrlParts u, std::chrono::milliseconds timeout,
                                                                   std::shared_ptr<ssl::context> ctx) {
    auto ex = co_await net::this_coro::executor;
    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
    WebSocketChannel::TlsStream ws(ex, *ctx);
    if (!::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), u.serverName.c_str())) {
        LOG_WARN("WSS: failed to set SNI host name {}", u.serverName);
    }
    (void)::SSL_set1_host(ws.next_layer().native_handle(), u.serverName.c_str());
    beast::get_lowest_layer(ws).expires_after(timeout);
    co_await beast::get_lowest_layer(ws).async_connect(results, net::use_awaitable);
    co_await ws.next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
    configureClientStream(ws);
    co_await ws.async_handshake(u.host + ":" + u.port, u.target, net::use_awaitable);
    co_return std::make_shared<StreamImpl<WebSocketChannel::TlsStream>>(std::move(ws), std::move(ctx));
}

} // namespace

//==========================================================================================================
// Runner: private io_context and thread for client channels
//==========================================================================================================
struct WebSocketChannel::Runner {
    std::shared_ptr<net::io_context> ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::thread ioThread;

    Runner() : ioc(std::make_shared<net::io_context>(1)) {
        work.emplace(ioc->get_executor());
        ioThread = std::thread([ioc = ioc]() {
            try {
                ioc->run();
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocketChannel io thread exception: {}", e.what());
            }
        });
    }

    ~Runner() {
        work.reset();
        ioc->stop();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                // Released from a handler running on this io thread; run() returns after stop()
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }
};

WebSocketChannel::WebSocketChannel(std::shared_ptr<Impl> impl, std::unique_ptr<Runner> r)
    : pImpl(std::move(impl)), runner(std::move(r)) {}

WebSocketChannel::~WebSocketChannel() {
    FUNC_SCOPE();
    pImpl->close();
    if (runner && runner->ioThread.get_id() != std::this_thread::get_id()) {
        // Give the close handshake a moment before the io thread stops
        (void)pImpl->closedFuture.wait_for(std::chrono::seconds(2));
    }
}

std::unique_ptr<WebSocketChannel> WebSocketChannel::Connect(const Options& opts) {
    FUNC_SCOPE();
    UrlParts u = ParseUrl(opts.url);
    if (u.scheme != "ws" && u.scheme != "wss") {
        throw errors::ToolwireException(errors::ErrorCategory::Validation,
                                        "WebSocket URL must use ws:// or wss://: " + opts.url);
    }
    auto r = std::make_unique<Runner>();
    auto ready = std::make_shared<std::promise<std::shared_ptr<Impl>>>();
    auto fut = ready->get_future();
    auto onDone = [ready](std::exception_ptr ep, std::shared_ptr<Impl> impl) {
        if (ep) {
            ready->set_exception(ep);
        } else {
            ready->set_value(std::move(impl));
        }
    };
    try {
        if (u.IsSecure()) {
            net::co_spawn(*r->ioc, connectTls(u, opts.connectTimeout, makeClientContext(opts.caFile)), onDone);
        } else {
            net::co_spawn(*r->ioc, connectPlain(u, opts.connectTimeout), onDone);
        }
    } catch (const std::exception& e) {
        throw errors::ToolwireException(errors::ErrorCategory::ConnectionClosed,
                                        "Failed to connect to " + opts.url + ": " + e.what());
    }
    if (fut.wait_for(opts.connectTimeout + std::chrono::seconds(1)) != std::future_status::ready) {
        throw errors::ToolwireException(errors::ErrorCategory::ConnectionClosed,
                                        "Timed out connecting to " + opts.url);
    }
    std::shared_ptr<Impl> impl;
    try {
        impl = fut.get();
    } catch (const std::exception& e) {
        throw errors::ToolwireException(errors::ErrorCategory::ConnectionClosed,
                                        "Failed to connect to " + opts.url + ": " + e.what());
    }
    LOG_INFO("WebSocketChannel {} connected to {}", impl->channelId, opts.url);
    return std::unique_ptr<WebSocketChannel>(new WebSocketChannel(std::move(impl), std::move(r)));
}

std::unique_ptr<WebSocketChannel> WebSocketChannel::Adopt(PlainStream&& ws) {
    auto impl = std::make_shared<StreamImpl<PlainStream>>(std::move(ws), nullptr);
    return std::unique_ptr<WebSocketChannel>(new WebSocketChannel(std::move(impl), nullptr));
}

std::unique_ptr<WebSocketChannel> WebSocketChannel::Adopt(TlsStream&& ws) {
    auto impl = std::make_shared<StreamImpl<TlsStream>>(std::move(ws), nullptr);
    return std::unique_ptr<WebSocketChannel>(new WebSocketChannel(std::move(impl), nullptr));
}

void WebSocketChannel::ConfigureServerStream(PlainStream& ws) { configureServerStream(ws); }
void WebSocketChannel::ConfigureServerStream(TlsStream& ws) { configureServerStream(ws); }

std::future<void> WebSocketChannel::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (!pImpl->started.exchange(true)) {
        auto impl = pImpl;
        net::post(impl->executor, [impl]() {
            if (impl->finished.load()) {
                return;
            }
            impl->startReading();
        });
    }
    promise.set_value();
    return promise.get_future();
}

std::future<void> WebSocketChannel::Close() {
    FUNC_SCOPE();
    pImpl->close();
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool WebSocketChannel::IsOpen() const { return pImpl->isOpen(); }

std::string WebSocketChannel::GetChannelId() const { return pImpl->channelId; }

bool WebSocketChannel::Send(const std::string& frame) {
    LOG_DEBUG("WebSocketChannel {} send: {}", pImpl->channelId, frame);
    return pImpl->send(frame);
}

void WebSocketChannel::SetFrameHandler(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->frameHandler = std::move(handler);
}

void WebSocketChannel::SetCloseHandler(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->closeHandler = std::move(handler);
}

bool WebSocketChannel::WaitClosed(std::chrono::milliseconds timeout) const {
    return pImpl->closedFuture.wait_for(timeout) == std::future_status::ready;
}

} // namespace toolwire
