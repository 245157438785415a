//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketChannel.hpp
// Purpose: IChannel over a Boost.Beast WebSocket (ws:// and wss://, client and server side)
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "toolwire/Channel.h"

namespace toolwire {

//==========================================================================================================
// WebSocketChannel
// Purpose: One text frame per WebSocket message. Reads run as a coroutine on the stream's executor;
//          writes are queued and written one at a time on the same executor.
// Notes:
//   Client channels own a private io_context and thread. Server channels adopt a stream already accepted
//   (and upgraded) on the listener's io_context.
//   Messages larger than MaxFrameBytes close the channel.
//==========================================================================================================
class WebSocketChannel : public IChannel {
public:
    using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using TlsStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    static constexpr std::size_t MaxFrameBytes = 4u * 1024u * 1024u;

    struct Options {
        std::string url;                                   // ws://host:port/path or wss://...
        std::string caFile;                                // optional CA bundle for wss
        std::chrono::milliseconds connectTimeout{10000};
    };

    //==========================================================================================================
    // Connect
    // Purpose: Resolves, connects and performs the (TLS and) WebSocket handshakes.
    // Throws:
    //   ToolwireException(Validation) for an unusable URL.
    //   ToolwireException(ConnectionClosed) when the connection or a handshake fails or times out.
    //==========================================================================================================
    static std::unique_ptr<WebSocketChannel> Connect(const Options& opts);

    // Wrap a server-side stream whose WebSocket handshake has completed.
    static std::unique_ptr<WebSocketChannel> Adopt(PlainStream&& ws);
    static std::unique_ptr<WebSocketChannel> Adopt(TlsStream&& ws);

    // Apply the timeout and size options every accepted or connected stream uses.
    static void ConfigureServerStream(PlainStream& ws);
    static void ConfigureServerStream(TlsStream& ws);

    virtual ~WebSocketChannel();

    ////////////////////////////////////////// IChannel //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsOpen() const override;
    std::string GetChannelId() const override;
    bool Send(const std::string& frame) override;
    void SetFrameHandler(FrameHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    // Blocks until the close handshake has finished or the timeout passes. Not for use on the I/O thread.
    bool WaitClosed(std::chrono::milliseconds timeout) const;

    class Impl;
    struct Runner;

private:
    WebSocketChannel(std::shared_ptr<Impl> impl, std::unique_ptr<Runner> runner);

    std::shared_ptr<Impl> pImpl;
    std::unique_ptr<Runner> runner;  // present for client channels
};

} // namespace toolwire
