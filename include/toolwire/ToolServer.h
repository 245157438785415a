//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServer.h
// Purpose: TCP listener accepting WebSocket sessions and serving the synchronous HTTP tool surface
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolwire/Session.h"
#include "toolwire/ToolRegistry.h"

namespace toolwire {

//==========================================================================================================
// ToolServer
// Purpose: Accepts connections on one I/O thread. The first HTTP request on a connection decides its use:
//   - WebSocket upgrade on wsPath: a server-role Session for the lifetime of the connection.
//   - GET /             : {"name","status":"running","version","tools_count"}
//   - GET /tools        : {"tools":[descriptor...]}
//   - POST /tools/{name}: runs the tool on the HTTP worker pool; 200 {"status":"success","result"},
//                         404/500 {"detail"}, 400 for an unusable body.
//   - anything else     : 404 {"detail":"Not found"}
//   Plain HTTP requests are answered one per connection. WebSocket handler invocations each get their own
//   thread, at most SessionOptions::maxInFlight per session, so sessions never wait on each other.
//==========================================================================================================
class ToolServer {
public:
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8089"};         // "0" picks a free port; see GetBoundPort()
        std::string wsPath{"/ws"};
        std::string scheme{"http"};       // "https" serves wss:// and HTTPS (TLS 1.3 only)
        std::string certFile;             // PEM certificate chain (https)
        std::string keyFile;              // PEM private key (https)
        std::size_t workerThreads{4};     // threads serving POST /tools/{name}
        std::string name{"toolwire"};
        SessionOptions session;
    };

    using ErrorHandler = std::function<void(const std::string& error)>;

    // The registry should be frozen; it is shared read-only by every session.
    ToolServer(const Options& opts, std::shared_ptr<const ToolRegistry> registry);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    //==========================================================================================================
    // Binds, listens and starts the I/O thread.
    // Returns:
    //   Future that completes once the listener accepts connections, or holds a ToolwireException
    //   (Validation for bad options, ConnectionClosed when the address cannot be bound).
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Closes the listener and every active session (their queued work is abandoned), waits for running
    // handlers, then joins the HTTP worker pool and the I/O thread. Idempotent.
    //==========================================================================================================
    std::future<void> Stop();

    // Port actually bound (meaningful after Start()).
    uint16_t GetBoundPort() const;

    std::size_t ActiveSessionCount() const;

    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolwire
