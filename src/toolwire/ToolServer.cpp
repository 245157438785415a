//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServer.cpp
// Purpose: Boost.Beast listener: WebSocket sessions plus the synchronous HTTP tool surface
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolwire/Dispatcher.h"
#include "toolwire/ToolServer.h"
#include "toolwire/WebSocketChannel.hpp"
#include "toolwire/TaskGroup.h"
#include "toolwire/WorkerPool.h"
#include "toolwire/errors/Errors.h"
#include "toolwire/version.h"

namespace toolwire {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

using errors::ErrorCategory;

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

constexpr auto HttpReadTimeout = std::chrono::seconds(30);

JSONValue detailBody(const std::string& detail) {
    JSONValue::Object obj;
    obj["detail"] = std::make_shared<JSONValue>(detail);
    return JSONValue{obj};
}

Response makeJsonResponse(http::status status, unsigned version, const JSONValue& body) {
    Response res{status, version};
    res.set(http::field::server, std::string("toolwire/") + getVersionString());
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = SerializeJSON(body);
    res.prepare_payload();
    return res;
}

} // namespace

class ToolServer::Impl {
public:
    ToolServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};

    // Declaration order: the TLS context and io_context outlive every stream and session below
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;

    std::shared_ptr<const ToolRegistry> registry;
    std::shared_ptr<const Dispatcher> dispatcher;
    std::shared_ptr<TaskGroup> sessionTasks; // WebSocket handler invocations
    std::shared_ptr<WorkerPool> workers;     // HTTP tool calls

    struct Connection {
        std::shared_ptr<Session> session;
        std::shared_ptr<WebSocketChannel> channel;
    };

    mutable std::mutex sessionsMutex;
    std::unordered_map<std::string, Connection> sessions;

    ToolServer::ErrorHandler errorHandler;

    Impl(const ToolServer::Options& o, std::shared_ptr<const ToolRegistry> reg)
        : opts(o), ioc(1), registry(std::move(reg)) {
        if (!registry) {
            throw errors::ToolwireException(ErrorCategory::Validation, "ToolServer requires a registry");
        }
        if (!registry->IsFrozen()) {
            LOG_WARN("ToolServer: registry is not frozen");
        }
        dispatcher = std::make_shared<Dispatcher>(registry);
        sessionTasks = std::make_shared<TaskGroup>();
        workers = std::make_shared<WorkerPool>(opts.workerThreads);
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("ToolServer: failed to load certificate/key: {}", e.what());
                throw errors::ToolwireException(ErrorCategory::Validation,
                                                std::string("Failed to load certificate/key: ") + e.what());
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw errors::ToolwireException(ErrorCategory::Validation, "Unsupported scheme: " + opts.scheme);
        }
    }

    ~Impl() {
        shutdown();
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    ////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    void listen() {
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            throw errors::ToolwireException(ErrorCategory::Validation, "Invalid port: '" + opts.port + "'");
        }
        unsigned long portNum = std::stoul(opts.port);
        if (portNum > 65535ul) {
            throw errors::ToolwireException(ErrorCategory::Validation, "Port out of range: " + opts.port);
        }
        try {
            tcp::resolver resolver(ioc);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();
            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            boundPort = acceptor->local_endpoint().port();
        } catch (const boost::system::system_error& e) {
            acceptor.reset();
            throw errors::ToolwireException(ErrorCategory::ConnectionClosed,
                                            "Failed to listen on " + opts.address + ":" + opts.port + ": " + e.what());
        }
    }

    void shutdown() {
        bool wasRunning = running.exchange(false);
        if (wasRunning) {
            LOG_INFO("ToolServer stopping");
        }
        if (acceptor) {
            net::post(ioc, [this]() {
                boost::system::error_code ec;
                if (acceptor) { acceptor->close(ec); }
            });
        }
        std::vector<Connection> active;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            for (auto& kv : sessions) {
                active.push_back(kv.second);
            }
        }
        for (auto& c : active) {
            c.session->Close("Server shutting down");
        }
        // Let peers see the close frame before the io thread stops
        for (auto& c : active) {
            if (!c.channel->WaitClosed(std::chrono::seconds(2))) {
                LOG_WARN("ToolServer: close handshake timed out for session {}", c.session->GetSessionId());
            }
        }
        if (sessionTasks) {
            sessionTasks->Stop();
        }
        if (workers) {
            workers->Stop();
        }
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            sessions.clear();
        }
        if (wasRunning) {
            LOG_INFO("ToolServer stopped");
        }
    }

    ////////////////////////////////////////// Sessions ///////////////////////////////////////////
    void attachSession(std::unique_ptr<WebSocketChannel> channel) {
        std::shared_ptr<WebSocketChannel> ch = std::move(channel);
        auto session = Session::Create(ch, opts.session, dispatcher, sessionTasks);
        const std::string id = session->GetSessionId();
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            sessions[id] = Connection{session, ch};
        }
        session->SetClosedHandler([this](const std::string& sessionId) {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            sessions.erase(sessionId);
        });
        if (!running.load()) {
            session->Close("Server shutting down");
            return;
        }
        session->StartServer();
    }

    ////////////////////////////////////////// HTTP surface ///////////////////////////////////////////
    // Runs the tool on the worker pool and completes on the io_context.
    template <class CompletionToken>
    auto asyncInvoke(std::string name, JSONValue params, CompletionToken&& token) {
        return net::async_initiate<CompletionToken, void(ToolOutcome)>(
            [this](auto handler, std::string toolName, JSONValue toolParams) {
                using Handler = std::decay_t<decltype(handler)>;
                auto h = std::make_shared<Handler>(std::move(handler));
                auto work = net::make_work_guard(ioc);
                auto complete = [this, h, work](ToolOutcome out) mutable {
                    auto ex = net::get_associated_executor(*h, ioc.get_executor());
                    net::post(ex, [h, out = std::move(out)]() mutable { (*h)(std::move(out)); });
                    work.reset();
                };
                bool posted = workers->Post([this, complete, toolName, toolParams]() mutable {
                    complete(dispatcher->Invoke(toolName, toolParams));
                });
                if (!posted) {
                    complete(ToolFailure{ErrorCategory::ConnectionClosed, "server shutting down"});
                }
            },
            token, std::move(name), std::move(params));
    }

    net::awaitable<Response> handleHttp(const Request& req) {
        std::string target = std::string(req.target());
        std::string path = target.substr(0, target.find('?'));
        const unsigned version = req.version();

        if (req.method() == http::verb::get && path == "/") {
            JSONValue::Object obj;
            obj["name"] = std::make_shared<JSONValue>(opts.name);
            obj["status"] = std::make_shared<JSONValue>("running");
            obj["version"] = std::make_shared<JSONValue>(getVersionString());
            obj["tools_count"] = std::make_shared<JSONValue>(static_cast<int64_t>(registry->Size()));
            co_return makeJsonResponse(http::status::ok, version, JSONValue{obj});
        }

        if (req.method() == http::verb::get && path == "/tools") {
            JSONValue::Array arr;
            for (const auto& tool : *registry) {
                arr.push_back(std::make_shared<JSONValue>(tool.descriptor.ToJSON()));
            }
            JSONValue::Object obj;
            obj["tools"] = std::make_shared<JSONValue>(std::move(arr));
            co_return makeJsonResponse(http::status::ok, version, JSONValue{obj});
        }

        const std::string prefix = "/tools/";
        if (req.method() == http::verb::post && path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0) {
            std::string name = path.substr(prefix.size());
            JSONValue params{JSONValue::Object{}};
            std::string body = req.body();
            bool blank = std::all_of(body.begin(), body.end(), [](unsigned char c) { return std::isspace(c) != 0; });
            if (!blank) {
                try {
                    params = ParseJSON(body);
                } catch (const std::exception& e) {
                    co_return makeJsonResponse(http::status::bad_request, version,
                                               detailBody(std::string("Invalid JSON body: ") + e.what()));
                }
                if (!params.isObject()) {
                    co_return makeJsonResponse(http::status::bad_request, version,
                                               detailBody("Request body must be a JSON object"));
                }
            }
            LOG_INFO("HTTP tool call: {}", name);
            ToolOutcome outcome = co_await asyncInvoke(name, std::move(params), net::use_awaitable);
            if (auto* ok = std::get_if<ToolSuccess>(&outcome)) {
                JSONValue::Object obj;
                obj["status"] = std::make_shared<JSONValue>("success");
                obj["result"] = std::make_shared<JSONValue>(std::move(ok->result));
                co_return makeJsonResponse(http::status::ok, version, JSONValue{obj});
            }
            const auto& failure = std::get<ToolFailure>(outcome);
            http::status status = failure.category == ErrorCategory::NotFound
                ? http::status::not_found : http::status::internal_server_error;
            co_return makeJsonResponse(status, version, detailBody(failure.message));
        }

        co_return makeJsonResponse(http::status::not_found, version, detailBody("Not found"));
    }

    template <class Stream>
    net::awaitable<void> serveConnection(Stream stream) {
        beast::flat_buffer buffer;
        Request req;
        beast::get_lowest_layer(stream).expires_after(HttpReadTimeout);
        co_await http::async_read(stream, buffer, req, net::use_awaitable);

        if (websocket::is_upgrade(req)) {
            std::string target = std::string(req.target());
            if (target.substr(0, target.find('?')) != opts.wsPath) {
                auto res = makeJsonResponse(http::status::not_found, req.version(), detailBody("Not found"));
                co_await http::async_write(stream, res, net::use_awaitable);
                co_return;
            }
            websocket::stream<Stream> ws(std::move(stream));
            WebSocketChannel::ConfigureServerStream(ws);
            co_await ws.async_accept(req, net::use_awaitable);
            attachSession(WebSocketChannel::Adopt(std::move(ws)));
            co_return;
        }

        beast::get_lowest_layer(stream).expires_never();
        Response res = co_await handleHttp(req);
        beast::get_lowest_layer(stream).expires_after(HttpReadTimeout);
        co_await http::async_write(stream, res, net::use_awaitable);
        boost::system::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_send, ec);
        co_return;
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            co_await serveConnection(beast::tcp_stream(std::move(socket)));
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                LOG_WARN("ToolServer plain connection error: {}", e.what());
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("ToolServer plain connection error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            beast::ssl_stream<beast::tcp_stream> tls(std::move(socket), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(HttpReadTimeout);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveConnection(std::move(tls));
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                LOG_WARN("ToolServer TLS connection error: {}", e.what());
            }
        } catch (const std::exception& e) {
            if (running.load()) {
                setError(std::string("ToolServer TLS connection error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                setError(std::string("ToolServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

ToolServer::ToolServer(const Options& opts, std::shared_ptr<const ToolRegistry> registry)
    : pImpl(std::make_unique<Impl>(opts, std::move(registry))) { FUNC_SCOPE(); }

ToolServer::~ToolServer() { FUNC_SCOPE(); }

std::future<void> ToolServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->listen();
    } catch (const std::exception& e) {
        LOG_ERROR("ToolServer failed to start: {}", e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("ToolServer io thread exception: ") + e.what());
        }
    });
    LOG_INFO("ToolServer listening on {}://{}:{} (websocket path {}, {} tool(s))",
             pImpl->sslCtx ? "https" : "http", pImpl->opts.address, pImpl->boundPort.load(),
             pImpl->opts.wsPath, pImpl->registry->Size());
    ready.set_value();
    return fut;
}

std::future<void> ToolServer::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    pImpl->shutdown();
    done.set_value();
    return done.get_future();
}

uint16_t ToolServer::GetBoundPort() const { return pImpl->boundPort.load(); }

std::size_t ToolServer::ActiveSessionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->sessionsMutex);
    return pImpl->sessions.size();
}

void ToolServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace toolwire
