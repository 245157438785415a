//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: toolwire client implementation
//==========================================================================================================

#include <mutex>

#include "logging/Logger.h"
#include "toolwire/Client.h"
#include "toolwire/Session.h"
#include "toolwire/WebSocketChannel.hpp"
#include "toolwire/errors/Errors.h"

namespace toolwire {

using errors::ErrorCategory;

class Client::Impl {
public:
    ClientOptions options;
    mutable std::mutex sessionMutex;
    std::shared_ptr<IChannel> channel;
    std::shared_ptr<Session> session;

    explicit Impl(ClientOptions o) : options(std::move(o)) {}

    std::shared_ptr<Session> current() const {
        std::lock_guard<std::mutex> lock(sessionMutex);
        return session;
    }

    void attach(std::shared_ptr<IChannel> ch) {
        if (!ch) {
            throw errors::ToolwireException(ErrorCategory::Validation, "Client requires a channel");
        }
        if (auto existing = current()) {
            if (existing->GetState() != SessionState::Closed) {
                throw errors::ToolwireException(ErrorCategory::Validation, "Client is already connected");
            }
        }
        SessionOptions sopts;
        sopts.defaultCallTimeout = options.callTimeout;
        auto s = Session::Create(ch, sopts);
        {
            std::lock_guard<std::mutex> lock(sessionMutex);
            channel = ch;
            session = s;
        }
        auto advertised = s->StartClient();
        if (advertised.wait_for(options.connectTimeout) != std::future_status::ready) {
            s->Close("Timed out waiting for tools_list");
            throw errors::ToolwireException(ErrorCategory::Timeout, "Timed out waiting for tools_list");
        }
        advertised.get();
        LOG_INFO("Client connected; {} tool(s) available", s->GetAdvertisedTools().size());
    }
};

Client::Client(ClientOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) { FUNC_SCOPE(); }

Client::~Client() {
    FUNC_SCOPE();
    if (auto s = pImpl->current()) {
        s->Close("Client destroyed");
    }
}

std::future<void> Client::Connect(const std::string& url) {
    FUNC_SCOPE();
    std::promise<void> promise;
    try {
        WebSocketChannel::Options wsOpts;
        wsOpts.url = url;
        wsOpts.caFile = pImpl->options.caFile;
        wsOpts.connectTimeout = pImpl->options.connectTimeout;
        std::shared_ptr<IChannel> ch = WebSocketChannel::Connect(wsOpts);
        pImpl->attach(std::move(ch));
        promise.set_value();
    } catch (const std::exception& e) {
        LOG_ERROR("Connect to {} failed: {}", url, e.what());
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

std::future<void> Client::Connect(std::shared_ptr<IChannel> channel) {
    FUNC_SCOPE();
    std::promise<void> promise;
    try {
        pImpl->attach(std::move(channel));
        promise.set_value();
    } catch (const std::exception& e) {
        LOG_ERROR("Connect failed: {}", e.what());
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

std::future<void> Client::Disconnect() {
    FUNC_SCOPE();
    if (auto s = pImpl->current()) {
        s->Close("Client disconnected");
    }
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool Client::IsConnected() const {
    auto s = pImpl->current();
    return s && s->GetState() == SessionState::Active;
}

std::vector<ToolDescriptor> Client::GetAvailableTools() const {
    auto s = pImpl->current();
    return s ? s->GetAdvertisedTools() : std::vector<ToolDescriptor>{};
}

std::vector<std::string> Client::GetToolNames() const {
    std::vector<std::string> names;
    for (const auto& t : GetAvailableTools()) {
        names.push_back(t.name);
    }
    return names;
}

std::optional<ToolDescriptor> Client::GetToolByName(const std::string& name) const {
    auto s = pImpl->current();
    return s ? s->FindAdvertisedTool(name) : std::nullopt;
}

std::future<JSONValue> Client::CallTool(const std::string& name, const JSONValue& parameters) {
    return CallTool(name, parameters, pImpl->options.callTimeout);
}

std::future<JSONValue> Client::CallTool(const std::string& name, const JSONValue& parameters,
                                        std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    auto s = pImpl->current();
    if (!s) {
        std::promise<JSONValue> p;
        p.set_exception(errors::makeExceptionPtr(ErrorCategory::ConnectionClosed, "Client is not connected"));
        return p.get_future();
    }
    return s->CallTool(name, parameters, timeout);
}

JSONValue ExecuteToolOnce(const std::string& url, const std::string& name, const JSONValue& parameters,
                          std::chrono::milliseconds timeout, const ClientOptions& options) {
    FUNC_SCOPE();
    Client client(options);
    client.Connect(url).get();

    // Disconnect on every exit path
    struct DisconnectGuard {
        Client& c;
        ~DisconnectGuard() { c.Disconnect(); }
    } guard{client};

    if (!client.GetToolByName(name).has_value()) {
        throw errors::ToolwireException(ErrorCategory::UnknownTool, "Tool '" + name + "' is not advertised by " + url);
    }
    return client.CallTool(name, parameters, timeout).get();
}

} // namespace toolwire
