//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: toolwire client interface - connects to a tool server and calls tools over one session
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolwire/Channel.h"
#include "toolwire/JSONTypes.h"
#include "toolwire/Protocol.h"

namespace toolwire {

struct ClientOptions {
    // Bound on connecting plus receiving the tools_list advertisement
    std::chrono::milliseconds connectTimeout{10000};
    // Deadline for CallTool without an explicit timeout
    std::chrono::milliseconds callTimeout{30000};
    // CA bundle for wss:// (system defaults when empty)
    std::string caFile;
};

//==========================================================================================================
// toolwire client interface
// Purpose: Client-role view of one session.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Connects to ws://host:port/path (or wss://) and waits for the tools_list advertisement.
    // Returns:
    //   A future that completes once tools are known; it holds a ToolwireException on failure
    //   (ConnectionClosed, Timeout, or Validation when the first frame is not tools_list).
    //==========================================================================================================
    virtual std::future<void> Connect(const std::string& url) = 0;

    //==========================================================================================================
    // Same as Connect(url) over an already established, not yet started channel.
    //==========================================================================================================
    virtual std::future<void> Connect(std::shared_ptr<IChannel> channel) = 0;

    //==========================================================================================================
    // Closes the session. Outstanding calls fail with ConnectionClosed.
    //==========================================================================================================
    virtual std::future<void> Disconnect() = 0;

    virtual bool IsConnected() const = 0;

    ////////////////////////////////////////// Tools ///////////////////////////////////////////
    virtual std::vector<ToolDescriptor> GetAvailableTools() const = 0;
    virtual std::vector<std::string> GetToolNames() const = 0;
    virtual std::optional<ToolDescriptor> GetToolByName(const std::string& name) const = 0;

    //==========================================================================================================
    // Calls a tool. The future yields the result or holds a ToolwireException (UnknownTool, Timeout,
    // ConnectionClosed, ToolExecution with the remote message).
    //==========================================================================================================
    virtual std::future<JSONValue> CallTool(const std::string& name, const JSONValue& parameters) = 0;
    virtual std::future<JSONValue> CallTool(const std::string& name, const JSONValue& parameters,
                                            std::chrono::milliseconds timeout) = 0;
};

//==========================================================================================================
// Client
// Purpose: Default IClient over a client-role Session.
//==========================================================================================================
class Client : public IClient {
public:
    explicit Client(ClientOptions options = {});
    virtual ~Client();

    std::future<void> Connect(const std::string& url) override;
    std::future<void> Connect(std::shared_ptr<IChannel> channel) override;
    std::future<void> Disconnect() override;
    bool IsConnected() const override;

    std::vector<ToolDescriptor> GetAvailableTools() const override;
    std::vector<std::string> GetToolNames() const override;
    std::optional<ToolDescriptor> GetToolByName(const std::string& name) const override;

    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& parameters) override;
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& parameters,
                                    std::chrono::milliseconds timeout) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ExecuteToolOnce
// Purpose: Connect, check the tool is advertised, call it, and always disconnect.
// Returns:
//   The tool result.
// Throws:
//   ToolwireException (UnknownTool when not advertised, plus every CallTool/Connect failure).
//==========================================================================================================
JSONValue ExecuteToolOnce(const std::string& url, const std::string& name, const JSONValue& parameters,
                          std::chrono::milliseconds timeout, const ClientOptions& options = {});

} // namespace toolwire
