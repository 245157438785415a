//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: One channel plus its correlation state; multiplexes inbound requests and correlates outbound calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolwire/Channel.h"
#include "toolwire/Dispatcher.h"
#include "toolwire/JSONTypes.h"
#include "toolwire/Protocol.h"
#include "toolwire/TaskGroup.h"

namespace toolwire {

struct SessionOptions {
    // Handler invocations allowed to run at once for this session
    std::size_t maxInFlight{16};
    // Requests waiting for a free slot; beyond this a request is refused immediately
    std::size_t maxQueued{256};
    // Deadline applied by CallTool when no timeout is given
    std::chrono::milliseconds defaultCallTimeout{30000};
};

// Connecting -> Advertised -> Active -> Closed. Closed is terminal.
enum class SessionState {
    Connecting,
    Advertised,
    Active,
    Closed
};

const char* toString(SessionState state);

//==========================================================================================================
// Session
// Purpose: Owns one channel and one CorrelationTable.
//   Server role: sends the tools_list advertisement once, then runs every inbound tool_request through
//   the Dispatcher on a task thread without blocking the receive loop, answering each exactly once.
//   Client role: waits for the advertisement, then issues calls correlated by request id.
// Notes:
//   Both roles can be active on one session; inbound requests on a session without a dispatcher are
//   answered with "Tool '<name>' not found".
//   Create() must be used; the session registers weak callbacks on the channel.
//==========================================================================================================
class Session : public std::enable_shared_from_this<Session> {
public:
    using ClosedHandler = std::function<void(const std::string& sessionId)>;

    //==========================================================================================================
    // Create
    // Args:
    //   channel: Channel to own. Must not be started yet.
    //   options: Concurrency cap and call timeout.
    //   dispatcher: Required for the server role; may be null for a pure client.
    //   tasks: Group that runs each admitted handler invocation on its own thread; required when dispatcher
    //          is set. Held weakly.
    // Throws:
    //   ToolwireException(Validation) when channel is null or a dispatcher is given without tasks.
    //==========================================================================================================
    static std::shared_ptr<Session> Create(std::shared_ptr<IChannel> channel,
                                           SessionOptions options = {},
                                           std::shared_ptr<const Dispatcher> dispatcher = nullptr,
                                           std::shared_ptr<TaskGroup> tasks = nullptr);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    ////////////////////////////////////////// Server role ///////////////////////////////////////////
    // Advertises the registry, enters Active and starts the receive loop.
    // Throws ToolwireException(Validation) without a dispatcher.
    void StartServer();

    // Sends the tools_list frame. Returns false (and logs an error) when it was already sent or the send failed.
    bool Advertise();

    ////////////////////////////////////////// Client role ///////////////////////////////////////////
    // Starts the receive loop. The future completes when the tools_list arrives, or fails when the first
    // frame is of another type or the channel closes first.
    std::future<void> StartClient();

    // Issues one call. Never throws; failures arrive through the future:
    //   UnknownTool (not advertised), Validation (parameters not an object), ConnectionClosed (not Active,
    //   send failure or session closed), Timeout, ToolExecution (remote error).
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& parameters);
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& parameters,
                                    std::chrono::milliseconds timeout);

    std::vector<ToolDescriptor> GetAdvertisedTools() const;
    std::optional<ToolDescriptor> FindAdvertisedTool(const std::string& name) const;

    ////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    // Abandons every pending call with ConnectionClosed(reason), signals running handlers to stop, closes
    // the channel and fires the closed handler. Idempotent.
    void Close(const std::string& reason = "Connection closed");

    SessionState GetState() const;
    const std::string& GetSessionId() const;
    std::size_t PendingCount() const;
    std::size_t InFlightCount() const;
    std::size_t QueuedCount() const;

    void SetClosedHandler(ClosedHandler handler);

private:
    Session(std::shared_ptr<IChannel> channel, SessionOptions options,
            std::shared_ptr<const Dispatcher> dispatcher, std::shared_ptr<TaskGroup> tasks);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolwire
