//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session state machine, inbound request multiplexing and outbound call correlation
//==========================================================================================================

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stop_token>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "toolwire/CorrelationTable.h"
#include "toolwire/FrameRouter.h"
#include "toolwire/Session.h"
#include "toolwire/errors/Errors.h"

namespace toolwire {

using errors::ErrorCategory;

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "Connecting";
        case SessionState::Advertised: return "Advertised";
        case SessionState::Active: return "Active";
        case SessionState::Closed: break;
    }
    return "Closed";
}

namespace {
std::future<JSONValue> failedCall(ErrorCategory category, const std::string& message) {
    std::promise<JSONValue> p;
    p.set_exception(errors::makeExceptionPtr(category, message));
    return p.get_future();
}

std::string newSessionId() {
    static std::mutex genMutex;
    static boost::uuids::random_generator gen;
    std::lock_guard<std::mutex> lock(genMutex);
    return boost::uuids::to_string(gen());
}
} // namespace

class Session::Impl {
public:
    // One inbound request waiting for, or holding, an in-flight slot
    struct InboundJob {
        std::optional<std::string> requestId;
        std::string toolName;
        JSONValue parameters;
    };

    std::weak_ptr<Session> owner;
    std::string sessionId;
    std::shared_ptr<IChannel> channel;
    SessionOptions options;
    std::shared_ptr<const Dispatcher> dispatcher;
    std::weak_ptr<TaskGroup> tasks;
    std::unique_ptr<IFrameRouter> router;
    CorrelationTable table;

    std::atomic<SessionState> state{SessionState::Connecting};
    std::atomic<bool> advertised{false};
    std::atomic<uint64_t> requestCounter{0};
    std::stop_source stopSource;

    // Client-role advertisement
    mutable std::mutex toolsMutex;
    std::vector<ToolDescriptor> advertisedTools;
    bool awaitingAdvertisement{false};
    bool advertisementSettled{false};
    std::promise<void> advertisementPromise;

    // Server-role admission control
    mutable std::mutex inflightMutex;
    std::size_t inFlight{0};
    std::deque<InboundJob> backlog;

    std::mutex closedMutex;
    ClosedHandler closedHandler;

    Impl(std::shared_ptr<IChannel> ch, SessionOptions opts,
         std::shared_ptr<const Dispatcher> disp, std::shared_ptr<TaskGroup> group)
        : sessionId(newSessionId()), channel(std::move(ch)), options(opts),
          dispatcher(std::move(disp)), tasks(group), router(MakeDefaultFrameRouter()) {
        if (options.maxInFlight == 0) {
            options.maxInFlight = 1;
        }
    }

    void installChannelHandlers() {
        std::weak_ptr<Session> weak = owner;
        channel->SetFrameHandler([weak](const std::string& frame) {
            if (auto self = weak.lock()) {
                self->pImpl->onFrame(frame);
            }
        });
        channel->SetCloseHandler([weak](const std::string& reason) {
            if (auto self = weak.lock()) {
                self->Close(reason);
            }
        });
    }

    ////////////////////////////////////////// Receive path ///////////////////////////////////////////
    void onFrame(const std::string& text) {
        if (state.load() == SessionState::Closed) {
            return;
        }
        FrameHandlers handlers;
        handlers.onToolsList = [this](ToolsListFrame&& f) { onToolsList(std::move(f)); };
        handlers.onToolRequest = [this](ToolRequestFrame&& f) { onToolRequest(std::move(f)); };
        handlers.onToolResponse = [this](ToolResponseFrame&& f) { onToolResponse(std::move(f)); };
        auto kind = router->route(text, handlers);
        LOG_DEBUG("Session {} received frame: {}", sessionId, toString(kind));
    }

    // Returns false (after failing the connection) when the first frame is not the advertisement.
    bool checkAdvertisementFirst(const char* gotType) {
        {
            std::lock_guard<std::mutex> lock(toolsMutex);
            if (!awaitingAdvertisement || advertisementSettled) {
                return true;
            }
            advertisementSettled = true;
            advertisementPromise.set_exception(errors::makeExceptionPtr(
                ErrorCategory::Validation, std::string("Expected tools_list message, got ") + gotType));
        }
        LOG_ERROR("Session {}: expected tools_list message, got {}", sessionId, gotType);
        if (auto self = owner.lock()) {
            self->Close("Protocol violation: first frame was not tools_list");
        }
        return false;
    }

    void onToolsList(ToolsListFrame&& frame) {
        std::lock_guard<std::mutex> lock(toolsMutex);
        if (!awaitingAdvertisement || advertisementSettled) {
            LOG_WARN("Session {}: ignoring repeated or unexpected tools_list", sessionId);
            return;
        }
        advertisedTools = std::move(frame.tools);
        advertisementSettled = true;
        state = SessionState::Advertised;
        LOG_INFO("Session {}: received {} tool(s)", sessionId, advertisedTools.size());
        state = SessionState::Active;
        advertisementPromise.set_value();
    }

    void onToolResponse(ToolResponseFrame&& frame) {
        if (!checkAdvertisementFirst(FrameTypes::ToolResponse)) {
            return;
        }
        if (!frame.requestId.has_value()) {
            LOG_DEBUG("Session {}: dropping tool_response without request_id", sessionId);
            return;
        }
        table.Resolve(*frame.requestId, std::move(frame.outcome));
    }

    void onToolRequest(ToolRequestFrame&& frame) {
        if (!checkAdvertisementFirst(FrameTypes::ToolRequest)) {
            return;
        }
        if (state.load() != SessionState::Active) {
            LOG_WARN("Session {}: request before Active; ignoring", sessionId);
            return;
        }
        if (!frame.toolName.has_value()) {
            sendResponse(frame.requestId, ToolFailure{ErrorCategory::Validation, errors::noToolSpecifiedMessage()});
            return;
        }
        if (!frame.parametersValid) {
            sendResponse(frame.requestId, ToolFailure{ErrorCategory::Validation, "parameters must be an object"});
            return;
        }
        if (!dispatcher) {
            sendResponse(frame.requestId,
                         ToolFailure{ErrorCategory::NotFound, errors::toolNotFoundMessage(*frame.toolName)});
            return;
        }
        LOG_INFO("Session {}: tool_request {} for '{}'", sessionId, frame.requestId.value_or("null"), *frame.toolName);
        InboundJob job{frame.requestId, *frame.toolName, std::move(frame.parameters)};
        bool launchNow = false;
        {
            std::lock_guard<std::mutex> lock(inflightMutex);
            if (inFlight < options.maxInFlight) {
                ++inFlight;
                launchNow = true;
            } else if (backlog.size() < options.maxQueued) {
                backlog.push_back(std::move(job));
                return;
            }
        }
        if (!launchNow) {
            LOG_WARN("Session {}: refusing request {}: too many requests in flight",
                     sessionId, job.requestId.value_or("null"));
            sendResponse(job.requestId, ToolFailure{ErrorCategory::ToolExecution, "too many requests in flight"});
            return;
        }
        launch(std::move(job));
    }

    ////////////////////////////////////////// Handler execution ///////////////////////////////////////////
    // Runs job on its own task thread; the caller already holds an in-flight slot for it.
    // The slot is released exactly once: by runJob, or here when the task is refused.
    void launch(InboundJob job) {
        auto self = owner.lock();
        auto group = tasks.lock();
        if (!self || !group) {
            sendResponse(job.requestId, ToolFailure{ErrorCategory::ConnectionClosed, "server shutting down"});
            releaseSlot();
            return;
        }
        auto shared = std::make_shared<InboundJob>(std::move(job));
        bool spawned = group->Spawn([self, shared]() { self->pImpl->runJob(std::move(*shared)); });
        if (!spawned) {
            sendResponse(shared->requestId, ToolFailure{ErrorCategory::ConnectionClosed, "server shutting down"});
            releaseSlot();
        }
    }

    void runJob(InboundJob job) {
        ToolOutcome outcome = dispatcher->Invoke(job.toolName, job.parameters, stopSource.get_token());
        if (IsFailure(outcome)) {
            LOG_WARN("Session {}: tool '{}' request {} failed: {}", sessionId, job.toolName,
                     job.requestId.value_or("null"), std::get<ToolFailure>(outcome).message);
        } else {
            LOG_INFO("Session {}: tool '{}' request {} succeeded", sessionId, job.toolName,
                     job.requestId.value_or("null"));
        }
        sendResponse(job.requestId, std::move(outcome));
        releaseSlot();
    }

    // Hands the slot to the next queued request, or frees it.
    void releaseSlot() {
        std::optional<InboundJob> next;
        {
            std::lock_guard<std::mutex> lock(inflightMutex);
            if (!backlog.empty() && state.load() != SessionState::Closed) {
                next = std::move(backlog.front());
                backlog.pop_front();
            } else if (inFlight > 0) {
                --inFlight;
            }
        }
        if (next.has_value()) {
            launch(std::move(*next));
        }
    }

    void sendResponse(const std::optional<std::string>& requestId, ToolOutcome outcome) {
        if (state.load() == SessionState::Closed) {
            LOG_DEBUG("Session {}: closed; dropping response for {}", sessionId, requestId.value_or("null"));
            return;
        }
        ToolResponseFrame frame(requestId, std::move(outcome));
        if (!channel->Send(frame.Serialize())) {
            LOG_WARN("Session {}: failed to send response for {}", sessionId, requestId.value_or("null"));
        }
    }
};

Session::Session(std::shared_ptr<IChannel> channel, SessionOptions options,
                 std::shared_ptr<const Dispatcher> dispatcher, std::shared_ptr<TaskGroup> tasks)
    : pImpl(std::make_unique<Impl>(std::move(channel), options, std::move(dispatcher), std::move(tasks))) {}

std::shared_ptr<Session> Session::Create(std::shared_ptr<IChannel> channel, SessionOptions options,
                                         std::shared_ptr<const Dispatcher> dispatcher,
                                         std::shared_ptr<TaskGroup> tasks) {
    FUNC_SCOPE();
    if (!channel) {
        throw errors::ToolwireException(ErrorCategory::Validation, "Session requires a channel");
    }
    if (dispatcher && !tasks) {
        throw errors::ToolwireException(ErrorCategory::Validation, "Session with a dispatcher requires a task group");
    }
    std::shared_ptr<Session> session(new Session(std::move(channel), options, std::move(dispatcher), std::move(tasks)));
    session->pImpl->owner = session;
    session->pImpl->installChannelHandlers();
    return session;
}

Session::~Session() {
    FUNC_SCOPE();
    if (pImpl->state.load() != SessionState::Closed) {
        pImpl->state = SessionState::Closed;
        pImpl->stopSource.request_stop();
        pImpl->table.Close("Connection closed");
        pImpl->channel->Close();
    }
}

void Session::StartServer() {
    FUNC_SCOPE();
    if (!pImpl->dispatcher) {
        throw errors::ToolwireException(ErrorCategory::Validation, "StartServer requires a dispatcher");
    }
    LOG_INFO("Session {} connected (channel {})", pImpl->sessionId, pImpl->channel->GetChannelId());
    Advertise();
    SessionState expected = SessionState::Advertised;
    pImpl->state.compare_exchange_strong(expected, SessionState::Active);
    pImpl->channel->Start();
}

bool Session::Advertise() {
    FUNC_SCOPE();
    if (!pImpl->dispatcher) {
        LOG_ERROR("Session {}: nothing to advertise without a dispatcher", pImpl->sessionId);
        return false;
    }
    if (pImpl->advertised.exchange(true)) {
        LOG_ERROR("Session {}: tools_list already sent; refusing to advertise twice", pImpl->sessionId);
        return false;
    }
    ToolsListFrame frame(pImpl->dispatcher->Registry().List());
    if (!pImpl->channel->Send(frame.Serialize())) {
        LOG_ERROR("Session {}: failed to send tools_list", pImpl->sessionId);
        return false;
    }
    SessionState expected = SessionState::Connecting;
    pImpl->state.compare_exchange_strong(expected, SessionState::Advertised);
    LOG_INFO("Session {}: advertised {} tool(s)", pImpl->sessionId, frame.tools.size());
    return true;
}

std::future<void> Session::StartClient() {
    FUNC_SCOPE();
    std::future<void> fut;
    {
        std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
        pImpl->awaitingAdvertisement = true;
        fut = pImpl->advertisementPromise.get_future();
    }
    LOG_INFO("Session {} connecting (channel {})", pImpl->sessionId, pImpl->channel->GetChannelId());
    pImpl->channel->Start();
    return fut;
}

std::future<JSONValue> Session::CallTool(const std::string& name, const JSONValue& parameters) {
    return CallTool(name, parameters, pImpl->options.defaultCallTimeout);
}

std::future<JSONValue> Session::CallTool(const std::string& name, const JSONValue& parameters,
                                         std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    if (pImpl->state.load() != SessionState::Active) {
        return failedCall(ErrorCategory::ConnectionClosed,
                          std::string("Session is not active (state ") + toString(pImpl->state.load()) + ")");
    }
    if (!FindAdvertisedTool(name).has_value()) {
        return failedCall(ErrorCategory::UnknownTool, "Unknown tool: " + name);
    }
    if (!parameters.isObject()) {
        return failedCall(ErrorCategory::Validation, "parameters must be an object");
    }
    const std::string requestId = pImpl->sessionId + "-" + std::to_string(++pImpl->requestCounter);
    auto fut = pImpl->table.Register(requestId, CorrelationTable::Clock::now() + timeout, name);
    ToolRequestFrame frame(requestId, name, parameters);
    if (!pImpl->channel->Send(frame.Serialize())) {
        pImpl->table.Resolve(requestId, ToolFailure{ErrorCategory::ConnectionClosed, "Failed to send request: connection closed"});
    } else {
        LOG_DEBUG("Session {}: sent tool_request {} for '{}'", pImpl->sessionId, requestId, name);
    }
    return fut;
}

std::vector<ToolDescriptor> Session::GetAdvertisedTools() const {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    return pImpl->advertisedTools;
}

std::optional<ToolDescriptor> Session::FindAdvertisedTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
    for (const auto& t : pImpl->advertisedTools) {
        if (t.name == name) {
            return t;
        }
    }
    return std::nullopt;
}

void Session::Close(const std::string& reason) {
    FUNC_SCOPE();
    if (pImpl->state.exchange(SessionState::Closed) == SessionState::Closed) {
        return;
    }
    // Keep this session alive while the closed handler drops other references to it
    auto self = shared_from_this();
    pImpl->stopSource.request_stop();
    pImpl->table.Close(reason);
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
        dropped = pImpl->backlog.size();
        pImpl->backlog.clear();
    }
    if (dropped > 0) {
        LOG_WARN("Session {}: dropped {} queued request(s) on close", pImpl->sessionId, dropped);
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->toolsMutex);
        if (pImpl->awaitingAdvertisement && !pImpl->advertisementSettled) {
            pImpl->advertisementSettled = true;
            pImpl->advertisementPromise.set_exception(errors::makeExceptionPtr(
                ErrorCategory::ConnectionClosed, "Connection closed before tools_list: " + reason));
        }
    }
    pImpl->channel->Close();
    LOG_INFO("Session {} disconnected: {}", pImpl->sessionId, reason);
    ClosedHandler handler;
    {
        std::lock_guard<std::mutex> lock(pImpl->closedMutex);
        handler = std::move(pImpl->closedHandler);
        pImpl->closedHandler = nullptr;
    }
    if (handler) {
        handler(pImpl->sessionId);
    }
}

SessionState Session::GetState() const { return pImpl->state.load(); }

const std::string& Session::GetSessionId() const { return pImpl->sessionId; }

std::size_t Session::PendingCount() const { return pImpl->table.Size(); }

std::size_t Session::InFlightCount() const {
    std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
    return pImpl->inFlight;
}

std::size_t Session::QueuedCount() const {
    std::lock_guard<std::mutex> lock(pImpl->inflightMutex);
    return pImpl->backlog.size();
}

void Session::SetClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->closedMutex);
    pImpl->closedHandler = std::move(handler);
}

} // namespace toolwire
