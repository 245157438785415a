//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CorrelationTable.cpp
// Purpose: Pending request bookkeeping with atomic resolve-and-remove and a deadline watcher thread
//==========================================================================================================

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "toolwire/CorrelationTable.h"
#include "toolwire/errors/Errors.h"

namespace toolwire {

using errors::ErrorCategory;

class CorrelationTable::Impl {
public:
    struct PendingRequest {
        std::promise<JSONValue> promise;
        std::string toolName;
    };

    mutable std::mutex requestMutex;
    std::condition_variable_any deadlineCv;
    std::unordered_map<std::string, PendingRequest> pendingRequests;
    std::unordered_map<std::string, Clock::time_point> requestDeadlines;
    bool closed{false};
    uint64_t generation{0};  // bumped whenever the deadline set changes
    std::string closeReason{"Connection closed"};
    std::jthread timeoutThread;

    Impl() {
        timeoutThread = std::jthread([this](std::stop_token st) { watchDeadlines(st); });
    }

    ~Impl() {
        timeoutThread.request_stop();
        deadlineCv.notify_all();
        if (timeoutThread.joinable()) {
            timeoutThread.join();
        }
    }

    // Removes the entry under the lock; the caller completes the promise after unlocking.
    std::optional<PendingRequest> takeLocked(const std::string& requestId) {
        auto it = pendingRequests.find(requestId);
        if (it == pendingRequests.end()) {
            return std::nullopt;
        }
        PendingRequest pending = std::move(it->second);
        pendingRequests.erase(it);
        requestDeadlines.erase(requestId);
        return pending;
    }

    std::optional<Clock::time_point> nextDeadlineLocked() const {
        std::optional<Clock::time_point> next;
        for (const auto& kv : requestDeadlines) {
            if (!next.has_value() || kv.second < *next) {
                next = kv.second;
            }
        }
        return next;
    }

    static void failTimeout(const std::string& requestId, PendingRequest& pending) {
        LOG_WARN("Request {} timed out waiting for tool '{}'", requestId, pending.toolName);
        pending.promise.set_exception(
            errors::makeExceptionPtr(ErrorCategory::Timeout, errors::timeoutMessage(pending.toolName)));
    }

    std::size_t expireDue(Clock::time_point now) {
        std::vector<std::pair<std::string, PendingRequest>> expired;
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            std::vector<std::string> ids;
            for (const auto& kv : requestDeadlines) {
                if (kv.second <= now) {
                    ids.push_back(kv.first);
                }
            }
            for (const auto& id : ids) {
                auto pending = takeLocked(id);
                if (pending.has_value()) {
                    expired.emplace_back(id, std::move(*pending));
                }
            }
        }
        for (auto& [id, pending] : expired) {
            failTimeout(id, pending);
        }
        return expired.size();
    }

    void watchDeadlines(std::stop_token st) {
        while (!st.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(requestMutex);
                auto next = nextDeadlineLocked();
                const uint64_t seen = generation;
                if (next.has_value()) {
                    deadlineCv.wait_until(lock, st, *next, [this, seen] { return generation != seen; });
                } else {
                    deadlineCv.wait(lock, st, [this, seen] { return generation != seen; });
                }
                if (generation != seen) {
                    continue;
                }
            }
            if (st.stop_requested()) {
                break;
            }
            expireDue(Clock::now());
        }
    }
};

CorrelationTable::CorrelationTable() : pImpl(std::make_unique<Impl>()) {}

CorrelationTable::~CorrelationTable() {
    Close("Connection closed");
}

std::future<JSONValue> CorrelationTable::Register(const std::string& requestId, Clock::time_point deadline,
                                                  const std::string& toolName) {
    FUNC_SCOPE();
    std::promise<JSONValue> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->closed) {
            promise.set_exception(errors::makeExceptionPtr(ErrorCategory::ConnectionClosed, pImpl->closeReason));
            return future;
        }
        if (pImpl->pendingRequests.count(requestId) != 0) {
            throw errors::ToolwireException(ErrorCategory::Validation,
                                            "Request id '" + requestId + "' is already pending");
        }
        pImpl->pendingRequests.emplace(requestId, Impl::PendingRequest{std::move(promise), toolName});
        pImpl->requestDeadlines.emplace(requestId, deadline);
        ++pImpl->generation;
    }
    pImpl->deadlineCv.notify_all();
    return future;
}

bool CorrelationTable::Resolve(const std::string& requestId, ToolOutcome outcome) {
    std::optional<Impl::PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pending = pImpl->takeLocked(requestId);
    }
    if (!pending.has_value()) {
        LOG_DEBUG("Dropping response for unknown or completed request id: {}", requestId);
        return false;
    }
    if (auto* ok = std::get_if<ToolSuccess>(&outcome)) {
        pending->promise.set_value(std::move(ok->result));
    } else {
        const auto& failure = std::get<ToolFailure>(outcome);
        pending->promise.set_exception(errors::makeExceptionPtr(failure.category, failure.message));
    }
    return true;
}

bool CorrelationTable::Expire(const std::string& requestId) {
    std::optional<Impl::PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pending = pImpl->takeLocked(requestId);
    }
    if (!pending.has_value()) {
        return false;
    }
    Impl::failTimeout(requestId, *pending);
    return true;
}

std::size_t CorrelationTable::ExpireDue(Clock::time_point now) {
    return pImpl->expireDue(now);
}

std::size_t CorrelationTable::AbandonAll(const std::string& reason) {
    std::unordered_map<std::string, Impl::PendingRequest> abandoned;
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        abandoned.swap(pImpl->pendingRequests);
        pImpl->requestDeadlines.clear();
    }
    for (auto& kv : abandoned) {
        kv.second.promise.set_exception(errors::makeExceptionPtr(ErrorCategory::ConnectionClosed, reason));
    }
    if (!abandoned.empty()) {
        LOG_INFO("Abandoned {} pending request(s): {}", abandoned.size(), reason);
    }
    return abandoned.size();
}

void CorrelationTable::Close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (!pImpl->closed) {
            pImpl->closed = true;
            pImpl->closeReason = reason;
        }
        ++pImpl->generation;
    }
    AbandonAll(reason);
    pImpl->deadlineCv.notify_all();
}

std::optional<CorrelationTable::Clock::time_point> CorrelationTable::NextDeadline() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->nextDeadlineLocked();
}

std::size_t CorrelationTable::Size() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

bool CorrelationTable::Contains(const std::string& requestId) const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.count(requestId) != 0;
}

bool CorrelationTable::IsClosed() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->closed;
}

} // namespace toolwire
