//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CorrelationTable.h
// Purpose: Per-session map of outstanding request ids to single-assignment result slots with deadlines
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "toolwire/JSONTypes.h"
#include "toolwire/Protocol.h"

namespace toolwire {

//==========================================================================================================
// CorrelationTable
// Purpose: Tracks pending calls. Every pending entry ends exactly once: resolved by a matching response,
//          expired by its deadline, or abandoned when the table closes. Removal of the entry and the write
//          to its slot form one step, so the first of (response, timeout, close) wins and later attempts
//          are no-ops.
// Notes:
//   A background timeout thread expires entries when their deadline passes.
//   Failures are delivered as ToolwireException through the returned future:
//     Timeout          -> "Timeout waiting for response from tool '<name>'"
//     remote error     -> ToolExecution with the remote message
//     closed           -> ConnectionClosed with the close reason
//==========================================================================================================
class CorrelationTable {
public:
    using Clock = std::chrono::steady_clock;

    CorrelationTable();
    ~CorrelationTable();

    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    // Create a pending entry. After Close() the returned future already holds ConnectionClosed.
    //
    // Throws:
    //   ToolwireException(Validation) when the id is already pending.
    std::future<JSONValue> Register(const std::string& requestId, Clock::time_point deadline,
                                    const std::string& toolName);

    // Complete and remove the entry for requestId. Returns false (and drops the outcome) when the id is
    // not pending, e.g. a late response after a timeout or a duplicate response.
    bool Resolve(const std::string& requestId, ToolOutcome outcome);

    // Fail and remove one entry with a Timeout error. Returns false when it is no longer pending.
    bool Expire(const std::string& requestId);

    // Expire every entry whose deadline is at or before now. Returns the number expired.
    std::size_t ExpireDue(Clock::time_point now);

    // Fail every pending entry with ConnectionClosed(reason). Returns the number abandoned.
    std::size_t AbandonAll(const std::string& reason);

    // AbandonAll and refuse further registrations. Idempotent.
    void Close(const std::string& reason);

    std::optional<Clock::time_point> NextDeadline() const;
    std::size_t Size() const;
    bool Contains(const std::string& requestId) const;
    bool IsClosed() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolwire
