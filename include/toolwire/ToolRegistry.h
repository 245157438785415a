//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name-keyed table of tools built once at startup and frozen before sessions are accepted
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolwire/JSONTypes.h"
#include "toolwire/Protocol.h"

namespace toolwire {

// Async, cancellable handler form using std::stop_token (C++20)
using ToolHandler = std::function<std::future<JSONValue>(const JSONValue&, std::stop_token)>;

// Synchronous handler form; throw to report a failure.
using SyncToolHandler = std::function<JSONValue(const JSONValue&)>;

// Wraps a synchronous function as a ToolHandler that runs on the caller's thread (deferred).
ToolHandler MakeSyncHandler(SyncToolHandler fn);

// A registered tool: its advertised descriptor plus the capability that executes it.
struct RegisteredTool {
    ToolDescriptor descriptor;
    ToolHandler handler;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Holds tools in registration order. Mutated only before Freeze(); after that it is shared
//          read-only across sessions without locking.
//==========================================================================================================
class ToolRegistry {
public:
    using const_iterator = std::vector<RegisteredTool>::const_iterator;

    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    ////////////////////////////////////////// Registration ///////////////////////////////////////////
    // Register a tool.
    //
    // Throws:
    //   ToolwireException(DuplicateName) when the name is already registered.
    //   ToolwireException(Validation) when frozen, the name is empty or the handler is null.
    void Register(const ToolDescriptor& descriptor, ToolHandler handler);
    void Register(const std::string& name, const std::string& description,
                  const JSONValue& parameterSchema, ToolHandler handler);

    // Make the registry read-only. Idempotent.
    void Freeze() noexcept { frozen = true; }
    bool IsFrozen() const noexcept { return frozen; }

    ////////////////////////////////////////// Lookup ///////////////////////////////////////////
    // Returns the entry for name or throws ToolwireException(NotFound).
    const RegisteredTool& Lookup(const std::string& name) const;

    // Returns the entry for name or nullptr.
    const RegisteredTool* Find(const std::string& name) const;

    // Descriptors in registration order.
    std::vector<ToolDescriptor> List() const;

    // Restartable iteration in registration order.
    const_iterator begin() const { return tools.begin(); }
    const_iterator end() const { return tools.end(); }

    std::size_t Size() const noexcept { return tools.size(); }

private:
    std::vector<RegisteredTool> tools;
    std::unordered_map<std::string, std::size_t> index;
    bool frozen{false};
};

} // namespace toolwire
