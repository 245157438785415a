//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Resolves a tool by name, invokes its handler and normalizes every failure into a ToolFailure
//==========================================================================================================

#pragma once

#include <memory>
#include <stop_token>
#include <string>

#include "toolwire/Protocol.h"
#include "toolwire/ToolRegistry.h"

namespace toolwire {

class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<const ToolRegistry> registry);

    // Invoke a tool once and wait for its result. Never throws for handler failures:
    //   unknown tool    -> ToolFailure{NotFound, "Tool '<name>' not found"}
    //   handler failure -> ToolFailure{ToolExecution, "Error executing tool: <message>"}
    ToolOutcome Invoke(const std::string& name, const JSONValue& parameters,
                       std::stop_token stopToken = {}) const;

    const ToolRegistry& Registry() const { return *registry; }

private:
    std::shared_ptr<const ToolRegistry> registry;
};

} // namespace toolwire
