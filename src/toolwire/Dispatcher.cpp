//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Tool invocation with error normalization
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "toolwire/Dispatcher.h"

namespace toolwire {

using errors::ErrorCategory;

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> registry)
    : registry(std::move(registry)) {
    if (!this->registry) {
        throw errors::ToolwireException(ErrorCategory::Validation, "Dispatcher requires a registry");
    }
}

ToolOutcome Dispatcher::Invoke(const std::string& name, const JSONValue& parameters,
                               std::stop_token stopToken) const {
    FUNC_SCOPE();
    const RegisteredTool* tool = registry->Find(name);
    if (!tool) {
        LOG_WARN("Dispatcher: tool not found: {}", name);
        return ToolFailure{ErrorCategory::NotFound, errors::toolNotFoundMessage(name)};
    }
    try {
        auto fut = tool->handler(parameters, stopToken);
        if (!fut.valid()) {
            throw std::runtime_error("handler returned no result");
        }
        JSONValue result = fut.get();
        LOG_DEBUG("Dispatcher: tool '{}' succeeded", name);
        return ToolSuccess{std::move(result)};
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatcher: tool '{}' failed: {}", name, e.what());
        return ToolFailure{ErrorCategory::ToolExecution, errors::toolExecutionMessage(e.what())};
    } catch (...) {
        LOG_ERROR("Dispatcher: tool '{}' failed with a non-standard exception", name);
        return ToolFailure{ErrorCategory::ToolExecution, errors::toolExecutionMessage("unknown error")};
    }
}

} // namespace toolwire
