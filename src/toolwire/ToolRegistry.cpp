//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registration, lookup and advertisement listing
//==========================================================================================================

#include "logging/Logger.h"
#include "toolwire/ToolRegistry.h"
#include "toolwire/errors/Errors.h"

namespace toolwire {

using errors::ErrorCategory;
using errors::ToolwireException;

ToolHandler MakeSyncHandler(SyncToolHandler fn) {
    return [fn = std::move(fn)](const JSONValue& params, std::stop_token st) {
        (void)st;
        return std::async(std::launch::deferred, [fn, params]() { return fn(params); });
    };
}

void ToolRegistry::Register(const ToolDescriptor& descriptor, ToolHandler handler) {
    FUNC_SCOPE();
    if (frozen) {
        throw ToolwireException(ErrorCategory::Validation,
                                "Cannot register tool '" + descriptor.name + "': registry is frozen");
    }
    if (descriptor.name.empty()) {
        throw ToolwireException(ErrorCategory::Validation, "Tool name must not be empty");
    }
    if (!handler) {
        throw ToolwireException(ErrorCategory::Validation, "Tool '" + descriptor.name + "' has no handler");
    }
    if (index.count(descriptor.name) != 0) {
        throw ToolwireException(ErrorCategory::DuplicateName,
                                "Tool '" + descriptor.name + "' is already registered");
    }
    index.emplace(descriptor.name, tools.size());
    tools.push_back(RegisteredTool{descriptor, std::move(handler)});
    LOG_INFO("Registered tool: {}", descriptor.name);
}

void ToolRegistry::Register(const std::string& name, const std::string& description,
                            const JSONValue& parameterSchema, ToolHandler handler) {
    Register(ToolDescriptor{name, description, parameterSchema}, std::move(handler));
}

const RegisteredTool& ToolRegistry::Lookup(const std::string& name) const {
    const RegisteredTool* tool = Find(name);
    if (!tool) {
        throw ToolwireException(ErrorCategory::NotFound, errors::toolNotFoundMessage(name));
    }
    return *tool;
}

const RegisteredTool* ToolRegistry::Find(const std::string& name) const {
    auto it = index.find(name);
    if (it == index.end()) {
        return nullptr;
    }
    return &tools[it->second];
}

std::vector<ToolDescriptor> ToolRegistry::List() const {
    std::vector<ToolDescriptor> out;
    out.reserve(tools.size());
    for (const auto& t : tools) {
        out.push_back(t.descriptor);
    }
    return out;
}

} // namespace toolwire
