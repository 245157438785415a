//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameRouter.h
// Purpose: Interface for toolwire frame routing (classification and dispatch)
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "toolwire/Protocol.h"

namespace toolwire {

struct FrameHandlers {
    std::function<void(ToolsListFrame&&)> onToolsList;
    std::function<void(ToolRequestFrame&&)> onToolRequest;
    std::function<void(ToolResponseFrame&&)> onToolResponse;
    std::function<void(const std::string&)> onDecodeError;
};

class IFrameRouter {
public:
    virtual ~IFrameRouter() = default;

    enum class FrameKind {
        ToolsList,
        ToolRequest,
        ToolResponse,
        Unknown,
        Malformed
    };

    // Classify a frame without invoking handlers.
    virtual FrameKind classify(const std::string& json) = 0;

    // Decodes one frame and invokes the matching handler. Malformed frames go to onDecodeError;
    // well-formed frames of an unknown type are logged and ignored. Returns the kind observed.
    virtual FrameKind route(const std::string& json, const FrameHandlers& handlers) = 0;
};

const char* toString(IFrameRouter::FrameKind kind);

// Factory: returns the default router implementation
std::unique_ptr<IFrameRouter> MakeDefaultFrameRouter();

} // namespace toolwire
