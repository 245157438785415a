//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameRouter.cpp
// Purpose: Default implementation for toolwire frame routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolwire/FrameRouter.h"

namespace toolwire {

const char* toString(IFrameRouter::FrameKind kind) {
    switch (kind) {
        case IFrameRouter::FrameKind::ToolsList: return FrameTypes::ToolsList;
        case IFrameRouter::FrameKind::ToolRequest: return FrameTypes::ToolRequest;
        case IFrameRouter::FrameKind::ToolResponse: return FrameTypes::ToolResponse;
        case IFrameRouter::FrameKind::Unknown: return "unknown";
        case IFrameRouter::FrameKind::Malformed: break;
    }
    return "malformed";
}

namespace {

class FrameRouter : public IFrameRouter {
public:
    FrameKind classify(const std::string& json) override {
        JSONValue frame;
        std::string error;
        return classifyParsed(json, frame, error);
    }

    FrameKind route(const std::string& json, const FrameHandlers& handlers) override {
        JSONValue frame;
        std::string error;
        FrameKind kind = classifyParsed(json, frame, error);
        switch (kind) {
            case FrameKind::ToolsList: {
                ToolsListFrame f;
                if (!f.FromJSON(frame)) {
                    return decodeError(handlers, "invalid tools_list payload");
                }
                if (handlers.onToolsList) {
                    handlers.onToolsList(std::move(f));
                }
                return kind;
            }
            case FrameKind::ToolRequest: {
                ToolRequestFrame f;
                if (!f.FromJSON(frame)) {
                    return decodeError(handlers, "invalid tool_request payload");
                }
                if (handlers.onToolRequest) {
                    handlers.onToolRequest(std::move(f));
                }
                return kind;
            }
            case FrameKind::ToolResponse: {
                ToolResponseFrame f;
                if (!f.FromJSON(frame)) {
                    return decodeError(handlers, "tool_response carries neither result nor error");
                }
                if (handlers.onToolResponse) {
                    handlers.onToolResponse(std::move(f));
                }
                return kind;
            }
            case FrameKind::Unknown:
                LOG_WARN("FrameRouter: ignoring frame of unknown type: {}", error);
                return kind;
            case FrameKind::Malformed:
                break;
        }
        return decodeError(handlers, error);
    }

private:
    static FrameKind decodeError(const FrameHandlers& handlers, const std::string& what) {
        LOG_ERROR("DecodeError: {}", what);
        if (handlers.onDecodeError) {
            handlers.onDecodeError(what);
        }
        return FrameKind::Malformed;
    }

    // Parses once; on Unknown/Malformed, 'error' describes why.
    static FrameKind classifyParsed(const std::string& json, JSONValue& frame, std::string& error) {
        try {
            frame = ParseJSON(json);
        } catch (const std::exception& e) {
            error = std::string("invalid JSON: ") + e.what();
            return FrameKind::Malformed;
        }
        if (!frame.isObject()) {
            error = "frame is not a JSON object";
            return FrameKind::Malformed;
        }
        auto type = GetStringMember(frame, "type");
        if (!type.has_value()) {
            error = "frame has no string 'type'";
            return FrameKind::Malformed;
        }
        const JSONValue* data = FindMember(frame, "data");
        if (!data || !data->isObject()) {
            error = "frame '" + *type + "' has no object 'data'";
            return FrameKind::Malformed;
        }
        if (*type == FrameTypes::ToolsList) return FrameKind::ToolsList;
        if (*type == FrameTypes::ToolRequest) return FrameKind::ToolRequest;
        if (*type == FrameTypes::ToolResponse) return FrameKind::ToolResponse;
        error = *type;
        return FrameKind::Unknown;
    }
};

} // namespace

std::unique_ptr<IFrameRouter> MakeDefaultFrameRouter() {
    return std::make_unique<FrameRouter>();
}

} // namespace toolwire
