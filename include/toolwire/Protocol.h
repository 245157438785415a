//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: toolwire wire protocol: frame types, tool descriptors and the tagged tool outcome
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "toolwire/JSONTypes.h"
#include "toolwire/errors/Errors.h"

namespace toolwire {

///////////////////////////////////////// Frame discriminators ///////////////////////////////////////////
namespace FrameTypes {
    constexpr const char* ToolsList = "tools_list";
    constexpr const char* ToolRequest = "tool_request";
    constexpr const char* ToolResponse = "tool_response";
}

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Advertised view of a tool (the handler is never part of the wire form).
struct ToolDescriptor {
    std::string name;
    std::string description;
    JSONValue parameters;  // parameter name -> {type, description}

    ToolDescriptor() : parameters(JSONValue::Object{}) {}
    ToolDescriptor(std::string name, std::string description, JSONValue parameters = JSONValue{JSONValue::Object{}})
        : name(std::move(name)), description(std::move(description)), parameters(std::move(parameters)) {}

    JSONValue ToJSON() const;
    bool FromJSON(const JSONValue& v);
};

bool operator==(const ToolDescriptor& a, const ToolDescriptor& b);

///////////////////////////////////////// Outcome ///////////////////////////////////////////
// Internal tagged result of one invocation. On the wire it becomes key presence (result vs error).
struct ToolSuccess {
    JSONValue result;
};

struct ToolFailure {
    errors::ErrorCategory category{errors::ErrorCategory::ToolExecution};
    std::string message;
};

using ToolOutcome = std::variant<ToolSuccess, ToolFailure>;

inline bool IsFailure(const ToolOutcome& outcome) {
    return std::holds_alternative<ToolFailure>(outcome);
}

//==========================================================================================================
// Frame
// Purpose: Abstract base for the JSON frames exchanged on a channel: {"type": ..., "data": {...}}.
// Methods:
//   Serialize(): Compact JSON string for the frame.
//   Deserialize(json): Parses a frame of this type; returns false on malformed input or type mismatch.
//   ToJSON()/FromJSON(v): The same, on an already-parsed value.
//==========================================================================================================
class Frame {
public:
    virtual ~Frame() = default;
    virtual const char* Type() const = 0;
    virtual JSONValue DataToJSON() const = 0;
    virtual bool DataFromJSON(const JSONValue& data) = 0;

    JSONValue ToJSON() const;
    bool FromJSON(const JSONValue& frame);
    std::string Serialize() const;
    bool Deserialize(const std::string& json);
};

//==========================================================================================================
// ToolsListFrame
// Purpose: Capability advertisement sent once, server to client, right after the connection opens.
//==========================================================================================================
class ToolsListFrame : public Frame {
public:
    std::vector<ToolDescriptor> tools;

    ToolsListFrame() = default;
    explicit ToolsListFrame(std::vector<ToolDescriptor> tools) : tools(std::move(tools)) {}

    const char* Type() const override { return FrameTypes::ToolsList; }
    JSONValue DataToJSON() const override;
    bool DataFromJSON(const JSONValue& data) override;
};

//==========================================================================================================
// ToolRequestFrame
// Purpose: One tool invocation. Fields absent on the wire stay empty so the receiver can answer them.
// Fields:
//   requestId: Correlation id (echoed as null when absent).
//   toolName: Tool to invoke; absent means "no tool specified".
//   parameters: Parameter bundle; {} when absent.
//   parametersValid: False when "parameters" was present but not an object.
//==========================================================================================================
class ToolRequestFrame : public Frame {
public:
    std::optional<std::string> requestId;
    std::optional<std::string> toolName;
    JSONValue parameters{JSONValue::Object{}};
    bool parametersValid{true};

    ToolRequestFrame() = default;
    ToolRequestFrame(std::string requestId, std::string toolName, JSONValue parameters)
        : requestId(std::move(requestId)), toolName(std::move(toolName)), parameters(std::move(parameters)) {}

    const char* Type() const override { return FrameTypes::ToolRequest; }
    JSONValue DataToJSON() const override;
    bool DataFromJSON(const JSONValue& data) override;
};

//==========================================================================================================
// ToolResponseFrame
// Purpose: Reply correlated by requestId carrying exactly one of result or error.
// Methods:
//   IsError(): True when the outcome is a failure.
//==========================================================================================================
class ToolResponseFrame : public Frame {
public:
    std::optional<std::string> requestId;
    ToolOutcome outcome{ToolSuccess{}};

    ToolResponseFrame() = default;
    ToolResponseFrame(std::optional<std::string> requestId, ToolOutcome outcome)
        : requestId(std::move(requestId)), outcome(std::move(outcome)) {}

    const char* Type() const override { return FrameTypes::ToolResponse; }
    JSONValue DataToJSON() const override;
    bool DataFromJSON(const JSONValue& data) override;

    bool IsError() const { return IsFailure(outcome); }
};

} // namespace toolwire
