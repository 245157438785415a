//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Encoding and decoding of toolwire frames
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "toolwire/Protocol.h"

namespace toolwire {

namespace {
JSONValue optionalString(const std::optional<std::string>& s) {
    return s.has_value() ? JSONValue(*s) : JSONValue(nullptr);
}
} // namespace

///////////////////////////////////////// ToolDescriptor ///////////////////////////////////////////
JSONValue ToolDescriptor::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["description"] = std::make_shared<JSONValue>(description);
    obj["parameters"] = std::make_shared<JSONValue>(parameters);
    return JSONValue{obj};
}

bool ToolDescriptor::FromJSON(const JSONValue& v) {
    auto n = GetStringMember(v, "name");
    if (!n.has_value() || n->empty()) {
        return false;
    }
    name = *n;
    description = GetStringMember(v, "description").value_or("");
    const JSONValue* params = FindMember(v, "parameters");
    parameters = (params && params->isObject()) ? *params : JSONValue{JSONValue::Object{}};
    return true;
}

bool operator==(const ToolDescriptor& a, const ToolDescriptor& b) {
    return a.name == b.name && a.description == b.description && JSONEquals(a.parameters, b.parameters);
}

///////////////////////////////////////// Frame ///////////////////////////////////////////
JSONValue Frame::ToJSON() const {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(Type());
    obj["data"] = std::make_shared<JSONValue>(DataToJSON());
    return JSONValue{obj};
}

bool Frame::FromJSON(const JSONValue& frame) {
    auto type = GetStringMember(frame, "type");
    if (!type.has_value() || *type != Type()) {
        return false;
    }
    const JSONValue* data = FindMember(frame, "data");
    if (!data || !data->isObject()) {
        return false;
    }
    return DataFromJSON(*data);
}

std::string Frame::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToJSON());
}

bool Frame::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromJSON(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_DEBUG("Frame::Deserialize failed: {}", e.what());
        return false;
    }
}

///////////////////////////////////////// ToolsListFrame ///////////////////////////////////////////
JSONValue ToolsListFrame::DataToJSON() const {
    JSONValue::Array arr;
    arr.reserve(tools.size());
    for (const auto& t : tools) {
        arr.push_back(std::make_shared<JSONValue>(t.ToJSON()));
    }
    JSONValue::Object obj;
    obj["tools"] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue{obj};
}

bool ToolsListFrame::DataFromJSON(const JSONValue& data) {
    const JSONValue* list = FindMember(data, "tools");
    if (!list || !list->isArray()) {
        return false;
    }
    std::vector<ToolDescriptor> parsed;
    for (const auto& item : std::get<JSONValue::Array>(list->value)) {
        ToolDescriptor d;
        if (!item || !d.FromJSON(*item)) {
            return false;
        }
        parsed.push_back(std::move(d));
    }
    tools = std::move(parsed);
    return true;
}

///////////////////////////////////////// ToolRequestFrame ///////////////////////////////////////////
JSONValue ToolRequestFrame::DataToJSON() const {
    JSONValue::Object obj;
    obj["request_id"] = std::make_shared<JSONValue>(optionalString(requestId));
    if (toolName.has_value()) {
        obj["tool_name"] = std::make_shared<JSONValue>(*toolName);
    }
    obj["parameters"] = std::make_shared<JSONValue>(parameters);
    return JSONValue{obj};
}

bool ToolRequestFrame::DataFromJSON(const JSONValue& data) {
    requestId = GetStringMember(data, "request_id");
    toolName = GetStringMember(data, "tool_name");
    if (toolName.has_value() && toolName->empty()) {
        toolName.reset();
    }
    const JSONValue* params = FindMember(data, "parameters");
    if (!params || params->isNull()) {
        parameters = JSONValue{JSONValue::Object{}};
        parametersValid = true;
    } else if (params->isObject()) {
        parameters = *params;
        parametersValid = true;
    } else {
        parameters = JSONValue{JSONValue::Object{}};
        parametersValid = false;
    }
    return true;
}

///////////////////////////////////////// ToolResponseFrame ///////////////////////////////////////////
JSONValue ToolResponseFrame::DataToJSON() const {
    JSONValue::Object obj;
    obj["request_id"] = std::make_shared<JSONValue>(optionalString(requestId));
    if (const auto* ok = std::get_if<ToolSuccess>(&outcome)) {
        obj["result"] = std::make_shared<JSONValue>(ok->result);
    } else {
        obj["error"] = std::make_shared<JSONValue>(std::get<ToolFailure>(outcome).message);
    }
    return JSONValue{obj};
}

bool ToolResponseFrame::DataFromJSON(const JSONValue& data) {
    requestId = GetStringMember(data, "request_id");
    // Key presence decides the branch; error wins when both are present
    if (const JSONValue* err = FindMember(data, "error")) {
        ToolFailure failure;
        failure.category = errors::ErrorCategory::ToolExecution;
        failure.message = err->isString() ? std::get<std::string>(err->value) : SerializeJSON(*err);
        outcome = std::move(failure);
        return true;
    }
    const auto& obj = std::get<JSONValue::Object>(data.value);
    auto it = obj.find("result");
    if (it == obj.end()) {
        return false;
    }
    outcome = ToolSuccess{it->second ? *it->second : JSONValue{}};
    return true;
}

} // namespace toolwire
