//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy, typed exception and wire message helpers for toolwire
//==========================================================================================================

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace toolwire {
namespace errors {

// Categorization of every failure the dispatch core can surface.
enum class ErrorCategory {
    NotFound,
    Validation,
    ToolExecution,
    Timeout,
    ConnectionClosed,
    Decode,
    DuplicateName,
    UnknownTool,
    Unknown
};

// Stable, human-readable name of a category (e.g. "NotFoundError").
inline const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NotFound: return "NotFoundError";
        case ErrorCategory::Validation: return "ValidationError";
        case ErrorCategory::ToolExecution: return "ToolExecutionError";
        case ErrorCategory::Timeout: return "TimeoutError";
        case ErrorCategory::ConnectionClosed: return "ConnectionClosedError";
        case ErrorCategory::Decode: return "DecodeError";
        case ErrorCategory::DuplicateName: return "DuplicateNameError";
        case ErrorCategory::UnknownTool: return "UnknownToolError";
        case ErrorCategory::Unknown: break;
    }
    return "UnknownError";
}

//==========================================================================================================
// ToolwireException
// Purpose: Exception carrying an ErrorCategory. Thrown by synchronous APIs and stored in futures
//          returned by asynchronous ones.
//==========================================================================================================
class ToolwireException : public std::runtime_error {
public:
    ToolwireException(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Convenience: an exception_ptr holding a ToolwireException, for promise::set_exception.
inline std::exception_ptr makeExceptionPtr(ErrorCategory category, const std::string& message) {
    return std::make_exception_ptr(ToolwireException(category, message));
}

// Wire error messages.
inline std::string noToolSpecifiedMessage() {
    return "no tool specified";
}

inline std::string toolNotFoundMessage(const std::string& name) {
    return "Tool '" + name + "' not found";
}

inline std::string toolExecutionMessage(const std::string& detail) {
    return "Error executing tool: " + detail;
}

inline std::string timeoutMessage(const std::string& toolName) {
    return "Timeout waiting for response from tool '" + toolName + "'";
}

} // namespace errors
} // namespace toolwire
