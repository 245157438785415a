//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read TOOLWIRE_* and other environment variables safely.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

// Returns the variable only when it is set to a non-empty value.
inline std::optional<std::string> GetEnvOptional(const char* name) {
    std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return std::nullopt;
    }
    return v;
}

// Interprets "1", "true", "yes" and "on" (any case) as enabled.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    auto v = GetEnvOptional(name);
    if (!v.has_value()) {
        return defaultValue;
    }
    std::string s;
    for (char c : *v) {
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return s == "1" || s == "true" || s == "yes" || s == "on";
}
