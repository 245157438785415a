//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server and client settings from TOOLWIRE_* environment variables and --key=value overrides
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "toolwire/ToolServer.h"

namespace toolwire {

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::string port{"8089"};
    std::string wsPath{"/ws"};
    std::string certFile;
    std::string keyFile;
    std::size_t workers{4};
    std::size_t maxInFlight{16};
    std::size_t maxQueued{256};
    std::string logLevel{"INFO"};
    std::string logFile;

    bool TlsEnabled() const { return !certFile.empty() && !keyFile.empty(); }
    ToolServer::Options ToServerOptions() const;
};

struct ClientConfig {
    std::string url{"ws://localhost:8089/ws"};
    std::chrono::milliseconds timeout{30000};
    std::string caFile;
    std::string logLevel{"INFO"};
    std::optional<std::string> tool;
    std::optional<std::string> params; // JSON object text
};

//==========================================================================================================
// GetArgValue
// Purpose: Finds "--key=value" among the command-line arguments.
// Args:
//   key: Option name including leading dashes (e.g., "--port")
// Returns:
//   Value of the last occurrence, or nullopt when absent.
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

// Environment first, then command-line overrides.
// Throws ToolwireException(Validation) naming the key when a numeric value is malformed
// or only one of cert/key is given.
ServerConfig LoadServerConfig(int argc, char** argv);
ClientConfig LoadClientConfig(int argc, char** argv);

} // namespace toolwire
