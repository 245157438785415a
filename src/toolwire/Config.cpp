//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Server and client settings from TOOLWIRE_* environment variables and --key=value overrides
//==========================================================================================================

#include <cctype>

#include "env/EnvVars.h"
#include "toolwire/Config.h"
#include "toolwire/errors/Errors.h"

namespace toolwire {

namespace {

// Reads ENV then "--flag=value"; the command line wins.
std::optional<std::string> lookup(int argc, char** argv, const char* envName, const std::string& flag) {
    std::optional<std::string> v = GetEnvOptional(envName);
    if (auto arg = GetArgValue(argc, argv, flag)) {
        v = *arg;
    }
    return v;
}

std::size_t parseCount(const std::string& key, const std::string& value, std::size_t minimum) {
    bool digits = !value.empty() && value.size() <= 9;
    for (unsigned char c : value) {
        if (!std::isdigit(c)) { digits = false; break; }
    }
    if (!digits) {
        throw errors::ToolwireException(errors::ErrorCategory::Validation,
                                        "Invalid value for " + key + ": '" + value + "'");
    }
    std::size_t n = static_cast<std::size_t>(std::stoul(value));
    if (n < minimum) {
        throw errors::ToolwireException(errors::ErrorCategory::Validation,
                                        key + " must be at least " + std::to_string(minimum));
    }
    return n;
}

void applyString(int argc, char** argv, const char* envName, const std::string& flag, std::string& out) {
    if (auto v = lookup(argc, argv, envName, flag)) {
        out = *v;
    }
}

void applyCount(int argc, char** argv, const char* envName, const std::string& flag,
                std::size_t minimum, std::size_t& out) {
    if (auto v = lookup(argc, argv, envName, flag)) {
        out = parseCount(flag, *v, minimum);
    }
}

} // namespace

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    std::optional<std::string> found;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (a.compare(0, eq, key) == 0 && eq == key.size()) {
            found = a.substr(eq + 1);
        }
    }
    return found;
}

ServerConfig LoadServerConfig(int argc, char** argv) {
    ServerConfig cfg;
    applyString(argc, argv, "TOOLWIRE_HOST", "--host", cfg.host);
    applyString(argc, argv, "TOOLWIRE_PORT", "--port", cfg.port);
    applyString(argc, argv, "TOOLWIRE_WS_PATH", "--ws-path", cfg.wsPath);
    applyString(argc, argv, "TOOLWIRE_CERT", "--cert", cfg.certFile);
    applyString(argc, argv, "TOOLWIRE_KEY", "--key", cfg.keyFile);
    applyCount(argc, argv, "TOOLWIRE_WORKERS", "--workers", 1, cfg.workers);
    applyCount(argc, argv, "TOOLWIRE_MAX_INFLIGHT", "--max-inflight", 1, cfg.maxInFlight);
    applyCount(argc, argv, "TOOLWIRE_MAX_QUEUED", "--max-queued", 0, cfg.maxQueued);
    applyString(argc, argv, "TOOLWIRE_LOG_LEVEL", "--log-level", cfg.logLevel);
    applyString(argc, argv, "TOOLWIRE_LOG_FILE", "--log-file", cfg.logFile);

    std::size_t port = parseCount("--port", cfg.port, 0);
    if (port > 65535) {
        throw errors::ToolwireException(errors::ErrorCategory::Validation, "--port out of range: " + cfg.port);
    }
    if (cfg.wsPath.empty() || cfg.wsPath.front() != '/') {
        throw errors::ToolwireException(errors::ErrorCategory::Validation,
                                        "Invalid value for --ws-path: '" + cfg.wsPath + "'");
    }
    if (cfg.certFile.empty() != cfg.keyFile.empty()) {
        throw errors::ToolwireException(errors::ErrorCategory::Validation,
                                        "--cert and --key must be given together");
    }
    return cfg;
}

ToolServer::Options ServerConfig::ToServerOptions() const {
    ToolServer::Options o;
    o.address = host;
    o.port = port;
    o.wsPath = wsPath;
    o.scheme = TlsEnabled() ? "https" : "http";
    o.certFile = certFile;
    o.keyFile = keyFile;
    o.workerThreads = workers;
    o.session.maxInFlight = maxInFlight;
    o.session.maxQueued = maxQueued;
    return o;
}

ClientConfig LoadClientConfig(int argc, char** argv) {
    ClientConfig cfg;
    applyString(argc, argv, "TOOLWIRE_URL", "--url", cfg.url);
    applyString(argc, argv, "TOOLWIRE_CA_FILE", "--ca-file", cfg.caFile);
    applyString(argc, argv, "TOOLWIRE_LOG_LEVEL", "--log-level", cfg.logLevel);
    std::size_t timeoutMs = static_cast<std::size_t>(cfg.timeout.count());
    applyCount(argc, argv, "TOOLWIRE_TIMEOUT_MS", "--timeout-ms", 1, timeoutMs);
    cfg.timeout = std::chrono::milliseconds(static_cast<long long>(timeoutMs));
    cfg.tool = GetArgValue(argc, argv, "--tool");
    cfg.params = GetArgValue(argc, argv, "--params");
    return cfg;
}

} // namespace toolwire
