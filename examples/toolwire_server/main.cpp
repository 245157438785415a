//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolwire server: built-in tools over WebSocket and HTTP
//==========================================================================================================

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "toolwire/Config.h"
#include "toolwire/ToolRegistry.h"
#include "toolwire/ToolServer.h"
#include "toolwire/tools/BuiltinTools.h"
#include "toolwire/version.h"

using namespace toolwire;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig cfg;
    try {
        cfg = LoadServerConfig(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    Logger::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }
    LOG_INFO("toolwire server {} starting", getVersionString());

    auto registry = std::make_shared<ToolRegistry>();
    tools::RegisterBuiltinTools(*registry);
    registry->Freeze();

    std::unique_ptr<ToolServer> server;
    try {
        server = std::make_unique<ToolServer>(cfg.ToServerOptions(), registry);
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed to start: {}", e.what());
        return 1;
    }

    boost::asio::io_context signalIoc;
    boost::asio::signal_set signals(signalIoc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
        }
    });
    signalIoc.run();

    server->Stop().get();
    LOG_INFO("toolwire server exited");
    return 0;
}
