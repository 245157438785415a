//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolwire client: lists the advertised tools and optionally calls one
//==========================================================================================================

#include <exception>
#include <iostream>

#include "logging/Logger.h"
#include "toolwire/Client.h"
#include "toolwire/Config.h"
#include "toolwire/JSONTypes.h"
#include "toolwire/errors/Errors.h"

using namespace toolwire;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ClientConfig cfg;
    JSONValue params{JSONValue::Object{}};
    try {
        cfg = LoadClientConfig(argc, argv);
        if (cfg.params.has_value()) {
            params = ParseJSON(*cfg.params);
            if (!params.isObject()) {
                std::cerr << "--params must be a JSON object" << std::endl;
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    }
    Logger::setLogLevelFromString(cfg.logLevel);

    ClientOptions opts;
    opts.callTimeout = cfg.timeout;
    opts.caFile = cfg.caFile;
    Client client(opts);
    try {
        client.Connect(cfg.url).get();
    } catch (const errors::ToolwireException& e) {
        std::cerr << errors::toString(e.category()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Connection failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Available tools:" << std::endl;
    for (const auto& tool : client.GetAvailableTools()) {
        std::cout << "  " << tool.name << " - " << tool.description << std::endl;
    }

    int rc = 0;
    if (cfg.tool.has_value()) {
        try {
            JSONValue result = client.CallTool(*cfg.tool, params, cfg.timeout).get();
            std::cout << SerializeJSON(result) << std::endl;
        } catch (const errors::ToolwireException& e) {
            std::cerr << errors::toString(e.category()) << ": " << e.what() << std::endl;
            rc = 1;
        }
    }
    client.Disconnect().get();
    return rc;
}
