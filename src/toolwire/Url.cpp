//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.cpp
// Purpose: URL splitting helper
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "toolwire/Url.h"
#include "toolwire/errors/Errors.h"

namespace toolwire {

UrlParts ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
    }
    if (parts.scheme != "http" && parts.scheme != "https" && parts.scheme != "ws" && parts.scheme != "wss") {
        throw errors::ToolwireException(errors::ErrorCategory::Validation,
                                        "Unsupported URL scheme '" + parts.scheme + "' in " + url);
    }

    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
        if (parts.target[0] == '?') {
            parts.target = "/" + parts.target;
        }
    }

    std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.IsSecure() ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    if (parts.host.empty()) {
        throw errors::ToolwireException(errors::ErrorCategory::Validation, "URL has no host: " + url);
    }
    if (parts.port.empty() ||
        !std::all_of(parts.port.begin(), parts.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw errors::ToolwireException(errors::ErrorCategory::Validation, "URL has an invalid port: " + url);
    }

    parts.serverName = parts.host;
    return parts;
}

} // namespace toolwire
