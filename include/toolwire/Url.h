//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.h
// Purpose: Minimal URL splitting for ws://, wss://, http:// and https:// endpoints
//==========================================================================================================

#pragma once

#include <string>

namespace toolwire {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;      // path plus query, always starting with '/'
    std::string serverName;  // SNI / certificate host name

    bool IsSecure() const { return scheme == "wss" || scheme == "https"; }
};

//==========================================================================================================
// ParseUrl
// Purpose: Splits scheme://host[:port][/path[?query]]. A missing scheme means http; a missing port is
//          taken from the scheme (80 for http/ws, 443 for https/wss).
// Throws:
//   ToolwireException(Validation) when the host is empty or the scheme is not one of the four above.
//==========================================================================================================
UrlParts ParseUrl(const std::string& url);

} // namespace toolwire
