//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpFetch.h
// Purpose: Blocking HTTP/HTTPS request helper used by the web-facing built-in tools
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace toolwire::tools {

struct HttpFetchRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpFetchResponse {
    int status{0};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

//==========================================================================================================
// HttpFetch
// Purpose: Performs one request with "Connection: close" on a private io_context, on the calling thread.
//          https verifies the peer against the system trust store (TLS 1.2 or newer).
// Throws:
//   ToolwireException(Validation) for an unsupported URL or method.
//   ToolwireException(Timeout) when the deadline passes.
//   std::system_error / boost::system::system_error for network and TLS failures.
//==========================================================================================================
HttpFetchResponse HttpFetch(const HttpFetchRequest& request);

} // namespace toolwire::tools
