//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpFetch.cpp
// Purpose: Blocking HTTP/HTTPS request helper used by the web-facing built-in tools
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolwire/Url.h"
#include "toolwire/errors/Errors.h"
#include "toolwire/tools/HttpFetch.h"
#include "toolwire/version.h"

namespace toolwire::tools {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

http::verb toVerb(const std::string& method) {
    std::string m;
    for (char c : method) {
        m.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (m == "GET") return http::verb::get;
    if (m == "POST") return http::verb::post;
    if (m == "PUT") return http::verb::put;
    if (m == "DELETE") return http::verb::delete_;
    throw errors::ToolwireException(errors::ErrorCategory::Validation, "Unsupported HTTP method: " + method);
}

http::request<http::string_body> buildRequest(const HttpFetchRequest& in, const UrlParts& u, http::verb verb) {
    http::request<http::string_body> req{verb, u.target, 11};
    req.set(http::field::host, u.host);
    req.set(http::field::user_agent, std::string("toolwire/") + getVersionString());
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : in.headers) {
        req.set(name, value);
    }
    if (!in.body.empty()) {
        req.body() = in.body;
        req.prepare_payload();
    }
    return req;
}

HttpFetchResponse toResult(http::response<http::string_body>&& res) {
    HttpFetchResponse out;
    out.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        out.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    out.body = std::move(res.body());
    return out;
}

net::awaitable<HttpFetchResponse> coFetch(HttpFetchRequest in, UrlParts u, http::verb verb, ssl::context* sslCtx) {
    auto ex = co_await net::this_coro::executor;
    tcp::resolver resolver(ex);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
    auto req = buildRequest(in, u, verb);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    if (sslCtx) {
        beast::ssl_stream<beast::tcp_stream> stream(ex, *sslCtx);
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.serverName.c_str())) {
            LOG_WARN("HttpFetch: failed to set SNI hostname {}", u.serverName);
        }
        if (!::SSL_set1_host(stream.native_handle(), u.serverName.c_str())) {
            LOG_WARN("HttpFetch: failed to set certificate hostname {}", u.serverName);
        }
        beast::get_lowest_layer(stream).expires_after(in.timeout);
        co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    } else {
        beast::tcp_stream stream(ex);
        stream.expires_after(in.timeout);
        co_await stream.async_connect(results, net::use_awaitable);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
    co_return toResult(std::move(res));
}

} // namespace

HttpFetchResponse HttpFetch(const HttpFetchRequest& request) {
    UrlParts u = ParseUrl(request.url);
    if (u.scheme != "http" && u.scheme != "https") {
        throw errors::ToolwireException(errors::ErrorCategory::Validation,
                                        "Unsupported URL scheme for HTTP request: " + u.scheme);
    }
    const http::verb verb = toVerb(request.method);

    std::unique_ptr<ssl::context> sslCtx;
    if (u.IsSecure()) {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        sslCtx->set_default_verify_paths();
        sslCtx->set_verify_mode(ssl::verify_peer);
    }

    LOG_DEBUG("HttpFetch: {} {}", request.method, request.url);
    net::io_context ioc;
    HttpFetchResponse result;
    std::exception_ptr failure;
    net::co_spawn(ioc, coFetch(request, u, verb, sslCtx.get()),
                  [&](std::exception_ptr ep, HttpFetchResponse r) {
                      failure = ep;
                      result = std::move(r);
                  });
    ioc.run();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const boost::system::system_error& e) {
            if (e.code() == beast::error::timeout) {
                throw errors::ToolwireException(errors::ErrorCategory::Timeout,
                                                "HTTP request to " + request.url + " timed out");
            }
            throw;
        }
    }
    return result;
}

} // namespace toolwire::tools
