//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_url.cpp
// Purpose: URL splitting for WebSocket and HTTP endpoints
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolwire/Url.h"
#include "toolwire/errors/Errors.h"

using namespace toolwire;
using errors::ToolwireException;

TEST(Url, WebSocketDefaults) {
    UrlParts u = ParseUrl("ws://localhost/ws");
    EXPECT_EQ(u.scheme, "ws");
    EXPECT_EQ(u.host, "localhost");
    EXPECT_EQ(u.port, "80");
    EXPECT_EQ(u.target, "/ws");
    EXPECT_EQ(u.serverName, "localhost");
    EXPECT_FALSE(u.IsSecure());

    UrlParts s = ParseUrl("WSS://tools.example.com");
    EXPECT_EQ(s.scheme, "wss");
    EXPECT_EQ(s.port, "443");
    EXPECT_EQ(s.target, "/");
    EXPECT_TRUE(s.IsSecure());
}

TEST(Url, ExplicitPortAndQuery) {
    UrlParts u = ParseUrl("http://127.0.0.1:8089/tools/echo?x=1");
    EXPECT_EQ(u.host, "127.0.0.1");
    EXPECT_EQ(u.port, "8089");
    EXPECT_EQ(u.target, "/tools/echo?x=1");

    UrlParts q = ParseUrl("https://api.github.com?page=2");
    EXPECT_EQ(q.port, "443");
    EXPECT_EQ(q.target, "/?page=2");

    UrlParts bare = ParseUrl("example.com:8080/path");
    EXPECT_EQ(bare.scheme, "http");
    EXPECT_EQ(bare.port, "8080");
}

TEST(Url, RejectsUnusableInput) {
    EXPECT_THROW(ParseUrl("ftp://example.com/"), ToolwireException);
    EXPECT_THROW(ParseUrl("ws:///path"), ToolwireException);
    EXPECT_THROW(ParseUrl("ws://host:/ws"), ToolwireException);
    EXPECT_THROW(ParseUrl("ws://host:80a/ws"), ToolwireException);
}
