//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client_session.cpp
// Purpose: Client-role Session and Client: advertisement handshake, call correlation, timeouts and close
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolwire/Client.h"
#include "toolwire/Dispatcher.h"
#include "toolwire/InMemoryChannel.hpp"
#include "toolwire/Session.h"
#include "toolwire/ToolRegistry.h"
#include "toolwire/TaskGroup.h"
#include "toolwire/errors/Errors.h"
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace toolwire;
using errors::ErrorCategory;
using errors::ToolwireException;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<ToolRegistry> makeRegistry() {
    auto reg = std::make_shared<ToolRegistry>();
    reg->Register("echo", "Echo parameters", JSONValue{JSONValue::Object{}},
                  [](const JSONValue& params, std::stop_token) {
                      return std::async(std::launch::async, [params]() { return params; });
                  });
    reg->Register("delay", "Sleeps for parameters.ms milliseconds", JSONValue{JSONValue::Object{}},
                  [](const JSONValue& params, std::stop_token) {
                      int64_t ms = GetIntMember(params, "ms").value_or(0);
                      return std::async(std::launch::async, [ms]() {
                          std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                          return JSONValue{ms};
                      });
                  });
    reg->Register("explode", "Always fails", JSONValue{JSONValue::Object{}},
                  MakeSyncHandler([](const JSONValue&) -> JSONValue { throw std::runtime_error("kaboom"); }));
    reg->Freeze();
    return reg;
}

ErrorCategory failureCategory(std::future<JSONValue>& fut, std::string* message = nullptr) {
    try {
        (void)fut.get();
    } catch (const ToolwireException& e) {
        if (message) {
            *message = e.what();
        }
        return e.category();
    }
    return ErrorCategory::Unknown;
}

JSONValue delayParams(int64_t ms) {
    JSONValue::Object o;
    o["ms"] = std::make_shared<JSONValue>(ms);
    return JSONValue{o};
}

// Real server session on the far end of an in-memory pair.
class ClientSessionTest : public ::testing::Test {
protected:
    std::shared_ptr<TaskGroup> tasks{std::make_shared<TaskGroup>()};
    std::shared_ptr<Session> server;
    std::shared_ptr<Session> client;

    void SetUp() override {
        auto pair = InMemoryChannel::CreatePair();
        auto dispatcher = std::make_shared<Dispatcher>(makeRegistry());
        server = Session::Create(std::move(pair.second), SessionOptions{}, dispatcher, tasks);
        client = Session::Create(std::move(pair.first));
        server->StartServer();
        auto ready = client->StartClient();
        ASSERT_EQ(ready.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        ready.get();
    }

    void TearDown() override {
        client->Close("test done");
        server->Close("test done");
        tasks->Stop();
    }
};

} // namespace

TEST_F(ClientSessionTest, LearnsAdvertisedTools) {
    EXPECT_EQ(client->GetState(), SessionState::Active);
    auto tools = client->GetAdvertisedTools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[1].name, "delay");
    EXPECT_TRUE(client->FindAdvertisedTool("explode").has_value());
    EXPECT_FALSE(client->FindAdvertisedTool("missing").has_value());
}

TEST_F(ClientSessionTest, CallReturnsResult) {
    auto fut = client->CallTool("echo", ParseJSON(R"({"x":1})"));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(JSONEquals(fut.get(), ParseJSON(R"({"x":1})")));
    EXPECT_EQ(client->PendingCount(), 0u);
}

TEST_F(ClientSessionTest, RemoteErrorRaisesExecutionError) {
    auto fut = client->CallTool("explode", JSONValue{JSONValue::Object{}});
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    std::string message;
    EXPECT_EQ(failureCategory(fut, &message), ErrorCategory::ToolExecution);
    EXPECT_EQ(message, "Error executing tool: kaboom");
}

TEST_F(ClientSessionTest, UnadvertisedToolFailsWithoutSending) {
    auto fut = client->CallTool("missing", JSONValue{JSONValue::Object{}});
    ASSERT_EQ(fut.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
    std::string message;
    EXPECT_EQ(failureCategory(fut, &message), ErrorCategory::UnknownTool);
    EXPECT_EQ(message, "Unknown tool: missing");
    EXPECT_EQ(client->PendingCount(), 0u);
}

TEST_F(ClientSessionTest, NonObjectParametersAreRejectedLocally) {
    auto fut = client->CallTool("echo", JSONValue{"text"});
    EXPECT_EQ(failureCategory(fut), ErrorCategory::Validation);
}

TEST_F(ClientSessionTest, ConcurrentCallsCorrelateOutOfOrder) {
    auto slow = client->CallTool("delay", delayParams(300));
    auto fast = client->CallTool("delay", delayParams(10));
    ASSERT_EQ(fast.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(slow.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);
    EXPECT_EQ(std::get<int64_t>(fast.get().value), 10);
    ASSERT_EQ(slow.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(std::get<int64_t>(slow.get().value), 300);
}

TEST_F(ClientSessionTest, TimeoutBeatsSlowHandlerAndLateResponseIsDropped) {
    auto fut = client->CallTool("delay", delayParams(500), 50ms);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    std::string message;
    EXPECT_EQ(failureCategory(fut, &message), ErrorCategory::Timeout);
    EXPECT_EQ(message, "Timeout waiting for response from tool 'delay'");
    EXPECT_EQ(client->PendingCount(), 0u);

    // Let the late response arrive; the session stays usable
    std::this_thread::sleep_for(600ms);
    EXPECT_EQ(client->GetState(), SessionState::Active);
    auto next = client->CallTool("echo", ParseJSON(R"({"after":"timeout"})"));
    ASSERT_EQ(next.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(JSONEquals(next.get(), ParseJSON(R"({"after":"timeout"})")));
}

TEST_F(ClientSessionTest, CloseFailsOutstandingCalls) {
    auto a = client->CallTool("delay", delayParams(1000));
    auto b = client->CallTool("delay", delayParams(1000));
    EXPECT_EQ(client->PendingCount(), 2u);
    client->Close("user closed");
    ASSERT_EQ(a.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    ASSERT_EQ(b.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    std::string message;
    EXPECT_EQ(failureCategory(a, &message), ErrorCategory::ConnectionClosed);
    EXPECT_EQ(message, "user closed");
    EXPECT_EQ(failureCategory(b), ErrorCategory::ConnectionClosed);
    EXPECT_EQ(client->PendingCount(), 0u);

    auto after = client->CallTool("echo", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(failureCategory(after), ErrorCategory::ConnectionClosed);
}

TEST_F(ClientSessionTest, ServerCloseFailsOutstandingCalls) {
    auto fut = client->CallTool("delay", delayParams(1000));
    server->Close("server going away");
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(failureCategory(fut), ErrorCategory::ConnectionClosed);
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (client->GetState() != SessionState::Closed && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(client->GetState(), SessionState::Closed);
}

TEST_F(ClientSessionTest, RequestIdsAreUniquePerSession) {
    std::vector<std::future<JSONValue>> futs;
    for (int i = 0; i < 50; ++i) {
        JSONValue::Object o;
        o["i"] = std::make_shared<JSONValue>(static_cast<int64_t>(i));
        futs.push_back(client->CallTool("echo", JSONValue{o}));
    }
    for (int i = 0; i < 50; ++i) {
        ASSERT_EQ(futs[static_cast<std::size_t>(i)].wait_for(std::chrono::seconds(2)), std::future_status::ready);
        EXPECT_EQ(GetIntMember(futs[static_cast<std::size_t>(i)].get(), "i").value_or(-1), i);
    }
}

////////////////////////////////////////// Handshake against a scripted peer //////////////////////////////////////////

TEST(ClientHandshake, FirstFrameMustBeToolsList) {
    auto pair = InMemoryChannel::CreatePair();
    auto peer = std::move(pair.second);
    auto client = Session::Create(std::move(pair.first));
    peer->Start().get();
    auto ready = client->StartClient();
    ASSERT_TRUE(peer->Send(R"({"type":"tool_request","data":{"request_id":"x","tool_name":"echo","parameters":{}}})"));
    ASSERT_EQ(ready.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    try {
        ready.get();
        FAIL() << "expected Validation";
    } catch (const ToolwireException& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Validation);
        EXPECT_STREQ(e.what(), "Expected tools_list message, got tool_request");
    }
    EXPECT_EQ(client->GetState(), SessionState::Closed);
    peer->Close().get();
}

TEST(ClientHandshake, RepeatedToolsListIsIgnored) {
    auto pair = InMemoryChannel::CreatePair();
    auto peer = std::move(pair.second);
    auto client = Session::Create(std::move(pair.first));
    peer->Start().get();
    auto ready = client->StartClient();
    ASSERT_TRUE(peer->Send(R"({"type":"tools_list","data":{"tools":[{"name":"one","description":"1","parameters":{}}]}})"));
    ASSERT_EQ(ready.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ready.get();
    ASSERT_TRUE(peer->Send(R"({"type":"tools_list","data":{"tools":[{"name":"two","description":"2","parameters":{}}]}})"));
    auto call = client->CallTool("one", JSONValue{JSONValue::Object{}});
    // Give the receive loop time to handle the second list
    std::this_thread::sleep_for(50ms);
    auto tools = client->GetAdvertisedTools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "one");
    EXPECT_EQ(client->GetState(), SessionState::Active);
    client->Close();
    EXPECT_EQ(failureCategory(call), ErrorCategory::ConnectionClosed);
    peer->Close().get();
}

TEST(ClientHandshake, ChannelCloseBeforeAdvertisementFailsConnect) {
    auto pair = InMemoryChannel::CreatePair();
    auto peer = std::move(pair.second);
    auto client = Session::Create(std::move(pair.first));
    auto ready = client->StartClient();
    peer->Close().get();
    ASSERT_EQ(ready.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    try {
        ready.get();
        FAIL() << "expected ConnectionClosed";
    } catch (const ToolwireException& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ConnectionClosed);
    }
}

TEST(ClientHandshake, CallBeforeActiveFails) {
    auto pair = InMemoryChannel::CreatePair();
    auto client = Session::Create(std::move(pair.first));
    auto fut = client->CallTool("echo", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(failureCategory(fut), ErrorCategory::ConnectionClosed);
    client->Close();
}

////////////////////////////////////////// Client facade //////////////////////////////////////////

TEST(ClientFacade, ConnectOverChannelAndCall) {
    auto tasks = std::make_shared<TaskGroup>();
    auto pair = InMemoryChannel::CreatePair();
    auto server = Session::Create(std::move(pair.second), SessionOptions{},
                                  std::make_shared<Dispatcher>(makeRegistry()), tasks);
    server->StartServer();
    {
        Client client;
        EXPECT_FALSE(client.IsConnected());
        client.Connect(std::shared_ptr<IChannel>(std::move(pair.first))).get();
        EXPECT_TRUE(client.IsConnected());
        EXPECT_EQ(client.GetToolNames(), (std::vector<std::string>{"echo", "delay", "explode"}));
        ASSERT_TRUE(client.GetToolByName("echo").has_value());
        EXPECT_EQ(client.GetToolByName("echo")->description, "Echo parameters");

        auto fut = client.CallTool("echo", ParseJSON(R"({"hello":"world"})"));
        ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        EXPECT_EQ(GetStringMember(fut.get(), "hello").value_or(""), "world");

        client.Disconnect().get();
        EXPECT_FALSE(client.IsConnected());
        auto after = client.CallTool("echo", JSONValue{JSONValue::Object{}});
        EXPECT_EQ(failureCategory(after), ErrorCategory::ConnectionClosed);
    }
    server->Close();
    tasks->Stop();
}

TEST(ClientFacade, ConnectTimesOutWithoutAdvertisement) {
    ClientOptions opts;
    opts.connectTimeout = 100ms;
    Client client(opts);
    auto pair = InMemoryChannel::CreatePair();
    auto silent = std::move(pair.second);
    silent->Start().get();
    auto fut = client.Connect(std::shared_ptr<IChannel>(std::move(pair.first)));
    try {
        fut.get();
        FAIL() << "expected Timeout";
    } catch (const ToolwireException& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Timeout);
    }
    EXPECT_FALSE(client.IsConnected());
    silent->Close().get();
}

TEST(ClientFacade, CallWithoutConnectFails) {
    Client client;
    auto fut = client.CallTool("echo", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(failureCategory(fut), ErrorCategory::ConnectionClosed);
    EXPECT_TRUE(client.GetAvailableTools().empty());
}
