//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_session.cpp
// Purpose: Server-role Session: advertisement, request multiplexing, admission control and close
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolwire/Dispatcher.h"
#include "toolwire/InMemoryChannel.hpp"
#include "toolwire/Session.h"
#include "toolwire/ToolRegistry.h"
#include "toolwire/TaskGroup.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace toolwire;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<ToolRegistry> makeRegistry(std::shared_future<void> gate, std::shared_ptr<std::atomic<bool>> sawStop) {
    auto reg = std::make_shared<ToolRegistry>();
    reg->Register("echo", "Echo parameters", JSONValue{JSONValue::Object{}},
                  [](const JSONValue& params, std::stop_token) {
                      return std::async(std::launch::async, [params]() { return params; });
                  });
    reg->Register("sleep", "Sleeps before answering", JSONValue{JSONValue::Object{}},
                  [](const JSONValue&, std::stop_token) {
                      return std::async(std::launch::async, []() {
                          std::this_thread::sleep_for(300ms);
                          return JSONValue{"slept"};
                      });
                  });
    reg->Register("gate", "Waits for the test to open the gate", JSONValue{JSONValue::Object{}},
                  [gate](const JSONValue&, std::stop_token) {
                      return std::async(std::launch::async, [gate]() {
                          gate.wait();
                          return JSONValue{"opened"};
                      });
                  });
    reg->Register("explode", "Always fails", JSONValue{JSONValue::Object{}},
                  MakeSyncHandler([](const JSONValue&) -> JSONValue { throw std::runtime_error("kaboom"); }));
    reg->Register("cooperative", "Runs until cancelled", JSONValue{JSONValue::Object{}},
                  [sawStop](const JSONValue&, std::stop_token st) {
                      return std::async(std::launch::async, [st, sawStop]() {
                          auto deadline = std::chrono::steady_clock::now() + 5s;
                          while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                              std::this_thread::sleep_for(5ms);
                          }
                          *sawStop = st.stop_requested();
                          return JSONValue{"stopped"};
                      });
                  });
    reg->Freeze();
    return reg;
}

const JSONValue& dataOf(const JSONValue& frame) {
    return *FindMember(frame, "data");
}

std::string requestFrame(const std::string& id, const std::string& tool, const std::string& params = "{}") {
    return R"({"type":"tool_request","data":{"request_id":")" + id + R"(","tool_name":")" + tool +
           R"(","parameters":)" + params + "}}";
}

// Server session on one end of an in-memory pair; the test drives the other end by hand.
class ServerSessionTest : public ::testing::Test {
protected:
    std::promise<void> gateOpen;
    std::shared_future<void> gate{gateOpen.get_future().share()};
    std::shared_ptr<std::atomic<bool>> sawStop{std::make_shared<std::atomic<bool>>(false)};
    std::shared_ptr<TaskGroup> tasks{std::make_shared<TaskGroup>()};
    std::shared_ptr<Session> session;
    std::unique_ptr<InMemoryChannel> peer;
    bool gateOpened{false};

    std::mutex m;
    std::condition_variable cv;
    std::vector<JSONValue> frames;

    void start(SessionOptions opts = {}) {
        auto pair = InMemoryChannel::CreatePair();
        peer = std::move(pair.second);
        peer->SetFrameHandler([this](const std::string& text) {
            std::lock_guard<std::mutex> lock(m);
            frames.push_back(ParseJSON(text));
            cv.notify_all();
        });
        auto dispatcher = std::make_shared<Dispatcher>(makeRegistry(gate, sawStop));
        session = Session::Create(std::move(pair.first), opts, dispatcher, tasks);
        peer->Start().get();
        session->StartServer();
    }

    bool waitFrames(std::size_t n, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, timeout, [&]() { return frames.size() >= n; });
    }

    JSONValue frameAt(std::size_t i) {
        std::lock_guard<std::mutex> lock(m);
        return frames.at(i);
    }

    // Response frame for request id, waiting until it arrives.
    std::optional<JSONValue> responseFor(const std::string& id, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(m);
        std::optional<JSONValue> found;
        cv.wait_for(lock, timeout, [&]() {
            for (const auto& f : frames) {
                if (GetStringMember(f, "type").value_or("") == "tool_response" &&
                    GetStringMember(dataOf(f), "request_id").value_or("") == id) {
                    found = f;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    void openGate() {
        if (!gateOpened) {
            gateOpened = true;
            gateOpen.set_value();
        }
    }

    void TearDown() override {
        openGate();
        if (peer) {
            peer->Close().get();
        }
        if (session) {
            session->Close("test done");
        }
        tasks->Stop();
    }
};

} // namespace

TEST_F(ServerSessionTest, AdvertisesRegistryFirst) {
    start();
    ASSERT_TRUE(waitFrames(1));
    JSONValue first = frameAt(0);
    EXPECT_EQ(GetStringMember(first, "type").value_or(""), "tools_list");
    const auto& tools = std::get<JSONValue::Array>(FindMember(dataOf(first), "tools")->value);
    ASSERT_EQ(tools.size(), 5u);
    EXPECT_EQ(GetStringMember(*tools[0], "name").value_or(""), "echo");
    EXPECT_EQ(GetStringMember(*tools[4], "name").value_or(""), "cooperative");
    EXPECT_EQ(session->GetState(), SessionState::Active);
}

TEST_F(ServerSessionTest, AdvertiseOnlyOnce) {
    start();
    ASSERT_TRUE(waitFrames(1));
    EXPECT_FALSE(session->Advertise());
    ASSERT_TRUE(peer->Send(requestFrame("r1", "echo")));
    ASSERT_TRUE(responseFor("r1").has_value());
    std::lock_guard<std::mutex> lock(m);
    int lists = 0;
    for (const auto& f : frames) {
        if (GetStringMember(f, "type").value_or("") == "tools_list") {
            ++lists;
        }
    }
    EXPECT_EQ(lists, 1);
}

TEST_F(ServerSessionTest, EchoRequestGetsCorrelatedResult) {
    start();
    ASSERT_TRUE(peer->Send(requestFrame("r1", "echo", R"({"x":1})")));
    auto resp = responseFor("r1");
    ASSERT_TRUE(resp.has_value());
    const JSONValue& data = dataOf(*resp);
    ASSERT_TRUE(FindMember(data, "result") != nullptr);
    EXPECT_TRUE(FindMember(data, "error") == nullptr);
    EXPECT_TRUE(JSONEquals(*FindMember(data, "result"), ParseJSON(R"({"x":1})")));
}

TEST_F(ServerSessionTest, UnknownToolIsReportedNotFound) {
    start();
    ASSERT_TRUE(peer->Send(requestFrame("r2", "nope")));
    auto resp = responseFor("r2");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(GetStringMember(dataOf(*resp), "error").value_or(""), "Tool 'nope' not found");
    EXPECT_TRUE(FindMember(dataOf(*resp), "result") == nullptr);
}

TEST_F(ServerSessionTest, MissingToolNameIsAnswered) {
    start();
    ASSERT_TRUE(peer->Send(R"({"type":"tool_request","data":{"request_id":"r3","parameters":{}}})"));
    auto resp = responseFor("r3");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(GetStringMember(dataOf(*resp), "error").value_or(""), "no tool specified");
}

TEST_F(ServerSessionTest, MissingRequestIdIsEchoedAsNull) {
    start();
    ASSERT_TRUE(waitFrames(1));
    ASSERT_TRUE(peer->Send(R"({"type":"tool_request","data":{"tool_name":"echo","parameters":{"y":2}}})"));
    ASSERT_TRUE(waitFrames(2));
    JSONValue resp = frameAt(1);
    EXPECT_EQ(GetStringMember(resp, "type").value_or(""), "tool_response");
    const JSONValue* id = FindMember(dataOf(resp), "request_id");
    ASSERT_TRUE(id != nullptr);
    EXPECT_TRUE(id->isNull());
    EXPECT_TRUE(JSONEquals(*FindMember(dataOf(resp), "result"), ParseJSON(R"({"y":2})")));
}

TEST_F(ServerSessionTest, NonObjectParametersAreRejected) {
    start();
    ASSERT_TRUE(peer->Send(requestFrame("r4", "echo", "[1,2]")));
    auto resp = responseFor("r4");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(GetStringMember(dataOf(*resp), "error").value_or(""), "parameters must be an object");
}

TEST_F(ServerSessionTest, HandlerFailureIsReported) {
    start();
    ASSERT_TRUE(peer->Send(requestFrame("r5", "explode")));
    auto resp = responseFor("r5");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(GetStringMember(dataOf(*resp), "error").value_or(""), "Error executing tool: kaboom");
}

TEST_F(ServerSessionTest, MalformedFrameDoesNotCloseSession) {
    start();
    ASSERT_TRUE(peer->Send("{this is not json"));
    ASSERT_TRUE(peer->Send(R"({"type":"mystery","data":{}})"));
    ASSERT_TRUE(peer->Send(requestFrame("r6", "echo", R"({"still":"alive"})")));
    auto resp = responseFor("r6");
    ASSERT_TRUE(resp.has_value());
    EXPECT_TRUE(FindMember(dataOf(*resp), "result") != nullptr);
    EXPECT_EQ(session->GetState(), SessionState::Active);
}

TEST_F(ServerSessionTest, SlowHandlerDoesNotDelayLaterRequests) {
    start();
    ASSERT_TRUE(waitFrames(1));
    ASSERT_TRUE(peer->Send(requestFrame("slow", "sleep")));
    ASSERT_TRUE(peer->Send(requestFrame("fast", "echo")));
    ASSERT_TRUE(responseFor("slow").has_value());
    ASSERT_TRUE(responseFor("fast").has_value());

    std::lock_guard<std::mutex> lock(m);
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(GetStringMember(dataOf(frames[1]), "request_id").value_or(""), "fast");
    EXPECT_EQ(GetStringMember(dataOf(frames[2]), "request_id").value_or(""), "slow");
}

TEST_F(ServerSessionTest, InFlightCapQueuesThenRefuses) {
    SessionOptions opts;
    opts.maxInFlight = 1;
    opts.maxQueued = 1;
    start(opts);
    ASSERT_TRUE(peer->Send(requestFrame("a", "gate")));
    ASSERT_TRUE(peer->Send(requestFrame("b", "echo")));
    ASSERT_TRUE(peer->Send(requestFrame("c", "echo")));

    // Third request exceeds running + queued and is refused at once
    auto refused = responseFor("c");
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ(GetStringMember(dataOf(*refused), "error").value_or(""), "too many requests in flight");
    EXPECT_EQ(session->InFlightCount(), 1u);
    EXPECT_EQ(session->QueuedCount(), 1u);
    EXPECT_FALSE(responseFor("b", 100ms).has_value());

    openGate();
    auto a = responseFor("a");
    auto b = responseFor("b");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(std::get<std::string>(FindMember(dataOf(*a), "result")->value), "opened");
    EXPECT_TRUE(FindMember(dataOf(*b), "result") != nullptr);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (session->InFlightCount() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(session->InFlightCount(), 0u);
    EXPECT_EQ(session->QueuedCount(), 0u);
}

TEST_F(ServerSessionTest, SlowCallsInOneSessionDoNotDelayAnother) {
    start();
    ASSERT_TRUE(waitFrames(1));
    // More blocked calls than a small shared pool would have threads
    constexpr int Blocked = 8;
    for (int i = 0; i < Blocked; ++i) {
        ASSERT_TRUE(peer->Send(requestFrame("slow-" + std::to_string(i), "gate")));
    }
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (session->InFlightCount() != Blocked && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(session->InFlightCount(), static_cast<std::size_t>(Blocked));

    // Second session on the same task group
    auto pair = InMemoryChannel::CreatePair();
    std::unique_ptr<InMemoryChannel> otherPeer = std::move(pair.second);
    std::promise<JSONValue> echoed;
    std::atomic<bool> answered{false};
    otherPeer->SetFrameHandler([&](const std::string& text) {
        JSONValue f = ParseJSON(text);
        if (GetStringMember(f, "type").value_or("") == "tool_response" && !answered.exchange(true)) {
            echoed.set_value(f);
        }
    });
    auto other = Session::Create(std::move(pair.first), SessionOptions{},
                                 std::make_shared<Dispatcher>(makeRegistry(gate, sawStop)), tasks);
    otherPeer->Start().get();
    other->StartServer();
    ASSERT_TRUE(otherPeer->Send(requestFrame("quick", "echo", R"({"n":1})")));

    auto fut = echoed.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::milliseconds(1000)), std::future_status::ready);
    JSONValue response = fut.get();
    EXPECT_EQ(GetStringMember(dataOf(response), "request_id").value_or(""), "quick");
    EXPECT_EQ(GetIntMember(*FindMember(dataOf(response), "result"), "n").value_or(0), 1);
    EXPECT_EQ(session->InFlightCount(), static_cast<std::size_t>(Blocked));

    otherPeer->Close().get();
    other->Close("test done");

    openGate();
    for (int i = 0; i < Blocked; ++i) {
        EXPECT_TRUE(responseFor("slow-" + std::to_string(i)).has_value());
    }
}

TEST_F(ServerSessionTest, PeerCloseClosesSessionAndFiresHandler) {
    start();
    std::promise<std::string> closedId;
    session->SetClosedHandler([&](const std::string& id) { closedId.set_value(id); });
    ASSERT_TRUE(waitFrames(1));
    peer->Close().get();
    auto fut = closedId.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fut.get(), session->GetSessionId());
    EXPECT_EQ(session->GetState(), SessionState::Closed);
}

TEST_F(ServerSessionTest, CloseSignalsRunningHandlers) {
    start();
    ASSERT_TRUE(peer->Send(requestFrame("coop", "cooperative")));
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (session->InFlightCount() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(session->InFlightCount(), 1u);
    session->Close("shutting down");
    tasks->Stop();
    EXPECT_TRUE(sawStop->load());
}

TEST(ServerSession, StartServerRequiresDispatcher) {
    auto pair = InMemoryChannel::CreatePair();
    auto session = Session::Create(std::move(pair.first));
    EXPECT_THROW(session->StartServer(), errors::ToolwireException);
    EXPECT_THROW(Session::Create(nullptr), errors::ToolwireException);
    session->Close();
}
