//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_dispatcher.cpp
// Purpose: Dispatcher invocation outcomes
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolwire/Dispatcher.h"
#include "toolwire/errors/Errors.h"
#include <future>
#include <stdexcept>
#include <stop_token>

using namespace toolwire;
using errors::ErrorCategory;

namespace {
std::shared_ptr<ToolRegistry> makeRegistry() {
    auto reg = std::make_shared<ToolRegistry>();
    reg->Register("echo", "Echo parameters", JSONValue{JSONValue::Object{}},
                  [](const JSONValue& params, std::stop_token) {
                      return std::async(std::launch::async, [params]() { return params; });
                  });
    reg->Register("explode", "Always fails", JSONValue{JSONValue::Object{}},
                  MakeSyncHandler([](const JSONValue&) -> JSONValue { throw std::runtime_error("kaboom"); }));
    reg->Register("empty", "Returns an invalid future", JSONValue{JSONValue::Object{}},
                  [](const JSONValue&, std::stop_token) { return std::future<JSONValue>{}; });
    reg->Register("nothing", "Returns null", JSONValue{JSONValue::Object{}},
                  MakeSyncHandler([](const JSONValue&) { return JSONValue{}; }));
    reg->Register("cooperative", "Observes cancellation", JSONValue{JSONValue::Object{}},
                  [](const JSONValue&, std::stop_token st) {
                      return std::async(std::launch::async, [st]() { return JSONValue{st.stop_requested()}; });
                  });
    reg->Freeze();
    return reg;
}
}

TEST(Dispatcher, RequiresRegistry) {
    EXPECT_THROW(Dispatcher(nullptr), errors::ToolwireException);
}

TEST(Dispatcher, SuccessCarriesResult) {
    Dispatcher d(makeRegistry());
    ToolOutcome out = d.Invoke("echo", ParseJSON(R"({"x":1})"));
    ASSERT_FALSE(IsFailure(out));
    EXPECT_TRUE(JSONEquals(std::get<ToolSuccess>(out).result, ParseJSON(R"({"x":1})")));
}

TEST(Dispatcher, NullResultIsSuccess) {
    Dispatcher d(makeRegistry());
    ToolOutcome out = d.Invoke("nothing", JSONValue{JSONValue::Object{}});
    ASSERT_FALSE(IsFailure(out));
    EXPECT_TRUE(std::get<ToolSuccess>(out).result.isNull());
}

TEST(Dispatcher, UnknownToolIsNotFound) {
    Dispatcher d(makeRegistry());
    ToolOutcome out = d.Invoke("nope", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(IsFailure(out));
    const auto& f = std::get<ToolFailure>(out);
    EXPECT_EQ(f.category, ErrorCategory::NotFound);
    EXPECT_EQ(f.message, "Tool 'nope' not found");
}

TEST(Dispatcher, HandlerExceptionBecomesExecutionError) {
    Dispatcher d(makeRegistry());
    ToolOutcome out = d.Invoke("explode", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(IsFailure(out));
    const auto& f = std::get<ToolFailure>(out);
    EXPECT_EQ(f.category, ErrorCategory::ToolExecution);
    EXPECT_EQ(f.message, "Error executing tool: kaboom");
}

TEST(Dispatcher, InvalidFutureBecomesExecutionError) {
    Dispatcher d(makeRegistry());
    ToolOutcome out = d.Invoke("empty", JSONValue{JSONValue::Object{}});
    ASSERT_TRUE(IsFailure(out));
    EXPECT_EQ(std::get<ToolFailure>(out).category, ErrorCategory::ToolExecution);
}

TEST(Dispatcher, PassesStopToken) {
    Dispatcher d(makeRegistry());
    std::stop_source src;
    src.request_stop();
    ToolOutcome out = d.Invoke("cooperative", JSONValue{JSONValue::Object{}}, src.get_token());
    ASSERT_FALSE(IsFailure(out));
    EXPECT_TRUE(std::get<bool>(std::get<ToolSuccess>(out).result.value));
}
