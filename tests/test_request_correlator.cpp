//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_correlator.cpp
// Purpose: Tests for request id allocation, response matching, timeouts and bulk failure
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "HostTestSupport.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/RequestCorrelator.hpp"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
using namespace std::chrono_literals;
using toolhost_test::RunUntil;

namespace {
struct Fixture {
    boost::asio::io_context io;
    RequestCorrelator correlator{io.get_executor()};
    std::vector<std::string> frames;
    RequestCorrelator::Writer writer = [this](const std::string& f) { frames.push_back(f); };

    std::future<JSONValue> send(const std::string& server, const std::string& method,
                                std::chrono::milliseconds timeout = 5s) {
        return boost::asio::co_spawn(io, correlator.Send(server, method, std::nullopt, timeout, writer),
                                     boost::asio::use_future);
    }

    JSONRPCRequest lastRequest() const {
        JSONRPCRequest r;
        std::string line = frames.back();
        EXPECT_EQ(line.back(), '\n');
        line.pop_back();
        EXPECT_TRUE(r.Deserialize(line));
        return r;
    }

    template <typename T>
    bool ready(std::future<T>& f) {
        return RunUntil(io, [&] { return f.wait_for(0s) == std::future_status::ready; }, 5s);
    }
};
} // namespace

TEST(RequestCorrelatorTest, ResolveCompletesMatchingRequest) {
    Fixture fx;
    auto fut = fx.send("alpha", "tools/list");
    ASSERT_TRUE(RunUntil(fx.io, [&] { return fx.frames.size() == 1; }));
    JSONRPCRequest req = fx.lastRequest();
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_EQ(fx.correlator.PendingCount(), 1u);
    EXPECT_EQ(fx.correlator.PendingCount("alpha"), 1u);

    JSONRPCResponse resp(req.id, ParseJSON(R"({"tools":[]})"));
    EXPECT_TRUE(fx.correlator.Resolve(std::move(resp)));
    ASSERT_TRUE(fx.ready(fut));
    EXPECT_EQ(fut.get(), ParseJSON(R"({"tools":[]})"));
    EXPECT_EQ(fx.correlator.PendingCount(), 0u);
}

TEST(RequestCorrelatorTest, IdsStartAtOneAndIncrease) {
    Fixture fx;
    EXPECT_EQ(fx.correlator.PeekNextId(), 1);
    auto a = fx.send("s", "ping");
    auto b = fx.send("s", "ping");
    ASSERT_TRUE(RunUntil(fx.io, [&] { return fx.frames.size() == 2; }));
    std::vector<int64_t> ids;
    for (const auto& f : fx.frames) {
        JSONRPCRequest r;
        ASSERT_TRUE(r.Deserialize(f.substr(0, f.size() - 1)));
        ids.push_back(std::get<int64_t>(r.id));
    }
    EXPECT_LT(ids[0], ids[1]);
    EXPECT_EQ(fx.correlator.PeekNextId(), 3);
    EXPECT_EQ(fx.correlator.FailServer("s", "test over"), 2u);
    ASSERT_TRUE(fx.ready(a));
    ASSERT_TRUE(fx.ready(b));
    EXPECT_THROW(a.get(), errors::ProcessError);
    EXPECT_THROW(b.get(), errors::ProcessError);
}

TEST(RequestCorrelatorTest, UnknownIdResolvesNothing) {
    Fixture fx;
    auto fut = fx.send("s", "ping");
    ASSERT_TRUE(RunUntil(fx.io, [&] { return fx.frames.size() == 1; }));
    EXPECT_FALSE(fx.correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(9999), JSONValue{})));
    EXPECT_FALSE(fx.correlator.Resolve(JSONRPCResponse(JSONRPCId(std::string("1")), JSONValue{})));
    EXPECT_EQ(fx.correlator.PendingCount(), 1u);
    fx.correlator.FailServer("s", "done");
    ASSERT_TRUE(fx.ready(fut));
    EXPECT_THROW(fut.get(), errors::ProcessError);
}

TEST(RequestCorrelatorTest, TimeoutRejectsAndLateResponseIsIgnored) {
    Fixture fx;
    auto fut = fx.send("slowpoke", "tools/call", 50ms);
    ASSERT_TRUE(RunUntil(fx.io, [&] { return fx.frames.size() == 1; }));
    const JSONRPCId id = fx.lastRequest().id;
    ASSERT_TRUE(fx.ready(fut));
    try {
        fut.get();
        FAIL() << "expected TimeoutError";
    } catch (const errors::TimeoutError& e) {
        EXPECT_NE(std::string(e.what()).find("slowpoke"), std::string::npos);
    }
    EXPECT_EQ(fx.correlator.PendingCount(), 0u);
    EXPECT_FALSE(fx.correlator.Resolve(JSONRPCResponse(id, JSONValue{})));
}

TEST(RequestCorrelatorTest, ExpireIsExplicitTimeout) {
    Fixture fx;
    auto fut = fx.send("s", "initialize");
    ASSERT_TRUE(RunUntil(fx.io, [&] { return fx.frames.size() == 1; }));
    const int64_t id = std::get<int64_t>(fx.lastRequest().id);
    EXPECT_TRUE(fx.correlator.Expire(id));
    EXPECT_FALSE(fx.correlator.Expire(id));
    ASSERT_TRUE(fx.ready(fut));
    EXPECT_THROW(fut.get(), errors::TimeoutError);
}

TEST(RequestCorrelatorTest, ErrorResponseBecomesRpcError) {
    Fixture fx;
    auto fut = fx.send("s", "tools/call");
    ASSERT_TRUE(RunUntil(fx.io, [&] { return fx.frames.size() == 1; }));
    auto resp = CreateErrorResponse(fx.lastRequest().id, JSONRPCErrorCodes::InvalidParams, "bad args");
    EXPECT_TRUE(fx.correlator.Resolve(std::move(*resp)));
    ASSERT_TRUE(fx.ready(fut));
    try {
        fut.get();
        FAIL() << "expected RpcError";
    } catch (const errors::RpcError& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(e.error().message, "bad args");
        EXPECT_EQ(e.error().category, errors::ErrorCategory::JsonRpcInvalidParams);
    }
}

TEST(RequestCorrelatorTest, FailServerOnlyTouchesThatServer) {
    Fixture fx;
    auto a = fx.send("a", "ping");
    auto b = fx.send("b", "ping");
    ASSERT_TRUE(RunUntil(fx.io, [&] { return fx.frames.size() == 2; }));
    EXPECT_EQ(fx.correlator.FailServer("a", "process exited"), 1u);
    ASSERT_TRUE(fx.ready(a));
    EXPECT_THROW(a.get(), errors::ProcessError);
    EXPECT_EQ(fx.correlator.PendingCount("b"), 1u);
    EXPECT_EQ(fx.correlator.FailServer("a", "again"), 0u);
    fx.correlator.FailServer("b", "done");
    ASSERT_TRUE(fx.ready(b));
    EXPECT_THROW(b.get(), errors::ProcessError);
}

TEST(RequestCorrelatorTest, WriterFailureRejectsImmediately) {
    boost::asio::io_context io;
    RequestCorrelator correlator(io.get_executor());
    RequestCorrelator::Writer broken = [](const std::string&) { throw std::runtime_error("broken pipe"); };
    auto fut = boost::asio::co_spawn(io, correlator.Send("s", "ping", std::nullopt, 5s, broken),
                                     boost::asio::use_future);
    ASSERT_TRUE(RunUntil(io, [&] { return fut.wait_for(0s) == std::future_status::ready; }, 5s));
    EXPECT_THROW(fut.get(), errors::ProcessError);
    EXPECT_EQ(correlator.PendingCount(), 0u);
}

TEST(RequestCorrelatorTest, NotifyWritesFrameWithoutId) {
    Fixture fx;
    fx.correlator.Notify("notifications/initialized", std::nullopt, fx.writer);
    ASSERT_EQ(fx.frames.size(), 1u);
    JSONValue v = ParseJSON(fx.frames[0]);
    EXPECT_EQ(FindMember(v, "id"), nullptr);
    EXPECT_EQ(GetStringMember(v, "method").value_or(""), "notifications/initialized");
    EXPECT_EQ(fx.correlator.PendingCount(), 0u);
}
