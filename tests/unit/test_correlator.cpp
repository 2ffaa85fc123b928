#include <gtest/gtest.h>
#include "toolbridge/correlator.hpp"
#include "toolbridge/error.hpp"
#include "../support/mock_transport.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace toolbridge;
using toolbridge::testing::MockTransport;
using namespace std::chrono_literals;

namespace {

int64_t sent_id(const MockTransport& t, size_t index) {
    auto msgs = t.sent();
    return std::get<int64_t>(std::get<JsonRpcRequest>(msgs.at(index)).id);
}

} // anonymous namespace

TEST(Correlator, ResolvesMatchingResponse) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto fut = c.send("tools/list", nlohmann::json::object(), 1000ms);
    ASSERT_EQ(transport.sent().size(), 1u);
    auto req = std::get<JsonRpcRequest>(transport.sent()[0]);
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_EQ(c.pending_count(), 1u);

    JsonRpcResponse resp;
    resp.id = req.id;
    resp.result = nlohmann::json{{"tools", nlohmann::json::array()}};
    EXPECT_TRUE(c.on_message(resp));

    auto result = fut.get();
    EXPECT_TRUE(result["tools"].is_array());
    EXPECT_EQ(c.pending_count(), 0u);
}

TEST(Correlator, IdsAreSequentialIntegers) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto f1 = c.send("a", {}, 1000ms);
    auto f2 = c.send("b", {}, 1000ms);
    EXPECT_EQ(sent_id(transport, 1), sent_id(transport, 0) + 1);
    c.fail_all("done");
}

TEST(Correlator, ErrorResponseBecomesProtocolError) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto fut = c.send("tools/call", {{"name", "nope"}}, 1000ms);
    JsonRpcResponse resp;
    resp.id = sent_id(transport, 0);
    resp.error = JsonRpcError{-32602, "Unknown tool: nope", std::nullopt};
    c.on_message(resp);

    try {
        fut.get();
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code, -32602);
        EXPECT_NE(std::string(e.what()).find("Unknown tool: nope"), std::string::npos);
    }
}

TEST(Correlator, StringIdEchoIsAccepted) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto fut = c.send("tools/list", {}, 1000ms);
    JsonRpcResponse resp;
    resp.id = std::to_string(sent_id(transport, 0));
    resp.result = nlohmann::json::object();
    EXPECT_TRUE(c.on_message(resp));
    EXPECT_EQ(fut.wait_for(0ms), std::future_status::ready);
}

TEST(Correlator, UnknownIdDoesNotDisturbPending) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto fut = c.send("tools/call", {}, 1000ms);
    int64_t id = sent_id(transport, 0);

    JsonRpcResponse stray;
    stray.id = id + 100;
    stray.result = nlohmann::json{{"content", "stray"}};
    EXPECT_FALSE(c.on_message(stray));

    JsonRpcResponse foreign;
    foreign.id = std::string("not-a-number");
    foreign.result = nlohmann::json::object();
    EXPECT_FALSE(c.on_message(foreign));

    EXPECT_EQ(c.pending_count(), 1u);
    EXPECT_EQ(fut.wait_for(0ms), std::future_status::timeout);

    JsonRpcResponse real;
    real.id = id;
    real.result = nlohmann::json{{"content", "real"}};
    c.on_message(real);
    EXPECT_EQ(fut.get()["content"], "real");
}

TEST(Correlator, SecondResponseIsNoOp) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto fut = c.send("x", {}, 1000ms);
    JsonRpcResponse resp;
    resp.id = sent_id(transport, 0);
    resp.result = nlohmann::json{{"n", 1}};
    EXPECT_TRUE(c.on_message(resp));
    resp.result = nlohmann::json{{"n", 2}};
    EXPECT_FALSE(c.on_message(resp));
    EXPECT_EQ(fut.get()["n"], 1);
}

TEST(Correlator, NotificationsAndRequestsAreIgnored) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    EXPECT_FALSE(c.on_message(make_notification("notifications/message")));
    EXPECT_FALSE(c.on_message(make_request(1, "ping")));
}

TEST(Correlator, OutOfOrderCompletion) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto first = c.send("tools/call", {{"name", "slow"}}, 1000ms);
    auto second = c.send("tools/call", {{"name", "fast"}}, 1000ms);

    JsonRpcResponse r2;
    r2.id = sent_id(transport, 1);
    r2.result = nlohmann::json{{"who", "fast"}};
    c.on_message(r2);
    EXPECT_EQ(second.get()["who"], "fast");
    EXPECT_EQ(first.wait_for(0ms), std::future_status::timeout);

    JsonRpcResponse r1;
    r1.id = sent_id(transport, 0);
    r1.result = nlohmann::json{{"who", "slow"}};
    c.on_message(r1);
    EXPECT_EQ(first.get()["who"], "slow");
}

TEST(Correlator, TimeoutRejectsAndCallsHook) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    std::atomic<int> hook_calls{0};
    std::string hook_method;
    std::mutex m;
    c.on_timeout([&](const std::string& method, int64_t) {
        std::lock_guard<std::mutex> lock(m);
        hook_method = method;
        ++hook_calls;
    });

    auto start = std::chrono::steady_clock::now();
    auto fut = c.send("tools/call", {}, 50ms);
    EXPECT_THROW(fut.get(), TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_EQ(c.pending_count(), 0u);

    c.stop();
    EXPECT_EQ(hook_calls.load(), 1);
    EXPECT_EQ(hook_method, "tools/call");
}

TEST(Correlator, LateResponseAfterTimeoutIsIgnored) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto fut = c.send("tools/list", {}, 20ms);
    EXPECT_THROW(fut.get(), TimeoutError);

    JsonRpcResponse late;
    late.id = sent_id(transport, 0);
    late.result = nlohmann::json::object();
    EXPECT_FALSE(c.on_message(late));
}

TEST(Correlator, ShortDeadlineFiresBeforeLongOne) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto slow = c.send("a", {}, 5000ms);
    auto fast = c.send("b", {}, 30ms);
    EXPECT_THROW(fast.get(), TimeoutError);
    EXPECT_EQ(slow.wait_for(0ms), std::future_status::timeout);
    EXPECT_EQ(c.pending_count(), 1u);
}

TEST(Correlator, HugeTimeoutDoesNotExpireEarly) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto huge = c.send("a", {}, std::chrono::milliseconds(10'000'000'000'000));
    auto unbounded = c.send("b", {}, std::chrono::milliseconds::max());
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(huge.wait_for(0ms), std::future_status::timeout);
    EXPECT_EQ(unbounded.wait_for(0ms), std::future_status::timeout);
    EXPECT_EQ(c.pending_count(), 2u);

    JsonRpcResponse resp;
    resp.id = sent_id(transport, 1);
    resp.result = nlohmann::json{{"ok", true}};
    EXPECT_TRUE(c.on_message(resp));
    EXPECT_TRUE(unbounded.get()["ok"].get<bool>());
}

TEST(Correlator, FailAllRejectsEverything) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto a = c.send("a", {}, 1000ms);
    auto b = c.send("b", {}, 1000ms);
    c.fail_all("process exited");

    EXPECT_THROW(a.get(), TransportError);
    try {
        b.get();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("process exited"), std::string::npos);
    }
    EXPECT_EQ(c.pending_count(), 0u);
}

TEST(Correlator, SendFailureSettlesFuture) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    transport.shutdown();
    Correlator c(transport);

    auto fut = c.send("tools/list", {}, 1000ms);
    EXPECT_THROW(fut.get(), TransportError);
    EXPECT_EQ(c.pending_count(), 0u);
}

TEST(Correlator, SendAfterStopThrows) {
    MockTransport transport;
    transport.start([](JsonRpcMessage) {}, nullptr);
    Correlator c(transport);

    auto pending = c.send("a", {}, 1000ms);
    c.stop();
    EXPECT_THROW(pending.get(), TransportError);
    EXPECT_THROW((void)c.send("b", {}, 1000ms), TransportError);
    c.stop();
}

TEST(Correlator, SynchronousAnswerFromTransport) {
    MockTransport transport;
    Correlator* target = nullptr;
    transport.start([&](JsonRpcMessage msg) { target->on_message(msg); }, nullptr);
    transport.set_responder([](MockTransport& t, const JsonRpcMessage& msg) {
        if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            t.respond(req->id, nlohmann::json{{"echo", req->method}});
        }
    });
    Correlator c(transport);
    target = &c;

    auto fut = c.send("initialize", {}, 1000ms);
    EXPECT_EQ(fut.get()["echo"], "initialize");
}
