#include <gtest/gtest.h>
#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"

using namespace toolbridge;

// ---- Parse tests ----

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"tools":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_EQ(resp.error->message, "Method not found");
    EXPECT_FALSE(resp.result.has_value());
}

TEST(CodecParse, ErrorWinsOverResult) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":-32000,"message":"boom"}})");
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32000);
    EXPECT_EQ(resp.error->message, "boom");
    EXPECT_FALSE(resp.result.has_value());
}

TEST(CodecParse, BareContentResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":3,"content":[{"type":"text","text":"hi"}]})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_FALSE(resp.result->contains("id"));
    EXPECT_FALSE(resp.result->contains("jsonrpc"));
    EXPECT_EQ((*resp.result)["content"][0]["text"], "hi");
}

TEST(CodecParse, ResponseWithoutPayload) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":3})"), ParseError);
}

TEST(CodecParse, ServerRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "srv-1");
    EXPECT_EQ(req.method, "ping");
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    auto& notif = std::get<JsonRpcNotification>(msg);
    EXPECT_EQ(notif.method, "notifications/message");
    ASSERT_TRUE(notif.params.has_value());
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), ParseError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"result":{}})"), ParseError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"result":{}})"), ParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), ParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), ParseError);
}

TEST(CodecParse, PlainTextLine) {
    EXPECT_THROW(Codec::parse("Weather server running on stdio"), ParseError);
}

TEST(CodecTryParse, SwallowsIrrelevantLines) {
    EXPECT_FALSE(Codec::try_parse("Server started").has_value());
    EXPECT_FALSE(Codec::try_parse(R"({"hello":"world"})").has_value());
    EXPECT_TRUE(Codec::try_parse(R"({"jsonrpc":"2.0","id":1,"result":{}})").has_value());
}

TEST(CodecParse, LargeMessage) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < 100; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Description for tool " + std::to_string(i)},
            {"inputSchema", {{"type", "object"}, {"properties", nlohmann::json::object()}}}
        });
    }
    nlohmann::json response = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ((*std::get<JsonRpcResponse>(msg).result)["tools"].size(), 100u);
}

// ---- Serialize tests ----

TEST(CodecSerialize, RequestIsOneLine) {
    auto req = make_request(7, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "a\nb"}}}});
    std::string out = Codec::serialize(req);
    EXPECT_EQ(out.find('\n'), std::string::npos);
    auto parsed = Codec::parse(out);
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(parsed));
    EXPECT_EQ(std::get<JsonRpcRequest>(parsed).method, "tools/call");
}

TEST(CodecSerialize, NotificationHasNoId) {
    std::string out = Codec::serialize(make_notification("notifications/initialized"));
    auto j = nlohmann::json::parse(out);
    EXPECT_FALSE(j.contains("id"));
    EXPECT_EQ(j["params"], nlohmann::json::object());
}

// ---- Line framing ----

TEST(LineFramer, SplitsCompleteLines) {
    LineFramer f;
    f.append("one\ntwo\n");
    EXPECT_EQ(f.next_line(), "one");
    EXPECT_EQ(f.next_line(), "two");
    EXPECT_FALSE(f.next_line().has_value());
    EXPECT_EQ(f.buffered(), 0u);
}

TEST(LineFramer, KeepsPartialTail) {
    LineFramer f;
    f.append(R"({"jsonrpc":"2.0",)");
    EXPECT_FALSE(f.next_line().has_value());
    f.append(R"("id":1,"result":{}})");
    EXPECT_FALSE(f.next_line().has_value());
    f.append("\n{\"part");
    auto line = f.next_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_TRUE(Codec::try_parse(*line).has_value());
    EXPECT_EQ(f.buffered(), 6u);
}

TEST(LineFramer, StripsCarriageReturnAndSkipsBlankLines) {
    LineFramer f;
    f.append("a\r\n\n\r\nb\n");
    EXPECT_EQ(f.next_line(), "a");
    EXPECT_EQ(f.next_line(), "b");
    EXPECT_FALSE(f.next_line().has_value());
}

TEST(LineFramer, ByteAtATime) {
    const std::string input = "first line\nsecond\n";
    LineFramer f;
    std::vector<std::string> lines;
    for (char c : input) {
        f.append(std::string_view(&c, 1));
        while (auto l = f.next_line()) lines.push_back(*l);
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "first line");
    EXPECT_EQ(lines[1], "second");
}

TEST(LineFramer, Clear) {
    LineFramer f;
    f.append("dangling");
    f.clear();
    EXPECT_EQ(f.buffered(), 0u);
    f.append("\n");
    EXPECT_FALSE(f.next_line().has_value());
}
