#include <benchmark/benchmark.h>
#include "toolbridge/codec.hpp"
#include "toolbridge/json_rpc.hpp"
#include "toolbridge/types.hpp"
#include <string>
#include <vector>

using namespace toolbridge;

static const std::string kInitializeResponse =
    R"({"jsonrpc":"2.0","id":1,"result":{"protocolVersion":"2024-11-05","capabilities":{"tools":{}},"serverInfo":{"name":"weather","version":"1.0.0"}}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_forecast","arguments":{"latitude":52.23,"longitude":21.01}}})";

static const std::string kBareContentResponse =
    R"({"jsonrpc":"2.0","id":7,"content":[{"type":"text","text":"Sunny, 21C"}]})";

// tools/list answer of a server offering n tools
static std::string make_tools_list(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", nlohmann::json::array({"param1"})}
            }}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 2},
        {"result", {{"tools", tools}}}
    };
    return resp.dump();
}

static const std::string kToolsList = make_tools_list(100);

// ---- Parse benchmarks ----

static void BM_ParseInitializeResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kInitializeResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kInitializeResponse.size());
}
BENCHMARK(BM_ParseInitializeResponse)->MinTime(1.0);

static void BM_ParseToolsList(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolsList);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolsList.size());
}
BENCHMARK(BM_ParseToolsList)->MinTime(1.0);

static void BM_ParseBareContent(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kBareContentResponse);
        benchmark::DoNotOptimize(msg);
    }
}
BENCHMARK(BM_ParseBareContent)->MinTime(1.0);

static void BM_TryParseNoise(benchmark::State& state) {
    const std::string banner = "Weather MCP Server running on stdio";
    for (auto _ : state) {
        auto msg = Codec::try_parse(banner);
        benchmark::DoNotOptimize(msg);
    }
}
BENCHMARK(BM_TryParseNoise)->MinTime(1.0);

// ---- Framing ----

static void BM_FrameAndParseStream(benchmark::State& state) {
    // 50 responses delivered in 4 KiB chunks, as a pipe read would.
    std::string stream;
    for (int i = 0; i < 50; ++i) {
        stream += R"({"jsonrpc":"2.0","id":)" + std::to_string(i)
                  + R"(,"result":{"content":[{"type":"text","text":"result text"}]}})" + "\n";
    }

    for (auto _ : state) {
        LineFramer framer;
        size_t parsed = 0;
        for (size_t off = 0; off < stream.size(); off += 4096) {
            framer.append(std::string_view(stream).substr(off, 4096));
            while (auto line = framer.next_line()) {
                auto msg = Codec::try_parse(*line);
                if (msg) ++parsed;
            }
        }
        benchmark::DoNotOptimize(parsed);
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameAndParseStream)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeToolCall(benchmark::State& state) {
    auto req = make_request(42, "tools/call",
                            nlohmann::json{{"name", "get_forecast"},
                                           {"arguments", {{"latitude", 52.23}, {"longitude", 21.01}}}});
    for (auto _ : state) {
        auto s = Codec::serialize(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolCall)->MinTime(1.0);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        auto serialized = Codec::serialize(msg);
        benchmark::DoNotOptimize(serialized);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);

// ---- Result normalization ----

static void BM_NormalizeToolResult(benchmark::State& state) {
    auto payload = nlohmann::json{
        {"content", nlohmann::json::array({
            nlohmann::json{{"type", "text"}, {"text", "line one"}},
            nlohmann::json{{"type", "text"}, {"text", "line two"}}})},
        {"structuredContent", {{"sum", 5}}}
    };
    for (auto _ : state) {
        auto result = normalize_tool_result(payload);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_NormalizeToolResult)->MinTime(1.0);
