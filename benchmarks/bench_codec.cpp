#include <benchmark/benchmark.h>
#include "mcpsse/catalog.hpp"
#include "mcpsse/codec.hpp"
#include "mcpsse/json_rpc.hpp"
#include <string>

using namespace mcpsse;

static const std::string kPingRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"retrieve","arguments":{"id":"contact-8812","type":"contact"}}})";

// A tools/list response with the default catalog repeated n times
static std::string make_tools_list_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        for (const auto& tool : default_tools()) {
            nlohmann::json t = tool;
            t["name"] = tool.name + "_" + std::to_string(i);
            tools.push_back(std::move(t));
        }
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"tools", tools}}}
    };
    return resp.dump();
}

static const std::string kLargeResponse = make_tools_list_response(50);

// ---- Parse benchmarks ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPingRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPingRequest.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_ParseLargeMessage)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError&) {
            benchmark::ClobberMemory();
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Frame benchmarks ----

static void BM_FrameResult(benchmark::State& state) {
    auto resp = Codec::make_result(RequestId{int64_t{1}}, nlohmann::json::object());
    for (auto _ : state) {
        auto frame = Codec::sse_frame(resp);
        benchmark::DoNotOptimize(frame);
    }
}
BENCHMARK(BM_FrameResult)->MinTime(1.0);

static void BM_FrameLargeMessage(benchmark::State& state) {
    auto msg = Codec::parse(kLargeResponse);
    for (auto _ : state) {
        auto frame = Codec::sse_frame(msg);
        benchmark::DoNotOptimize(frame);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_FrameLargeMessage)->MinTime(1.0);

static void BM_ParseThenFrame(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        auto frame = Codec::sse_frame(msg);
        benchmark::DoNotOptimize(frame);
    }
}
BENCHMARK(BM_ParseThenFrame)->MinTime(1.0);
