#include <benchmark/benchmark.h>
#include "mcpsse/dispatcher.hpp"
#include "mcpsse/log.hpp"
#include "mcpsse/session.hpp"
#include <string>

using namespace mcpsse;

namespace {

// Every request logs at info level; keep stderr out of the numbers.
struct Fixture {
    Fixture() { set_log_level(spdlog::level::off); }

    ToolRegistry registry{default_tools()};
    StubDataProvider provider{[] { return std::string("2024-11-05T10:00:00.000Z"); }};
};

class NullSink : public IStreamSink {
public:
    bool write(std::string_view frame) override {
        bytes += frame.size();
        return true;
    }
    void close() override {}

    size_t bytes = 0;
};

JsonRpcRequest make_request(const std::string& method, std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = method;
    req.params = std::move(params);
    return req;
}

} // anonymous namespace

static void BM_DispatchPing(benchmark::State& state) {
    Fixture f;
    Dispatcher dispatcher(f.registry, f.provider);
    auto req = make_request("ping");

    for (auto _ : state) {
        auto resp = dispatcher.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    Fixture f;
    Dispatcher dispatcher(f.registry, f.provider);
    auto req = make_request("resources/list");

    for (auto _ : state) {
        auto resp = dispatcher.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    Fixture f;
    Dispatcher dispatcher(f.registry, f.provider);
    auto req = make_request("tools/list");

    for (auto _ : state) {
        auto resp = dispatcher.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->MinTime(1.0);

static void BM_DispatchToolsCall(benchmark::State& state) {
    Fixture f;
    Dispatcher::Options opts;
    opts.strict_arguments = state.range(0) != 0;
    Dispatcher dispatcher(f.registry, f.provider, opts);
    auto req = make_request("tools/call", nlohmann::json{
        {"name", "retrieve"},
        {"arguments", {{"id", "contact-8812"}, {"type", "contact"}}}
    });

    for (auto _ : state) {
        auto resp = dispatcher.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsCall)->Arg(0)->Arg(1)->MinTime(1.0);

static void BM_ExchangeSession(benchmark::State& state) {
    Fixture f;
    Dispatcher dispatcher(f.registry, f.provider);
    const std::string body =
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"search","arguments":{"query":"leads"}}})";
    NullSink sink;

    for (auto _ : state) {
        Session session(dispatcher, sink);
        session.exchange(body);
        session.close();
    }
    state.SetBytesProcessed(static_cast<int64_t>(sink.bytes));
}
BENCHMARK(BM_ExchangeSession)->MinTime(1.0);
