#include <benchmark/benchmark.h>
#include "mdmcp/converter.hpp"
#include "mdmcp/session.hpp"
#include <memory>
#include <string>

using namespace mdmcp;

namespace {

class ConstantConverter : public Converter {
public:
    std::string convert(const std::string&) override { return "# Title\n\nBody text."; }
};

std::unique_ptr<Session> make_ready_session() {
    auto registry = std::make_shared<CapabilityRegistry>();
    registry->register_capability(make_convert_capability(std::make_shared<ConstantConverter>()));

    Session::Options opts;
    opts.id = "bench";
    auto session = std::make_unique<Session>(registry, opts);
    (void)session->handle_inbound(
        R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{"protocolVersion":"2025-06-18","capabilities":{}}})");
    (void)session->handle_inbound(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    return session;
}

} // namespace

static void BM_HandlePing(benchmark::State& state) {
    auto session = make_ready_session();
    const std::string frame = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    for (auto _ : state) {
        auto out = session->handle_inbound(frame);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandlePing)->MinTime(1.0);

static void BM_HandleToolsList(benchmark::State& state) {
    auto session = make_ready_session();
    const std::string frame = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
    for (auto _ : state) {
        auto out = session->handle_inbound(frame);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleToolsList)->MinTime(1.0);

static void BM_HandleConvertCall(benchmark::State& state) {
    auto session = make_ready_session();
    const std::string frame =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"convert_to_markdown","arguments":{"uri":"file:///a.txt"}}})";
    for (auto _ : state) {
        auto out = session->handle_inbound(frame);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleConvertCall)->MinTime(1.0);

static void BM_HandleMissingUri(benchmark::State& state) {
    auto session = make_ready_session();
    const std::string frame =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"convert_to_markdown","arguments":{}}})";
    for (auto _ : state) {
        auto out = session->handle_inbound(frame);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleMissingUri)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto session = make_ready_session();
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "resources/list";
    for (auto _ : state) {
        auto resp = session->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);
