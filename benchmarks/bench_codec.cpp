#include <benchmark/benchmark.h>
#include "mdmcp/codec.hpp"
#include "mdmcp/json_rpc.hpp"
#include <string>

using namespace mdmcp;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kConvertCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"convert_to_markdown","arguments":{"uri":"https://example.com/report.pdf"}}})";

// A tools/call result carrying a converted document of roughly `kib` KiB.
static std::string make_markdown_response(int kib) {
    std::string markdown = "# Quarterly report\n\n";
    while (markdown.size() < static_cast<size_t>(kib) * 1024) {
        markdown += "| Region | Revenue | Growth |\n|---|---|---|\n| North | 1,204 | 3.1% |\n\n";
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"result", {{"content", {{{"type", "text"}, {"text", markdown}}}}, {"isError", false}}}
    };
    return resp.dump();
}

static const std::string kLargeResponse = make_markdown_response(256);

// ---- Decode ----

static void BM_DecodePing(benchmark::State& state) {
    for (auto _ : state) {
        auto frame = Codec::decode(kPing);
        benchmark::DoNotOptimize(frame);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_DecodePing)->MinTime(1.0);

static void BM_DecodeConvertCall(benchmark::State& state) {
    for (auto _ : state) {
        auto frame = Codec::decode(kConvertCall);
        benchmark::DoNotOptimize(frame);
    }
    state.SetBytesProcessed(state.iterations() * kConvertCall.size());
}
BENCHMARK(BM_DecodeConvertCall)->MinTime(1.0);

static void BM_DecodeLargeResult(benchmark::State& state) {
    for (auto _ : state) {
        auto frame = Codec::decode(kLargeResponse);
        benchmark::DoNotOptimize(frame);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_DecodeLargeResult)->MinTime(1.0);

static void BM_DecodeBatch(benchmark::State& state) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < state.range(0); ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "ping"}});
    }
    std::string raw = batch.dump();

    for (auto _ : state) {
        auto frame = Codec::decode(raw);
        benchmark::DoNotOptimize(frame);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_DecodeBatch)->Arg(10)->Arg(100)->MinTime(1.0);

static void BM_DecodeInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto frame = Codec::decode(bad);
            benchmark::DoNotOptimize(frame);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.code);
        }
    }
}
BENCHMARK(BM_DecodeInvalidJson)->MinTime(1.0);

// ---- Serialize ----

static void BM_SerializeLargeResult(benchmark::State& state) {
    auto msg = Codec::parse(kLargeResponse);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kLargeResponse.size());
}
BENCHMARK(BM_SerializeLargeResult)->MinTime(1.0);
