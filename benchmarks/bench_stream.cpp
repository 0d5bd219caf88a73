/// @file bench_stream.cpp
/// @brief Throughput benchmarks for the streaming parser.
///
/// Measures:
///   - Materializing whole documents (MB/s)
///   - Skipping documents without materializing them
///   - Path navigation to a value near the end of the document
///   - Chunk size sensitivity (the cost of split tokens)

#include <sjson/sjson.hpp>

#include <benchmark/benchmark.h>

#include <string>
#include <vector>

using namespace sjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Pure integer array: [0,1,2,...,N-1]
static std::string gen_int_array(int n) {
    std::string s = "[";
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        s += std::to_string(i);
    }
    return s + "]";
}

/// Array of API-like records followed by a trailing summary field.
static std::string gen_records(int n) {
    std::string s = R"({"records":[)";
    for (int i = 0; i < n; ++i) {
        if (i) s += ',';
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","active":)" + (i % 2 ? "true" : "false") +
             R"(,"score":)" + std::to_string(i * 0.5) +
             R"(,"tags":["a","b","c"]})";
    }
    return s + R"(],"summary":{"count":)" + std::to_string(n) + "}}";
}

static std::vector<std::string> split(const std::string& doc, size_t size) {
    std::vector<std::string> out;
    for (size_t i = 0; i < doc.size(); i += size) out.push_back(doc.substr(i, size));
    return out;
}

static Parser<Value> tree_parser() {
    return root()
        .bind([](ParseResult<Root> r) { return parse_value(r); })
        .map([](std::pair<Unit, Value> p) { return std::move(p.second); });
}

// ═══════════════════════════════════════════════════════════════════════════════
// Materialize / skip
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Stream_Parse_IntArray(benchmark::State& state) {
    auto input = gen_int_array(static_cast<int>(state.range(0)));
    auto parser = tree_parser();
    for (auto _ : state) {
        auto out = parse_all(parser, input);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Stream_Parse_IntArray)->Arg(1000)->Arg(100000);

static void BM_Stream_Parse_Records(benchmark::State& state) {
    auto input = gen_records(static_cast<int>(state.range(0)));
    auto parser = tree_parser();
    for (auto _ : state) {
        auto out = parse_all(parser, input);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
    state.counters["doc_bytes"] = static_cast<double>(input.size());
}
BENCHMARK(BM_Stream_Parse_Records)->Arg(100)->Arg(10000);

static void BM_Stream_Skip_Records(benchmark::State& state) {
    auto input = gen_records(static_cast<int>(state.range(0)));
    auto parser = root().bind([](ParseResult<Root> r) { return skip_value(r); });
    for (auto _ : state) {
        auto out = parse_all(parser, input);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Stream_Skip_Records)->Arg(100)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// Navigation
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Stream_Navigate_Tail(benchmark::State& state) {
    auto input = gen_records(static_cast<int>(state.range(0)));
    auto parser = navigate_to_or_fail(parse_path("summary.count"))
        .map([](SomeParseResult r) { return r.number().as_integer(); });
    for (auto _ : state) {
        auto out = parse_all(parser, input);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Stream_Navigate_Tail)->Arg(100)->Arg(10000);

// ═══════════════════════════════════════════════════════════════════════════════
// Chunk size sensitivity
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Stream_Chunked_Skip(benchmark::State& state) {
    auto input = gen_records(5000);
    auto chunks = split(input, static_cast<size_t>(state.range(0)));
    auto parser = root().bind([](ParseResult<Root> r) { return skip_value(r); });
    for (auto _ : state) {
        auto out = parse_chunks(parser, chunks);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
    state.counters["chunks"] = static_cast<double>(chunks.size());
}
BENCHMARK(BM_Stream_Chunked_Skip)->Arg(16)->Arg(256)->Arg(4096)->Arg(65536);
