// leptjson-cpp benchmarks: measures throughput of parsing, serialization,
// pointer resolution and patching.

#include <leptjson-cpp/leptjson.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace leptjson_cpp;

// Builds a document of `n` records, each a small object with a nested array.
static auto make_document_text(std::size_t n) -> std::string {
    auto text = std::string{"["};
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) text += ',';
        text += R"({"id":)" + std::to_string(i) +
                R"(,"name":"record )" + std::to_string(i) +
                R"(","score":)" + std::to_string(static_cast<double>(i) * 0.25) +
                R"(,"tags":["alpha","beta\n","\u00e9"],"active":true,"parent":null})";
    }
    text += ']';
    return text;
}

static auto make_document(std::size_t n) -> Value {
    return parse(make_document_text(n)).value;
}

// =============================================================================
// Parsing
// =============================================================================

static void bm_parse(benchmark::State& state) {
    const auto text = make_document_text(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto result = parse(text);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse)->Range(8, 4096);

static void bm_parse_hardened(benchmark::State& state) {
    const auto text = make_document_text(static_cast<std::size_t>(state.range(0)));
    const auto options = ParseOptions::hardened();
    for (auto _ : state) {
        auto result = parse(text, options);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_parse_hardened)->Range(8, 4096);

static void bm_parse_numbers(benchmark::State& state) {
    auto text = std::string{"["};
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) text += ',';
        text += std::to_string(i * 1.0001e-3);
    }
    text += ']';
    for (auto _ : state) {
        auto result = parse(text);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(bm_parse_numbers);

static void bm_parse_many(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto storage = std::vector<std::string>(count, make_document_text(64));
    const auto texts = std::vector<std::string_view>(storage.begin(), storage.end());
    for (auto _ : state) {
        auto results = parse_many(texts);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * count));
}
BENCHMARK(bm_parse_many)->Range(2, 256)->UseRealTime();

// =============================================================================
// Serialization and copying
// =============================================================================

static void bm_stringify(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto text = stringify(doc);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_stringify)->Range(8, 4096);

static void bm_deep_copy(benchmark::State& state) {
    const auto doc = make_document(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto copy = doc;
        benchmark::DoNotOptimize(copy);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_deep_copy)->Range(8, 4096);

static void bm_equality(benchmark::State& state) {
    const auto a = make_document(static_cast<std::size_t>(state.range(0)));
    const auto b = a;
    for (auto _ : state) {
        auto same = a == b;
        benchmark::DoNotOptimize(same);
    }
}
BENCHMARK(bm_equality)->Range(8, 4096);

// =============================================================================
// Pointer and patch
// =============================================================================

static void bm_pointer_resolve(benchmark::State& state) {
    const auto doc = make_document(1024);
    const auto pointer = Pointer::parse("/1000/tags/2");
    for (auto _ : state) {
        const auto& v = resolve(doc, pointer);
        benchmark::DoNotOptimize(&v);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_resolve);

static void bm_apply_patch(benchmark::State& state) {
    const auto doc = make_document(256);
    const auto ops = parse_patch(parse(R"([
        {"op":"replace","path":"/0/name","value":"renamed"},
        {"op":"add","path":"/1/tags/-","value":"gamma"},
        {"op":"move","from":"/2/parent","path":"/2/origin"},
        {"op":"copy","from":"/3","path":"/-"},
        {"op":"remove","path":"/4/active"},
        {"op":"test","path":"/5/id","value":5}
    ])").value);
    for (auto _ : state) {
        auto target = doc;
        apply_patch(target, ops);
        benchmark::DoNotOptimize(target);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * ops.size()));
}
BENCHMARK(bm_apply_patch);

static void bm_diff(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto source = make_document(n);
    auto target = source;
    for (std::size_t i = 0; i < n; i += 7) {
        target[i].set("score", -1.0);
    }
    for (auto _ : state) {
        auto ops = diff(source, target);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff)->Range(8, 1024);

static void bm_merge_patch(benchmark::State& state) {
    const auto target = parse(R"({"a":{"b":1,"c":[1,2,3]},"d":"text","e":{"f":{"g":true}}})").value;
    const auto patch = parse(R"({"a":{"b":null,"x":2},"e":{"f":{"h":false}},"new":[1]})").value;
    for (auto _ : state) {
        auto result = apply_merge_patch(target, patch);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_merge_patch);
