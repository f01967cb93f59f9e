// richdoc-cpp benchmarks — measures throughput of span algebra and document edits.

#include <richdoc-cpp/richdoc.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace richdoc_cpp;

// A text of `n` characters with a bold span on every tenth character run.
static auto striped_text(std::size_t n) -> AttributedText {
    auto text = AttributedText{std::string(n, 'x')};
    for (std::size_t i = 0; i + 4 < n; i += 10) {
        text = text.apply_attribution(attributions::bold(), i, i + 4);
    }
    return text;
}

static auto paragraphs(std::size_t n) -> std::vector<DocumentNode> {
    auto ids = NodeIdGenerator{SequentialNodeIds{"p"}};
    auto nodes = std::vector<DocumentNode>{};
    nodes.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        nodes.push_back(make_paragraph(ids, AttributedText{"paragraph text"}));
    }
    return nodes;
}

// =============================================================================
// Attribution edits
// =============================================================================

static void bm_apply_attribution(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto text = striped_text(n);
    for (auto _ : state) {
        auto result = text.apply_attribution(attributions::italics(), n / 4, n / 2);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_attribution)->Range(100, 10000);

static void bm_apply_merging_attribution(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto text = striped_text(n);
    for (auto _ : state) {
        // Covers every stripe, so all bold spans fold into one.
        auto result = text.apply_attribution(attributions::bold(), 0, n - 1);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_merging_attribution)->Range(100, 10000);

static void bm_toggle_attribution(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto text = striped_text(n);
    for (auto _ : state) {
        text = text.toggle_attribution(attributions::underline(), 0, n / 2);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_toggle_attribution)->Range(100, 10000);

static void bm_attributions_at(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto text = striped_text(n);
    std::size_t offset = 0;
    for (auto _ : state) {
        auto result = text.attributions_at(offset);
        benchmark::DoNotOptimize(result);
        offset = (offset + 7) % n;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_attributions_at)->Range(100, 10000);

// =============================================================================
// Text edits
// =============================================================================

static void bm_insert_typing(benchmark::State& state) {
    const auto keystroke = AttributedText{"a"};
    for (auto _ : state) {
        state.PauseTiming();
        auto text = striped_text(1000);
        state.ResumeTiming();
        for (int i = 0; i < 100; ++i) {
            text = text.insert(500, keystroke);
        }
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations() * 100);
}
BENCHMARK(bm_insert_typing);

static void bm_erase_range(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto text = striped_text(n);
    for (auto _ : state) {
        auto result = text.erase(n / 4, n / 2);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_erase_range)->Range(100, 10000);

static void bm_copy_text(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto text = striped_text(n);
    for (auto _ : state) {
        auto result = text.copy_text(n / 3, 2 * n / 3);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_copy_text)->Range(100, 10000);

// =============================================================================
// Document lookups and mutations
// =============================================================================

static void bm_node_index_last(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = Document{paragraphs(n)};
    const auto last = "p-" + std::to_string(n - 1);
    for (auto _ : state) {
        auto index = doc.node_index(last);
        benchmark::DoNotOptimize(index);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_node_index_last)->Range(10, 10000);

static void bm_insert_then_delete_node(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto doc = MutableDocument{paragraphs(n)};
    const auto node = make_horizontal_rule("hr");
    for (auto _ : state) {
        auto inserted = doc.insert_node(n / 2, node);
        auto deleted = doc.delete_node("hr");
        benchmark::DoNotOptimize(inserted);
        benchmark::DoNotOptimize(deleted);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_insert_then_delete_node)->Range(10, 10000);

static void bm_update_node_text(benchmark::State& state) {
    auto doc = MutableDocument{paragraphs(100)};
    auto listener_calls = std::int64_t{0};
    (void)doc.subscribe([&](const ChangeBatch&) { ++listener_calls; });
    for (auto _ : state) {
        auto events = doc.update_node("p-50", [](const DocumentNode& node) {
            return node.with_text(node.text()->insert(0, AttributedText{"x"}));
        });
        benchmark::DoNotOptimize(events);
    }
    state.SetItemsProcessed(listener_calls);
}
BENCHMARK(bm_update_node_text);

static void bm_selection_normalize(benchmark::State& state) {
    const auto doc = Document{paragraphs(1000)};
    const auto sel = DocumentSelection{
        .base = {.node_id = "p-900", .node_position = TextNodePosition{.offset = 2}},
        .extent = {.node_id = "p-100", .node_position = TextNodePosition{.offset = 5}},
    };
    for (auto _ : state) {
        auto normalized = sel.normalize(doc);
        benchmark::DoNotOptimize(normalized);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_selection_normalize);
