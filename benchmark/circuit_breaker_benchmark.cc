#include <benchmark/benchmark.h>
#include <memory>
#include <string>

#include "../src/gate/feature_scanner.h"
#include "../src/gate/gate_scorer.h"
#include "../src/reliability/atomic_circuit_breaker.h"
#include "../src/reliability/monitored_circuit_breaker.h"

using namespace Sluice;

namespace {

CircuitBreakerConfig BenchConfig() {
    CircuitBreakerConfig config;
    config.failure_threshold = 1000000;
    return config;
}

ICircuitBreaker& SharedAtomicBreaker() {
    static std::shared_ptr<AtomicCircuitBreaker> breaker =
        *AtomicCircuitBreaker::Create("bench_atomic", BenchConfig());
    return *breaker;
}

ICircuitBreaker& SharedMonitoredBreaker() {
    static std::shared_ptr<MonitoredCircuitBreaker> breaker =
        *MonitoredCircuitBreaker::Create("bench_monitored", BenchConfig());
    return *breaker;
}

void RunAdmission(benchmark::State& state, ICircuitBreaker& breaker) {
    for (auto _ : state) {
        absl::StatusOr<Permit> permit = breaker.TryAcquire();
        if (permit.ok()) {
            breaker.OnSuccess(std::move(*permit));
        }
        benchmark::DoNotOptimize(permit);
    }
    state.SetItemsProcessed(state.iterations());
}

std::string ArticlePage(int paragraphs) {
    std::string html = "<html><head><meta property=\"og:title\" content=\"t\"></head><body><article>";
    for (int i = 0; i < paragraphs; ++i) {
        html += "<p>Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod.</p>";
    }
    html += "</article><script>var x = 1;</script></body></html>";
    return html;
}

} // namespace

// Permit plus success on a closed circuit, lock-free word
static void BM_AtomicBreakerAdmission(benchmark::State& state) {
    RunAdmission(state, SharedAtomicBreaker());
}
BENCHMARK(BM_AtomicBreakerAdmission)->ThreadRange(1, 8);

// Same path through the mutex-guarded breaker
static void BM_MonitoredBreakerAdmission(benchmark::State& state) {
    RunAdmission(state, SharedMonitoredBreaker());
}
BENCHMARK(BM_MonitoredBreakerAdmission)->ThreadRange(1, 8);

// Rejection path while open
static void BM_AtomicBreakerRejection(benchmark::State& state) {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.open_cooldown = std::chrono::hours(1);
    auto breaker = *AtomicCircuitBreaker::Create("bench_open", config);
    breaker->OnFailure(*breaker->TryAcquire());

    for (auto _ : state) {
        absl::StatusOr<Permit> permit = breaker->TryAcquire();
        benchmark::DoNotOptimize(permit);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AtomicBreakerRejection);

static void BM_GateScore(benchmark::State& state) {
    GateFeatures features;
    features.html_bytes = 50000;
    features.visible_text_chars = 12000;
    features.paragraph_count = 25;
    features.article_tag_count = 1;
    features.script_bytes = 8000;
    features.has_open_graph_title = true;
    features.domain_prior = 0.7;

    for (auto _ : state) {
        double score = GateScorer::Score(features);
        benchmark::DoNotOptimize(score);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GateScore);

static void BM_ScanHtml(benchmark::State& state) {
    const std::string html = ArticlePage(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        GateFeatures features = FeatureScanner::ScanHtml(html);
        benchmark::DoNotOptimize(features);
    }
    state.SetBytesProcessed(state.iterations() * html.size());
}
BENCHMARK(BM_ScanHtml)->Range(8, 1 << 10);

BENCHMARK_MAIN();
