#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include "../../src/common/errors.h"
#include "../../src/reliability/atomic_circuit_breaker.h"
#include "../../src/reliability/monitored_circuit_breaker.h"
#include "../../src/reliability/reliable_extractor.h"
#include "../fakes.h"

using namespace Sluice;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

using DocumentOr = absl::StatusOr<ExtractedDocument>;

GateFeatures RawFeatures() {
    GateFeatures features;
    features.html_bytes = 10000;
    features.visible_text_chars = 5000;
    features.paragraph_count = 10;
    features.article_tag_count = 1;
    features.script_bytes = 500;
    features.has_open_graph_title = true;
    features.has_jsonld_article = true;
    features.domain_prior = 0.7;
    return features;
}

ExtractionRequest MakeRequest(std::optional<GateFeatures> features = RawFeatures()) {
    ExtractionRequest request;
    request.url = "https://news.example.com/story";
    request.html = "<html><body><article><p>story</p></article></body></html>";
    request.features = features;
    return request;
}

// Title plus 300 chars of text: quality 0.4
ExtractedDocument PoorDocument(std::string_view url) {
    return fakes::MakeDocument(url, 300);
}

} // namespace

class ReliableExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        loader_ = std::make_shared<fakes::FakeLoader>();
        renderer_ = std::make_shared<::testing::NiceMock<fakes::MockHeadlessRenderer>>();

        pool_config_.name = "extractor_pool";
        pool_config_.initial_size = 1;
        pool_config_.max_size = 2;
        pool_config_.max_failures_per_instance = 100;
        pool_config_.acquire_wait_budget = 20ms;
        pool_config_.epoch_timeout = 2s;
        pool_config_.executor_threads = 2;

        breaker_config_.failure_threshold = 5;
        breaker_config_.open_cooldown = 30s;

        options_.retry = DefaultRetryPolicies();
    }

    void TearDown() override {
        extractor_.reset();
        pool_.reset();
    }

    void BuildPool() {
        auto pool = ExtractionInstancePool::Create(pool_config_, loader_, nullptr, clock_);
        ASSERT_TRUE(pool.ok()) << pool.status();
        pool_ = std::move(*pool);
    }

    void BuildBreakers() {
        for (Decision mode : {Decision::kRaw, Decision::kProbesFirst}) {
            auto breaker = AtomicCircuitBreaker::Create(ToString(mode), breaker_config_, clock_);
            ASSERT_TRUE(breaker.ok());
            breakers_[ModeIndex(mode)] = *breaker;
        }
        auto headless = MonitoredCircuitBreaker::Create("headless", breaker_config_, clock_);
        ASSERT_TRUE(headless.ok());
        breakers_[ModeIndex(Decision::kHeadless)] = *headless;
    }

    void Build() {
        BuildPool();
        BuildBreakers();
        auto extractor = ReliableExtractor::Create(pool_, renderer_, breakers_, options_, clock_);
        ASSERT_TRUE(extractor.ok()) << extractor.status();
        extractor_ = std::move(*extractor);
    }

    void TripBreaker(Decision mode) {
        ICircuitBreaker& breaker = *breakers_[ModeIndex(mode)];
        while (breaker.State() == CircuitStateKind::kClosed) {
            auto permit = breaker.TryAcquire();
            ASSERT_TRUE(permit.ok());
            breaker.OnFailure(std::move(*permit));
        }
    }

    void ExpectRenderSucceeds() {
        EXPECT_CALL(*renderer_, Render(_, _, _))
            .WillOnce(Invoke([](std::string_view url, std::string_view, TimePoint) -> DocumentOr {
                return fakes::RichDocument(url);
            }));
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<fakes::FakeLoader> loader_;
    std::shared_ptr<::testing::NiceMock<fakes::MockHeadlessRenderer>> renderer_;
    PoolConfig pool_config_;
    CircuitBreakerConfig breaker_config_;
    ReliabilityOptions options_;
    ModeBreakers breakers_;
    std::shared_ptr<ExtractionInstancePool> pool_;
    std::unique_ptr<ReliableExtractor> extractor_;
};

TEST_F(ReliableExtractorTest, RawSuccessOnFirstAttempt) {
    Build();
    EXPECT_CALL(*renderer_, Render(_, _, _)).Times(0);

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->mode, Decision::kRaw);
    EXPECT_FALSE(result->degraded);
    EXPECT_EQ(result->attempts, 1u);
    EXPECT_GT(result->quality_score, 0.9);

    ReliabilityStats stats = extractor_->Stats();
    EXPECT_EQ(stats.total_attempts, 1u);
    EXPECT_EQ(stats.successes, 1u);
    EXPECT_EQ(stats.failures, 0u);
    EXPECT_EQ(stats.extractions, 1u);
    EXPECT_DOUBLE_EQ(stats.avg_retries, 0.0);
}

TEST_F(ReliableExtractorTest, RawFailuresEscalateToHeadless) {
    loader_->SetBehavior(fakes::FakeLoader::Failing());
    Build();
    ExpectRenderSucceeds();

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->mode, Decision::kHeadless);
    EXPECT_TRUE(result->degraded);

    const uint32_t raw_budget = options_.retry[ModeIndex(Decision::kRaw)].max_attempts;
    ReliabilityStats stats = extractor_->Stats();
    EXPECT_GE(stats.total_attempts, raw_budget + 1);
    EXPECT_EQ(stats.total_attempts, 5u);
    EXPECT_EQ(result->attempts, 5u);
    EXPECT_EQ(stats.successes, 1u);
    EXPECT_EQ(stats.failures, 2u);
    EXPECT_EQ(stats.escalations, 2u);
    EXPECT_EQ(stats.degraded_results, 1u);
    EXPECT_DOUBLE_EQ(stats.avg_retries, 2.0);
    EXPECT_EQ(stats.circuit_breaker_trips, 0u);
}

TEST_F(ReliableExtractorTest, EngineSeesRequestedMode) {
    loader_->SetBehavior([](std::string_view, std::string_view url, Decision mode,
                            ExecutionContext&) -> DocumentOr {
        if (mode == Decision::kRaw) {
            return MakeError(ErrorKind::kEngineError, "raw parser found no content");
        }
        return fakes::RichDocument(url);
    });
    Build();

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->mode, Decision::kProbesFirst);
    EXPECT_TRUE(result->degraded);
    EXPECT_EQ(result->attempts, 3u);
}

TEST_F(ReliableExtractorTest, ModeHintSkipsGate) {
    Build();
    ExpectRenderSucceeds();
    auto result = extractor_->ExtractWithReliability(MakeRequest(), Decision::kHeadless);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->mode, Decision::kHeadless);
    EXPECT_FALSE(result->degraded);
    EXPECT_EQ(loader_->engines().front()->calls(), 0);
}

TEST_F(ReliableExtractorTest, OpenCircuitEscalatesWithoutSpendingBudget) {
    Build();
    TripBreaker(Decision::kRaw);

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->mode, Decision::kProbesFirst);
    EXPECT_TRUE(result->degraded);
    EXPECT_EQ(result->attempts, 1u);

    ReliabilityStats stats = extractor_->Stats();
    EXPECT_EQ(stats.circuit_breaker_trips, 1u);
    EXPECT_EQ(stats.total_attempts, 1u);
    EXPECT_EQ(stats.escalations, 1u);
    EXPECT_EQ(stats.failures, 1u);
}

TEST_F(ReliableExtractorTest, OpenCircuitSurfacesWhenEscalationAndRetryDisabled) {
    options_.allow_escalation = false;
    options_.allow_retry = false;
    Build();
    TripBreaker(Decision::kRaw);

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kCircuitOpen)) << result.status();
    EXPECT_EQ(extractor_->Stats().circuit_breaker_trips, 1u);
}

TEST_F(ReliableExtractorTest, OpenCircuitAbsorbedWhenOnlyRetryEnabled) {
    options_.allow_escalation = false;
    Build();
    TripBreaker(Decision::kRaw);

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kAllModesExhausted)) << result.status();
}

TEST_F(ReliableExtractorTest, NoEscalationExhaustsRetryBudget) {
    options_.allow_escalation = false;
    loader_->SetBehavior(fakes::FakeLoader::Failing());
    Build();
    EXPECT_CALL(*renderer_, Render(_, _, _)).Times(0);

    const TimePoint start = clock_->Now();
    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kAllModesExhausted)) << result.status();
    EXPECT_NE(result.status().message().find("engine trapped"), std::string_view::npos);

    // One backoff between the two Raw attempts
    const Duration slept = clock_->Now() - start;
    EXPECT_GE(slept, Duration(100ms));
    EXPECT_LE(slept, Duration(105ms));
    EXPECT_EQ(extractor_->Stats().total_attempts, 2u);
}

TEST_F(ReliableExtractorTest, RetryDisabledUsesSingleAttemptPerMode) {
    options_.allow_retry = false;
    loader_->SetBehavior(fakes::FakeLoader::Failing());
    Build();
    ExpectRenderSucceeds();

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->attempts, 3u);
    EXPECT_DOUBLE_EQ(extractor_->Stats().avg_retries, 0.0);
}

TEST_F(ReliableExtractorTest, LowQualityProbeKeptAsFallback) {
    loader_->SetBehavior([](std::string_view, std::string_view url, Decision,
                            ExecutionContext&) -> DocumentOr { return PoorDocument(url); });
    Build();
    EXPECT_CALL(*renderer_, Render(_, _, _))
        .WillOnce(Return(DocumentOr(MakeError(ErrorKind::kEngineError, "browser crashed"))));

    auto result = extractor_->ExtractWithReliability(MakeRequest(), Decision::kProbesFirst);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->mode, Decision::kProbesFirst);
    EXPECT_TRUE(result->degraded);
    EXPECT_NEAR(result->quality_score, 0.4, 1e-9);
    // Low quality is not retried at the same mode
    EXPECT_EQ(result->attempts, 2u);

    ReliabilityStats stats = extractor_->Stats();
    EXPECT_EQ(stats.successes, 1u);
    EXPECT_EQ(stats.degraded_results, 1u);
}

TEST_F(ReliableExtractorTest, FallbackDisabledReportsExhaustion) {
    options_.enable_graceful_degradation = false;
    loader_->SetBehavior([](std::string_view, std::string_view url, Decision,
                            ExecutionContext&) -> DocumentOr { return PoorDocument(url); });
    Build();
    EXPECT_CALL(*renderer_, Render(_, _, _))
        .WillOnce(Return(DocumentOr(MakeError(ErrorKind::kEngineError, "browser crashed"))));

    auto result = extractor_->ExtractWithReliability(MakeRequest(), Decision::kProbesFirst);
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kAllModesExhausted)) << result.status();
    EXPECT_EQ(extractor_->Stats().successes, 0u);
}

TEST_F(ReliableExtractorTest, ExpiredDeadlineFailsWithoutAttempts) {
    Build();
    auto result = extractor_->ExtractWithReliability(MakeRequest(), std::nullopt, clock_->Now());
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kDeadlineExpired)) << result.status();
    EXPECT_EQ(extractor_->Stats().total_attempts, 0u);
}

TEST_F(ReliableExtractorTest, SlowInstanceCreationChargesNeitherInstanceNorBreaker) {
    pool_config_.initial_size = 0;
    Build();
    loader_->SetOnLoad([clock = clock_]() { clock->Advance(20ms); });

    auto result =
        extractor_->ExtractWithReliability(MakeRequest(), std::nullopt, clock_->Now() + 10ms);
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kDeadlineExpired)) << result.status();

    EXPECT_EQ(loader_->loads(), 1);
    for (const auto& engine : loader_->engines()) {
        EXPECT_EQ(engine->calls(), 0);
    }
    BreakerSnapshot breaker = breakers_[ModeIndex(Decision::kRaw)]->Snapshot();
    EXPECT_EQ(breaker.state, CircuitStateKind::kClosed);
    EXPECT_EQ(breaker.failure_count, 0u);
    EXPECT_EQ(pool_->Snapshot().epoch_timeouts, 0u);

    loader_->SetOnLoad(nullptr);
    auto instance = pool_->Acquire();
    ASSERT_TRUE(instance.ok()) << instance.status();
    EXPECT_EQ((*instance)->failure_count, 0u);
    EXPECT_EQ((*instance)->use_count, 0u);
    EXPECT_EQ(loader_->loads(), 1);
}

TEST_F(ReliableExtractorTest, FinalAttemptTimeoutSurfaces) {
    options_.allow_escalation = false;
    options_.allow_retry = false;
    pool_config_.epoch_timeout = 30ms;
    loader_->SetBehavior([](std::string_view, std::string_view, Decision,
                            ExecutionContext& context) -> DocumentOr {
        while (!context.interrupted()) {
            std::this_thread::sleep_for(1ms);
        }
        return context.CheckInterrupt();
    });
    Build();

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kExtractionTimeout)) << result.status();
    EXPECT_EQ(pool_->Snapshot().epoch_timeouts, 1u);
}

TEST_F(ReliableExtractorTest, CreationFailuresFeedBreaker) {
    pool_config_.initial_size = 0;
    breaker_config_.failure_threshold = 2;
    options_.allow_escalation = false;
    loader_->SetFailLoads(true);
    Build();

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_FALSE(result.ok());
    EXPECT_TRUE(IsKind(result.status(), ErrorKind::kAllModesExhausted)) << result.status();
    EXPECT_EQ(breakers_[ModeIndex(Decision::kRaw)]->State(), CircuitStateKind::kOpen);
}

TEST_F(ReliableExtractorTest, PoolExhaustionDoesNotFeedBreaker) {
    pool_config_.initial_size = 1;
    pool_config_.max_size = 1;
    options_.allow_escalation = false;
    breaker_config_.failure_threshold = 1;
    Build();

    auto held = pool_->Acquire();
    ASSERT_TRUE(held.ok());
    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(breakers_[ModeIndex(Decision::kRaw)]->State(), CircuitStateKind::kClosed);
    EXPECT_EQ(pool_->Snapshot().exhausted_total, 2u);
}

TEST_F(ReliableExtractorTest, HeadlessFailuresTripHeadlessBreaker) {
    breaker_config_.failure_threshold = 1;
    Build();
    EXPECT_CALL(*renderer_, Render(_, _, _))
        .WillOnce(Invoke([](std::string_view, std::string_view, TimePoint) -> DocumentOr {
            throw std::runtime_error("renderer connection reset");
        }));

    auto first = extractor_->ExtractWithReliability(MakeRequest(), Decision::kHeadless);
    EXPECT_TRUE(IsKind(first.status(), ErrorKind::kAllModesExhausted)) << first.status();
    EXPECT_EQ(breakers_[ModeIndex(Decision::kHeadless)]->State(), CircuitStateKind::kOpen);

    auto second = extractor_->ExtractWithReliability(MakeRequest(), Decision::kHeadless);
    EXPECT_TRUE(IsKind(second.status(), ErrorKind::kAllModesExhausted)) << second.status();
    EXPECT_EQ(extractor_->Stats().circuit_breaker_trips, 1u);
}

TEST_F(ReliableExtractorTest, ResetBreakerOnEscalation) {
    options_.reset_breaker_on_escalation = true;
    loader_->SetBehavior([](std::string_view, std::string_view url, Decision mode,
                            ExecutionContext&) -> DocumentOr {
        if (mode == Decision::kRaw) {
            return MakeError(ErrorKind::kEngineError, "raw failed");
        }
        return fakes::RichDocument(url);
    });
    Build();
    TripBreaker(Decision::kProbesFirst);
    EXPECT_CALL(*renderer_, Render(_, _, _)).Times(0);

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->mode, Decision::kProbesFirst);
}

TEST_F(ReliableExtractorTest, GateDecidesFromHtmlWhenNoFeatures) {
    Build();
    ExtractionRequest shell = MakeRequest(std::nullopt);
    shell.html = "<html><body><div id=\"root\"></div>"
                 "<script>window.__INITIAL_STATE__ = {};</script></body></html>";
    EXPECT_EQ(extractor_->DecideMode(shell), Decision::kHeadless);
    EXPECT_EQ(extractor_->DecideMode(MakeRequest()), Decision::kRaw);

    ExtractionRequest unsanitized = MakeRequest();
    unsanitized.features->domain_prior = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(extractor_->DecideMode(unsanitized), Decision::kRaw);
}

TEST_F(ReliableExtractorTest, StatsIdempotentBetweenCalls) {
    Build();
    ASSERT_TRUE(extractor_->ExtractWithReliability(MakeRequest()).ok());
    ReliabilityStats first = extractor_->Stats();
    ReliabilityStats second = extractor_->Stats();
    EXPECT_EQ(first, second);
}

TEST_F(ReliableExtractorTest, HealthReportsComponents) {
    Build();
    TripBreaker(Decision::kRaw);
    ASSERT_TRUE(extractor_->ExtractWithReliability(MakeRequest()).ok());

    ExtractorHealth health = extractor_->Health();
    EXPECT_EQ(health.breakers[ModeIndex(Decision::kRaw)].name, "raw");
    EXPECT_EQ(health.breakers[ModeIndex(Decision::kRaw)].state, CircuitStateKind::kOpen);
    EXPECT_EQ(health.breakers[ModeIndex(Decision::kHeadless)].name, "headless");
    EXPECT_EQ(health.pool.max_size, 2u);
    EXPECT_EQ(health.stats, extractor_->Stats());
}

TEST_F(ReliableExtractorTest, CreateValidatesCollaborators) {
    BuildPool();
    BuildBreakers();

    auto no_renderer = ReliableExtractor::Create(pool_, nullptr, breakers_, options_, clock_);
    EXPECT_TRUE(IsKind(no_renderer.status(), ErrorKind::kInvalidConfig));

    ModeBreakers missing = breakers_;
    missing[ModeIndex(Decision::kHeadless)] = nullptr;
    auto no_breaker = ReliableExtractor::Create(pool_, renderer_, missing, options_, clock_);
    EXPECT_TRUE(IsKind(no_breaker.status(), ErrorKind::kInvalidConfig));

    ReliabilityOptions bad = options_;
    bad.gate.lo = 0.9;
    auto bad_gate = ReliableExtractor::Create(pool_, renderer_, breakers_, bad, clock_);
    EXPECT_TRUE(IsKind(bad_gate.status(), ErrorKind::kInvalidConfig));

    bad = options_;
    bad.retry[ModeIndex(Decision::kRaw)].max_attempts = 0;
    auto bad_retry = ReliableExtractor::Create(pool_, renderer_, breakers_, bad, clock_);
    EXPECT_TRUE(IsKind(bad_retry.status(), ErrorKind::kInvalidConfig));
}

TEST_F(ReliableExtractorTest, SharedBreakerAcrossPoolModes) {
    breaker_config_.failure_threshold = 2;
    BuildPool();
    BuildBreakers();
    breakers_[ModeIndex(Decision::kProbesFirst)] = breakers_[ModeIndex(Decision::kRaw)];
    loader_->SetBehavior(fakes::FakeLoader::Failing());
    auto extractor = ReliableExtractor::Create(pool_, renderer_, breakers_, options_, clock_);
    ASSERT_TRUE(extractor.ok());
    extractor_ = std::move(*extractor);
    ExpectRenderSucceeds();

    auto result = extractor_->ExtractWithReliability(MakeRequest());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->mode, Decision::kHeadless);
    // Raw used both attempts and tripped the shared breaker, so ProbesFirst was skipped
    EXPECT_EQ(result->attempts, 3u);
    EXPECT_EQ(extractor_->Stats().circuit_breaker_trips, 1u);
}
