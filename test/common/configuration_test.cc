#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "../../src/common/configuration.h"
#include "../../src/common/errors.h"
#include "../../src/reliability/atomic_circuit_breaker.h"
#include "../../src/reliability/monitored_circuit_breaker.h"

using namespace Sluice;
using namespace std::chrono_literals;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override { Configuration::getInstance().reset(); }

    void TearDown() override {
        unsetenv("SLUICE_GATE_HI");
        unsetenv("SLUICE_POOL_MAX_SIZE");
        unsetenv("SLUICE_ALLOW_RETRY");
        Configuration::getInstance().reset();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    EXPECT_TRUE(config().validate());
    EXPECT_TRUE(config().getValidationErrors().empty());

    GateThresholds gate = config().gateThresholds();
    EXPECT_DOUBLE_EQ(gate.hi, 0.7);
    EXPECT_DOUBLE_EQ(gate.lo, 0.3);

    RetryPolicies retry = config().retryPolicies();
    EXPECT_EQ(retry[ModeIndex(Decision::kRaw)].max_attempts, 2u);
    EXPECT_EQ(retry[ModeIndex(Decision::kHeadless)].max_attempts, 1u);

    CircuitBreakerConfig headless = config().headlessBreakerConfig();
    EXPECT_EQ(headless.failure_threshold, 3u);
    EXPECT_EQ(headless.open_cooldown, Duration(60s));
}

TEST_F(ConfigurationTest, LoadsYamlOverrides) {
    const std::string yaml = R"(
sluice:
  gate:
    hi: 0.8
    lo: 0.2
  breaker:
    pool:
      failure_threshold: 7
      open_cooldown_ms: 1500
  pool:
    max_size: 16
    epoch_timeout_ms: 250
    engine_path: /opt/engines/readability.wasm
  retry:
    raw:
      max_attempts: 4
      initial_backoff_ms: 50
  extractor:
    allow_escalation: false
    probe_quality_threshold: 0.5
)";
    ASSERT_TRUE(config().loadFromString(yaml));

    EXPECT_DOUBLE_EQ(config().gateThresholds().hi, 0.8);
    CircuitBreakerConfig pool_breaker = config().poolBreakerConfig();
    EXPECT_EQ(pool_breaker.failure_threshold, 7u);
    EXPECT_EQ(pool_breaker.open_cooldown, Duration(1500ms));

    PoolConfig pool = config().poolConfig();
    EXPECT_EQ(pool.max_size, 16u);
    EXPECT_EQ(pool.initial_size, 2u);
    EXPECT_EQ(pool.epoch_timeout, Duration(250ms));
    EXPECT_EQ(pool.engine_path, "/opt/engines/readability.wasm");

    ReliabilityOptions options = config().reliabilityOptions();
    EXPECT_FALSE(options.allow_escalation);
    EXPECT_TRUE(options.allow_retry);
    EXPECT_DOUBLE_EQ(options.probe_quality_threshold, 0.5);
    EXPECT_EQ(options.retry[ModeIndex(Decision::kRaw)].max_attempts, 4u);
    EXPECT_EQ(options.retry[ModeIndex(Decision::kRaw)].initial_backoff, Duration(50ms));
    EXPECT_DOUBLE_EQ(options.gate.lo, 0.2);
    EXPECT_TRUE(options.Validate().ok());
}

TEST_F(ConfigurationTest, RejectsInvalidValues) {
    const std::string yaml = R"(
sluice:
  gate:
    hi: 0.2
    lo: 0.6
  breaker:
    headless:
      variant: optimistic
      failure_threshold: 0
  pool:
    max_size: 0
)";
    EXPECT_FALSE(config().loadFromString(yaml));
    auto errors = config().getValidationErrors();
    EXPECT_GE(errors.size(), 3u);
}

TEST_F(ConfigurationTest, RejectsCountsBeyondUint32) {
    const std::string yaml = R"(
sluice:
  breaker:
    pool:
      failure_threshold: 4294967297
  retry:
    raw:
      max_attempts: 4294967297
)";
    EXPECT_FALSE(config().loadFromString(yaml));
    auto errors = config().getValidationErrors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("Breaker pool"), std::string::npos);
    EXPECT_NE(errors[1].find("max_attempts out of range"), std::string::npos);
}

TEST_F(ConfigurationTest, BuildsModeBreakersFromVariants) {
    auto clock = std::make_shared<ManualClock>();
    absl::StatusOr<ModeBreakers> breakers = config().buildModeBreakers(clock);
    ASSERT_TRUE(breakers.ok()) << breakers.status();

    const auto& raw = (*breakers)[ModeIndex(Decision::kRaw)];
    const auto& probes = (*breakers)[ModeIndex(Decision::kProbesFirst)];
    const auto& headless = (*breakers)[ModeIndex(Decision::kHeadless)];
    EXPECT_EQ(raw, probes);
    EXPECT_NE(raw, headless);
    EXPECT_NE(dynamic_cast<AtomicCircuitBreaker*>(raw.get()), nullptr);
    EXPECT_NE(dynamic_cast<MonitoredCircuitBreaker*>(headless.get()), nullptr);
    EXPECT_EQ(raw->Name(), "pool");
    EXPECT_EQ(headless->Name(), "headless");
}

TEST_F(ConfigurationTest, BuildModeBreakersRejectsUnknownVariant) {
    config().config().pool_breaker.variant.set("sharded");
    absl::StatusOr<ModeBreakers> breakers = config().buildModeBreakers();
    EXPECT_FALSE(breakers.ok());
    EXPECT_TRUE(IsKind(breakers.status(), ErrorKind::kInvalidConfig));
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config().loadFromString("sluice: [unterminated"));
    EXPECT_FALSE(config().loadFromFile("/nonexistent/sluice.yaml"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config().loadFromString("sluice:\n  gate:\n    hi: 0.9\n"));
    setenv("SLUICE_GATE_HI", "0.75", 1);
    setenv("SLUICE_POOL_MAX_SIZE", "12", 1);
    setenv("SLUICE_ALLOW_RETRY", "off", 1);

    EXPECT_DOUBLE_EQ(config().gateThresholds().hi, 0.75);
    EXPECT_EQ(config().poolConfig().max_size, 12u);
    EXPECT_FALSE(config().reliabilityOptions().allow_retry);

    setenv("SLUICE_POOL_MAX_SIZE", "many", 1);
    EXPECT_EQ(config().poolConfig().max_size, 8u);
}

TEST_F(ConfigurationTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "sluice_config_test.yaml";
    {
        std::ofstream out(path);
        out << "sluice:\n  pool:\n    initial_size: 1\n    max_size: 1\n";
    }
    ASSERT_TRUE(config().loadFromFile(path));
    EXPECT_EQ(config().poolConfig().max_size, 1u);
    std::remove(path.c_str());
}
