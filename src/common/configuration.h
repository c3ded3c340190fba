#ifndef SLUICE_CONFIGURATION_H_
#define SLUICE_CONFIGURATION_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "common/clock.h"
#include "common/event_bus.h"
#include "gate/gate_scorer.h"
#include "pool/instance_pool.h"
#include "reliability/circuit_breaker.h"
#include "reliability/reliable_extractor.h"
#include "reliability/retry_policy.h"

namespace YAML {
class Node;
}

namespace Sluice {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct SluiceConfig {
    struct Gate {
        ConfigValue<double> hi{0.7, "SLUICE_GATE_HI"};
        ConfigValue<double> lo{0.3, "SLUICE_GATE_LO"};
        // Prior used when a request does not carry one.
        ConfigValue<double> default_domain_prior{0.5, "SLUICE_GATE_DEFAULT_PRIOR"};
    } gate;

    struct Breaker {
        // "atomic" or "monitored"
        ConfigValue<std::string> variant;
        ConfigValue<size_t> failure_threshold;
        ConfigValue<int> open_cooldown_ms;
        ConfigValue<size_t> half_open_max_in_flight;
    };
    // Guards Raw and ProbesFirst, both served by the pool.
    Breaker pool_breaker{{"atomic", "SLUICE_BREAKER_POOL_VARIANT"},
                         {5, "SLUICE_BREAKER_POOL_FAILURE_THRESHOLD"},
                         {30000, "SLUICE_BREAKER_POOL_COOLDOWN_MS"},
                         {1, "SLUICE_BREAKER_POOL_HALF_OPEN_MAX"}};
    Breaker headless_breaker{{"monitored", "SLUICE_BREAKER_HEADLESS_VARIANT"},
                             {3, "SLUICE_BREAKER_HEADLESS_FAILURE_THRESHOLD"},
                             {60000, "SLUICE_BREAKER_HEADLESS_COOLDOWN_MS"},
                             {1, "SLUICE_BREAKER_HEADLESS_HALF_OPEN_MAX"}};

    struct Pool {
        ConfigValue<size_t> initial_size{2, "SLUICE_POOL_INITIAL_SIZE"};
        ConfigValue<size_t> max_size{8, "SLUICE_POOL_MAX_SIZE"};
        ConfigValue<size_t> max_uses_per_instance{1000, "SLUICE_POOL_MAX_USES"};
        ConfigValue<size_t> max_failures_per_instance{5, "SLUICE_POOL_MAX_FAILURES"};
        ConfigValue<size_t> memory_limit_bytes{256UL << 20, "SLUICE_POOL_MEMORY_LIMIT"};
        ConfigValue<int> epoch_timeout_ms{10000, "SLUICE_POOL_EPOCH_TIMEOUT_MS"};
        ConfigValue<int> health_check_interval_ms{30000, "SLUICE_POOL_HEALTH_CHECK_MS"};
        ConfigValue<int> acquire_wait_budget_ms{5000, "SLUICE_POOL_ACQUIRE_WAIT_MS"};
        ConfigValue<size_t> grow_failure_threshold{10, "SLUICE_POOL_GROW_FAILURE_THRESHOLD"};
        ConfigValue<int> max_instance_age_s{3600, "SLUICE_POOL_MAX_INSTANCE_AGE_S"};
        ConfigValue<int> max_idle_time_s{1800, "SLUICE_POOL_MAX_IDLE_S"};
        ConfigValue<std::string> engine_path{"engines/extractor.wasm", "SLUICE_POOL_ENGINE_PATH"};
        ConfigValue<size_t> executor_threads{4, "SLUICE_POOL_EXECUTOR_THREADS"};
    } pool;

    struct Retry {
        ConfigValue<size_t> max_attempts;
        ConfigValue<int> initial_backoff_ms;
        ConfigValue<int> max_backoff_ms;
        ConfigValue<double> multiplier;
        ConfigValue<double> jitter;
    };
    Retry retry_raw{{2, "SLUICE_RETRY_RAW_ATTEMPTS"},
                    {100, "SLUICE_RETRY_RAW_INITIAL_MS"},
                    {2000, "SLUICE_RETRY_RAW_MAX_MS"},
                    {2.0, "SLUICE_RETRY_RAW_MULTIPLIER"},
                    {0.05, "SLUICE_RETRY_RAW_JITTER"}};
    Retry retry_probes_first{{2, "SLUICE_RETRY_PROBES_ATTEMPTS"},
                             {100, "SLUICE_RETRY_PROBES_INITIAL_MS"},
                             {2000, "SLUICE_RETRY_PROBES_MAX_MS"},
                             {2.0, "SLUICE_RETRY_PROBES_MULTIPLIER"},
                             {0.05, "SLUICE_RETRY_PROBES_JITTER"}};
    Retry retry_headless{{1, "SLUICE_RETRY_HEADLESS_ATTEMPTS"},
                         {100, "SLUICE_RETRY_HEADLESS_INITIAL_MS"},
                         {2000, "SLUICE_RETRY_HEADLESS_MAX_MS"},
                         {2.0, "SLUICE_RETRY_HEADLESS_MULTIPLIER"},
                         {0.05, "SLUICE_RETRY_HEADLESS_JITTER"}};

    struct Extractor {
        ConfigValue<bool> allow_escalation{true, "SLUICE_ALLOW_ESCALATION"};
        ConfigValue<bool> allow_retry{true, "SLUICE_ALLOW_RETRY"};
        ConfigValue<bool> reset_breaker_on_escalation{false, "SLUICE_RESET_BREAKER_ON_ESCALATION"};
        ConfigValue<bool> enable_graceful_degradation{true, "SLUICE_GRACEFUL_DEGRADATION"};
        ConfigValue<double> probe_quality_threshold{0.6, "SLUICE_PROBE_QUALITY_THRESHOLD"};
        ConfigValue<int> default_timeout_ms{30000, "SLUICE_DEFAULT_TIMEOUT_MS"};
    } extractor;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Back to built-in defaults
    void reset();

    // Get the configuration
    const SluiceConfig& config() const { return config_; }
    SluiceConfig& config() { return config_; }

    // Typed views consumed by the components
    GateThresholds gateThresholds() const;
    CircuitBreakerConfig poolBreakerConfig() const;
    CircuitBreakerConfig headlessBreakerConfig() const;
    PoolConfig poolConfig() const;
    RetryPolicies retryPolicies() const;
    ReliabilityOptions reliabilityOptions() const;

    // Raw and ProbesFirst share the pool breaker; Headless gets its own.
    // Only monitored breakers report to |sink|.
    absl::StatusOr<ModeBreakers> buildModeBreakers(
        std::shared_ptr<Clock> clock = DefaultClock(),
        std::shared_ptr<IEventSink> sink = nullptr) const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SluiceConfig config_;
    mutable std::vector<std::string> validation_errors_;

    bool applyYaml(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Sluice

#endif // SLUICE_CONFIGURATION_H_
