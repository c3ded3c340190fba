#include "configuration.h"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <utility>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"
#include "reliability/atomic_circuit_breaker.h"
#include "reliability/monitored_circuit_breaker.h"

namespace Sluice {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

template<typename T>
void setIfPresent(const YAML::Node& node, const char* key, ConfigValue<T>& value) {
    if (node[key]) {
        value.set(node[key].as<T>());
    }
}

void parseBreaker(const YAML::Node& node, SluiceConfig::Breaker& breaker) {
    setIfPresent(node, "variant", breaker.variant);
    setIfPresent(node, "failure_threshold", breaker.failure_threshold);
    setIfPresent(node, "open_cooldown_ms", breaker.open_cooldown_ms);
    setIfPresent(node, "half_open_max_in_flight", breaker.half_open_max_in_flight);
}

void parseRetry(const YAML::Node& node, SluiceConfig::Retry& retry) {
    setIfPresent(node, "max_attempts", retry.max_attempts);
    setIfPresent(node, "initial_backoff_ms", retry.initial_backoff_ms);
    setIfPresent(node, "max_backoff_ms", retry.max_backoff_ms);
    setIfPresent(node, "multiplier", retry.multiplier);
    setIfPresent(node, "jitter", retry.jitter);
}

// Values past uint32_t saturate so range checks still reject them.
uint32_t saturateU32(size_t value) {
    return static_cast<uint32_t>(
        std::min<size_t>(value, std::numeric_limits<uint32_t>::max()));
}

CircuitBreakerConfig toBreakerConfig(const SluiceConfig::Breaker& breaker) {
    CircuitBreakerConfig config;
    config.failure_threshold = saturateU32(breaker.failure_threshold.get());
    config.open_cooldown = std::chrono::milliseconds(breaker.open_cooldown_ms.get());
    config.half_open_max_in_flight = saturateU32(breaker.half_open_max_in_flight.get());
    return config;
}

RetryPolicy toRetryPolicy(const SluiceConfig::Retry& retry) {
    RetryPolicy policy;
    policy.max_attempts = saturateU32(retry.max_attempts.get());
    policy.initial_backoff = std::chrono::milliseconds(retry.initial_backoff_ms.get());
    policy.max_backoff = std::chrono::milliseconds(retry.max_backoff_ms.get());
    policy.multiplier = retry.multiplier.get();
    policy.jitter = retry.jitter.get();
    return policy;
}

absl::StatusOr<std::shared_ptr<ICircuitBreaker>> makeBreaker(const std::string& name,
                                                             const SluiceConfig::Breaker& breaker,
                                                             std::shared_ptr<Clock> clock,
                                                             std::shared_ptr<IEventSink> sink) {
    const std::string variant = breaker.variant.get();
    if (variant == "atomic") {
        absl::StatusOr<std::shared_ptr<AtomicCircuitBreaker>> created =
            AtomicCircuitBreaker::Create(name, toBreakerConfig(breaker), std::move(clock));
        if (!created.ok()) {
            return created.status();
        }
        return std::shared_ptr<ICircuitBreaker>(std::move(*created));
    }
    if (variant == "monitored") {
        absl::StatusOr<std::shared_ptr<MonitoredCircuitBreaker>> created =
            MonitoredCircuitBreaker::Create(name, toBreakerConfig(breaker), std::move(clock),
                                            std::move(sink));
        if (!created.ok()) {
            return created.status();
        }
        return std::shared_ptr<ICircuitBreaker>(std::move(*created));
    }
    return MakeError(ErrorKind::kInvalidConfig,
                     "breaker " + name + ": unknown variant '" + variant + "'");
}

void validateBreaker(const char* name, const SluiceConfig::Breaker& breaker,
                     std::vector<std::string>& errors) {
    const std::string variant = breaker.variant.get();
    if (variant != "atomic" && variant != "monitored") {
        errors.push_back(std::string("Breaker ") + name + " variant must be atomic or monitored");
    }
    absl::Status status = toBreakerConfig(breaker).Validate();
    if (!status.ok()) {
        errors.push_back(std::string("Breaker ") + name + ": " + std::string(status.message()));
    }
}

void validateRetry(const char* name, const SluiceConfig::Retry& retry,
                   std::vector<std::string>& errors) {
    if (retry.max_attempts.get() > std::numeric_limits<uint32_t>::max()) {
        errors.push_back(std::string("Retry ") + name + ": max_attempts out of range");
        return;
    }
    absl::Status status = toRetryPolicy(retry).Validate();
    if (!status.ok()) {
        errors.push_back(std::string("Retry ") + name + ": " + std::string(status.message()));
    }
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        return applyYaml(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYaml(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::reset() {
    config_ = SluiceConfig();
    validation_errors_.clear();
}

bool Configuration::applyYaml(const YAML::Node& yaml) {
    if (!yaml["sluice"]) {
        LOG(WARNING) << "Configuration has no top-level 'sluice' key; keeping defaults";
        return validate();
    }
    const YAML::Node root = yaml["sluice"];

    if (root["gate"]) {
        const YAML::Node gate = root["gate"];
        setIfPresent(gate, "hi", config_.gate.hi);
        setIfPresent(gate, "lo", config_.gate.lo);
        setIfPresent(gate, "default_domain_prior", config_.gate.default_domain_prior);
    }

    if (root["breaker"]) {
        const YAML::Node breaker = root["breaker"];
        if (breaker["pool"]) parseBreaker(breaker["pool"], config_.pool_breaker);
        if (breaker["headless"]) parseBreaker(breaker["headless"], config_.headless_breaker);
    }

    if (root["pool"]) {
        const YAML::Node pool = root["pool"];
        setIfPresent(pool, "initial_size", config_.pool.initial_size);
        setIfPresent(pool, "max_size", config_.pool.max_size);
        setIfPresent(pool, "max_uses_per_instance", config_.pool.max_uses_per_instance);
        setIfPresent(pool, "max_failures_per_instance", config_.pool.max_failures_per_instance);
        setIfPresent(pool, "memory_limit_bytes", config_.pool.memory_limit_bytes);
        setIfPresent(pool, "epoch_timeout_ms", config_.pool.epoch_timeout_ms);
        setIfPresent(pool, "health_check_interval_ms", config_.pool.health_check_interval_ms);
        setIfPresent(pool, "acquire_wait_budget_ms", config_.pool.acquire_wait_budget_ms);
        setIfPresent(pool, "grow_failure_threshold", config_.pool.grow_failure_threshold);
        setIfPresent(pool, "max_instance_age_s", config_.pool.max_instance_age_s);
        setIfPresent(pool, "max_idle_time_s", config_.pool.max_idle_time_s);
        setIfPresent(pool, "engine_path", config_.pool.engine_path);
        setIfPresent(pool, "executor_threads", config_.pool.executor_threads);
    }

    if (root["retry"]) {
        const YAML::Node retry = root["retry"];
        if (retry["raw"]) parseRetry(retry["raw"], config_.retry_raw);
        if (retry["probes_first"]) parseRetry(retry["probes_first"], config_.retry_probes_first);
        if (retry["headless"]) parseRetry(retry["headless"], config_.retry_headless);
    }

    if (root["extractor"]) {
        const YAML::Node extractor = root["extractor"];
        setIfPresent(extractor, "allow_escalation", config_.extractor.allow_escalation);
        setIfPresent(extractor, "allow_retry", config_.extractor.allow_retry);
        setIfPresent(extractor, "reset_breaker_on_escalation",
                     config_.extractor.reset_breaker_on_escalation);
        setIfPresent(extractor, "enable_graceful_degradation",
                     config_.extractor.enable_graceful_degradation);
        setIfPresent(extractor, "probe_quality_threshold",
                     config_.extractor.probe_quality_threshold);
        setIfPresent(extractor, "default_timeout_ms", config_.extractor.default_timeout_ms);
    }

    if (!validate()) {
        for (const auto& error : validation_errors_) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return false;
    }
    return true;
}

GateThresholds Configuration::gateThresholds() const {
    GateThresholds thresholds;
    thresholds.hi = config_.gate.hi.get();
    thresholds.lo = config_.gate.lo.get();
    return thresholds;
}

CircuitBreakerConfig Configuration::poolBreakerConfig() const {
    return toBreakerConfig(config_.pool_breaker);
}

CircuitBreakerConfig Configuration::headlessBreakerConfig() const {
    return toBreakerConfig(config_.headless_breaker);
}

PoolConfig Configuration::poolConfig() const {
    const auto& pool = config_.pool;
    PoolConfig config;
    config.initial_size = pool.initial_size.get();
    config.max_size = pool.max_size.get();
    config.max_uses_per_instance = pool.max_uses_per_instance.get();
    config.max_failures_per_instance = pool.max_failures_per_instance.get();
    config.memory_limit_bytes = pool.memory_limit_bytes.get();
    config.epoch_timeout = std::chrono::milliseconds(pool.epoch_timeout_ms.get());
    config.health_check_interval = std::chrono::milliseconds(pool.health_check_interval_ms.get());
    config.acquire_wait_budget = std::chrono::milliseconds(pool.acquire_wait_budget_ms.get());
    config.grow_failure_threshold = pool.grow_failure_threshold.get();
    config.max_instance_age = std::chrono::seconds(pool.max_instance_age_s.get());
    config.max_idle_time = std::chrono::seconds(pool.max_idle_time_s.get());
    config.engine_path = pool.engine_path.get();
    config.executor_threads = pool.executor_threads.get();
    return config;
}

RetryPolicies Configuration::retryPolicies() const {
    RetryPolicies policies;
    policies[ModeIndex(Decision::kRaw)] = toRetryPolicy(config_.retry_raw);
    policies[ModeIndex(Decision::kProbesFirst)] = toRetryPolicy(config_.retry_probes_first);
    policies[ModeIndex(Decision::kHeadless)] = toRetryPolicy(config_.retry_headless);
    return policies;
}

ReliabilityOptions Configuration::reliabilityOptions() const {
    const auto& extractor = config_.extractor;
    ReliabilityOptions options;
    options.allow_escalation = extractor.allow_escalation.get();
    options.allow_retry = extractor.allow_retry.get();
    options.reset_breaker_on_escalation = extractor.reset_breaker_on_escalation.get();
    options.enable_graceful_degradation = extractor.enable_graceful_degradation.get();
    options.probe_quality_threshold = extractor.probe_quality_threshold.get();
    options.default_timeout = std::chrono::milliseconds(extractor.default_timeout_ms.get());
    options.gate = gateThresholds();
    options.retry = retryPolicies();
    return options;
}

absl::StatusOr<ModeBreakers> Configuration::buildModeBreakers(
    std::shared_ptr<Clock> clock, std::shared_ptr<IEventSink> sink) const {
    absl::StatusOr<std::shared_ptr<ICircuitBreaker>> pool =
        makeBreaker("pool", config_.pool_breaker, clock, sink);
    if (!pool.ok()) {
        return pool.status();
    }
    absl::StatusOr<std::shared_ptr<ICircuitBreaker>> headless =
        makeBreaker("headless", config_.headless_breaker, clock, sink);
    if (!headless.ok()) {
        return headless.status();
    }

    ModeBreakers breakers;
    breakers[ModeIndex(Decision::kRaw)] = *pool;
    breakers[ModeIndex(Decision::kProbesFirst)] = *pool;
    breakers[ModeIndex(Decision::kHeadless)] = *headless;
    return breakers;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Gate
    const double hi = config_.gate.hi.get();
    const double lo = config_.gate.lo.get();
    if (!(hi >= 0.0 && hi <= 1.0) || !(lo >= 0.0 && lo <= 1.0)) {
        validation_errors_.push_back("Gate thresholds must be within [0, 1]");
    } else if (lo > hi) {
        validation_errors_.push_back("Gate lo threshold cannot exceed hi threshold");
    }
    const double prior = config_.gate.default_domain_prior.get();
    if (!(prior >= 0.0 && prior <= 1.0)) {
        validation_errors_.push_back("Gate default domain prior must be within [0, 1]");
    }

    // Breakers
    validateBreaker("pool", config_.pool_breaker, validation_errors_);
    validateBreaker("headless", config_.headless_breaker, validation_errors_);

    // Pool
    absl::Status pool_status = poolConfig().Validate();
    if (!pool_status.ok()) {
        validation_errors_.push_back("Pool: " + std::string(pool_status.message()));
    }

    // Retry
    validateRetry("raw", config_.retry_raw, validation_errors_);
    validateRetry("probes_first", config_.retry_probes_first, validation_errors_);
    validateRetry("headless", config_.retry_headless, validation_errors_);

    // Extractor
    const double quality = config_.extractor.probe_quality_threshold.get();
    if (!(quality >= 0.0 && quality <= 1.0)) {
        validation_errors_.push_back("Probe quality threshold must be within [0, 1]");
    }
    if (config_.extractor.default_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Default timeout must be positive");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Sluice
