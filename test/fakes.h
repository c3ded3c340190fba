#ifndef SLUICE_TEST_FAKES_H_
#define SLUICE_TEST_FAKES_H_

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include "absl/synchronization/mutex.h"
#include "../src/common/errors.h"
#include "../src/common/event_bus.h"
#include "../src/pool/extraction_engine.h"
#include "../src/reliability/headless_renderer.h"

namespace Sluice {
namespace fakes {

using EngineBehavior = std::function<absl::StatusOr<ExtractedDocument>(
    std::string_view content, std::string_view url, Decision mode, ExecutionContext& context)>;

inline ExtractedDocument MakeDocument(std::string_view url, size_t text_chars,
                                      bool with_title = true) {
    ExtractedDocument document;
    document.url = std::string(url);
    document.text = std::string(text_chars, 'x');
    if (with_title) {
        document.title = "Title";
    }
    return document;
}

// Document scoring 0.2 + 0.4 + 0.2 + 0.15 = 0.95 on ProbeQuality
inline ExtractedDocument RichDocument(std::string_view url) {
    ExtractedDocument document = MakeDocument(url, 1500);
    document.markdown = "# a\n## b\n* c\n* d\n[e](f) [g](h)";
    document.byline = "Author";
    document.description = "Summary";
    document.links = {"https://example.com/next"};
    return document;
}

/**
 * Engine whose Extract runs a shared, swappable behavior. Counts calls and
 * interrupts so tests can observe the pool driving it.
 */
class FakeEngine : public IExtractionEngine {
public:
    explicit FakeEngine(std::shared_ptr<EngineBehavior> behavior) : behavior_(std::move(behavior)) {}

    absl::StatusOr<ExtractedDocument> Extract(std::string_view content, std::string_view url,
                                              Decision mode, ExecutionContext& context) override {
        calls_.fetch_add(1);
        return (*behavior_)(content, url, mode, context);
    }

    void Interrupt() override { interrupts_.fetch_add(1); }

    int calls() const { return calls_.load(); }
    int interrupts() const { return interrupts_.load(); }

private:
    std::shared_ptr<EngineBehavior> behavior_;
    std::atomic<int> calls_{0};
    std::atomic<int> interrupts_{0};
};

/**
 * Loader handing out FakeEngines that share one behavior. Loads can be made
 * to fail, and each load may pre-allocate |load_bytes| on the tracker.
 */
class FakeLoader : public IEngineLoader {
public:
    FakeLoader() : behavior_(std::make_shared<EngineBehavior>(Succeeding())) {}

    absl::StatusOr<std::shared_ptr<IExtractionEngine>> Load(const std::string& engine_path,
                                                             ResourceTracker& tracker) override {
        loads_.fetch_add(1);
        {
            absl::MutexLock lock(&mutex_);
            if (on_load_) {
                on_load_();
            }
        }
        if (fail_loads_.load()) {
            return absl::UnavailableError("engine image " + engine_path + " unavailable");
        }
        const size_t bytes = load_bytes_.load();
        if (bytes > 0 && !tracker.MemoryGrowing(0, bytes)) {
            return absl::ResourceExhaustedError("load-time allocation refused");
        }
        auto engine = std::make_shared<FakeEngine>(behavior_);
        absl::MutexLock lock(&mutex_);
        engines_.push_back(engine);
        return engine;
    }

    // Must be called before engines run.
    void SetBehavior(EngineBehavior behavior) { *behavior_ = std::move(behavior); }
    void SetFailLoads(bool fail) { fail_loads_.store(fail); }
    void SetLoadBytes(size_t bytes) { load_bytes_.store(bytes); }
    // Runs at the start of every load, e.g. to let a slow load advance a clock.
    void SetOnLoad(std::function<void()> on_load) {
        absl::MutexLock lock(&mutex_);
        on_load_ = std::move(on_load);
    }

    int loads() const { return loads_.load(); }

    std::vector<std::shared_ptr<FakeEngine>> engines() const {
        absl::MutexLock lock(&mutex_);
        return engines_;
    }

    static EngineBehavior Succeeding() {
        return [](std::string_view, std::string_view url, Decision, ExecutionContext&)
                   -> absl::StatusOr<ExtractedDocument> { return RichDocument(url); };
    }

    static EngineBehavior Failing() {
        return [](std::string_view, std::string_view, Decision, ExecutionContext&)
                   -> absl::StatusOr<ExtractedDocument> {
            return MakeError(ErrorKind::kEngineError, "engine trapped");
        };
    }

private:
    std::shared_ptr<EngineBehavior> behavior_;
    std::atomic<bool> fail_loads_{false};
    std::atomic<size_t> load_bytes_{0};
    std::atomic<int> loads_{0};

    mutable absl::Mutex mutex_;
    std::vector<std::shared_ptr<FakeEngine>> engines_;
    std::function<void()> on_load_;
};

class MockHeadlessRenderer : public IHeadlessRenderer {
public:
    MOCK_METHOD(absl::StatusOr<ExtractedDocument>, Render,
                (std::string_view url, std::string_view content, TimePoint deadline), (override));
};

class MockEventSink : public IEventSink {
public:
    MOCK_METHOD(void, OnEvent, (const HealthEvent& event), (override));
};

// Sink that records every event it sees.
class RecordingSink : public IEventSink {
public:
    void OnEvent(const HealthEvent& event) override {
        absl::MutexLock lock(&mutex_);
        events_.push_back(event);
    }

    std::vector<HealthEvent> events() const {
        absl::MutexLock lock(&mutex_);
        return events_;
    }

    size_t Count(EventType type) const {
        absl::MutexLock lock(&mutex_);
        size_t count = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                ++count;
            }
        }
        return count;
    }

private:
    mutable absl::Mutex mutex_;
    std::vector<HealthEvent> events_;
};

class ThrowingSink : public IEventSink {
public:
    void OnEvent(const HealthEvent& event) override {
        throw std::runtime_error("sink unavailable");
    }
};

} // namespace fakes
} // namespace Sluice

#endif // SLUICE_TEST_FAKES_H_
