#pragma once

#include <functional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "clock.h"

namespace Sluice {

/**
 * Health notifications emitted by breakers and pools.
 *
 * Delivery is best-effort: the emitting component has already committed its
 * state change before any sink sees the event, and a failing sink never
 * affects that state.
 */
enum class EventType {
    kCircuitOpened,
    kCircuitHalfOpened,
    kCircuitClosed,
    kInstanceCreated,
    kInstanceRetired,
    kPoolExhausted,
    kMemoryCleanup,
    kPoolHealthCheck,
};

const char* EventTypeName(EventType type);

struct HealthEvent {
    EventType type;
    std::string source;        // breaker or pool name
    std::string instance_id;   // empty for component-level events
    TimePoint at{};
    absl::flat_hash_map<std::string, std::string> metadata;

    HealthEvent& With(const std::string& key, const std::string& value) {
        metadata[key] = value;
        return *this;
    }
};

class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void OnEvent(const HealthEvent& event) = 0;
};

// Delivers |event| to |sink| if present. A throwing sink is logged and
// otherwise ignored.
void NotifyBestEffort(IEventSink* sink, const HealthEvent& event);

/**
 * In-process publish/subscribe sink. Handlers run synchronously on the
 * publishing thread, outside the bus lock, so a handler may publish again.
 */
class EventBus : public IEventSink {
public:
    using Handler = std::function<void(const HealthEvent&)>;

    EventBus() = default;
    ~EventBus() override = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void Subscribe(EventType type, Handler handler);
    void SubscribeAll(Handler handler);

    void OnEvent(const HealthEvent& event) override { Publish(event); }
    void Publish(const HealthEvent& event);

    size_t PublishedCount() const;
    size_t HandlerFailures() const;

private:
    mutable absl::Mutex mutex_;
    absl::flat_hash_map<EventType, std::vector<Handler>> handlers_ ABSL_GUARDED_BY(mutex_);
    std::vector<Handler> wildcard_handlers_ ABSL_GUARDED_BY(mutex_);
    size_t published_ ABSL_GUARDED_BY(mutex_) = 0;
    size_t handler_failures_ ABSL_GUARDED_BY(mutex_) = 0;
};

} // namespace Sluice
