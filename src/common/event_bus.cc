#include "event_bus.h"

#include <exception>

#include <glog/logging.h>

namespace Sluice {

const char* EventTypeName(EventType type) {
    switch (type) {
        case EventType::kCircuitOpened: return "circuit_opened";
        case EventType::kCircuitHalfOpened: return "circuit_half_opened";
        case EventType::kCircuitClosed: return "circuit_closed";
        case EventType::kInstanceCreated: return "instance_created";
        case EventType::kInstanceRetired: return "instance_retired";
        case EventType::kPoolExhausted: return "pool_exhausted";
        case EventType::kMemoryCleanup: return "memory_cleanup";
        case EventType::kPoolHealthCheck: return "pool_health_check";
    }
    return "unknown";
}

void NotifyBestEffort(IEventSink* sink, const HealthEvent& event) {
    if (sink == nullptr) {
        return;
    }
    try {
        sink->OnEvent(event);
    } catch (const std::exception& e) {
        LOG(WARNING) << "Event sink failed for " << EventTypeName(event.type)
                     << " from " << event.source << ": " << e.what();
    }
}

void EventBus::Subscribe(EventType type, Handler handler) {
    absl::MutexLock lock(&mutex_);
    handlers_[type].push_back(std::move(handler));
}

void EventBus::SubscribeAll(Handler handler) {
    absl::MutexLock lock(&mutex_);
    wildcard_handlers_.push_back(std::move(handler));
}

void EventBus::Publish(const HealthEvent& event) {
    std::vector<Handler> targets;
    {
        absl::MutexLock lock(&mutex_);
        ++published_;
        auto it = handlers_.find(event.type);
        if (it != handlers_.end()) {
            targets = it->second;
        }
        targets.insert(targets.end(), wildcard_handlers_.begin(), wildcard_handlers_.end());
    }

    size_t failures = 0;
    for (const auto& handler : targets) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            ++failures;
            LOG(WARNING) << "EventBus handler failed for " << EventTypeName(event.type)
                         << ": " << e.what();
        }
    }

    if (failures > 0) {
        absl::MutexLock lock(&mutex_);
        handler_failures_ += failures;
    }
    VLOG(3) << "EventBus: " << EventTypeName(event.type) << " from " << event.source
            << " delivered to " << targets.size() << " handlers";
}

size_t EventBus::PublishedCount() const {
    absl::MutexLock lock(&mutex_);
    return published_;
}

size_t EventBus::HandlerFailures() const {
    absl::MutexLock lock(&mutex_);
    return handler_failures_;
}

} // namespace Sluice
