#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crisisguard { class ThreadPool; }

namespace crisisguard {

enum class EventType {
    SESSION_STARTED,
    MESSAGE_ANALYZED,
    CRISIS_DETECTED,
    ESCALATION_REQUIRED,
    DETECTOR_FAILURE,
    EXTERNAL_ANALYZER_FAILURE,
    STORE_FAILURE,
    SESSION_ENDED
};

struct Event {
    EventType type;
    uint64_t timestamp;
    std::string session_id;
    std::unordered_map<std::string, std::string> metadata;

    Event(EventType t, const std::string& session)
        : type(t), timestamp(GetCurrentTimestamp()), session_id(session) {}

private:
    static uint64_t GetCurrentTimestamp();
};

using EventHandler = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

class EventBus {
public:
    static EventBus& Instance();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(EventType type, EventHandler handler);
    void Unsubscribe(SubscriptionId id);

    // Handlers run on the caller's thread. A throwing handler is logged and
    // does not prevent delivery to the remaining subscribers.
    void Publish(const Event& event);
    void PublishAsync(Event event);

    // Must be called once before any PublishAsync() calls that should be asynchronous.
    void InitAsyncPool(size_t num_threads = 1);

    // Drain pending async deliveries. Call during shutdown before subscribers go away.
    void ShutdownAsyncPool();

    size_t GetSubscriberCount(EventType type) const;
    void Clear();

private:
    EventBus() = default;

    mutable std::mutex mutex_;
    std::unordered_map<EventType, std::vector<std::pair<SubscriptionId, EventHandler>>> subscribers_;
    SubscriptionId next_id_ = 1;

    std::unique_ptr<ThreadPool> async_pool_;
};

inline std::string EventTypeToString(EventType type) {
    switch (type) {
        case EventType::SESSION_STARTED:           return "SESSION_STARTED";
        case EventType::MESSAGE_ANALYZED:          return "MESSAGE_ANALYZED";
        case EventType::CRISIS_DETECTED:           return "CRISIS_DETECTED";
        case EventType::ESCALATION_REQUIRED:       return "ESCALATION_REQUIRED";
        case EventType::DETECTOR_FAILURE:          return "DETECTOR_FAILURE";
        case EventType::EXTERNAL_ANALYZER_FAILURE: return "EXTERNAL_ANALYZER_FAILURE";
        case EventType::STORE_FAILURE:             return "STORE_FAILURE";
        case EventType::SESSION_ENDED:             return "SESSION_ENDED";
        default:                                   return "UNKNOWN";
    }
}

} // namespace crisisguard
