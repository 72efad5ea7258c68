#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace openfang::kernel {

// Orchestrator lifecycle events
enum class EventType {
    AGENT_REGISTERED,       // New agent or new version
    AGENT_REMOVED,
    RUN_QUEUED,             // Admitted (or re-admitted after restart)
    RUN_STARTED,            // Workload launched
    RUN_FINISHED,           // Terminal state committed
    RUN_CANCEL_REQUESTED,
    RUN_RECOVERED,          // Reconciled after a restart
    RUN_RETRYING            // Provisioning failed transiently, retry scheduled
};

struct Event {
    EventType type;
    nlohmann::json data;
    int64_t timestamp_ms;
    uint64_t sequence;
};

inline std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::AGENT_REGISTERED:     return "AGENT_REGISTERED";
        case EventType::AGENT_REMOVED:        return "AGENT_REMOVED";
        case EventType::RUN_QUEUED:           return "RUN_QUEUED";
        case EventType::RUN_STARTED:          return "RUN_STARTED";
        case EventType::RUN_FINISHED:         return "RUN_FINISHED";
        case EventType::RUN_CANCEL_REQUESTED: return "RUN_CANCEL_REQUESTED";
        case EventType::RUN_RECOVERED:        return "RUN_RECOVERED";
        case EventType::RUN_RETRYING:         return "RUN_RETRYING";
        default: return "UNKNOWN";
    }
}

inline std::optional<EventType> event_type_from_string(const std::string& str) {
    if (str == "AGENT_REGISTERED")     return EventType::AGENT_REGISTERED;
    if (str == "AGENT_REMOVED")        return EventType::AGENT_REMOVED;
    if (str == "RUN_QUEUED")           return EventType::RUN_QUEUED;
    if (str == "RUN_STARTED")          return EventType::RUN_STARTED;
    if (str == "RUN_FINISHED")         return EventType::RUN_FINISHED;
    if (str == "RUN_CANCEL_REQUESTED") return EventType::RUN_CANCEL_REQUESTED;
    if (str == "RUN_RECOVERED")        return EventType::RUN_RECOVERED;
    if (str == "RUN_RETRYING")         return EventType::RUN_RETRYING;
    return std::nullopt;
}

// Pub/sub with one bounded queue per subscriber; the oldest event is dropped on overflow
class EventBus {
public:
    explicit EventBus(size_t max_queued_per_subscriber = 1024);

    void emit(EventType type, const nlohmann::json& data);
    void subscribe(uint32_t subscriber_id, const std::vector<EventType>& types);
    void unsubscribe(uint32_t subscriber_id, const std::vector<EventType>& types, bool unsubscribe_all);
    nlohmann::json poll(uint32_t subscriber_id, int max_events);

    uint64_t dropped(uint32_t subscriber_id) const;

private:
    size_t max_queued_;
    uint64_t next_sequence_ = 1;
    std::unordered_map<uint32_t, std::set<EventType>> subscriptions_;
    std::unordered_map<uint32_t, std::deque<Event>> queues_;
    std::unordered_map<uint32_t, uint64_t> dropped_;
    mutable std::mutex mutex_;
};

} // namespace openfang::kernel
