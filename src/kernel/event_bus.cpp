#include "kernel/event_bus.hpp"
#include "runtime/agent/types.hpp"
#include <spdlog/spdlog.h>

namespace openfang::kernel {

EventBus::EventBus(size_t max_queued_per_subscriber)
    : max_queued_(max_queued_per_subscriber == 0 ? 1 : max_queued_per_subscriber) {}

void EventBus::emit(EventType type, const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(mutex_);

    Event event;
    event.type = type;
    event.data = data;
    event.timestamp_ms = runtime::now_ms();
    event.sequence = next_sequence_++;

    for (const auto& [subscriber_id, subscriptions] : subscriptions_) {
        if (subscriptions.count(type) == 0) {
            continue;
        }
        auto& queue = queues_[subscriber_id];
        if (queue.size() >= max_queued_) {
            queue.pop_front();
            dropped_[subscriber_id]++;
        }
        queue.push_back(event);
        spdlog::trace("Event {} queued for subscriber {}", event_type_to_string(type), subscriber_id);
    }
}

void EventBus::subscribe(uint32_t subscriber_id, const std::vector<EventType>& types) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& subs = subscriptions_[subscriber_id];
    for (auto type : types) {
        subs.insert(type);
    }
}

void EventBus::unsubscribe(uint32_t subscriber_id, const std::vector<EventType>& types, bool unsubscribe_all) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unsubscribe_all) {
        subscriptions_.erase(subscriber_id);
        queues_.erase(subscriber_id);
        dropped_.erase(subscriber_id);
        return;
    }

    auto it = subscriptions_.find(subscriber_id);
    if (it == subscriptions_.end()) {
        return;
    }

    for (auto type : types) {
        it->second.erase(type);
    }
}

nlohmann::json EventBus::poll(uint32_t subscriber_id, int max_events) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json events_array = nlohmann::json::array();
    auto it = queues_.find(subscriber_id);
    if (it == queues_.end()) {
        return events_array;
    }

    auto& queue = it->second;
    int count = 0;

    while (!queue.empty() && count < max_events) {
        const auto& event = queue.front();

        nlohmann::json event_json;
        event_json["type"] = event_type_to_string(event.type);
        event_json["data"] = event.data;
        event_json["timestamp_ms"] = event.timestamp_ms;
        event_json["sequence"] = event.sequence;

        events_array.push_back(event_json);
        queue.pop_front();
        count++;
    }

    return events_array;
}

uint64_t EventBus::dropped(uint32_t subscriber_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dropped_.find(subscriber_id);
    return it == dropped_.end() ? 0 : it->second;
}

} // namespace openfang::kernel
