#include "kernel/task_queue.hpp"
#include <algorithm>

namespace openfang::kernel {

TaskQueue::TaskQueue(size_t capacity, size_t max_concurrent)
    : capacity_(capacity)
    , max_concurrent_(max_concurrent == 0 ? 1 : max_concurrent) {}

PushResult TaskQueue::push(const QueuedRun& run, bool force) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return PushResult::CLOSED;
        }
        if (index_.count(run.run_id)) {
            return PushResult::DUPLICATE;
        }
        if (!force && pending_.size() >= capacity_) {
            return PushResult::FULL;
        }
        auto [it, inserted] = pending_.insert(run);
        (void)inserted;
        index_[run.run_id] = it;
    }
    cv_.notify_all();
    return PushResult::ADMITTED;
}

bool TaskQueue::remove(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(run_id);
    if (it == index_.end()) {
        return false;
    }
    pending_.erase(it->second);
    index_.erase(it);
    return true;
}

std::optional<QueuedRun> TaskQueue::take_expired_locked(std::chrono::steady_clock::time_point now) {
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->deadline && *it->deadline <= now) {
            QueuedRun run = *it;
            index_.erase(run.run_id);
            pending_.erase(it);
            return run;
        }
    }
    return std::nullopt;
}

std::optional<std::chrono::steady_clock::time_point> TaskQueue::earliest_deadline_locked() const {
    std::optional<std::chrono::steady_clock::time_point> earliest;
    for (const auto& run : pending_) {
        if (run.deadline && (!earliest || *run.deadline < *earliest)) {
            earliest = run.deadline;
        }
    }
    return earliest;
}

std::optional<Dequeued> TaskQueue::next_ready(std::chrono::milliseconds wait) {
    auto until = std::chrono::steady_clock::now() + wait;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!closed_) {
        auto now = std::chrono::steady_clock::now();
        if (auto expired = take_expired_locked(now)) {
            return Dequeued{*expired, true};
        }

        if (!pending_.empty() && active_ < max_concurrent_) {
            QueuedRun run = *pending_.begin();
            index_.erase(run.run_id);
            pending_.erase(pending_.begin());
            ++active_;
            peak_active_ = std::max(peak_active_, active_);
            return Dequeued{run, false};
        }

        if (now >= until) {
            break;
        }
        auto wake = until;
        if (auto deadline = earliest_deadline_locked(); deadline && *deadline < wake) {
            wake = *deadline;
        }
        cv_.wait_until(lock, wake);
    }
    return std::nullopt;
}

std::optional<QueuedRun> TaskQueue::next_expired(std::chrono::milliseconds wait) {
    auto until = std::chrono::steady_clock::now() + wait;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!closed_) {
        auto now = std::chrono::steady_clock::now();
        if (auto expired = take_expired_locked(now)) {
            return expired;
        }
        if (now >= until) {
            break;
        }
        auto wake = until;
        if (auto deadline = earliest_deadline_locked(); deadline && *deadline < wake) {
            wake = *deadline;
        }
        cv_.wait_until(lock, wake);
    }
    return std::nullopt;
}

void TaskQueue::release_slot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) {
            --active_;
        }
    }
    cv_.notify_all();
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool TaskQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t TaskQueue::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t TaskQueue::peak_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_active_;
}

bool TaskQueue::contains(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(run_id) > 0;
}

std::vector<std::string> TaskQueue::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(pending_.size());
    for (const auto& run : pending_) {
        ids.push_back(run.run_id);
    }
    return ids;
}

} // namespace openfang::kernel
