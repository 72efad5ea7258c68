#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace openfang::kernel {

struct QueuedRun {
    std::string run_id;
    int32_t priority = 0;
    uint64_t sequence = 0;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct Dequeued {
    QueuedRun run;
    bool expired = false;       // Deadline passed while queued; no slot was taken
};

enum class PushResult {
    ADMITTED,
    FULL,
    DUPLICATE,
    CLOSED
};

/**
 * Pending runs and the concurrency ceiling.
 *
 * Order: higher priority first, then lower sequence (submission order).
 * next_ready() hands out a run only together with a free slot, under one
 * lock, so the number of provisioning + running runs never exceeds
 * max_concurrent.
 */
class TaskQueue {
public:
    TaskQueue(size_t capacity, size_t max_concurrent);

    // force admits beyond capacity (re-admission of recovered runs)
    PushResult push(const QueuedRun& run, bool force = false);

    // Remove a queued run; false if it was never queued or already dequeued
    bool remove(const std::string& run_id);

    // Wait up to `wait` for a run whose deadline expired or a run plus a free slot
    std::optional<Dequeued> next_ready(std::chrono::milliseconds wait);

    // Wait up to `wait` for a run whose deadline expired; never takes a slot
    std::optional<QueuedRun> next_expired(std::chrono::milliseconds wait);

    // Return the slot taken by next_ready
    void release_slot();

    // Stop handing out runs and wake all waiters
    void shutdown();

    bool closed() const;
    size_t size() const;
    size_t active() const;
    size_t peak_active() const;
    size_t capacity() const { return capacity_; }
    size_t max_concurrent() const { return max_concurrent_; }
    bool contains(const std::string& run_id) const;

    // Queued run ids in dequeue order
    std::vector<std::string> snapshot() const;

private:
    struct Order {
        bool operator()(const QueuedRun& a, const QueuedRun& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.sequence < b.sequence;
        }
    };

    const size_t capacity_;
    const size_t max_concurrent_;

    std::set<QueuedRun, Order> pending_;
    std::unordered_map<std::string, std::set<QueuedRun, Order>::iterator> index_;
    size_t active_ = 0;
    size_t peak_active_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::optional<QueuedRun> take_expired_locked(std::chrono::steady_clock::time_point now);
    std::optional<std::chrono::steady_clock::time_point> earliest_deadline_locked() const;
};

} // namespace openfang::kernel
