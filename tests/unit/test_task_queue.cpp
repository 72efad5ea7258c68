#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "kernel/task_queue.hpp"

namespace {

using openfang::kernel::PushResult;
using openfang::kernel::QueuedRun;
using openfang::kernel::TaskQueue;
using namespace std::chrono_literals;

QueuedRun queued(const std::string& id, int32_t priority, uint64_t sequence) {
    return QueuedRun{id, priority, sequence, std::nullopt};
}

TEST(TaskQueueTest, OrdersByPriorityThenSubmission) {
    TaskQueue queue(16, 4);
    queue.push(queued("a", 0, 1));
    queue.push(queued("b", 5, 2));
    queue.push(queued("c", 0, 3));
    queue.push(queued("d", 5, 4));
    queue.push(queued("e", -1, 5));

    EXPECT_EQ(queue.snapshot(), (std::vector<std::string>{"b", "d", "a", "c", "e"}));

    auto next = queue.next_ready(0ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->run.run_id, "b");
    EXPECT_FALSE(next->expired);
}

TEST(TaskQueueTest, RejectsBeyondCapacityUnlessForced) {
    TaskQueue queue(2, 1);
    EXPECT_EQ(queue.push(queued("a", 0, 1)), PushResult::ADMITTED);
    EXPECT_EQ(queue.push(queued("b", 0, 2)), PushResult::ADMITTED);
    EXPECT_EQ(queue.push(queued("c", 0, 3)), PushResult::FULL);
    EXPECT_EQ(queue.push(queued("a", 0, 4)), PushResult::DUPLICATE);
    EXPECT_EQ(queue.push(queued("c", 0, 3), true), PushResult::ADMITTED);
    EXPECT_EQ(queue.size(), 3u);
}

TEST(TaskQueueTest, CeilingHoldsRunsUntilSlotReleased) {
    TaskQueue queue(16, 1);
    queue.push(queued("a", 0, 1));
    queue.push(queued("b", 0, 2));

    auto first = queue.next_ready(0ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->run.run_id, "a");
    EXPECT_EQ(queue.active(), 1u);

    EXPECT_FALSE(queue.next_ready(50ms).has_value());
    EXPECT_TRUE(queue.contains("b"));

    queue.release_slot();
    auto second = queue.next_ready(0ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->run.run_id, "b");
    EXPECT_EQ(queue.peak_active(), 1u);
}

TEST(TaskQueueTest, ReleasedSlotWakesWaitingWorker) {
    TaskQueue queue(16, 1);
    queue.push(queued("a", 0, 1));
    queue.push(queued("b", 0, 2));
    ASSERT_TRUE(queue.next_ready(0ms).has_value());

    std::thread releaser([&]() {
        std::this_thread::sleep_for(50ms);
        queue.release_slot();
    });
    auto next = queue.next_ready(5000ms);
    releaser.join();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->run.run_id, "b");
}

TEST(TaskQueueTest, ExpiredRunIsHandedOutWithoutSlot) {
    TaskQueue queue(16, 1);
    queue.push(queued("running", 0, 1));
    ASSERT_TRUE(queue.next_ready(0ms).has_value());

    QueuedRun late = queued("late", 0, 2);
    late.deadline = std::chrono::steady_clock::now() + 30ms;
    queue.push(late);

    auto next = queue.next_ready(2000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->run.run_id, "late");
    EXPECT_TRUE(next->expired);
    EXPECT_EQ(queue.active(), 1u);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(TaskQueueTest, ExpiryWaitsOnDeadlinesWhileSlotsAreBusy) {
    TaskQueue queue(16, 1);
    queue.push(queued("running", 0, 1));
    ASSERT_TRUE(queue.next_ready(0ms).has_value());
    queue.push(queued("waiting", 0, 2));

    QueuedRun late = queued("late", 0, 3);
    late.deadline = std::chrono::steady_clock::now() + 50ms;
    queue.push(late);

    auto start = std::chrono::steady_clock::now();
    auto expired = queue.next_expired(5000ms);
    ASSERT_TRUE(expired.has_value());
    EXPECT_EQ(expired->run_id, "late");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);
    EXPECT_EQ(queue.active(), 1u);
    EXPECT_EQ(queue.snapshot(), std::vector<std::string>{"waiting"});

    EXPECT_FALSE(queue.next_expired(20ms).has_value());
    queue.shutdown();
    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.next_expired(5000ms).has_value());
}

TEST(TaskQueueTest, RemoveTakesRunOutOfQueue) {
    TaskQueue queue(16, 1);
    queue.push(queued("a", 0, 1));
    EXPECT_TRUE(queue.remove("a"));
    EXPECT_FALSE(queue.remove("a"));
    EXPECT_FALSE(queue.contains("a"));
    EXPECT_FALSE(queue.next_ready(0ms).has_value());
}

TEST(TaskQueueTest, ShutdownWakesWaitersAndClosesAdmission) {
    TaskQueue queue(16, 1);
    std::thread stopper([&]() {
        std::this_thread::sleep_for(50ms);
        queue.shutdown();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.next_ready(5000ms).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4000ms);
    stopper.join();

    EXPECT_EQ(queue.push(queued("a", 0, 1)), PushResult::CLOSED);
}

TEST(TaskQueueTest, ConcurrentWorkersNeverExceedCeiling) {
    constexpr size_t kCeiling = 3;
    constexpr int kRuns = 30;
    TaskQueue queue(100, kCeiling);
    for (int i = 0; i < kRuns; ++i) {
        queue.push(queued("run-" + std::to_string(i), i % 3, static_cast<uint64_t>(i)));
    }

    std::atomic<int> processed{0};
    std::atomic<int> running{0};
    std::atomic<int> max_running{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 8; ++w) {
        workers.emplace_back([&]() {
            while (processed.load() < kRuns) {
                auto next = queue.next_ready(20ms);
                if (!next) continue;
                int now = ++running;
                int seen = max_running.load();
                while (now > seen && !max_running.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(2ms);
                --running;
                ++processed;
                queue.release_slot();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(processed.load(), kRuns);
    EXPECT_LE(max_running.load(), static_cast<int>(kCeiling));
    EXPECT_LE(queue.peak_active(), kCeiling);
    EXPECT_EQ(queue.active(), 0u);
}

} // namespace
