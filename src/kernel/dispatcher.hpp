#pragma once
#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>
#include "kernel/event_bus.hpp"
#include "kernel/run_table.hpp"
#include "kernel/supervisor.hpp"
#include "kernel/task_queue.hpp"
#include "runtime/sandbox/provisioner.hpp"

namespace openfang::kernel {

// Bounded retry of transient provisioning failures
struct RetryPolicy {
    uint32_t max_retries = 2;
    uint32_t backoff_initial_ms = 200;
    double backoff_multiplier = 2.0;
    uint32_t backoff_max_ms = 5000;
};

// initial * multiplier^failures, capped at backoff_max_ms
uint32_t calculate_backoff_delay(const RetryPolicy& policy, uint32_t consecutive_failures);

/**
 * Worker pool between the TaskQueue and the ExecutionSupervisor.
 *
 * Each worker takes a run together with a concurrency slot, drives it
 * through provisioning (retrying transient ProvisionErrors per the
 * RetryPolicy) and supervision, and returns the slot only after the
 * terminal record is committed. A separate expiry thread cancels queued
 * runs whose deadline passes while every slot is busy.
 */
class Dispatcher {
public:
    Dispatcher(TaskQueue& queue, RunTable& runs, runtime::SandboxProvisioner& provisioner,
               EventBus& events, RetryPolicy retry, SupervisorOptions supervisor_options);
    ~Dispatcher();

    void start();

    // Stop taking new runs and join the workers; in-flight runs are finished first
    void stop();

private:
    TaskQueue& queue_;
    RunTable& runs_;
    runtime::SandboxProvisioner& provisioner_;
    EventBus& events_;
    RetryPolicy retry_;
    SupervisorOptions supervisor_options_;

    std::vector<std::thread> workers_;
    std::thread expiry_;
    std::atomic<bool> stopping_{false};

    void worker_loop();
    void expiry_loop();
    void execute(const QueuedRun& queued);
    void expire(const QueuedRun& queued);

    // Sleep for the backoff; false when cancelled or stopping first
    bool wait_backoff(const RunEntry& entry, uint32_t delay_ms) const;
};

} // namespace openfang::kernel
