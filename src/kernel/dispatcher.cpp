#include "kernel/dispatcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

using openfang::runtime::RunState;

namespace openfang::kernel {

uint32_t calculate_backoff_delay(const RetryPolicy& policy, uint32_t consecutive_failures) {
    if (consecutive_failures == 0) {
        return std::min(policy.backoff_initial_ms, policy.backoff_max_ms);
    }

    double delay = policy.backoff_initial_ms;
    for (uint32_t i = 0; i < consecutive_failures; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= policy.backoff_max_ms) {
            return policy.backoff_max_ms;
        }
    }

    return static_cast<uint32_t>(delay);
}

Dispatcher::Dispatcher(TaskQueue& queue, RunTable& runs, runtime::SandboxProvisioner& provisioner,
                       EventBus& events, RetryPolicy retry, SupervisorOptions supervisor_options)
    : queue_(queue)
    , runs_(runs)
    , provisioner_(provisioner)
    , events_(events)
    , retry_(retry)
    , supervisor_options_(supervisor_options) {}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::start() {
    if (!workers_.empty()) {
        return;
    }
    stopping_ = false;
    size_t worker_count = queue_.max_concurrent();
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    expiry_ = std::thread([this]() { expiry_loop(); });
    spdlog::debug("Dispatcher started with {} workers", worker_count);
}

void Dispatcher::stop() {
    stopping_ = true;
    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    if (expiry_.joinable()) {
        expiry_.join();
    }
}

void Dispatcher::worker_loop() {
    while (!stopping_) {
        auto next = queue_.next_ready(std::chrono::milliseconds(200));
        if (!next) {
            if (queue_.closed()) {
                break;
            }
            continue;
        }
        if (next->expired) {
            expire(next->run);
            continue;
        }

        execute(next->run);
        // The terminal record is committed by now
        queue_.release_slot();
    }
}

void Dispatcher::expiry_loop() {
    while (!stopping_ && !queue_.closed()) {
        if (auto expired = queue_.next_expired(std::chrono::milliseconds(200))) {
            expire(*expired);
        }
    }
}

void Dispatcher::expire(const QueuedRun& queued) {
    auto entry = runs_.find(queued.run_id);
    if (!entry) {
        return;
    }
    ExecutionSupervisor supervisor(provisioner_, runs_, supervisor_options_);
    supervisor.finish_unlaunched(*entry, RunState::CANCELLED, runtime::kTagDeadlineExpired,
        "deadline passed while queued");
}

bool Dispatcher::wait_backoff(const RunEntry& entry, uint32_t delay_ms) const {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    while (std::chrono::steady_clock::now() < until) {
        if (entry.cancel_token->load()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return !entry.cancel_token->load();
}

void Dispatcher::execute(const QueuedRun& queued) {
    auto entry = runs_.find(queued.run_id);
    if (!entry) {
        spdlog::error("Dispatcher: run {} dequeued but unknown", queued.run_id);
        return;
    }

    ExecutionSupervisor supervisor(provisioner_, runs_, supervisor_options_);
    try {
        if (entry->cancel_token->load()) {
            supervisor.finish_unlaunched(*entry, RunState::CANCELLED, "", "cancelled before provisioning");
            return;
        }

        auto provisioning = runs_.transition(entry->id, RunState::PROVISIONING);
        if (!provisioning.applied) {
            spdlog::debug("Dispatcher: run {} skipped: {}", entry->id, provisioning.error);
            return;
        }

        for (uint32_t attempt = 0;; ++attempt) {
            auto counted = runs_.update(entry->id, [&](runtime::Run& r) {
                r.provision_attempts = attempt + 1;
            });
            if (!counted.success) {
                spdlog::warn("Run {}: attempt count not persisted: {}", entry->id, counted.error);
            }

            auto result = supervisor.provision(*entry);
            if (result.success) {
                supervisor.supervise(*entry, std::move(result.lease));
                return;
            }

            if (entry->cancel_token->load()) {
                supervisor.finish_unlaunched(*entry, RunState::CANCELLED, "", "cancelled during provisioning");
                return;
            }

            std::string reason = std::string(runtime::provision_error_to_string(result.error)) +
                                 ": " + result.message;
            if (runtime::is_transient(result.error) && attempt < retry_.max_retries) {
                uint32_t delay = calculate_backoff_delay(retry_, attempt);
                spdlog::warn("Run {}: provisioning failed ({}), retry {}/{} in {}ms",
                    entry->id, reason, attempt + 1, retry_.max_retries, delay);
                events_.emit(EventType::RUN_RETRYING, {
                    {"run_id", entry->id},
                    {"attempt", attempt + 1},
                    {"delay_ms", delay},
                    {"error", runtime::provision_error_to_string(result.error)},
                    {"message", result.message}
                });
                if (!wait_backoff(*entry, delay)) {
                    supervisor.finish_unlaunched(*entry, RunState::CANCELLED, "", "cancelled during provisioning");
                    return;
                }
                continue;
            }

            spdlog::error("Run {}: provisioning failed after {} attempt(s): {}", entry->id, attempt + 1, reason);
            supervisor.finish_unlaunched(*entry, RunState::SANDBOX_ERROR, "", reason);
            return;
        }
    } catch (const std::exception& e) {
        spdlog::error("Run {}: dispatcher fault: {}", entry->id, e.what());
        supervisor.finish_unlaunched(*entry, RunState::SANDBOX_ERROR, "", std::string("dispatcher fault: ") + e.what());
    }
}

} // namespace openfang::kernel
