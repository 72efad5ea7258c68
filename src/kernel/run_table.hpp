#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/event_bus.hpp"
#include "kernel/state_store.hpp"
#include "runtime/agent/types.hpp"
#include "runtime/sandbox/output_buffer.hpp"

namespace openfang::kernel {

// In-memory handle of one run; `run` is guarded by `mutex`
struct RunEntry {
    std::string id;
    std::string agent_id;
    std::shared_ptr<runtime::OutputBuffer> output;
    std::shared_ptr<std::atomic<bool>> cancel_token;

    mutable std::mutex mutex;
    runtime::Run run;
};

struct TransitionResult {
    bool applied = false;           // False when the move is not allowed from the current state
    bool persisted = false;
    runtime::RunState previous = runtime::RunState::QUEUED;
    std::string error;
};

struct CancelResult {
    bool found = false;
    bool first_request = false;     // Only the first request has an effect
    runtime::RunState state = runtime::RunState::QUEUED;
};

/**
 * Live runs and their durable records.
 *
 * Every state change goes through transition(), which enforces the run
 * state machine and commits the record to the StateStore under the run's
 * own lock. Terminal entries are kept for streaming and evicted oldest
 * first once more than `retain_finished` accumulate.
 */
class RunTable {
public:
    RunTable(StateStore& store, EventBus& events, size_t retain_finished = 1024);

    StoreResult insert(const runtime::Run& run);
    std::shared_ptr<RunEntry> find(const std::string& run_id) const;

    TransitionResult transition(const std::string& run_id, runtime::RunState to,
                                const std::function<void(runtime::Run&)>& mutate = {});

    // Persisted change that keeps the current state (sandbox ref, attempt counters)
    StoreResult update(const std::string& run_id, const std::function<void(runtime::Run&)>& mutate);

    CancelResult request_cancel(const std::string& run_id);

    // Live copy, falling back to the durable record
    std::optional<runtime::Run> snapshot(const std::string& run_id) const;

    // Non-terminal runs pinned to an agent
    size_t active_for_agent(const std::string& agent_id) const;

    // Newest first
    std::vector<runtime::Run> list(size_t limit) const;

    std::vector<std::shared_ptr<RunEntry>> entries() const;

private:
    StateStore& store_;
    EventBus& events_;
    size_t retain_finished_;

    std::unordered_map<std::string, std::shared_ptr<RunEntry>> entries_;
    mutable std::mutex mutex_;

    void evict_finished();
};

} // namespace openfang::kernel
