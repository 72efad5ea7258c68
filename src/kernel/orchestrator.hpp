/**
 * openfang Orchestrator
 *
 * Facade over all subsystems:
 * - StateStore (durable agents and runs)
 * - TaskQueue + Dispatcher (admission, ceiling, workers)
 * - ExecutionSupervisor (one per in-flight run, driven by the dispatcher)
 * - SandboxProvisioner (process or container sandboxes)
 * - EventBus (lifecycle feed)
 *
 * The network layer talks only to this class.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "kernel/dispatcher.hpp"
#include "kernel/errors.hpp"
#include "kernel/event_bus.hpp"
#include "kernel/run_table.hpp"
#include "kernel/state_store.hpp"
#include "kernel/task_queue.hpp"
#include "runtime/agent/types.hpp"
#include "runtime/sandbox/provisioner.hpp"

namespace openfang::kernel {

struct RegisterResult {
    bool success = false;
    OrchestratorError error = OrchestratorError::NONE;
    std::string message;
    uint32_t version = 0;
    bool changed = false;           // False when an identical definition was already registered
};

struct RemoveResult {
    bool success = false;
    OrchestratorError error = OrchestratorError::NONE;
    std::string message;
};

struct SubmitResult {
    bool success = false;
    OrchestratorError error = OrchestratorError::NONE;
    std::string message;
    std::string run_id;
};

struct StatusResult {
    bool success = false;
    OrchestratorError error = OrchestratorError::NONE;
    std::string message;
    runtime::Run run;
};

struct CancelRunResult {
    bool success = false;
    OrchestratorError error = OrchestratorError::NONE;
    std::string message;
    bool effective = false;         // This call was the one that requested cancellation
    runtime::RunState state = runtime::RunState::QUEUED;
};

struct StreamResult {
    bool success = false;
    OrchestratorError error = OrchestratorError::NONE;
    std::string message;
    std::string data;
    size_t next_offset = 0;
    bool terminal = false;
    bool truncated = false;
};

// What init() found from the previous process lifetime
struct RecoveryReport {
    size_t reconciled = 0;          // PROVISIONING/RUNNING -> SANDBOX_ERROR
    size_t readmitted = 0;          // QUEUED runs put back on the queue
    size_t orphans_swept = 0;
};

class Orchestrator {
public:
    using Config = OrchestratorConfig;

    explicit Orchestrator(Config config);
    ~Orchestrator();

    // Non-copyable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Lock the home dir, recover state, register bundles and start the workers
    bool init(std::string* error = nullptr);

    // Cancel in-flight runs, stop workers, release every sandbox and the lock.
    // Queued runs stay QUEUED on disk for the next start.
    void shutdown();

    bool is_running() const { return running_.load(); }
    const Config& get_config() const { return config_; }
    const RecoveryReport& recovery() const { return recovery_; }

    // Agents
    RegisterResult register_agent(runtime::AgentDefinition def);
    RegisterResult register_bundle(const std::string& bundle_dir);
    RemoveResult remove_agent(const std::string& agent_id);
    std::optional<runtime::AgentDefinition> get_agent(const std::string& agent_id) const;
    std::vector<runtime::AgentDefinition> list_agents() const;

    // Runs
    SubmitResult submit_run(const runtime::RunRequest& request);
    StatusResult get_run_status(const std::string& run_id) const;
    CancelRunResult cancel_run(const std::string& run_id);
    StreamResult stream_output(const std::string& run_id, size_t offset, std::chrono::milliseconds wait) const;
    std::vector<runtime::Run> list_runs(size_t limit) const;

    // Block until the run is terminal or `timeout` passes
    StatusResult wait_for_run(const std::string& run_id, std::chrono::milliseconds timeout) const;

    // Event feed
    void subscribe(uint32_t subscriber_id, const std::vector<EventType>& types);
    void unsubscribe(uint32_t subscriber_id);
    nlohmann::json poll_events(uint32_t subscriber_id, int max_events);

    // Introspection
    size_t queued_runs() const;
    size_t active_runs() const;
    size_t peak_active_runs() const;
    const runtime::SandboxProvisioner& provisioner() const { return *provisioner_; }

private:
    Config config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};
    int lock_fd_ = -1;
    RecoveryReport recovery_;

    // Subsystems (order matters for teardown)
    std::unique_ptr<StateStore> store_;
    std::unique_ptr<EventBus> events_;
    std::unique_ptr<RunTable> runs_;
    std::unique_ptr<TaskQueue> queue_;
    std::unique_ptr<runtime::SandboxProvisioner> provisioner_;
    std::unique_ptr<Dispatcher> dispatcher_;

    // Registry of latest agent versions; also serializes admission against removal
    std::unordered_map<std::string, runtime::AgentDefinition> agents_;
    mutable std::mutex agents_mutex_;
    uint64_t next_sequence_ = 1;

    bool acquire_lock(std::string* error);
    void release_lock();

    void load_agents();
    void reconcile_unfinished();
    void readmit_queued();
    void register_bundles();

    static std::optional<std::chrono::steady_clock::time_point> queue_deadline(const runtime::Run& run);
};

} // namespace openfang::kernel
