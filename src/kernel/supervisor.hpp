/**
 * openfang Execution Supervisor
 *
 * Owns one run's sandbox from provisioning to release. The observe loop
 * reads output, reaps the process and checks the monotonic deadline and the
 * cancel token on every pass, so a hung workload can never hold the
 * supervisor past its deadline plus the termination grace period.
 */
#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "kernel/run_table.hpp"
#include "runtime/sandbox/provisioner.hpp"

namespace openfang::kernel {

// Scoped ownership of a provisioned sandbox. release() is the normal path;
// the destructor only covers exits that skipped it.
class SandboxLease {
public:
    SandboxLease() = default;
    SandboxLease(runtime::SandboxProvisioner* provisioner, std::shared_ptr<runtime::Sandbox> sandbox);
    ~SandboxLease();

    SandboxLease(SandboxLease&& other) noexcept;
    SandboxLease& operator=(SandboxLease&& other) noexcept;
    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    bool release();

    runtime::Sandbox* get() const { return sandbox_.get(); }
    runtime::Sandbox* operator->() const { return sandbox_.get(); }
    explicit operator bool() const { return sandbox_ != nullptr; }

private:
    runtime::SandboxProvisioner* provisioner_ = nullptr;
    std::shared_ptr<runtime::Sandbox> sandbox_;
};

struct SupervisorOptions {
    std::chrono::milliseconds grace_period{3000};
    std::chrono::milliseconds poll_interval{20};
};

struct ProvisionAttempt {
    bool success = false;
    runtime::ProvisionError error = runtime::ProvisionError::NONE;
    std::string message;
    SandboxLease lease;
};

// Why the observe loop stopped the workload
enum class StopReason {
    NONE,
    EXITED,
    TIMEOUT,
    CANCELLED,
    OUTPUT_OVERFLOW,
    FAULT
};

const char* stop_reason_to_string(StopReason reason);

class ExecutionSupervisor {
public:
    ExecutionSupervisor(runtime::SandboxProvisioner& provisioner, RunTable& runs, SupervisorOptions options);

    // One provisioning attempt: sandbox, invocation, launch. On success the run is RUNNING.
    ProvisionAttempt provision(RunEntry& entry);

    // Observe a launched run to its terminal state, release the sandbox, commit the record
    runtime::RunState supervise(RunEntry& entry, SandboxLease lease);

    // Terminal state for a run that never launched a process
    runtime::RunState finish_unlaunched(RunEntry& entry, runtime::RunState state,
                                        const std::string& tag, const std::string& message);

private:
    runtime::SandboxProvisioner& provisioner_;
    RunTable& runs_;
    SupervisorOptions options_;

    // Agent timeout, capped at kMaxDurationMs
    static std::chrono::milliseconds timeout_limit(const runtime::Run& run);

    // Effective wall-clock limit: min(timeout, time left until the request deadline)
    std::chrono::milliseconds effective_limit(const runtime::Run& run) const;

    // Read whatever the pipe holds; false on EOF or error
    bool drain_output(runtime::Sandbox& sandbox, runtime::OutputBuffer& output, bool* overflow);

    // SIGTERM, wait out the grace period while draining output, then SIGKILL
    runtime::ExitStatus terminate(runtime::Sandbox& sandbox, runtime::OutputBuffer& output);
};

} // namespace openfang::kernel
