/**
 * openfang Sandbox
 *
 * One isolated execution environment for exactly one run: a private root
 * directory with a writable scratch area, a process group for the launched
 * workload, cgroup v2 limits (memory, CPU weight, PIDs) where the host
 * delegates a writable cgroup, rlimits otherwise, and mount/network
 * namespaces when running privileged.
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "runtime/adapters/adapters.hpp"
#include "runtime/agent/types.hpp"

namespace openfang::runtime {

// Environment marker identifying a sandbox's processes after a restart.
// The value is the sandbox root dir, unique per host and data home.
inline constexpr const char* kSandboxMarkerEnv = "OPENFANG_SANDBOX";

// Sandbox configuration
struct SandboxConfig {
    std::string name;                       // Unique sandbox name
    std::string driver = "process";
    std::string root_dir;                   // Private root; scratch lives in root_dir/scratch
    std::string bundle_dir;                 // Host path, exposed read-only
    std::vector<std::string> hidden_dirs;   // Host paths masked inside the sandbox
    ResourceLimits limits;
    AccessPolicy access;

    bool enable_namespaces = false;         // Mount (+ network) namespaces
    std::string cgroup_parent;              // Empty disables cgroup limits
    std::string container_name;             // Set by the container driver
};

// Sandbox state
enum class SandboxState {
    CREATED,
    READY,
    RUNNING,
    EXITED,
    DESTROYED,
    FAILED
};

const char* sandbox_state_to_string(SandboxState state);

// Isolation status - tracks what isolation features are actually active
struct IsolationStatus {
    bool mnt_namespace = false;
    bool net_namespace = false;
    bool cgroup_limits = false;
    bool address_space_rlimit = false;

    bool fully_isolated = false;
    std::string degraded_reason;

    bool is_degraded() const { return !fully_isolated && !degraded_reason.empty(); }
};

// Workload exit as observed by the parent
struct ExitStatus {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    ResourceUsage usage;

    bool success() const { return exit_code && *exit_code == 0; }
};

// Why a launch failed, mirrored from the child's pre-exec stage
struct StartError {
    std::string stage;
    int err = 0;
    std::string message;
};

class Sandbox {
public:
    explicit Sandbox(const SandboxConfig& config);
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Lifecycle
    bool create(std::string* error);
    bool start(const InvocationSpec& spec, StartError* error);
    void destroy();

    // Signal the whole process group; false once the group is gone
    bool signal_group(int signum);

    // Non-blocking reap; nullopt while the workload is alive
    std::optional<ExitStatus> try_wait();

    // Read end of the combined stdout/stderr pipe (non-blocking), -1 before start
    int output_fd() const { return output_fd_; }
    void close_output();

    // Status
    SandboxState state() const;
    bool destroyed() const;
    pid_t pid() const { return child_pid_; }
    const std::string& name() const { return config_.name; }
    const SandboxConfig& config() const { return config_; }
    std::string scratch_dir() const;
    std::string cgroup_path() const { return cgroup_path_; }
    const std::string& marker() const { return config_.root_dir; }
    const IsolationStatus& isolation_status() const { return isolation_status_; }

    // Durable reference for crash recovery
    SandboxRef to_ref() const;

private:
    SandboxConfig config_;
    SandboxState state_ = SandboxState::CREATED;
    pid_t child_pid_ = -1;
    bool reaped_ = false;
    int output_fd_ = -1;
    std::string cgroup_path_;
    IsolationStatus isolation_status_;
    mutable std::mutex mutex_;

    bool setup_cgroup(std::string* error);
    void cleanup_cgroup();
    void set_state(SandboxState new_state);
};

struct MarkedProcess {
    pid_t pid;
    pid_t pgrp;
    std::string marker;
};

// Live processes carrying a sandbox marker (scans /proc)
std::vector<MarkedProcess> find_marked_processes();

// Kill a recorded process group if its members still carry the sandbox marker.
// Returns true when a live group was found and killed.
bool kill_marked_group(pid_t pgid, const std::string& marker);

// Kill everything in a cgroup and remove it; missing cgroups are ignored
void remove_cgroup(const std::string& cgroup_path);

} // namespace openfang::runtime
