/**
 * openfang Sandbox Provisioner
 *
 * Creates and tears down one Sandbox per run through the configured
 * SandboxDriver. Failures are reported immediately as ProvisionError;
 * retrying is the dispatcher's decision.
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "runtime/adapters/adapters.hpp"
#include "runtime/sandbox/drivers.hpp"
#include "runtime/sandbox/sandbox.hpp"

namespace openfang::runtime {

enum class ProvisionError {
    NONE,
    RESOURCE_EXHAUSTED,
    RUNTIME_UNAVAILABLE,
    SETUP_FAILED
};

const char* provision_error_to_string(ProvisionError error);

// Errors worth another attempt after a backoff
bool is_transient(ProvisionError error);

struct ProvisionerConfig {
    std::string sandboxes_dir;                  // One subdirectory per live sandbox
    std::string driver = "process";             // "process" or "container"
    bool enable_isolation = true;               // Namespaces and cgroups when available
    size_t max_sandboxes = 64;
    Toolchains toolchains;
    std::string container_cli = "docker";
    std::map<std::string, std::string> container_images;
    std::vector<std::string> hidden_dirs;       // Masked from workloads (state, sibling sandboxes)
    std::string cgroup_root;                    // Delegated cgroup v2 dir; empty = autodetect
};

struct ProvisionResult {
    bool success = false;
    ProvisionError error = ProvisionError::NONE;
    std::string message;
    std::shared_ptr<Sandbox> sandbox;
};

struct LaunchResult {
    bool success = false;
    ProvisionError error = ProvisionError::NONE;
    std::string message;
};

class SandboxProvisioner {
public:
    explicit SandboxProvisioner(ProvisionerConfig config);
    ~SandboxProvisioner();

    SandboxProvisioner(const SandboxProvisioner&) = delete;
    SandboxProvisioner& operator=(const SandboxProvisioner&) = delete;

    // Create directories, probe cgroup delegation and namespace privilege
    bool init(std::string* error);

    // Allocate a ready (not yet started) sandbox for one run of def
    ProvisionResult provision(const std::string& run_id, const AgentDefinition& def);

    // Adapter invocation for def, wrapped for the driver
    InvocationSpec prepare_invocation(const Sandbox& sandbox, const std::string& run_id,
                                      const AgentDefinition& def, const std::string& payload) const;

    // Start the workload; the sandbox stays owned by the caller on failure
    LaunchResult launch(Sandbox& sandbox, const InvocationSpec& spec);

    // Destroy a sandbox. Idempotent; returns true only for the call that released it.
    bool release(const std::shared_ptr<Sandbox>& sandbox);

    // Tear down a sandbox known only from a durable record (crash recovery)
    void force_release(const SandboxRef& ref);

    // Remove sandbox processes, directories and cgroups no live sandbox owns
    size_t sweep_orphans();

    // Release every live sandbox (shutdown)
    void cleanup_all();

    size_t live_count() const;
    uint64_t released_count() const;
    const SandboxDriver& driver() const { return *driver_; }

private:
    ProvisionerConfig config_;
    std::unique_ptr<SandboxDriver> driver_;
    std::string cgroup_parent_;
    bool namespaces_available_ = false;

    std::unordered_map<std::string, std::shared_ptr<Sandbox>> live_;
    uint64_t released_ = 0;
    mutable std::mutex mutex_;

    std::string probe_cgroup_parent() const;
    bool owns_root(const std::string& root_dir) const;
};

std::unique_ptr<SandboxDriver> make_driver(const ProvisionerConfig& config, bool namespaces);

} // namespace openfang::runtime
