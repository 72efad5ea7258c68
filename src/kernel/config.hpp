#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/adapters/adapters.hpp"
#include "runtime/agent/types.hpp"

namespace openfang::kernel {

// Orchestrator configuration
struct OrchestratorConfig {
    std::string home = "/data";                         // Persistent volume
    std::string agents_dir = "/opt/openfang/agents";    // Bundles registered at startup
    uint16_t port = 4200;                               // Listener port (API layer)

    // Admission and dispatch
    size_t max_concurrent_runs = 4;                     // Provisioning + running ceiling
    size_t queue_capacity = 256;                        // Queued runs before QUEUE_FULL
    uint64_t grace_period_ms = 3000;                    // SIGTERM -> SIGKILL

    // Provision retry policy
    uint32_t provision_retries = 2;
    uint32_t retry_backoff_ms = 200;
    double retry_backoff_multiplier = 2.0;
    uint32_t retry_backoff_max_ms = 5000;

    // Sandboxes
    size_t max_sandboxes = 64;
    runtime::ResourceLimits default_limits;
    std::string sandbox_driver = "process";             // "process" or "container"
    std::string container_cli = "docker";
    std::map<std::string, std::string> container_images;
    runtime::Toolchains toolchains;
    bool enable_isolation = true;
    std::string cgroup_root;                            // Delegated cgroup v2 dir; empty = autodetect

    std::string log_level = "info";

    std::string state_dir() const;
    std::string sandboxes_dir() const;
    std::string logs_dir() const;
    std::string lock_path() const;
    std::string config_file() const;

    nlohmann::json to_json() const;

    // Overlay values from a config file object; problems are appended to warnings
    void apply_json(const nlohmann::json& j, std::vector<std::string>* warnings);

    // Overlay OPENFANG_* environment variables
    void apply_env();

    // Defaults < <home>/config.json < environment
    static OrchestratorConfig load();
};

} // namespace openfang::kernel
