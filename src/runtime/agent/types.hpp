#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace openfang::runtime {

// Language runtime an agent is written for
enum class RuntimeKind {
    JAVA,
    NODE,
    GO,
    PYTHON,
    NATIVE
};

const char* runtime_kind_to_string(RuntimeKind kind);
std::optional<RuntimeKind> runtime_kind_from_string(const std::string& str);

// Upper bounds accepted for timeouts, deadlines and memory limits
inline constexpr uint64_t kMaxDurationMs = 30ull * 24 * 60 * 60 * 1000;
inline constexpr uint64_t kMaxMemoryBytes = 1ull << 40;

// Resource limits applied to every sandbox of an agent
struct ResourceLimits {
    uint64_t cpu_shares = 1024;                        // Relative CPU weight
    uint64_t memory_limit_bytes = 512ull * 1024 * 1024;
    uint64_t timeout_ms = 60000;                       // Wall-clock limit
    uint64_t max_output_bytes = 1024 * 1024;           // Captured output cap
    uint64_t max_pids = 128;                           // Max processes

    nlohmann::json to_json() const;

    // Fields missing from j keep their defaults; negative or non-integer values are rejected
    static std::optional<ResourceLimits> from_json(const nlohmann::json& j, const ResourceLimits& defaults,
                                                   std::string* error = nullptr);
};

// Declared network/filesystem access. The bundle is always mounted read-only.
struct AccessPolicy {
    bool allow_network = false;

    nlohmann::json to_json() const;
};

struct AgentDefinition {
    std::string id;
    uint32_t version = 1;
    RuntimeKind runtime = RuntimeKind::NATIVE;
    std::string entry_point;                   // Relative to bundle_path
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string bundle_path;
    std::string description;
    ResourceLimits limits;
    AccessPolicy access;
    int64_t registered_at_ms = 0;

    // Equality of everything that affects execution (ignores version and timestamps)
    bool same_definition(const AgentDefinition& other) const;

    // Id charset, entry point inside the bundle, non-zero and bounded limits
    bool validate(std::string* error) const;

    nlohmann::json to_json() const;
    static std::optional<AgentDefinition> from_json(const nlohmann::json& j,
                                                    const ResourceLimits& default_limits,
                                                    std::string* error = nullptr);
};

struct RunRequest {
    std::string agent_id;
    std::string payload;
    int32_t priority = 0;                      // Higher dequeues first
    std::optional<uint64_t> deadline_ms;       // Relative to submission

    nlohmann::json to_json() const;
    static RunRequest from_json(const nlohmann::json& j);
};

// Run lifecycle. Terminal states are final.
enum class RunState {
    QUEUED,
    PROVISIONING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    TIMED_OUT,
    CANCELLED,
    SANDBOX_ERROR
};

const char* run_state_to_string(RunState state);
std::optional<RunState> run_state_from_string(const std::string& str);
bool is_terminal(RunState state);
bool is_valid_transition(RunState from, RunState to);

struct ResourceUsage {
    uint64_t user_cpu_ms = 0;
    uint64_t system_cpu_ms = 0;
    uint64_t max_rss_bytes = 0;
    uint64_t wall_ms = 0;

    nlohmann::json to_json() const;
    static ResourceUsage from_json(const nlohmann::json& j);
};

// Durable description of a live sandbox, enough to tear it down after a crash
struct SandboxRef {
    std::string name;
    std::string driver;                        // "process" or "container"
    pid_t pgid = -1;
    std::string root_dir;
    std::string cgroup_path;
    std::string container_name;

    bool empty() const { return name.empty(); }

    nlohmann::json to_json() const;
    static SandboxRef from_json(const nlohmann::json& j);
};

// Failure tags attached to terminal runs
inline constexpr const char* kTagOutputOverflow = "output-overflow";
inline constexpr const char* kTagDeadlineExpired = "deadline-expired";
inline constexpr const char* kTagRecovered = "recovered-after-restart";

struct Run {
    std::string id;
    uint64_t sequence = 0;                     // Admission order
    RunRequest request;
    AgentDefinition agent;                     // Definition pinned at submission
    RunState state = RunState::QUEUED;
    SandboxRef sandbox;

    int64_t submitted_at_ms = 0;
    int64_t started_at_ms = 0;
    int64_t finished_at_ms = 0;

    std::string output;
    bool output_truncated = false;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::string failure_tag;
    std::string error_message;
    ResourceUsage usage;
    uint32_t provision_attempts = 0;

    // Epoch ms at which the request deadline passes, the relative part capped at kMaxDurationMs
    std::optional<int64_t> deadline_at_ms() const;

    nlohmann::json to_json() const;
    nlohmann::json summary_json() const;
    static std::optional<Run> from_json(const nlohmann::json& j, std::string* error = nullptr);
};

// Milliseconds since the Unix epoch
int64_t now_ms();

} // namespace openfang::runtime
