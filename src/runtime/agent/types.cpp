#include "runtime/agent/types.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>

using json = nlohmann::json;

namespace openfang::runtime {

namespace {

bool valid_agent_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (!ok) return false;
    }
    return id != "." && id != "..";
}

// Entry points must stay inside the bundle
bool valid_entry_point(const std::string& entry) {
    if (entry.empty()) return false;
    std::filesystem::path p(entry);
    if (p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

void set_error(std::string* error, const std::string& message) {
    if (error) *error = message;
}

// Optional non-negative integer field of a limits object
bool read_limit(const json& j, const char* key, uint64_t& out, std::string* error) {
    auto it = j.find(key);
    if (it == j.end()) {
        return true;
    }
    if (it->is_number_unsigned()) {
        out = it->get<uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        out = static_cast<uint64_t>(it->get<int64_t>());
        return true;
    }
    set_error(error, std::string("limits.") + key + " must be a non-negative integer");
    return false;
}

} // namespace

const char* runtime_kind_to_string(RuntimeKind kind) {
    switch (kind) {
        case RuntimeKind::JAVA:   return "java";
        case RuntimeKind::NODE:   return "node";
        case RuntimeKind::GO:     return "go";
        case RuntimeKind::PYTHON: return "python";
        case RuntimeKind::NATIVE: return "native";
        default: return "unknown";
    }
}

std::optional<RuntimeKind> runtime_kind_from_string(const std::string& str) {
    if (str == "java") return RuntimeKind::JAVA;
    if (str == "node" || str == "nodejs") return RuntimeKind::NODE;
    if (str == "go" || str == "golang") return RuntimeKind::GO;
    if (str == "python" || str == "python3") return RuntimeKind::PYTHON;
    if (str == "native") return RuntimeKind::NATIVE;
    return std::nullopt;
}

json ResourceLimits::to_json() const {
    return json{
        {"cpu_shares", cpu_shares},
        {"memory_bytes", memory_limit_bytes},
        {"timeout_ms", timeout_ms},
        {"max_output_bytes", max_output_bytes},
        {"max_pids", max_pids}
    };
}

std::optional<ResourceLimits> ResourceLimits::from_json(const json& j, const ResourceLimits& defaults,
                                                       std::string* error) {
    ResourceLimits limits = defaults;
    if (!j.is_object()) {
        return limits;
    }

    uint64_t memory_mb = 0;
    bool ok = read_limit(j, "cpu_shares", limits.cpu_shares, error) &&
              read_limit(j, "memory_bytes", limits.memory_limit_bytes, error) &&
              read_limit(j, "timeout_ms", limits.timeout_ms, error) &&
              read_limit(j, "max_output_bytes", limits.max_output_bytes, error) &&
              read_limit(j, "max_pids", limits.max_pids, error) &&
              read_limit(j, "memory_mb", memory_mb, error);
    if (!ok) {
        return std::nullopt;
    }

    if (!j.contains("memory_bytes") && j.contains("memory_mb")) {
        if (memory_mb > kMaxMemoryBytes / (1024 * 1024)) {
            set_error(error, "limits.memory_mb exceeds " + std::to_string(kMaxMemoryBytes / (1024 * 1024)));
            return std::nullopt;
        }
        limits.memory_limit_bytes = memory_mb * 1024 * 1024;
    }
    return limits;
}

json AccessPolicy::to_json() const {
    return json{{"network", allow_network}};
}

bool AgentDefinition::same_definition(const AgentDefinition& other) const {
    return id == other.id &&
           runtime == other.runtime &&
           entry_point == other.entry_point &&
           args == other.args &&
           env == other.env &&
           bundle_path == other.bundle_path &&
           description == other.description &&
           limits.cpu_shares == other.limits.cpu_shares &&
           limits.memory_limit_bytes == other.limits.memory_limit_bytes &&
           limits.timeout_ms == other.limits.timeout_ms &&
           limits.max_output_bytes == other.limits.max_output_bytes &&
           limits.max_pids == other.limits.max_pids &&
           access.allow_network == other.access.allow_network;
}

bool AgentDefinition::validate(std::string* error) const {
    if (!valid_agent_id(id)) {
        set_error(error, "invalid agent id '" + id + "'");
        return false;
    }
    if (!valid_entry_point(entry_point)) {
        set_error(error, "entry point must be a relative path inside the bundle");
        return false;
    }
    if (limits.timeout_ms == 0 || limits.max_output_bytes == 0 || limits.memory_limit_bytes == 0) {
        set_error(error, "resource limits must be non-zero");
        return false;
    }
    if (limits.timeout_ms > kMaxDurationMs) {
        set_error(error, "timeout_ms exceeds " + std::to_string(kMaxDurationMs) + " ms");
        return false;
    }
    if (limits.memory_limit_bytes > kMaxMemoryBytes) {
        set_error(error, "memory limit exceeds " + std::to_string(kMaxMemoryBytes) + " bytes");
        return false;
    }
    return true;
}

json AgentDefinition::to_json() const {
    return json{
        {"id", id},
        {"version", version},
        {"runtime", runtime_kind_to_string(runtime)},
        {"entry", entry_point},
        {"args", args},
        {"env", env},
        {"bundle_path", bundle_path},
        {"description", description},
        {"limits", limits.to_json()},
        {"access", access.to_json()},
        {"registered_at_ms", registered_at_ms}
    };
}

std::optional<AgentDefinition> AgentDefinition::from_json(const json& j,
                                                          const ResourceLimits& default_limits,
                                                          std::string* error) {
    if (!j.is_object()) {
        set_error(error, "agent definition must be a JSON object");
        return std::nullopt;
    }

    try {
        AgentDefinition def;
        def.id = j.value("id", "");

        auto kind = runtime_kind_from_string(j.value("runtime", ""));
        if (!kind) {
            set_error(error, "unknown runtime '" + j.value("runtime", "") + "'");
            return std::nullopt;
        }
        def.runtime = *kind;

        def.entry_point = j.value("entry", "");

        def.version = j.value("version", 1u);
        def.args = j.value("args", std::vector<std::string>{});
        def.env = j.value("env", std::map<std::string, std::string>{});
        def.bundle_path = j.value("bundle_path", "");
        def.description = j.value("description", "");
        auto limits = ResourceLimits::from_json(j.value("limits", json::object()), default_limits, error);
        if (!limits) {
            return std::nullopt;
        }
        def.limits = *limits;
        if (j.contains("access") && j["access"].is_object()) {
            def.access.allow_network = j["access"].value("network", false);
        }
        def.registered_at_ms = j.value("registered_at_ms", int64_t{0});

        if (!def.validate(error)) {
            return std::nullopt;
        }
        return def;
    } catch (const json::exception& e) {
        set_error(error, std::string("malformed agent definition: ") + e.what());
        return std::nullopt;
    }
}

json RunRequest::to_json() const {
    json j{
        {"agent_id", agent_id},
        {"payload", payload},
        {"priority", priority}
    };
    if (deadline_ms) {
        j["deadline_ms"] = *deadline_ms;
    }
    return j;
}

RunRequest RunRequest::from_json(const json& j) {
    RunRequest req;
    req.agent_id = j.value("agent_id", "");
    req.payload = j.value("payload", "");
    req.priority = j.value("priority", 0);
    if (j.contains("deadline_ms") && j["deadline_ms"].is_number_unsigned()) {
        req.deadline_ms = j["deadline_ms"].get<uint64_t>();
    }
    return req;
}

const char* run_state_to_string(RunState state) {
    switch (state) {
        case RunState::QUEUED:        return "QUEUED";
        case RunState::PROVISIONING:  return "PROVISIONING";
        case RunState::RUNNING:       return "RUNNING";
        case RunState::SUCCEEDED:     return "SUCCEEDED";
        case RunState::FAILED:        return "FAILED";
        case RunState::TIMED_OUT:     return "TIMED_OUT";
        case RunState::CANCELLED:     return "CANCELLED";
        case RunState::SANDBOX_ERROR: return "SANDBOX_ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<RunState> run_state_from_string(const std::string& str) {
    if (str == "QUEUED")        return RunState::QUEUED;
    if (str == "PROVISIONING")  return RunState::PROVISIONING;
    if (str == "RUNNING")       return RunState::RUNNING;
    if (str == "SUCCEEDED")     return RunState::SUCCEEDED;
    if (str == "FAILED")        return RunState::FAILED;
    if (str == "TIMED_OUT")     return RunState::TIMED_OUT;
    if (str == "CANCELLED")     return RunState::CANCELLED;
    if (str == "SANDBOX_ERROR") return RunState::SANDBOX_ERROR;
    return std::nullopt;
}

bool is_terminal(RunState state) {
    switch (state) {
        case RunState::SUCCEEDED:
        case RunState::FAILED:
        case RunState::TIMED_OUT:
        case RunState::CANCELLED:
        case RunState::SANDBOX_ERROR:
            return true;
        default:
            return false;
    }
}

bool is_valid_transition(RunState from, RunState to) {
    if (is_terminal(from)) {
        return false;
    }
    // Infrastructure faults can end a run from any live state
    if (to == RunState::SANDBOX_ERROR) {
        return true;
    }
    switch (from) {
        case RunState::QUEUED:
            return to == RunState::PROVISIONING || to == RunState::CANCELLED;
        case RunState::PROVISIONING:
            return to == RunState::RUNNING || to == RunState::CANCELLED;
        case RunState::RUNNING:
            return to == RunState::SUCCEEDED || to == RunState::FAILED ||
                   to == RunState::TIMED_OUT || to == RunState::CANCELLED;
        default:
            return false;
    }
}

json ResourceUsage::to_json() const {
    return json{
        {"user_cpu_ms", user_cpu_ms},
        {"system_cpu_ms", system_cpu_ms},
        {"max_rss_bytes", max_rss_bytes},
        {"wall_ms", wall_ms}
    };
}

ResourceUsage ResourceUsage::from_json(const json& j) {
    ResourceUsage usage;
    if (!j.is_object()) return usage;
    usage.user_cpu_ms = j.value("user_cpu_ms", uint64_t{0});
    usage.system_cpu_ms = j.value("system_cpu_ms", uint64_t{0});
    usage.max_rss_bytes = j.value("max_rss_bytes", uint64_t{0});
    usage.wall_ms = j.value("wall_ms", uint64_t{0});
    return usage;
}

json SandboxRef::to_json() const {
    return json{
        {"name", name},
        {"driver", driver},
        {"pgid", pgid},
        {"root_dir", root_dir},
        {"cgroup_path", cgroup_path},
        {"container_name", container_name}
    };
}

SandboxRef SandboxRef::from_json(const json& j) {
    SandboxRef ref;
    if (!j.is_object()) return ref;
    ref.name = j.value("name", "");
    ref.driver = j.value("driver", "");
    ref.pgid = j.value("pgid", -1);
    ref.root_dir = j.value("root_dir", "");
    ref.cgroup_path = j.value("cgroup_path", "");
    ref.container_name = j.value("container_name", "");
    return ref;
}

std::optional<int64_t> Run::deadline_at_ms() const {
    if (!request.deadline_ms) {
        return std::nullopt;
    }
    return submitted_at_ms + static_cast<int64_t>(std::min(*request.deadline_ms, kMaxDurationMs));
}

json Run::to_json() const {
    json j{
        {"id", id},
        {"sequence", sequence},
        {"request", request.to_json()},
        {"agent", agent.to_json()},
        {"state", run_state_to_string(state)},
        {"sandbox", sandbox.to_json()},
        {"submitted_at_ms", submitted_at_ms},
        {"started_at_ms", started_at_ms},
        {"finished_at_ms", finished_at_ms},
        {"output", output},
        {"output_truncated", output_truncated},
        {"failure_tag", failure_tag},
        {"error_message", error_message},
        {"usage", usage.to_json()},
        {"provision_attempts", provision_attempts}
    };
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["term_signal"] = term_signal ? json(*term_signal) : json(nullptr);
    return j;
}

json Run::summary_json() const {
    json j{
        {"id", id},
        {"agent_id", agent.id},
        {"agent_version", agent.version},
        {"runtime", runtime_kind_to_string(agent.runtime)},
        {"state", run_state_to_string(state)},
        {"priority", request.priority},
        {"submitted_at_ms", submitted_at_ms},
        {"started_at_ms", started_at_ms},
        {"finished_at_ms", finished_at_ms},
        {"output_bytes", output.size()},
        {"output_truncated", output_truncated},
        {"failure_tag", failure_tag},
        {"error_message", error_message},
        {"usage", usage.to_json()}
    };
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["term_signal"] = term_signal ? json(*term_signal) : json(nullptr);
    return j;
}

std::optional<Run> Run::from_json(const json& j, std::string* error) {
    if (!j.is_object()) {
        set_error(error, "run record must be a JSON object");
        return std::nullopt;
    }

    try {
        Run run;
        run.id = j.value("id", "");
        if (run.id.empty()) {
            set_error(error, "run record has no id");
            return std::nullopt;
        }

        auto state = run_state_from_string(j.value("state", ""));
        if (!state) {
            set_error(error, "run record has unknown state '" + j.value("state", "") + "'");
            return std::nullopt;
        }
        run.state = *state;

        auto agent = AgentDefinition::from_json(j.value("agent", json::object()), ResourceLimits{}, error);
        if (!agent) {
            return std::nullopt;
        }
        run.agent = *agent;

        run.sequence = j.value("sequence", uint64_t{0});
        run.request = RunRequest::from_json(j.value("request", json::object()));
        run.sandbox = SandboxRef::from_json(j.value("sandbox", json::object()));
        run.submitted_at_ms = j.value("submitted_at_ms", int64_t{0});
        run.started_at_ms = j.value("started_at_ms", int64_t{0});
        run.finished_at_ms = j.value("finished_at_ms", int64_t{0});
        run.output = j.value("output", "");
        run.output_truncated = j.value("output_truncated", false);
        run.failure_tag = j.value("failure_tag", "");
        run.error_message = j.value("error_message", "");
        run.usage = ResourceUsage::from_json(j.value("usage", json::object()));
        run.provision_attempts = j.value("provision_attempts", 0u);
        if (j.contains("exit_code") && j["exit_code"].is_number_integer()) {
            run.exit_code = j["exit_code"].get<int>();
        }
        if (j.contains("term_signal") && j["term_signal"].is_number_integer()) {
            run.term_signal = j["term_signal"].get<int>();
        }
        return run;
    } catch (const json::exception& e) {
        set_error(error, std::string("malformed run record: ") + e.what());
        return std::nullopt;
    }
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace openfang::runtime
