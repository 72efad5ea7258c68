#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/agent/types.hpp"

namespace openfang::kernel {

struct StoreResult {
    bool success = false;
    std::string key;
    std::string error;
};

struct FetchResult {
    bool success = false;
    bool exists = false;
    nlohmann::json value;
    std::string error;
};

struct DeleteResult {
    bool success = false;
    bool deleted = false;
};

/**
 * Durable records on the persistent volume.
 *
 * Layout: <root>/agents/<agent_id>.json and <root>/runs/<run_id>.json.
 * Every put is an atomic per-record commit (write temp, fsync, rename,
 * fsync dir), so writes for different keys never need a shared lock and a
 * crash leaves either the old or the new record, never a torn one.
 */
class StateStore {
public:
    explicit StateStore(std::string root);

    bool init(std::string* error);
    const std::string& root() const { return root_; }

    // Agent definitions (latest version per id)
    StoreResult put_agent(const runtime::AgentDefinition& def);
    std::optional<runtime::AgentDefinition> get_agent(const std::string& agent_id);
    DeleteResult delete_agent(const std::string& agent_id);
    std::vector<runtime::AgentDefinition> list_agents();

    // Run records
    StoreResult put_run(const runtime::Run& run);
    std::optional<runtime::Run> get_run(const std::string& run_id);
    std::vector<runtime::Run> list_runs();

    // Runs a previous process left PROVISIONING or RUNNING
    std::vector<runtime::Run> list_unfinished_runs();

    // Runs still QUEUED, in admission order
    std::vector<runtime::Run> list_queued_runs();

    // Raw record access
    StoreResult write_record(const std::string& collection, const std::string& key,
                             const nlohmann::json& value);
    FetchResult read_record(const std::string& collection, const std::string& key);
    DeleteResult erase_record(const std::string& collection, const std::string& key);
    std::vector<std::string> keys(const std::string& collection);

private:
    std::string root_;
    std::atomic<uint64_t> tmp_counter_{0};

    std::string record_path(const std::string& collection, const std::string& key) const;
    static bool valid_key(const std::string& key);
};

} // namespace openfang::kernel
