#include "kernel/state_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace openfang::kernel {

namespace {

constexpr const char* kAgents = "agents";
constexpr const char* kRuns = "runs";
constexpr const char* kSuffix = ".json";

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void fsync_dir(const std::string& dir) {
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd >= 0) {
        fsync(fd);
        close(fd);
    }
}

} // namespace

StateStore::StateStore(std::string root)
    : root_(std::move(root)) {}

bool StateStore::init(std::string* error) {
    for (const char* collection : {kAgents, kRuns}) {
        std::error_code ec;
        fs::create_directories(fs::path(root_) / collection, ec);
        if (ec) {
            if (error) *error = "cannot create " + (fs::path(root_) / collection).string() + ": " + ec.message();
            return false;
        }
    }

    // Temp files from commits interrupted by a crash
    for (const char* collection : {kAgents, kRuns}) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(fs::path(root_) / collection, ec)) {
            if (entry.path().filename().string().find(".tmp-") != std::string::npos) {
                std::error_code remove_ec;
                fs::remove(entry.path(), remove_ec);
            }
        }
    }

    spdlog::debug("State store at {}", root_);
    return true;
}

bool StateStore::valid_key(const std::string& key) {
    if (key.empty() || key == "." || key == ".." || key.size() > 200) {
        return false;
    }
    return key.find('/') == std::string::npos && key.find('\0') == std::string::npos;
}

std::string StateStore::record_path(const std::string& collection, const std::string& key) const {
    return (fs::path(root_) / collection / (key + kSuffix)).string();
}

StoreResult StateStore::write_record(const std::string& collection, const std::string& key,
                                     const json& value) {
    StoreResult result;
    result.key = key;
    if (!valid_key(key)) {
        result.error = "invalid record key '" + key + "'";
        return result;
    }

    // Captured output is arbitrary bytes; invalid UTF-8 is replaced rather than failing the commit
    std::string data = value.dump(2, ' ', false, json::error_handler_t::replace);
    data.push_back('\n');

    std::string path = record_path(collection, key);
    std::string tmp = path + ".tmp-" + std::to_string(getpid()) + "-" + std::to_string(tmp_counter_.fetch_add(1));

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0640);
    if (fd < 0) {
        result.error = "open " + tmp + ": " + strerror(errno);
        spdlog::error("State store: {}", result.error);
        return result;
    }
    bool ok = write_all(fd, data) && fsync(fd) == 0;
    int err = errno;
    close(fd);
    if (!ok || rename(tmp.c_str(), path.c_str()) != 0) {
        if (ok) err = errno;
        unlink(tmp.c_str());
        result.error = "commit " + path + ": " + strerror(err);
        spdlog::error("State store: {}", result.error);
        return result;
    }
    fsync_dir((fs::path(root_) / collection).string());

    result.success = true;
    return result;
}

FetchResult StateStore::read_record(const std::string& collection, const std::string& key) {
    FetchResult result;
    if (!valid_key(key)) {
        result.error = "invalid record key '" + key + "'";
        return result;
    }

    std::ifstream in(record_path(collection, key));
    if (!in) {
        result.success = true;
        result.exists = false;
        return result;
    }
    try {
        result.value = json::parse(in);
    } catch (const json::parse_error& e) {
        result.error = "corrupt record " + record_path(collection, key) + ": " + e.what();
        spdlog::warn("State store: {}", result.error);
        return result;
    }
    result.success = true;
    result.exists = true;
    return result;
}

DeleteResult StateStore::erase_record(const std::string& collection, const std::string& key) {
    DeleteResult result;
    if (!valid_key(key)) {
        return result;
    }
    std::string path = record_path(collection, key);
    if (unlink(path.c_str()) != 0) {
        result.success = errno == ENOENT;
        return result;
    }
    fsync_dir((fs::path(root_) / collection).string());
    result.success = true;
    result.deleted = true;
    return result;
}

std::vector<std::string> StateStore::keys(const std::string& collection) {
    std::vector<std::string> keys;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(fs::path(root_) / collection, ec)) {
        const auto& p = entry.path();
        if (p.extension() == kSuffix && p.filename().string().find(".tmp-") == std::string::npos) {
            keys.push_back(p.stem().string());
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

StoreResult StateStore::put_agent(const runtime::AgentDefinition& def) {
    return write_record(kAgents, def.id, def.to_json());
}

std::optional<runtime::AgentDefinition> StateStore::get_agent(const std::string& agent_id) {
    auto fetched = read_record(kAgents, agent_id);
    if (!fetched.success || !fetched.exists) {
        return std::nullopt;
    }
    std::string error;
    auto def = runtime::AgentDefinition::from_json(fetched.value, runtime::ResourceLimits{}, &error);
    if (!def) {
        spdlog::warn("State store: agent record {}: {}", agent_id, error);
    }
    return def;
}

DeleteResult StateStore::delete_agent(const std::string& agent_id) {
    return erase_record(kAgents, agent_id);
}

std::vector<runtime::AgentDefinition> StateStore::list_agents() {
    std::vector<runtime::AgentDefinition> agents;
    for (const auto& key : keys(kAgents)) {
        if (auto def = get_agent(key)) {
            agents.push_back(std::move(*def));
        }
    }
    return agents;
}

StoreResult StateStore::put_run(const runtime::Run& run) {
    return write_record(kRuns, run.id, run.to_json());
}

std::optional<runtime::Run> StateStore::get_run(const std::string& run_id) {
    auto fetched = read_record(kRuns, run_id);
    if (!fetched.success || !fetched.exists) {
        return std::nullopt;
    }
    std::string error;
    auto run = runtime::Run::from_json(fetched.value, &error);
    if (!run) {
        spdlog::warn("State store: run record {}: {}", run_id, error);
    }
    return run;
}

std::vector<runtime::Run> StateStore::list_runs() {
    std::vector<runtime::Run> runs;
    for (const auto& key : keys(kRuns)) {
        if (auto run = get_run(key)) {
            runs.push_back(std::move(*run));
        }
    }
    std::sort(runs.begin(), runs.end(), [](const runtime::Run& a, const runtime::Run& b) {
        return a.sequence < b.sequence;
    });
    return runs;
}

std::vector<runtime::Run> StateStore::list_unfinished_runs() {
    std::vector<runtime::Run> unfinished;
    for (auto& run : list_runs()) {
        if (run.state == runtime::RunState::PROVISIONING || run.state == runtime::RunState::RUNNING) {
            unfinished.push_back(std::move(run));
        }
    }
    return unfinished;
}

std::vector<runtime::Run> StateStore::list_queued_runs() {
    std::vector<runtime::Run> queued;
    for (auto& run : list_runs()) {
        if (run.state == runtime::RunState::QUEUED) {
            queued.push_back(std::move(run));
        }
    }
    return queued;
}

} // namespace openfang::kernel
