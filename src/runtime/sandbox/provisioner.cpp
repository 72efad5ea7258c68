#include "runtime/sandbox/provisioner.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <set>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace openfang::runtime {

namespace {

bool write_control(const fs::path& path, const std::string& value) {
    std::ofstream out(path);
    if (!out) {
        return false;
    }
    out << value;
    out.flush();
    return static_cast<bool>(out);
}

std::string read_first_line(const fs::path& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return line;
}

// Java main classes are names, not files
bool entry_is_file(const AgentDefinition& def) {
    if (def.runtime != RuntimeKind::JAVA) {
        return true;
    }
    const auto ext = fs::path(def.entry_point).extension();
    return ext == ".jar" || ext == ".java";
}

// Root inside an unprivileged container still cannot unshare; try it in a throwaway child
bool probe_namespaces() {
    if (geteuid() != 0) {
        return false;
    }
    pid_t pid = fork();
    if (pid < 0) {
        return false;
    }
    if (pid == 0) {
        if (unshare(CLONE_NEWNS | CLONE_NEWNET) != 0) _exit(1);
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) _exit(2);
        _exit(0);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

ProvisionError classify_start_error(const StartError& err) {
    switch (err.err) {
        case EAGAIN:
        case ENOMEM:
        case EMFILE:
        case ENFILE:
            return ProvisionError::RESOURCE_EXHAUSTED;
        default:
            break;
    }
    if (err.stage == "exec" && (err.err == ENOENT || err.err == EACCES)) {
        return ProvisionError::RUNTIME_UNAVAILABLE;
    }
    return ProvisionError::SETUP_FAILED;
}

} // namespace

const char* provision_error_to_string(ProvisionError error) {
    switch (error) {
        case ProvisionError::NONE:                return "NONE";
        case ProvisionError::RESOURCE_EXHAUSTED:  return "RESOURCE_EXHAUSTED";
        case ProvisionError::RUNTIME_UNAVAILABLE: return "RUNTIME_UNAVAILABLE";
        case ProvisionError::SETUP_FAILED:        return "SETUP_FAILED";
        default: return "UNKNOWN";
    }
}

bool is_transient(ProvisionError error) {
    return error == ProvisionError::RESOURCE_EXHAUSTED || error == ProvisionError::SETUP_FAILED;
}

std::unique_ptr<SandboxDriver> make_driver(const ProvisionerConfig& config, bool namespaces) {
    if (config.driver == "container") {
        return std::make_unique<ContainerDriver>(config.container_cli, config.container_images);
    }
    return std::make_unique<ProcessDriver>(namespaces);
}

SandboxProvisioner::SandboxProvisioner(ProvisionerConfig config)
    : config_(std::move(config)) {}

SandboxProvisioner::~SandboxProvisioner() {
    cleanup_all();
}

bool SandboxProvisioner::init(std::string* error) {
    std::error_code ec;
    fs::create_directories(config_.sandboxes_dir, ec);
    if (ec) {
        if (error) *error = "cannot create " + config_.sandboxes_dir + ": " + ec.message();
        return false;
    }
    config_.sandboxes_dir = fs::canonical(config_.sandboxes_dir, ec).string();
    config_.hidden_dirs.push_back(config_.sandboxes_dir);

    if (config_.driver != "process" && config_.driver != "container") {
        if (error) *error = "unknown sandbox driver: " + config_.driver;
        return false;
    }

    if (config_.driver == "process" && config_.enable_isolation) {
        namespaces_available_ = probe_namespaces();
        if (!namespaces_available_) {
            spdlog::warn("Mount/network namespaces unavailable (needs root with CAP_SYS_ADMIN), isolation degraded");
        }
        cgroup_parent_ = probe_cgroup_parent();
        if (cgroup_parent_.empty()) {
            spdlog::warn("No writable cgroup v2 hierarchy: falling back to rlimits");
        } else {
            spdlog::info("Sandbox cgroups under {}", cgroup_parent_);
        }
    } else if (config_.driver == "process") {
        spdlog::warn("Sandbox isolation disabled by configuration");
    }

    driver_ = make_driver(config_, namespaces_available_);
    spdlog::info("Sandbox provisioner ready (driver={}, max_sandboxes={})",
        driver_->name(), config_.max_sandboxes);
    return true;
}

std::string SandboxProvisioner::probe_cgroup_parent() const {
    fs::path base;
    if (!config_.cgroup_root.empty()) {
        base = config_.cgroup_root;
    } else {
        std::error_code ec;
        if (!fs::exists("/sys/fs/cgroup/cgroup.controllers", ec)) {
            return {};
        }
        // cgroup v2 entry: "0::/path"
        std::string line = read_first_line("/proc/self/cgroup");
        if (line.compare(0, 3, "0::") != 0) {
            return {};
        }
        base = fs::path("/sys/fs/cgroup") / fs::path(line.substr(3)).relative_path();
    }

    fs::path parent = base / "openfang";
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        spdlog::debug("cgroup probe: cannot create {}: {}", parent.string(), ec.message());
        return {};
    }

    // Delegating controllers may fail when base still holds processes; parent may already have them
    write_control(base / "cgroup.subtree_control", "+memory +cpu +pids");
    for (const char* controller : {"+memory", "+pids", "+cpu"}) {
        write_control(parent / "cgroup.subtree_control", controller);
    }

    std::string enabled = read_first_line(parent / "cgroup.subtree_control");
    if (enabled.find("memory") == std::string::npos) {
        spdlog::debug("cgroup probe: memory controller not delegated to {}", parent.string());
        fs::remove(parent, ec);
        return {};
    }
    return parent.string();
}

ProvisionResult SandboxProvisioner::provision(const std::string& run_id, const AgentDefinition& def) {
    ProvisionResult result;
    auto fail = [&](ProvisionError error, const std::string& message) {
        result.error = error;
        result.message = message;
        return result;
    };

    if (!driver_) {
        return fail(ProvisionError::SETUP_FAILED, "provisioner not initialized");
    }

    std::error_code ec;
    fs::path bundle = fs::canonical(def.bundle_path, ec);
    if (ec || !fs::is_directory(bundle, ec)) {
        return fail(ProvisionError::SETUP_FAILED, "agent bundle not found: " + def.bundle_path);
    }
    fs::path entry = bundle / def.entry_point;
    if (entry_is_file(def) && !fs::exists(entry, ec)) {
        return fail(ProvisionError::SETUP_FAILED, "entry point not found: " + entry.string());
    }

    RuntimeAdapter adapter = make_adapter(def.runtime, config_.toolchains);
    std::string launcher = driver_->required_executable(adapter, def);
    if (launcher.empty()) {
        if (access(entry.c_str(), X_OK) != 0) {
            return fail(ProvisionError::SETUP_FAILED, "entry point is not executable: " + entry.string());
        }
    } else if (!core::paths::find_executable(launcher)) {
        return fail(ProvisionError::RUNTIME_UNAVAILABLE,
            std::string(runtime_kind_to_string(def.runtime)) + " launcher not found: " + launcher);
    }

    SandboxConfig sandbox_config;
    sandbox_config.name = "sbx-" + run_id;
    sandbox_config.root_dir = (fs::path(config_.sandboxes_dir) / sandbox_config.name).string();
    sandbox_config.bundle_dir = bundle.string();
    sandbox_config.hidden_dirs = config_.hidden_dirs;
    sandbox_config.limits = def.limits;
    sandbox_config.access = def.access;
    sandbox_config.cgroup_parent = cgroup_parent_;
    driver_->configure(sandbox_config);

    auto sandbox = std::make_shared<Sandbox>(sandbox_config);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (live_.size() >= config_.max_sandboxes) {
            return fail(ProvisionError::RESOURCE_EXHAUSTED,
                "sandbox limit reached (" + std::to_string(config_.max_sandboxes) + ")");
        }
        if (live_.count(sandbox_config.name)) {
            return fail(ProvisionError::SETUP_FAILED, "sandbox already live: " + sandbox_config.name);
        }
        live_[sandbox_config.name] = sandbox;
    }

    // Leftovers from an earlier attempt with the same name
    fs::remove_all(sandbox_config.root_dir, ec);

    std::string error;
    if (!sandbox->create(&error)) {
        release(sandbox);
        return fail(ProvisionError::SETUP_FAILED, error);
    }

    const auto& isolation = sandbox->isolation_status();
    if (isolation.is_degraded()) {
        spdlog::debug("Sandbox {} isolation degraded: {}", sandbox->name(), isolation.degraded_reason);
    }

    result.success = true;
    result.sandbox = std::move(sandbox);
    return result;
}

InvocationSpec SandboxProvisioner::prepare_invocation(const Sandbox& sandbox, const std::string& run_id,
                                                      const AgentDefinition& def,
                                                      const std::string& payload) const {
    RuntimeAdapter adapter = make_adapter(def.runtime, config_.toolchains);
    InvocationContext ctx = driver_->context_for(sandbox, run_id);
    return driver_->wrap(sandbox, def, build_invocation(adapter, def, payload, ctx));
}

LaunchResult SandboxProvisioner::launch(Sandbox& sandbox, const InvocationSpec& spec) {
    LaunchResult result;
    StartError err;
    if (sandbox.start(spec, &err)) {
        result.success = true;
        return result;
    }
    result.error = classify_start_error(err);
    result.message = err.message;
    spdlog::debug("Sandbox {} launch failed at {}: {}", sandbox.name(), err.stage, err.message);
    return result;
}

bool SandboxProvisioner::release(const std::shared_ptr<Sandbox>& sandbox) {
    if (!sandbox) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live_.find(sandbox->name());
        if (it == live_.end() || it->second != sandbox) {
            return false;
        }
        live_.erase(it);
        ++released_;
    }

    SandboxRef ref = sandbox->to_ref();
    sandbox->destroy();
    driver_->teardown(ref);
    spdlog::debug("Sandbox {} released", ref.name);
    return true;
}

bool SandboxProvisioner::owns_root(const std::string& root_dir) const {
    if (root_dir.empty()) {
        return false;
    }
    fs::path parent = fs::path(root_dir).lexically_normal().parent_path();
    return parent == fs::path(config_.sandboxes_dir).lexically_normal();
}

void SandboxProvisioner::force_release(const SandboxRef& ref) {
    if (ref.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (live_.count(ref.name)) {
            spdlog::warn("Refusing to force-release live sandbox {}", ref.name);
            return;
        }
    }

    if (kill_marked_group(ref.pgid, ref.root_dir)) {
        spdlog::warn("Killed surviving process group {} of sandbox {}", ref.pgid, ref.name);
    }
    if (!ref.cgroup_path.empty()) {
        remove_cgroup(ref.cgroup_path);
    }
    if (ref.driver == "container") {
        ContainerDriver(config_.container_cli, config_.container_images).teardown(ref);
    }
    if (owns_root(ref.root_dir)) {
        std::error_code ec;
        fs::remove_all(ref.root_dir, ec);
        if (ec) {
            spdlog::warn("Failed to remove {}: {}", ref.root_dir, ec.message());
        }
    }
}

size_t SandboxProvisioner::sweep_orphans() {
    std::set<std::string> live_names;
    std::set<std::string> live_roots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, sandbox] : live_) {
            live_names.insert(name);
            live_roots.insert(sandbox->config().root_dir);
        }
    }

    size_t swept = 0;
    std::set<pid_t> killed;
    for (const auto& process : find_marked_processes()) {
        if (!owns_root(process.marker) || live_roots.count(process.marker) || killed.count(process.pgrp)) {
            continue;
        }
        if (process.pgrp > 1 && process.pgrp != getpgrp()) {
            kill(-process.pgrp, SIGKILL);
            killed.insert(process.pgrp);
            spdlog::warn("Killed orphaned sandbox process group {} ({})", process.pgrp, process.marker);
            ++swept;
        }
    }

    std::error_code ec;
    if (!cgroup_parent_.empty()) {
        for (const auto& entry : fs::directory_iterator(cgroup_parent_, ec)) {
            if (entry.is_directory() && !live_names.count(entry.path().filename().string())) {
                remove_cgroup(entry.path().string());
                ++swept;
            }
        }
    }

    for (const auto& entry : fs::directory_iterator(config_.sandboxes_dir, ec)) {
        if (!entry.is_directory() || live_names.count(entry.path().filename().string())) {
            continue;
        }
        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            spdlog::warn("Failed to remove orphaned sandbox dir {}: {}", entry.path().string(), remove_ec.message());
            continue;
        }
        spdlog::info("Removed orphaned sandbox dir {}", entry.path().string());
        ++swept;
    }
    return swept;
}

void SandboxProvisioner::cleanup_all() {
    std::vector<std::shared_ptr<Sandbox>> sandboxes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, sandbox] : live_) {
            sandboxes.push_back(sandbox);
        }
    }
    for (const auto& sandbox : sandboxes) {
        release(sandbox);
    }
}

size_t SandboxProvisioner::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

uint64_t SandboxProvisioner::released_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

} // namespace openfang::runtime
