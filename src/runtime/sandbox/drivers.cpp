#include "runtime/sandbox/drivers.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace openfang::runtime {

ProcessDriver::ProcessDriver(bool enable_namespaces)
    : enable_namespaces_(enable_namespaces) {}

std::string ProcessDriver::required_executable(const RuntimeAdapter& adapter,
                                               const AgentDefinition& def) const {
    return required_launcher(adapter, def);
}

void ProcessDriver::configure(SandboxConfig& config) const {
    config.driver = name();
    config.enable_namespaces = enable_namespaces_;
}

InvocationContext ProcessDriver::context_for(const Sandbox& sandbox, const std::string& run_id) const {
    InvocationContext ctx;
    ctx.run_id = run_id;
    ctx.bundle_dir = sandbox.config().bundle_dir;
    ctx.scratch_dir = sandbox.scratch_dir();
    return ctx;
}

InvocationSpec ProcessDriver::wrap(const Sandbox& sandbox, const AgentDefinition& def,
                                   InvocationSpec spec) const {
    (void)sandbox;
    (void)def;
    return spec;
}

ContainerDriver::ContainerDriver(std::string cli, std::map<std::string, std::string> images)
    : cli_(std::move(cli))
    , images_(std::move(images)) {}

std::string ContainerDriver::required_executable(const RuntimeAdapter& adapter,
                                                 const AgentDefinition& def) const {
    // The launcher lives in the image
    (void)adapter;
    (void)def;
    return cli_;
}

void ContainerDriver::configure(SandboxConfig& config) const {
    config.driver = name();
    config.enable_namespaces = false;
    config.cgroup_parent.clear();
    config.container_name = "openfang-" + config.name;
}

InvocationContext ContainerDriver::context_for(const Sandbox& sandbox, const std::string& run_id) const {
    (void)sandbox;
    InvocationContext ctx;
    ctx.run_id = run_id;
    ctx.bundle_dir = kBundleMount;
    ctx.scratch_dir = kScratchMount;
    return ctx;
}

std::string ContainerDriver::image_for(RuntimeKind kind) const {
    auto it = images_.find(runtime_kind_to_string(kind));
    if (it != images_.end()) {
        return it->second;
    }
    return default_container_images()[runtime_kind_to_string(kind)];
}

InvocationSpec ContainerDriver::wrap(const Sandbox& sandbox, const AgentDefinition& def,
                                     InvocationSpec spec) const {
    const SandboxConfig& config = sandbox.config();
    const ResourceLimits& limits = config.limits;

    std::vector<std::string> argv = {
        cli_, "run", "--rm", "-i", "--init",
        "--name", config.container_name,
        "--memory", std::to_string(limits.memory_limit_bytes),
        "--memory-swap", std::to_string(limits.memory_limit_bytes),
        "--cpu-shares", std::to_string(limits.cpu_shares),
        "--pids-limit", std::to_string(limits.max_pids),
        "--network", config.access.allow_network ? "bridge" : "none",
        "--read-only", "--tmpfs", "/tmp",
        "--user", std::to_string(getuid()) + ":" + std::to_string(getgid()),
        "-v", config.bundle_dir + ":" + kBundleMount + ":ro",
        "-v", sandbox.scratch_dir() + ":" + kScratchMount,
        "-w", spec.working_dir.empty() ? std::string(kScratchMount) : spec.working_dir
    };
    for (const auto& [key, value] : spec.env) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }

    argv.push_back(image_for(def.runtime));
    argv.insert(argv.end(), spec.argv.begin(), spec.argv.end());

    InvocationSpec wrapped;
    wrapped.argv = std::move(argv);
    wrapped.working_dir = sandbox.scratch_dir();
    wrapped.stdin_data = std::move(spec.stdin_data);
    wrapped.address_space_limit_safe = false;
    return wrapped;
}

void ContainerDriver::teardown(const SandboxRef& ref) const {
    if (ref.container_name.empty()) {
        return;
    }
    int rc = run_host_command({cli_, "rm", "-f", ref.container_name}, std::chrono::seconds(15));
    if (rc != 0) {
        spdlog::debug("Container {} removal exited with {}", ref.container_name, rc);
    }
}

std::map<std::string, std::string> default_container_images() {
    return {
        {"java", "eclipse-temurin:21-jdk"},
        {"node", "node:20-slim"},
        {"go", "golang:1.22"},
        {"python", "python:3.12-slim"},
        {"native", "debian:bookworm-slim"}
    };
}

int run_host_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return -1;
    }
    auto program = core::paths::find_executable(argv.front());
    if (!program) {
        spdlog::warn("Host command not found: {}", argv.front());
        return -1;
    }

    std::vector<std::string> args = argv;
    std::vector<char*> c_args;
    for (auto& a : args) {
        c_args.push_back(a.data());
    }
    c_args.push_back(nullptr);
    std::string path = program->string();

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("fork failed for {}: {}", argv.front(), strerror(errno));
        return -1;
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execv(path.c_str(), c_args.data());
        _exit(127);
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        if (r < 0 && errno != EINTR) {
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Host command {} timed out, killing", argv.front());
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

} // namespace openfang::runtime
