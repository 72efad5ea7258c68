#include "runtime/sandbox/sandbox.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <dirent.h>
#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace openfang::runtime {

namespace {

// Pre-exec steps in the child, reported back through the error pipe
enum ChildStage : int {
    STAGE_SETPGID = 1,
    STAGE_CGROUP,
    STAGE_UNSHARE,
    STAGE_MOUNT_PRIVATE,
    STAGE_BIND_BUNDLE,
    STAGE_HIDE_DIR,
    STAGE_BIND_SCRATCH,
    STAGE_RLIMIT,
    STAGE_CHDIR,
    STAGE_STDIO,
    STAGE_EXEC
};

const char* stage_name(int stage) {
    switch (stage) {
        case STAGE_SETPGID:       return "setpgid";
        case STAGE_CGROUP:        return "cgroup-attach";
        case STAGE_UNSHARE:       return "unshare";
        case STAGE_MOUNT_PRIVATE: return "mount-private";
        case STAGE_BIND_BUNDLE:   return "bind-bundle";
        case STAGE_HIDE_DIR:      return "hide-dir";
        case STAGE_BIND_SCRATCH:  return "bind-scratch";
        case STAGE_RLIMIT:        return "rlimit";
        case STAGE_CHDIR:         return "chdir";
        case STAGE_STDIO:         return "stdio";
        case STAGE_EXEC:          return "exec";
        default: return "unknown";
    }
}

struct ChildFailure {
    int stage;
    int err;
};

// Only async-signal-safe calls between fork and exec
[[noreturn]] void child_fail(int fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t ignored = write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

bool write_file(const std::string& path, const std::string& value) {
    std::ofstream out(path);
    if (!out) {
        return false;
    }
    out << value;
    out.flush();
    return static_cast<bool>(out);
}

// cgroup v1 shares [2, 262144] map onto v2 weight [1, 10000]
uint64_t cpu_weight_from_shares(uint64_t shares) {
    shares = std::clamp<uint64_t>(shares, 2, 262144);
    return 1 + ((shares - 2) * 9999) / 262142;
}

uint64_t timeval_ms(const struct timeval& tv) {
    return static_cast<uint64_t>(tv.tv_sec) * 1000 + static_cast<uint64_t>(tv.tv_usec) / 1000;
}

bool path_contains(const fs::path& dir, const fs::path& path) {
    auto d = dir.lexically_normal();
    auto p = path.lexically_normal();
    auto it = std::mismatch(d.begin(), d.end(), p.begin(), p.end());
    return it.first == d.end() || (std::next(it.first) == d.end() && it.first->empty());
}

std::vector<char*> c_strings(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& v : values) {
        out.push_back(v.data());
    }
    out.push_back(nullptr);
    return out;
}

} // namespace

const char* sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::CREATED:   return "CREATED";
        case SandboxState::READY:     return "READY";
        case SandboxState::RUNNING:   return "RUNNING";
        case SandboxState::EXITED:    return "EXITED";
        case SandboxState::DESTROYED: return "DESTROYED";
        case SandboxState::FAILED:    return "FAILED";
        default: return "UNKNOWN";
    }
}

Sandbox::Sandbox(const SandboxConfig& config)
    : config_(config) {}

Sandbox::~Sandbox() {
    destroy();
}

std::string Sandbox::scratch_dir() const {
    return (fs::path(config_.root_dir) / "scratch").string();
}

bool Sandbox::create(std::string* error) {
    std::error_code ec;
    fs::create_directories(scratch_dir(), ec);
    if (ec) {
        if (error) *error = "cannot create scratch dir " + scratch_dir() + ": " + ec.message();
        set_state(SandboxState::FAILED);
        return false;
    }

    std::vector<std::string> degraded;

    if (!config_.cgroup_parent.empty()) {
        std::string cgroup_error;
        if (setup_cgroup(&cgroup_error)) {
            isolation_status_.cgroup_limits = true;
        } else {
            degraded.push_back(cgroup_error);
        }
    } else if (config_.driver == "process") {
        degraded.push_back("cgroup limits unavailable");
    }

    if (config_.enable_namespaces) {
        isolation_status_.mnt_namespace = true;
        isolation_status_.net_namespace = !config_.access.allow_network;
    } else if (config_.driver == "process") {
        degraded.push_back("namespaces disabled (bundle not remounted read-only, network not isolated)");
    }

    isolation_status_.fully_isolated = degraded.empty();
    for (const auto& reason : degraded) {
        if (!isolation_status_.degraded_reason.empty()) {
            isolation_status_.degraded_reason += "; ";
        }
        isolation_status_.degraded_reason += reason;
    }

    set_state(SandboxState::READY);
    spdlog::debug("Sandbox {} created (root={}, isolation={})", config_.name, config_.root_dir,
        isolation_status_.fully_isolated ? "full" : isolation_status_.degraded_reason);
    return true;
}

bool Sandbox::setup_cgroup(std::string* error) {
    fs::path path = fs::path(config_.cgroup_parent) / config_.name;
    std::error_code ec;
    fs::create_directory(path, ec);
    if (ec) {
        *error = "cannot create cgroup " + path.string() + ": " + ec.message();
        return false;
    }

    cgroup_path_ = path.string();
    const auto& limits = config_.limits;
    if (!write_file(cgroup_path_ + "/memory.max", std::to_string(limits.memory_limit_bytes))) {
        *error = "cannot set memory.max in " + cgroup_path_;
        cleanup_cgroup();
        return false;
    }
    // Not every kernel exposes swap accounting
    write_file(cgroup_path_ + "/memory.swap.max", "0");
    if (!write_file(cgroup_path_ + "/cpu.weight", std::to_string(cpu_weight_from_shares(limits.cpu_shares)))) {
        spdlog::warn("Sandbox {}: cpu.weight not applied", config_.name);
    }
    if (!write_file(cgroup_path_ + "/pids.max", std::to_string(limits.max_pids))) {
        spdlog::warn("Sandbox {}: pids.max not applied", config_.name);
    }
    return true;
}

void Sandbox::cleanup_cgroup() {
    if (cgroup_path_.empty()) {
        return;
    }
    remove_cgroup(cgroup_path_);
    cgroup_path_.clear();
}

bool Sandbox::start(const InvocationSpec& spec, StartError* error) {
    auto fail = [&](const std::string& stage, int err, const std::string& message) {
        if (error) {
            error->stage = stage;
            error->err = err;
            error->message = message;
        }
        set_state(SandboxState::FAILED);
        return false;
    };

    if (state() != SandboxState::READY) {
        return fail("state", EINVAL, std::string("sandbox not ready: ") + sandbox_state_to_string(state()));
    }
    if (spec.argv.empty()) {
        return fail("exec", EINVAL, "empty invocation");
    }

    // Everything the child needs is prepared before fork
    std::string program = spec.program();
    if (program.find('/') == std::string::npos) {
        auto resolved = core::paths::find_executable(program);
        if (!resolved) {
            return fail("exec", ENOENT, "launcher not found on PATH: " + program);
        }
        program = resolved->string();
    }

    std::vector<std::string> argv_strings = spec.argv;
    std::vector<std::string> env_strings;
    for (const auto& [key, value] : spec.env) {
        env_strings.push_back(key + "=" + value);
    }
    if (spec.env.find("PATH") == spec.env.end()) {
        env_strings.push_back("PATH=" + core::config::get_env_or("PATH", "/usr/local/bin:/usr/bin:/bin"));
    }
    env_strings.push_back(std::string(kSandboxMarkerEnv) + "=" + marker());
    std::vector<char*> argv = c_strings(argv_strings);
    std::vector<char*> envp = c_strings(env_strings);

    std::string working_dir = spec.working_dir.empty() ? scratch_dir() : spec.working_dir;
    std::string cgroup_procs = cgroup_path_.empty() ? std::string() : cgroup_path_ + "/cgroup.procs";

    // Mount plan for privileged isolation
    std::string bundle = fs::path(config_.bundle_dir).lexically_normal().string();
    std::string scratch = scratch_dir();
    std::vector<std::string> hide;
    std::vector<std::string> rebuild_chain;
    int scratch_fd = -1;
    if (config_.enable_namespaces) {
        for (const auto& dir : config_.hidden_dirs) {
            std::error_code ec;
            if (!fs::is_directory(dir, ec)) continue;
            if (path_contains(dir, bundle)) {
                spdlog::warn("Sandbox {}: not hiding {} (contains the agent bundle)", config_.name, dir);
                continue;
            }
            hide.push_back(fs::path(dir).lexically_normal().string());
            if (path_contains(dir, scratch) && rebuild_chain.empty()) {
                fs::path current = fs::path(dir).lexically_normal();
                fs::path rel = fs::path(scratch).lexically_relative(current);
                for (const auto& part : rel) {
                    current /= part;
                    rebuild_chain.push_back(current.string());
                }
            }
        }
        scratch_fd = open(scratch.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC);
        if (scratch_fd < 0) {
            return fail("bind-scratch", errno, "cannot open scratch dir: " + std::string(strerror(errno)));
        }
    }
    std::string scratch_fd_path = "/proc/self/fd/" + std::to_string(scratch_fd);
    int unshare_flags = CLONE_NEWNS | (config_.access.allow_network ? 0 : CLONE_NEWNET);

    bool limit_address_space = cgroup_path_.empty() && spec.address_space_limit_safe;
    rlim_t address_space = static_cast<rlim_t>(config_.limits.memory_limit_bytes);
    isolation_status_.address_space_rlimit = limit_address_space;
    if (cgroup_path_.empty() && !spec.address_space_limit_safe && config_.driver == "process") {
        spdlog::warn("Sandbox {}: memory ceiling not enforced for this runtime without cgroups",
            config_.name);
    }

    struct rlimit nofile{};
    getrlimit(RLIMIT_NOFILE, &nofile);
    int max_fd = nofile.rlim_cur == RLIM_INFINITY ? 65536
                 : static_cast<int>(std::min<rlim_t>(nofile.rlim_cur, 65536));

    // Payload goes in through a file so the child can never block the supervisor
    fs::path stdin_path = fs::path(config_.root_dir) / "stdin";
    {
        std::ofstream payload(stdin_path, std::ios::binary | std::ios::trunc);
        payload.write(spec.stdin_data.data(), static_cast<std::streamsize>(spec.stdin_data.size()));
        if (!payload) {
            if (scratch_fd >= 0) close(scratch_fd);
            return fail("stdio", EIO, "cannot write payload file " + stdin_path.string());
        }
    }
    int stdin_fd = open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (stdin_fd < 0 || pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        for (int fd : {stdin_fd, out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], scratch_fd}) {
            if (fd >= 0) close(fd);
        }
        return fail("stdio", err, std::string("pipe setup failed: ") + strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {stdin_fd, out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], scratch_fd}) {
            if (fd >= 0) close(fd);
        }
        return fail("fork", err, std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        int report_fd = err_pipe[1];

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        struct sigaction dfl{};
        dfl.sa_handler = SIG_DFL;
        for (int sig : {SIGPIPE, SIGINT, SIGTERM, SIGHUP, SIGCHLD}) {
            sigaction(sig, &dfl, nullptr);
        }

        if (setpgid(0, 0) != 0) child_fail(report_fd, STAGE_SETPGID);

        if (!cgroup_procs.empty()) {
            int fd = open(cgroup_procs.c_str(), O_WRONLY | O_CLOEXEC);
            if (fd < 0 || write(fd, "0", 1) != 1) child_fail(report_fd, STAGE_CGROUP);
            close(fd);
        }

        if (scratch_fd >= 0) {
            if (unshare(unshare_flags) != 0) child_fail(report_fd, STAGE_UNSHARE);
            if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
                child_fail(report_fd, STAGE_MOUNT_PRIVATE);
            }
            if (mount(bundle.c_str(), bundle.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0 ||
                mount(nullptr, bundle.c_str(), nullptr,
                      MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr) != 0) {
                child_fail(report_fd, STAGE_BIND_BUNDLE);
            }
            for (const auto& dir : hide) {
                if (mount("tmpfs", dir.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, "mode=0755,size=64k") != 0) {
                    child_fail(report_fd, STAGE_HIDE_DIR);
                }
            }
            for (const auto& dir : rebuild_chain) {
                if (mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST) child_fail(report_fd, STAGE_BIND_SCRATCH);
            }
            if (mount(scratch_fd_path.c_str(), scratch.c_str(), nullptr, MS_BIND, nullptr) != 0) {
                child_fail(report_fd, STAGE_BIND_SCRATCH);
            }
        }

        struct rlimit no_core{0, 0};
        setrlimit(RLIMIT_CORE, &no_core);
        if (limit_address_space) {
            struct rlimit as{address_space, address_space};
            if (setrlimit(RLIMIT_AS, &as) != 0) child_fail(report_fd, STAGE_RLIMIT);
        }

        if (chdir(working_dir.c_str()) != 0) child_fail(report_fd, STAGE_CHDIR);

        if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
            dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(out_pipe[1], STDERR_FILENO) < 0) {
            child_fail(report_fd, STAGE_STDIO);
        }
        for (int fd = 3; fd < max_fd; ++fd) {
            if (fd != report_fd) close(fd);
        }

        execve(program.c_str(), argv.data(), envp.data());
        child_fail(report_fd, STAGE_EXEC);
    }

    // Parent; repeat setpgid so signals never race the child's own call
    setpgid(pid, pid);
    close(stdin_fd);
    close(out_pipe[1]);
    close(err_pipe[1]);
    if (scratch_fd >= 0) close(scratch_fd);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = read(err_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        child_pid_ = pid;
    }

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reaped_ = true;
        }
        close(out_pipe[0]);
        return fail(stage_name(failure.stage), failure.err,
            std::string(stage_name(failure.stage)) + " failed: " + strerror(failure.err));
    }

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);
    output_fd_ = out_pipe[0];

    set_state(SandboxState::RUNNING);
    spdlog::debug("Sandbox {} launched pid {} ({})", config_.name, pid, spec.program());
    return true;
}

bool Sandbox::signal_group(int signum) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SandboxState::DESTROYED || child_pid_ <= 0) {
        return false;
    }
    return kill(-child_pid_, signum) == 0;
}

std::optional<ExitStatus> Sandbox::try_wait() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (child_pid_ <= 0 || reaped_) {
        return std::nullopt;
    }

    int status = 0;
    struct rusage ru{};
    pid_t r = wait4(child_pid_, &status, WNOHANG, &ru);
    if (r == 0) {
        return std::nullopt;
    }
    if (r < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        // Someone else reaped the child; the exit status is lost
        spdlog::error("Sandbox {}: wait4 failed: {}", config_.name, strerror(errno));
        reaped_ = true;
        state_ = SandboxState::EXITED;
        return ExitStatus{};
    }

    reaped_ = true;
    state_ = SandboxState::EXITED;

    ExitStatus exit;
    if (WIFEXITED(status)) {
        exit.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.term_signal = WTERMSIG(status);
    }
    exit.usage.user_cpu_ms = timeval_ms(ru.ru_utime);
    exit.usage.system_cpu_ms = timeval_ms(ru.ru_stime);
    exit.usage.max_rss_bytes = static_cast<uint64_t>(ru.ru_maxrss) * 1024;
    return exit;
}

void Sandbox::close_output() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }
}

void Sandbox::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SandboxState::DESTROYED) {
        return;
    }

    if (child_pid_ > 0) {
        // Stragglers may outlive the leader
        kill(-child_pid_, SIGKILL);
        if (!reaped_) {
            int status = 0;
            while (waitpid(child_pid_, &status, 0) < 0 && errno == EINTR) {}
            reaped_ = true;
        }
    }

    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }

    cleanup_cgroup();

    std::error_code ec;
    fs::remove_all(config_.root_dir, ec);
    if (ec) {
        spdlog::warn("Sandbox {}: failed to remove {}: {}", config_.name, config_.root_dir, ec.message());
    }

    state_ = SandboxState::DESTROYED;
    spdlog::debug("Sandbox {} destroyed", config_.name);
}

SandboxState Sandbox::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Sandbox::destroyed() const {
    return state() == SandboxState::DESTROYED;
}

void Sandbox::set_state(SandboxState new_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = new_state;
}

SandboxRef Sandbox::to_ref() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SandboxRef ref;
    ref.name = config_.name;
    ref.driver = config_.driver;
    ref.pgid = child_pid_;
    ref.root_dir = config_.root_dir;
    ref.cgroup_path = cgroup_path_;
    ref.container_name = config_.container_name;
    return ref;
}

std::vector<MarkedProcess> find_marked_processes() {
    std::vector<MarkedProcess> found;
    const std::string prefix = std::string(kSandboxMarkerEnv) + "=";

    DIR* proc = opendir("/proc");
    if (!proc) {
        return found;
    }
    struct dirent* entry;
    while ((entry = readdir(proc)) != nullptr) {
        if (entry->d_name[0] < '0' || entry->d_name[0] > '9') continue;
        std::string base = std::string("/proc/") + entry->d_name;

        std::ifstream environ_file(base + "/environ", std::ios::binary);
        std::string var;
        std::string marker;
        while (std::getline(environ_file, var, '\0')) {
            if (var.compare(0, prefix.size(), prefix) == 0) {
                marker = var.substr(prefix.size());
                break;
            }
        }
        if (marker.empty()) continue;

        std::ifstream stat_file(base + "/stat");
        std::string stat;
        if (!std::getline(stat_file, stat)) continue;
        // Fields after the parenthesised comm: state ppid pgrp ...
        size_t close_paren = stat.rfind(')');
        if (close_paren == std::string::npos) continue;
        char state_char;
        int ppid = 0;
        int pgrp = 0;
        if (sscanf(stat.c_str() + close_paren + 1, " %c %d %d", &state_char, &ppid, &pgrp) != 3) continue;
        if (state_char == 'Z') continue;

        found.push_back(MarkedProcess{static_cast<pid_t>(std::atoi(entry->d_name)),
                                      static_cast<pid_t>(pgrp), marker});
    }
    closedir(proc);
    return found;
}

bool kill_marked_group(pid_t pgid, const std::string& marker) {
    if (pgid <= 0) {
        return false;
    }
    for (const auto& process : find_marked_processes()) {
        if (process.pgrp == pgid && process.marker == marker) {
            kill(-pgid, SIGKILL);
            return true;
        }
    }
    return false;
}

void remove_cgroup(const std::string& cgroup_path) {
    std::error_code ec;
    if (cgroup_path.empty() || !fs::exists(cgroup_path, ec)) {
        return;
    }

    if (!write_file(cgroup_path + "/cgroup.kill", "1")) {
        // Kernels before 5.14: kill members one by one
        std::ifstream procs(cgroup_path + "/cgroup.procs");
        pid_t member;
        while (procs >> member) {
            kill(member, SIGKILL);
        }
    }

    for (int attempt = 0; attempt < 50; ++attempt) {
        if (rmdir(cgroup_path.c_str()) == 0 || errno == ENOENT) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    spdlog::warn("Failed to remove cgroup {}: {}", cgroup_path, strerror(errno));
}

} // namespace openfang::runtime
