#include "kernel/supervisor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <thread>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

using openfang::runtime::ExitStatus;
using openfang::runtime::Run;
using openfang::runtime::RunState;

namespace openfang::kernel {

namespace {

using Clock = std::chrono::steady_clock;

// Bounded so a workload flooding the pipe cannot starve deadline checks
constexpr int kMaxReadsPerDrain = 16;

int poll_timeout_ms(std::chrono::milliseconds interval, Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return static_cast<int>(std::max<int64_t>(0, std::min(interval.count(), left.count())));
}

} // namespace

SandboxLease::SandboxLease(runtime::SandboxProvisioner* provisioner, std::shared_ptr<runtime::Sandbox> sandbox)
    : provisioner_(provisioner)
    , sandbox_(std::move(sandbox)) {}

SandboxLease::~SandboxLease() {
    if (sandbox_) {
        spdlog::warn("Sandbox {} released by lease scope exit", sandbox_->name());
        release();
    }
}

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : provisioner_(other.provisioner_)
    , sandbox_(std::move(other.sandbox_)) {
    other.provisioner_ = nullptr;
}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
    if (this != &other) {
        if (sandbox_) {
            release();
        }
        provisioner_ = other.provisioner_;
        sandbox_ = std::move(other.sandbox_);
        other.provisioner_ = nullptr;
    }
    return *this;
}

bool SandboxLease::release() {
    if (!sandbox_ || !provisioner_) {
        return false;
    }
    auto sandbox = std::move(sandbox_);
    sandbox_.reset();
    return provisioner_->release(sandbox);
}

const char* stop_reason_to_string(StopReason reason) {
    switch (reason) {
        case StopReason::NONE:            return "NONE";
        case StopReason::EXITED:          return "EXITED";
        case StopReason::TIMEOUT:         return "TIMEOUT";
        case StopReason::CANCELLED:       return "CANCELLED";
        case StopReason::OUTPUT_OVERFLOW: return "OUTPUT_OVERFLOW";
        case StopReason::FAULT:           return "FAULT";
        default: return "UNKNOWN";
    }
}

ExecutionSupervisor::ExecutionSupervisor(runtime::SandboxProvisioner& provisioner, RunTable& runs,
                                         SupervisorOptions options)
    : provisioner_(provisioner)
    , runs_(runs)
    , options_(options) {}

std::chrono::milliseconds ExecutionSupervisor::timeout_limit(const Run& run) {
    return std::chrono::milliseconds(
        static_cast<int64_t>(std::min(run.agent.limits.timeout_ms, runtime::kMaxDurationMs)));
}

std::chrono::milliseconds ExecutionSupervisor::effective_limit(const Run& run) const {
    auto limit = timeout_limit(run);
    if (auto deadline = run.deadline_at_ms()) {
        int64_t left = *deadline - runtime::now_ms();
        limit = std::min(limit, std::chrono::milliseconds(std::max<int64_t>(0, left)));
    }
    return limit;
}

ProvisionAttempt ExecutionSupervisor::provision(RunEntry& entry) {
    ProvisionAttempt attempt;
    Run run;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        run = entry.run;
    }

    auto provisioned = provisioner_.provision(run.id, run.agent);
    if (!provisioned.success) {
        attempt.error = provisioned.error;
        attempt.message = provisioned.message;
        return attempt;
    }
    SandboxLease lease(&provisioner_, provisioned.sandbox);

    // Durable before launch, so a crash from here on can still find the sandbox
    auto stored = runs_.update(run.id, [&](Run& r) {
        r.sandbox = lease->to_ref();
    });
    if (!stored.success) {
        spdlog::warn("Run {}: sandbox reference not persisted: {}", run.id, stored.error);
    }

    if (entry.cancel_token->load()) {
        lease.release();
        attempt.message = "cancelled before launch";
        return attempt;
    }

    auto spec = provisioner_.prepare_invocation(*lease.get(), run.id, run.agent, run.request.payload);
    auto launched = provisioner_.launch(*lease.get(), spec);
    if (!launched.success) {
        lease.release();
        attempt.error = launched.error;
        attempt.message = launched.message;
        return attempt;
    }

    auto transition = runs_.transition(run.id, RunState::RUNNING, [&](Run& r) {
        r.sandbox = lease->to_ref();
    });
    if (!transition.applied) {
        spdlog::error("Run {}: {}", run.id, transition.error);
        lease.release();
        attempt.message = transition.error;
        return attempt;
    }

    const auto& isolation = lease->isolation_status();
    spdlog::info("Run {} started: agent={} v{} runtime={} sandbox={} pid={}{}",
        run.id, run.agent.id, run.agent.version, runtime::runtime_kind_to_string(run.agent.runtime),
        lease->name(), lease->pid(),
        isolation.is_degraded() ? " (isolation degraded: " + isolation.degraded_reason + ")" : "");

    attempt.success = true;
    attempt.lease = std::move(lease);
    return attempt;
}

bool ExecutionSupervisor::drain_output(runtime::Sandbox& sandbox, runtime::OutputBuffer& output, bool* overflow) {
    int fd = sandbox.output_fd();
    if (fd < 0) {
        return false;
    }
    char buf[8192];
    for (int i = 0; i < kMaxReadsPerDrain; ++i) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (!output.append(buf, static_cast<size_t>(n)) && overflow) {
                *overflow = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        spdlog::warn("Sandbox {}: output read failed: {}", sandbox.name(), strerror(errno));
        return false;
    }
    return true;
}

ExitStatus ExecutionSupervisor::terminate(runtime::Sandbox& sandbox, runtime::OutputBuffer& output) {
    sandbox.signal_group(SIGTERM);

    auto grace_deadline = Clock::now() + options_.grace_period;
    while (Clock::now() < grace_deadline) {
        if (auto status = sandbox.try_wait()) {
            return *status;
        }
        if (sandbox.output_fd() >= 0) {
            pollfd pfd{sandbox.output_fd(), POLLIN, 0};
            if (poll(&pfd, 1, poll_timeout_ms(options_.poll_interval, grace_deadline)) > 0 &&
                !drain_output(sandbox, output, nullptr)) {
                sandbox.close_output();
            }
        } else {
            std::this_thread::sleep_for(options_.poll_interval);
        }
    }

    spdlog::warn("Sandbox {}: grace period expired, killing process group", sandbox.name());
    sandbox.signal_group(SIGKILL);
    // SIGKILL cannot be ignored; only a process stuck in the kernel delays this
    auto kill_deadline = Clock::now() + std::chrono::seconds(10);
    while (Clock::now() < kill_deadline) {
        if (auto status = sandbox.try_wait()) {
            return *status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    throw std::runtime_error("process did not exit after SIGKILL");
}

RunState ExecutionSupervisor::supervise(RunEntry& entry, SandboxLease lease) {
    Run run;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        run = entry.run;
    }
    auto& output = *entry.output;

    const auto started = Clock::now();
    const auto limit = effective_limit(run);
    const auto deadline = started + limit;
    const bool deadline_bound = limit < timeout_limit(run);

    StopReason reason = StopReason::NONE;
    std::optional<ExitStatus> reaped;
    std::string fault;

    try {
        bool pipe_open = lease->output_fd() >= 0;
        bool overflow = false;
        while (true) {
            if (pipe_open) {
                pollfd pfd{lease->output_fd(), POLLIN, 0};
                int rc = poll(&pfd, 1, poll_timeout_ms(options_.poll_interval, deadline));
                if (rc < 0 && errno != EINTR) {
                    throw std::runtime_error(std::string("poll failed: ") + strerror(errno));
                }
                if (rc > 0) {
                    pipe_open = drain_output(*lease.get(), output, &overflow);
                    if (!pipe_open) {
                        lease->close_output();
                    }
                }
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(poll_timeout_ms(options_.poll_interval, deadline)));
            }

            if (overflow) {
                reason = StopReason::OUTPUT_OVERFLOW;
                break;
            }
            if (auto status = lease->try_wait()) {
                // Pick up what the process wrote right before exiting
                if (pipe_open && !drain_output(*lease.get(), output, &overflow)) {
                    lease->close_output();
                }
                reaped = status;
                reason = overflow ? StopReason::OUTPUT_OVERFLOW : StopReason::EXITED;
                break;
            }
            if (entry.cancel_token->load()) {
                reason = StopReason::CANCELLED;
                break;
            }
            if (Clock::now() >= deadline) {
                reason = StopReason::TIMEOUT;
                break;
            }
        }

        if (!reaped) {
            reaped = lease->try_wait();
        }
        if (!reaped) {
            reaped = terminate(*lease.get(), output);
        }
    } catch (const std::exception& e) {
        reason = StopReason::FAULT;
        fault = e.what();
        spdlog::error("Run {}: supervisor fault: {}", run.id, fault);
    }

    ExitStatus exit = reaped.value_or(ExitStatus{});
    exit.usage.wall_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count());

    lease.release();

    RunState state = RunState::SANDBOX_ERROR;
    std::string tag;
    std::string message;
    switch (reason) {
        case StopReason::EXITED:
            state = exit.success() ? RunState::SUCCEEDED : RunState::FAILED;
            if (exit.term_signal) {
                message = "terminated by signal " + std::to_string(*exit.term_signal);
            } else if (exit.exit_code && *exit.exit_code != 0) {
                message = "exit code " + std::to_string(*exit.exit_code);
            }
            break;
        case StopReason::TIMEOUT:
            state = RunState::TIMED_OUT;
            if (deadline_bound) {
                tag = runtime::kTagDeadlineExpired;
                message = "run deadline reached after " + std::to_string(limit.count()) + " ms";
            } else {
                message = "wall-clock limit of " + std::to_string(limit.count()) + " ms exceeded";
            }
            break;
        case StopReason::CANCELLED:
            state = RunState::CANCELLED;
            message = "cancelled while running";
            break;
        case StopReason::OUTPUT_OVERFLOW:
            state = RunState::FAILED;
            tag = runtime::kTagOutputOverflow;
            message = "output exceeded " + std::to_string(output.capacity()) + " bytes";
            break;
        case StopReason::FAULT:
        case StopReason::NONE:
        default:
            state = RunState::SANDBOX_ERROR;
            message = fault.empty() ? "supervision ended unexpectedly" : fault;
            break;
    }

    auto committed = runs_.transition(run.id, state, [&](Run& r) {
        r.exit_code = exit.exit_code;
        r.term_signal = exit.term_signal;
        r.usage = exit.usage;
        r.failure_tag = tag;
        r.error_message = message;
    });
    if (!committed.applied) {
        spdlog::error("Run {}: terminal state not applied: {}", run.id, committed.error);
        return committed.previous;
    }

    spdlog::info("Run {} finished: {} ({}) in {} ms{}", run.id, runtime::run_state_to_string(state),
        stop_reason_to_string(reason), exit.usage.wall_ms, message.empty() ? "" : ": " + message);
    return state;
}

RunState ExecutionSupervisor::finish_unlaunched(RunEntry& entry, RunState state,
                                                const std::string& tag, const std::string& message) {
    auto committed = runs_.transition(entry.id, state, [&](Run& r) {
        r.failure_tag = tag;
        r.error_message = message;
    });
    if (!committed.applied) {
        spdlog::debug("Run {}: {} not applied: {}", entry.id, runtime::run_state_to_string(state), committed.error);
        return committed.previous;
    }
    spdlog::info("Run {} finished: {}{}", entry.id, runtime::run_state_to_string(state),
        message.empty() ? "" : ": " + message);
    return state;
}

} // namespace openfang::kernel
