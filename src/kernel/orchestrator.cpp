#include "kernel/orchestrator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include "core/ids.hpp"
#include "kernel/agent_loader.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

using openfang::runtime::AgentDefinition;
using openfang::runtime::Run;
using openfang::runtime::RunState;

namespace openfang::kernel {

Orchestrator::Orchestrator(Config config)
    : config_(std::move(config)) {}

Orchestrator::~Orchestrator() {
    shutdown();
}

bool Orchestrator::init(std::string* error) {
    if (running_) {
        return true;
    }

    auto fail = [&](const std::string& message) {
        spdlog::error("Orchestrator init failed: {}", message);
        if (error) *error = message;
        dispatcher_.reset();
        provisioner_.reset();
        release_lock();
        return false;
    };

    if (config_.max_concurrent_runs == 0 || config_.queue_capacity == 0) {
        return fail("max_concurrent_runs and queue_capacity must be at least 1");
    }

    for (const auto& dir : {config_.home, config_.state_dir(), config_.sandboxes_dir(), config_.logs_dir()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return fail("cannot create " + dir + ": " + ec.message());
        }
    }

    std::string reason;
    if (!acquire_lock(&reason)) {
        return fail(reason);
    }

    store_ = std::make_unique<StateStore>(config_.state_dir());
    if (!store_->init(&reason)) {
        return fail("state store: " + reason);
    }
    events_ = std::make_unique<EventBus>();
    runs_ = std::make_unique<RunTable>(*store_, *events_);
    queue_ = std::make_unique<TaskQueue>(config_.queue_capacity, config_.max_concurrent_runs);

    runtime::ProvisionerConfig pconfig;
    pconfig.sandboxes_dir = config_.sandboxes_dir();
    pconfig.driver = config_.sandbox_driver;
    pconfig.enable_isolation = config_.enable_isolation;
    pconfig.max_sandboxes = config_.max_sandboxes;
    pconfig.toolchains = config_.toolchains;
    pconfig.container_cli = config_.container_cli;
    pconfig.container_images = config_.container_images;
    pconfig.hidden_dirs = {config_.state_dir(), config_.logs_dir()};
    pconfig.cgroup_root = config_.cgroup_root;
    provisioner_ = std::make_unique<runtime::SandboxProvisioner>(pconfig);
    if (!provisioner_->init(&reason)) {
        return fail("sandbox provisioner: " + reason);
    }

    load_agents();
    reconcile_unfinished();
    recovery_.orphans_swept = provisioner_->sweep_orphans();
    register_bundles();
    readmit_queued();

    RetryPolicy retry;
    retry.max_retries = config_.provision_retries;
    retry.backoff_initial_ms = config_.retry_backoff_ms;
    retry.backoff_multiplier = config_.retry_backoff_multiplier;
    retry.backoff_max_ms = config_.retry_backoff_max_ms;

    SupervisorOptions options;
    options.grace_period = std::chrono::milliseconds(config_.grace_period_ms);

    dispatcher_ = std::make_unique<Dispatcher>(*queue_, *runs_, *provisioner_, *events_, retry, options);
    dispatcher_->start();

    accepting_ = true;
    running_ = true;
    spdlog::info("Orchestrator started: home={} driver={} ceiling={} queue={} agents={}",
        config_.home, provisioner_->driver().name(), config_.max_concurrent_runs,
        config_.queue_capacity, list_agents().size());
    if (recovery_.reconciled || recovery_.readmitted || recovery_.orphans_swept) {
        spdlog::warn("Recovery: {} run(s) reconciled, {} re-admitted, {} orphan(s) swept",
            recovery_.reconciled, recovery_.readmitted, recovery_.orphans_swept);
    }
    return true;
}

void Orchestrator::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    accepting_ = false;
    spdlog::info("Orchestrator shutting down...");

    // No more dequeues; anything already handed to a worker is in flight
    queue_->shutdown();
    size_t cancelled = 0;
    for (const auto& entry : runs_->entries()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (runtime::is_terminal(entry->run.state) || queue_->contains(entry->id)) {
            continue;
        }
        if (!entry->cancel_token->exchange(true)) {
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        spdlog::info("Cancelling {} in-flight run(s)", cancelled);
    }

    dispatcher_->stop();
    provisioner_->cleanup_all();
    release_lock();
    spdlog::info("Orchestrator stopped ({} run(s) left queued)", queue_->size());
}

// ---------------------------------------------------------------------------
// Startup
// ---------------------------------------------------------------------------

bool Orchestrator::acquire_lock(std::string* error) {
    const std::string path = config_.lock_path();
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        *error = "cannot open lock file " + path + ": " + std::strerror(errno);
        return false;
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        *error = err == EWOULDBLOCK
            ? "another openfang process holds " + path
            : "cannot lock " + path + ": " + std::strerror(err);
        return false;
    }

    std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::write(fd, pid.data(), pid.size()) < 0) {
        spdlog::debug("Could not record pid in {}: {}", path, std::strerror(errno));
    }
    lock_fd_ = fd;
    return true;
}

void Orchestrator::release_lock() {
    if (lock_fd_ >= 0) {
        ::flock(lock_fd_, LOCK_UN);
        ::close(lock_fd_);
        lock_fd_ = -1;
    }
}

void Orchestrator::load_agents() {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    for (auto& def : store_->list_agents()) {
        agents_[def.id] = std::move(def);
    }

    uint64_t max_sequence = 0;
    for (const auto& run : store_->list_runs()) {
        max_sequence = std::max(max_sequence, run.sequence);
    }
    next_sequence_ = max_sequence + 1;
}

void Orchestrator::reconcile_unfinished() {
    for (auto& run : store_->list_unfinished_runs()) {
        const RunState previous = run.state;
        if (!run.sandbox.empty()) {
            spdlog::warn("Run {}: releasing sandbox {} left by previous process", run.id, run.sandbox.name);
            provisioner_->force_release(run.sandbox);
        }

        run.state = RunState::SANDBOX_ERROR;
        run.failure_tag = runtime::kTagRecovered;
        run.error_message = std::string("orchestrator restarted while run was ") +
                            runtime::run_state_to_string(previous);
        run.finished_at_ms = runtime::now_ms();

        auto stored = store_->put_run(run);
        if (!stored.success) {
            spdlog::error("Run {}: reconciliation not persisted: {}", run.id, stored.error);
            continue;
        }
        spdlog::warn("Run {}: {} -> SANDBOX_ERROR ({})", run.id,
            runtime::run_state_to_string(previous), runtime::kTagRecovered);
        events_->emit(EventType::RUN_RECOVERED, {
            {"run_id", run.id},
            {"agent_id", run.agent.id},
            {"previous_state", runtime::run_state_to_string(previous)},
            {"sandbox", run.sandbox.name}
        });
        recovery_.reconciled++;
    }
}

void Orchestrator::register_bundles() {
    for (auto& def : scan_bundles(config_.agents_dir, config_.default_limits)) {
        std::string id = def.id;
        auto registered = register_agent(std::move(def));
        if (!registered.success) {
            spdlog::warn("Bundle {} not registered: {}", id, registered.message);
        }
    }
}

std::optional<std::chrono::steady_clock::time_point> Orchestrator::queue_deadline(const Run& run) {
    auto deadline = run.deadline_at_ms();
    if (!deadline) {
        return std::nullopt;
    }
    int64_t left = *deadline - runtime::now_ms();
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max<int64_t>(0, left));
}

void Orchestrator::readmit_queued() {
    for (const auto& run : store_->list_queued_runs()) {
        auto stored = runs_->insert(run);
        if (!stored.success) {
            spdlog::error("Run {}: cannot re-admit: {}", run.id, stored.error);
            continue;
        }
        QueuedRun queued{run.id, run.request.priority, run.sequence, queue_deadline(run)};
        if (queue_->push(queued, true) != PushResult::ADMITTED) {
            spdlog::error("Run {}: re-admission rejected by queue", run.id);
            continue;
        }
        events_->emit(EventType::RUN_QUEUED, {
            {"run_id", run.id},
            {"agent_id", run.agent.id},
            {"priority", run.request.priority},
            {"sequence", run.sequence},
            {"readmitted", true}
        });
        recovery_.readmitted++;
    }
}

// ---------------------------------------------------------------------------
// Agents
// ---------------------------------------------------------------------------

RegisterResult Orchestrator::register_agent(AgentDefinition def) {
    RegisterResult result;
    if (!store_) {
        result.error = OrchestratorError::INVALID_STATE;
        result.message = "orchestrator not initialized";
        return result;
    }
    std::string invalid;
    if (!def.validate(&invalid)) {
        result.error = OrchestratorError::INVALID_ARGUMENT;
        result.message = invalid;
        return result;
    }
    std::error_code ec;
    fs::path bundle = fs::canonical(def.bundle_path, ec);
    if (ec || !fs::is_directory(bundle, ec)) {
        result.error = OrchestratorError::INVALID_ARGUMENT;
        result.message = "bundle directory not found: " + def.bundle_path;
        return result;
    }
    def.bundle_path = bundle.string();

    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(def.id);
    if (it != agents_.end() && it->second.same_definition(def)) {
        result.success = true;
        result.version = it->second.version;
        return result;
    }
    def.version = it == agents_.end() ? 1 : it->second.version + 1;
    def.registered_at_ms = runtime::now_ms();

    auto stored = store_->put_agent(def);
    if (!stored.success) {
        result.error = OrchestratorError::STORE_FAILED;
        result.message = stored.error;
        return result;
    }

    spdlog::info("Agent {} registered (v{}, {})", def.id, def.version, runtime::runtime_kind_to_string(def.runtime));
    if (events_) {
        events_->emit(EventType::AGENT_REGISTERED, {
            {"agent_id", def.id},
            {"version", def.version},
            {"runtime", runtime::runtime_kind_to_string(def.runtime)}
        });
    }
    result.success = true;
    result.changed = true;
    result.version = def.version;
    agents_[def.id] = std::move(def);
    return result;
}

RegisterResult Orchestrator::register_bundle(const std::string& bundle_dir) {
    auto loaded = load_manifest(bundle_dir, config_.default_limits);
    if (!loaded.success) {
        RegisterResult result;
        result.error = OrchestratorError::INVALID_ARGUMENT;
        result.message = loaded.error;
        return result;
    }
    return register_agent(std::move(loaded.definition));
}

RemoveResult Orchestrator::remove_agent(const std::string& agent_id) {
    RemoveResult result;
    std::lock_guard<std::mutex> lock(agents_mutex_);
    if (!agents_.count(agent_id)) {
        result.error = OrchestratorError::NOT_FOUND;
        result.message = "unknown agent " + agent_id;
        return result;
    }

    size_t active = runs_ ? runs_->active_for_agent(agent_id) : 0;
    if (active > 0) {
        result.error = OrchestratorError::AGENT_IN_USE;
        result.message = "agent " + agent_id + " has " + std::to_string(active) + " non-terminal run(s)";
        return result;
    }

    auto deleted = store_->delete_agent(agent_id);
    if (!deleted.success) {
        result.error = OrchestratorError::STORE_FAILED;
        result.message = "cannot delete agent record " + agent_id;
        return result;
    }
    agents_.erase(agent_id);

    spdlog::info("Agent {} removed", agent_id);
    events_->emit(EventType::AGENT_REMOVED, {{"agent_id", agent_id}});
    result.success = true;
    return result;
}

std::optional<AgentDefinition> Orchestrator::get_agent(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AgentDefinition> Orchestrator::list_agents() const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    std::vector<AgentDefinition> agents;
    agents.reserve(agents_.size());
    for (const auto& [id, def] : agents_) {
        agents.push_back(def);
    }
    std::sort(agents.begin(), agents.end(), [](const AgentDefinition& a, const AgentDefinition& b) {
        return a.id < b.id;
    });
    return agents;
}

// ---------------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------------

SubmitResult Orchestrator::submit_run(const runtime::RunRequest& request) {
    SubmitResult result;
    if (!accepting_) {
        result.error = OrchestratorError::SHUTTING_DOWN;
        result.message = "orchestrator is not accepting runs";
        return result;
    }

    if (request.deadline_ms && *request.deadline_ms > runtime::kMaxDurationMs) {
        result.error = OrchestratorError::INVALID_ARGUMENT;
        result.message = "deadline_ms exceeds " + std::to_string(runtime::kMaxDurationMs) + " ms";
        return result;
    }

    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(request.agent_id);
    if (it == agents_.end()) {
        result.error = OrchestratorError::NOT_FOUND;
        result.message = "unknown agent " + request.agent_id;
        return result;
    }
    if (queue_->size() >= queue_->capacity()) {
        result.error = OrchestratorError::QUEUE_FULL;
        result.message = "queue is at capacity (" + std::to_string(queue_->capacity()) + ")";
        spdlog::warn("Run for {} rejected: {}", request.agent_id, result.message);
        return result;
    }

    Run run;
    do {
        run.id = core::generate_run_id();
    } while (runs_->find(run.id));
    run.sequence = next_sequence_++;
    run.request = request;
    run.agent = it->second;
    run.state = RunState::QUEUED;
    run.submitted_at_ms = runtime::now_ms();

    auto stored = runs_->insert(run);
    if (!stored.success) {
        result.error = OrchestratorError::STORE_FAILED;
        result.message = stored.error;
        return result;
    }

    QueuedRun queued{run.id, request.priority, run.sequence, queue_deadline(run)};
    PushResult pushed = queue_->push(queued);
    if (pushed != PushResult::ADMITTED) {
        runs_->transition(run.id, RunState::CANCELLED, [](Run& r) {
            r.error_message = "rejected by queue";
        });
        result.error = pushed == PushResult::CLOSED ? OrchestratorError::SHUTTING_DOWN : OrchestratorError::QUEUE_FULL;
        result.message = "run could not be queued";
        return result;
    }

    spdlog::info("Run {} queued for {} v{} (priority {})", run.id, run.agent.id, run.agent.version, request.priority);
    events_->emit(EventType::RUN_QUEUED, {
        {"run_id", run.id},
        {"agent_id", run.agent.id},
        {"priority", request.priority},
        {"sequence", run.sequence}
    });
    result.success = true;
    result.run_id = run.id;
    return result;
}

StatusResult Orchestrator::get_run_status(const std::string& run_id) const {
    StatusResult result;
    auto run = runs_ ? runs_->snapshot(run_id) : std::nullopt;
    if (!run) {
        result.error = OrchestratorError::NOT_FOUND;
        result.message = "unknown run " + run_id;
        return result;
    }
    result.success = true;
    result.run = std::move(*run);
    return result;
}

CancelRunResult Orchestrator::cancel_run(const std::string& run_id) {
    CancelRunResult result;
    if (!runs_) {
        result.error = OrchestratorError::INVALID_STATE;
        result.message = "orchestrator not initialized";
        return result;
    }

    auto requested = runs_->request_cancel(run_id);
    if (!requested.found) {
        result.error = OrchestratorError::NOT_FOUND;
        result.message = "unknown run " + run_id;
        return result;
    }
    result.success = true;
    result.state = requested.state;
    if (!requested.first_request) {
        return result;
    }

    result.effective = true;
    spdlog::info("Run {}: cancel requested while {}", run_id, runtime::run_state_to_string(requested.state));
    events_->emit(EventType::RUN_CANCEL_REQUESTED, {
        {"run_id", run_id},
        {"state", runtime::run_state_to_string(requested.state)}
    });

    // Still queued: it never reaches a worker. Otherwise the supervisor sees the token.
    if (queue_->remove(run_id)) {
        runs_->transition(run_id, RunState::CANCELLED, [](Run& r) {
            r.error_message = "cancelled while queued";
        });
    }
    if (auto run = runs_->snapshot(run_id)) {
        result.state = run->state;
    }
    return result;
}

StreamResult Orchestrator::stream_output(const std::string& run_id, size_t offset,
                                         std::chrono::milliseconds wait) const {
    StreamResult result;
    if (auto entry = runs_ ? runs_->find(run_id) : nullptr) {
        auto chunk = entry->output->read_from(offset, wait);
        result.success = true;
        result.data = std::move(chunk.data);
        result.next_offset = chunk.next_offset;
        result.terminal = chunk.closed;
        result.truncated = chunk.truncated;
        return result;
    }

    auto run = runs_ ? runs_->snapshot(run_id) : std::nullopt;
    if (!run) {
        result.error = OrchestratorError::NOT_FOUND;
        result.message = "unknown run " + run_id;
        return result;
    }
    result.success = true;
    if (offset < run->output.size()) {
        result.data = run->output.substr(offset);
    }
    result.next_offset = std::max(offset, run->output.size());
    result.terminal = runtime::is_terminal(run->state);
    result.truncated = run->output_truncated;
    return result;
}

std::vector<Run> Orchestrator::list_runs(size_t limit) const {
    return runs_ ? runs_->list(limit) : std::vector<Run>{};
}

StatusResult Orchestrator::wait_for_run(const std::string& run_id, std::chrono::milliseconds timeout) const {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto status = get_run_status(run_id);
        if (!status.success || runtime::is_terminal(status.run.state) ||
            std::chrono::steady_clock::now() >= until) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

// ---------------------------------------------------------------------------
// Events and introspection
// ---------------------------------------------------------------------------

void Orchestrator::subscribe(uint32_t subscriber_id, const std::vector<EventType>& types) {
    if (events_) events_->subscribe(subscriber_id, types);
}

void Orchestrator::unsubscribe(uint32_t subscriber_id) {
    if (events_) events_->unsubscribe(subscriber_id, {}, true);
}

json Orchestrator::poll_events(uint32_t subscriber_id, int max_events) {
    return events_ ? events_->poll(subscriber_id, max_events) : json::array();
}

size_t Orchestrator::queued_runs() const {
    return queue_ ? queue_->size() : 0;
}

size_t Orchestrator::active_runs() const {
    return queue_ ? queue_->active() : 0;
}

size_t Orchestrator::peak_active_runs() const {
    return queue_ ? queue_->peak_active() : 0;
}

} // namespace openfang::kernel
