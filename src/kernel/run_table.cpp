#include "kernel/run_table.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

using openfang::runtime::Run;
using openfang::runtime::RunState;

namespace openfang::kernel {

RunTable::RunTable(StateStore& store, EventBus& events, size_t retain_finished)
    : store_(store)
    , events_(events)
    , retain_finished_(retain_finished) {}

StoreResult RunTable::insert(const Run& run) {
    StoreResult stored = store_.put_run(run);
    if (!stored.success) {
        return stored;
    }

    auto entry = std::make_shared<RunEntry>();
    entry->id = run.id;
    entry->agent_id = run.agent.id;
    entry->output = std::make_shared<runtime::OutputBuffer>(run.agent.limits.max_output_bytes);
    entry->cancel_token = std::make_shared<std::atomic<bool>>(false);
    entry->run = run;
    if (runtime::is_terminal(run.state)) {
        entry->output->append(run.output.data(), run.output.size());
        entry->output->close();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[run.id] = std::move(entry);
    }
    evict_finished();
    return stored;
}

std::shared_ptr<RunEntry> RunTable::find(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(run_id);
    return it == entries_.end() ? nullptr : it->second;
}

TransitionResult RunTable::transition(const std::string& run_id, RunState to,
                                      const std::function<void(Run&)>& mutate) {
    TransitionResult result;
    auto entry = find(run_id);
    if (!entry) {
        result.error = "unknown run " + run_id;
        return result;
    }

    Run committed;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        result.previous = entry->run.state;
        if (!runtime::is_valid_transition(entry->run.state, to)) {
            result.error = std::string("invalid transition ") + runtime::run_state_to_string(entry->run.state) +
                           " -> " + runtime::run_state_to_string(to);
            return result;
        }

        Run next = entry->run;
        if (mutate) {
            mutate(next);
        }
        next.state = to;
        if (to == RunState::RUNNING && next.started_at_ms == 0) {
            next.started_at_ms = runtime::now_ms();
        }
        if (runtime::is_terminal(to)) {
            if (next.finished_at_ms == 0) {
                next.finished_at_ms = runtime::now_ms();
            }
            next.output = entry->output->contents();
            next.output_truncated = entry->output->truncated();
        }

        StoreResult stored = store_.put_run(next);
        result.persisted = stored.success;
        if (!stored.success) {
            result.error = stored.error;
            spdlog::error("Run {}: {} not persisted: {}", run_id, runtime::run_state_to_string(to), stored.error);
        }
        // Memory always follows the state machine so the run can still finish
        entry->run = next;
        result.applied = true;
        committed = std::move(next);
    }

    if (runtime::is_terminal(to)) {
        entry->output->close();
    }

    spdlog::debug("Run {}: {} -> {}", run_id, runtime::run_state_to_string(result.previous),
        runtime::run_state_to_string(to));
    if (to == RunState::RUNNING) {
        events_.emit(EventType::RUN_STARTED, {
            {"run_id", run_id},
            {"agent_id", committed.agent.id},
            {"sandbox", committed.sandbox.name}
        });
    } else if (runtime::is_terminal(to)) {
        events_.emit(EventType::RUN_FINISHED, committed.summary_json());
        evict_finished();
    }
    return result;
}

StoreResult RunTable::update(const std::string& run_id, const std::function<void(Run&)>& mutate) {
    StoreResult result;
    result.key = run_id;
    auto entry = find(run_id);
    if (!entry) {
        result.error = "unknown run " + run_id;
        return result;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (runtime::is_terminal(entry->run.state)) {
        result.error = "run is terminal";
        return result;
    }
    Run next = entry->run;
    mutate(next);
    next.state = entry->run.state;
    result = store_.put_run(next);
    entry->run = std::move(next);
    return result;
}

CancelResult RunTable::request_cancel(const std::string& run_id) {
    CancelResult result;
    auto entry = find(run_id);
    if (!entry) {
        if (auto stored = store_.get_run(run_id)) {
            result.found = true;
            result.state = stored->state;
        }
        return result;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    result.found = true;
    result.state = entry->run.state;
    if (runtime::is_terminal(entry->run.state)) {
        return result;
    }
    result.first_request = !entry->cancel_token->exchange(true);
    return result;
}

std::optional<Run> RunTable::snapshot(const std::string& run_id) const {
    if (auto entry = find(run_id)) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        Run copy = entry->run;
        if (!runtime::is_terminal(copy.state)) {
            copy.output = entry->output->contents();
            copy.output_truncated = entry->output->truncated();
        }
        return copy;
    }
    return store_.get_run(run_id);
}

size_t RunTable::active_for_agent(const std::string& agent_id) const {
    std::vector<std::shared_ptr<RunEntry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            if (entry->agent_id == agent_id) {
                entries.push_back(entry);
            }
        }
    }

    size_t active = 0;
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!runtime::is_terminal(entry->run.state)) {
            ++active;
        }
    }
    return active;
}

std::vector<Run> RunTable::list(size_t limit) const {
    std::vector<Run> runs;
    std::set<std::string> seen;

    for (const auto& entry : entries()) {
        if (auto run = snapshot(entry->id)) {
            seen.insert(run->id);
            runs.push_back(std::move(*run));
        }
    }
    for (auto& run : store_.list_runs()) {
        if (!seen.count(run.id)) {
            runs.push_back(std::move(run));
        }
    }

    std::sort(runs.begin(), runs.end(), [](const Run& a, const Run& b) {
        return a.sequence > b.sequence;
    });
    if (limit > 0 && runs.size() > limit) {
        runs.resize(limit);
    }
    return runs;
}

std::vector<std::shared_ptr<RunEntry>> RunTable::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<RunEntry>> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(entry);
    }
    return out;
}

void RunTable::evict_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<uint64_t, std::string>> finished;
    for (const auto& [id, entry] : entries_) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        if (runtime::is_terminal(entry->run.state)) {
            finished.emplace_back(entry->run.sequence, id);
        }
    }
    if (finished.size() <= retain_finished_) {
        return;
    }
    std::sort(finished.begin(), finished.end());
    size_t excess = finished.size() - retain_finished_;
    for (size_t i = 0; i < excess; ++i) {
        entries_.erase(finished[i].second);
    }
}

} // namespace openfang::kernel
