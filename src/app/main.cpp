#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <signal.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "app/cli_parser.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "kernel/config.hpp"
#include "kernel/orchestrator.hpp"
#include "kernel/state_store.hpp"

using openfang::kernel::Orchestrator;
using openfang::kernel::OrchestratorConfig;
using openfang::runtime::Run;
using openfang::runtime::RunState;

namespace {

sigset_t shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

// Wait up to `timeout` for SIGINT/SIGTERM (blocked in every thread)
bool wait_for_signal(std::chrono::milliseconds timeout) {
    sigset_t set = shutdown_signals();
    timespec ts{};
    ts.tv_sec = timeout.count() / 1000;
    ts.tv_nsec = (timeout.count() % 1000) * 1000000;
    return sigtimedwait(&set, nullptr, &ts) > 0;
}

void print_run(const Run& run, bool as_json) {
    if (as_json) {
        std::cout << run.summary_json().dump(2) << std::endl;
        return;
    }
    std::cout << "id:        " << run.id << "\n"
              << "agent:     " << run.agent.id << " v" << run.agent.version
              << " (" << openfang::runtime::runtime_kind_to_string(run.agent.runtime) << ")\n"
              << "state:     " << openfang::runtime::run_state_to_string(run.state) << "\n"
              << "priority:  " << run.request.priority << "\n";
    if (run.exit_code) std::cout << "exit code: " << *run.exit_code << "\n";
    if (run.term_signal) std::cout << "signal:    " << *run.term_signal << "\n";
    if (!run.failure_tag.empty()) std::cout << "tag:       " << run.failure_tag << "\n";
    if (!run.error_message.empty()) std::cout << "error:     " << run.error_message << "\n";
    if (run.finished_at_ms > 0 && run.started_at_ms > 0) {
        std::cout << "duration:  " << (run.finished_at_ms - run.started_at_ms) << " ms\n";
    }
    std::cout << "output:    " << run.output.size() << " bytes" << (run.output_truncated ? " (truncated)" : "")
              << std::endl;
}

int cmd_start(const OrchestratorConfig& config) {
    Orchestrator orchestrator(config);
    std::string error;
    if (!orchestrator.init(&error)) {
        std::cerr << "openfang: " << error << std::endl;
        return 1;
    }

    spdlog::info("openfang ready (port {} is served by the API layer)", config.port);
    while (!wait_for_signal(std::chrono::milliseconds(1000))) {
    }
    spdlog::info("Signal received");
    orchestrator.shutdown();
    return 0;
}

int cmd_run(const OrchestratorConfig& config, const openfang::app::cli::CliOptions& options) {
    Orchestrator orchestrator(config);
    std::string error;
    if (!orchestrator.init(&error)) {
        std::cerr << "openfang: " << error << std::endl;
        return 1;
    }

    openfang::runtime::RunRequest request;
    request.agent_id = options.agent_id;
    request.payload = options.payload;
    request.priority = options.priority;
    request.deadline_ms = options.deadline_ms;

    auto submitted = orchestrator.submit_run(request);
    if (!submitted.success) {
        std::cerr << "openfang: " << openfang::kernel::orchestrator_error_to_string(submitted.error)
                  << ": " << submitted.message << std::endl;
        return 2;
    }
    const std::string run_id = submitted.run_id;

    std::atomic<bool> done{false};
    std::thread watcher([&]() {
        while (!done) {
            if (wait_for_signal(std::chrono::milliseconds(200))) {
                orchestrator.cancel_run(run_id);
            }
        }
    });

    size_t offset = 0;
    while (true) {
        auto chunk = orchestrator.stream_output(run_id, offset, std::chrono::milliseconds(200));
        if (!chunk.success) {
            break;
        }
        if (!chunk.data.empty()) {
            std::cout << chunk.data << std::flush;
        }
        offset = chunk.next_offset;
        if (chunk.terminal) {
            break;
        }
    }

    done = true;
    watcher.join();

    auto status = orchestrator.wait_for_run(run_id, std::chrono::milliseconds(5000));
    orchestrator.shutdown();
    if (!status.success) {
        std::cerr << "openfang: " << status.message << std::endl;
        return 1;
    }
    std::cerr << "\n";
    print_run(status.run, options.json);
    return status.run.state == RunState::SUCCEEDED ? 0 : 1;
}

int cmd_agents(const OrchestratorConfig& config, bool as_json) {
    openfang::kernel::StateStore store(config.state_dir());
    auto agents = store.list_agents();
    if (as_json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& def : agents) out.push_back(def.to_json());
        std::cout << out.dump(2) << std::endl;
        return 0;
    }
    if (agents.empty()) {
        std::cout << "No agents registered in " << config.state_dir() << std::endl;
        return 0;
    }
    for (const auto& def : agents) {
        std::cout << def.id << "  v" << def.version << "  "
                  << openfang::runtime::runtime_kind_to_string(def.runtime) << "  "
                  << def.entry_point << "  " << def.bundle_path << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int cmd_runs(const OrchestratorConfig& config, size_t limit, bool as_json) {
    openfang::kernel::StateStore store(config.state_dir());
    auto runs = store.list_runs();
    std::sort(runs.begin(), runs.end(), [](const Run& a, const Run& b) {
        return a.sequence > b.sequence;
    });
    if (runs.size() > limit) runs.resize(limit);

    if (as_json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& run : runs) out.push_back(run.summary_json());
        std::cout << out.dump(2) << std::endl;
        return 0;
    }
    for (const auto& run : runs) {
        std::cout << run.id << "  " << openfang::runtime::run_state_to_string(run.state) << "  "
                  << run.agent.id << "  " << run.failure_tag << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int cmd_status(const OrchestratorConfig& config, const std::string& run_id, bool as_json) {
    openfang::kernel::StateStore store(config.state_dir());
    auto run = store.get_run(run_id);
    if (!run) {
        std::cerr << "openfang: unknown run " << run_id << std::endl;
        return 1;
    }
    print_run(*run, as_json);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    openfang::core::config::load_dotenv();

    auto parsed = openfang::app::cli::parse_and_validate(argc, argv);
    if (!parsed.success) {
        std::cerr << "openfang: " << parsed.error << "\n";
        if (!parsed.hint.empty()) std::cerr << parsed.hint << "\n";
        std::cerr << openfang::app::cli::usage();
        return 2;
    }
    const auto& options = parsed.options;
    if (options.home) {
        setenv("OPENFANG_HOME", options.home->c_str(), 1);
    }

    // Every thread (workers included) inherits the blocked set; signals are taken with sigtimedwait
    sigset_t signals = shutdown_signals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    const bool serving = options.command == openfang::app::cli::Command::START ||
                         options.command == openfang::app::cli::Command::RUN;
    OrchestratorConfig config = OrchestratorConfig::load();
    openfang::core::init_logger(serving ? std::filesystem::path(config.logs_dir()) : std::filesystem::path());
    openfang::core::set_log_level(openfang::core::level_from_string(config.log_level));

    switch (options.command) {
        case openfang::app::cli::Command::START:  return cmd_start(config);
        case openfang::app::cli::Command::RUN:    return cmd_run(config, options);
        case openfang::app::cli::Command::AGENTS: return cmd_agents(config, options.json);
        case openfang::app::cli::Command::RUNS:   return cmd_runs(config, options.limit, options.json);
        case openfang::app::cli::Command::STATUS: return cmd_status(config, options.run_id, options.json);
    }
    return 2;
}
