#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "kernel/orchestrator.hpp"
#include "kernel/state_store.hpp"
#include "runtime/sandbox/sandbox.hpp"
#include "test_helpers.hpp"

namespace {

using openfang::kernel::EventType;
using openfang::kernel::Orchestrator;
using openfang::kernel::OrchestratorConfig;
using openfang::kernel::OrchestratorError;
using openfang::kernel::StateStore;
using openfang::runtime::AgentDefinition;
using openfang::runtime::Run;
using openfang::runtime::RunRequest;
using openfang::runtime::RunState;
using openfang::testing::TempWorkspace;
using openfang::testing::eventually;
using namespace std::chrono_literals;

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorConfig make_config(size_t ceiling = 2) const {
        OrchestratorConfig config;
        config.home = (workspace_.root() / "home").string();
        config.agents_dir = (workspace_.root() / "agents").string();
        config.enable_isolation = false;
        config.max_concurrent_runs = ceiling;
        config.queue_capacity = 32;
        config.grace_period_ms = 500;
        config.retry_backoff_ms = 10;
        config.log_level = "warn";
        return config;
    }

    std::unique_ptr<Orchestrator> start(const OrchestratorConfig& config) {
        auto orchestrator = std::make_unique<Orchestrator>(config);
        std::string error;
        EXPECT_TRUE(orchestrator->init(&error)) << error;
        return orchestrator;
    }

    AgentDefinition shell_agent(const std::string& id, const std::string& script, uint64_t timeout_ms = 5000) {
        return openfang::testing::shell_agent(bundles(), id, script, timeout_ms);
    }

    AgentDefinition add_agent(Orchestrator& orchestrator, const AgentDefinition& def) {
        auto registered = orchestrator.register_agent(def);
        EXPECT_TRUE(registered.success) << registered.message;
        return def;
    }

    std::string submit(Orchestrator& orchestrator, const std::string& agent_id, const std::string& payload = "",
                       int32_t priority = 0, std::optional<uint64_t> deadline_ms = std::nullopt) {
        RunRequest request;
        request.agent_id = agent_id;
        request.payload = payload;
        request.priority = priority;
        request.deadline_ms = deadline_ms;
        auto submitted = orchestrator.submit_run(request);
        EXPECT_TRUE(submitted.success) << submitted.message;
        return submitted.run_id;
    }

    openfang::runtime::Run finish(const Orchestrator& orchestrator, const std::string& run_id,
               std::chrono::milliseconds timeout = 15000ms) {
        auto status = orchestrator.wait_for_run(run_id, timeout);
        EXPECT_TRUE(status.success) << status.message;
        EXPECT_TRUE(openfang::runtime::is_terminal(status.run.state)) << run_id << " still "
            << openfang::runtime::run_state_to_string(status.run.state);
        return status.run;
    }

    bool reaches(const Orchestrator& orchestrator, const std::string& run_id, RunState state) {
        return eventually([&]() { return orchestrator.get_run_status(run_id).run.state == state; }, 10000ms);
    }

    std::filesystem::path bundles() const { return workspace_.root() / "bundles"; }

    TempWorkspace workspace_{"orchestrator"};
};

TEST_F(OrchestratorTest, NativeAgentSucceedsWithPayloadOnStdin) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("echo", "cat; echo; echo \"$OPENFANG_AGENT_ID\""));

    auto run = finish(*orchestrator, submit(*orchestrator, "echo", "ping"));
    EXPECT_EQ(run.state, RunState::SUCCEEDED);
    EXPECT_EQ(run.output, "ping\necho\n");
    EXPECT_EQ(run.exit_code, 0);
    EXPECT_GT(run.started_at_ms, 0);
    EXPECT_GE(run.finished_at_ms, run.started_at_ms);
    EXPECT_TRUE(eventually([&]() { return orchestrator->provisioner().live_count() == 0; }));
}

TEST_F(OrchestratorTest, PythonAgentPrintsOk) {
    if (!openfang::testing::has_executable("python3")) {
        GTEST_SKIP() << "python3 not installed";
    }
    auto orchestrator = start(make_config());

    AgentDefinition def;
    def.id = "py-ok";
    def.runtime = openfang::runtime::RuntimeKind::PYTHON;
    def.entry_point = "main.py";
    def.bundle_path = (bundles() / "py-ok").string();
    openfang::testing::write_file(bundles() / "py-ok" / "main.py",
        "import sys\nsys.stdin.read()\nprint(\"ok\")\n");
    add_agent(*orchestrator, def);

    auto run = finish(*orchestrator, submit(*orchestrator, "py-ok", "{}"));
    EXPECT_EQ(run.state, RunState::SUCCEEDED) << run.error_message << " " << run.output;
    EXPECT_EQ(run.output, "ok\n");
}

TEST_F(OrchestratorTest, JavaAgentSleepingPastTimeoutIsTimedOut) {
    if (!openfang::testing::has_executable("java")) {
        GTEST_SKIP() << "java not installed";
    }
    auto orchestrator = start(make_config());

    AgentDefinition def;
    def.id = "java-sleep";
    def.runtime = openfang::runtime::RuntimeKind::JAVA;
    def.entry_point = "Sleep.java";
    def.bundle_path = (bundles() / "java-sleep").string();
    def.limits.timeout_ms = 2000;
    openfang::testing::write_file(bundles() / "java-sleep" / "Sleep.java",
        "public class Sleep {\n"
        "    public static void main(String[] args) throws Exception {\n"
        "        Thread.sleep(10000);\n"
        "    }\n"
        "}\n");
    add_agent(*orchestrator, def);

    auto run = finish(*orchestrator, submit(*orchestrator, "java-sleep"));
    EXPECT_EQ(run.state, RunState::TIMED_OUT);
    EXPECT_LE(run.finished_at_ms - run.started_at_ms, 2000 + 500 + 1500);
    EXPECT_TRUE(eventually([&]() { return orchestrator->provisioner().live_count() == 0; }));
}

TEST_F(OrchestratorTest, TimeoutTerminatesWithinGracePeriod) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("slow", "sleep 10", 300));

    auto run = finish(*orchestrator, submit(*orchestrator, "slow"));
    EXPECT_EQ(run.state, RunState::TIMED_OUT);
    EXPECT_TRUE(run.failure_tag.empty());
    EXPECT_LE(run.finished_at_ms - run.started_at_ms, 300 + 500 + 1500);
}

TEST_F(OrchestratorTest, IgnoredTermEscalatesToKill) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("stubborn", "trap '' TERM\nwhile :; do sleep 0.05; done", 300));

    auto run = finish(*orchestrator, submit(*orchestrator, "stubborn"));
    EXPECT_EQ(run.state, RunState::TIMED_OUT);
    ASSERT_TRUE(run.term_signal.has_value());
    EXPECT_EQ(*run.term_signal, SIGKILL);
    EXPECT_LE(run.finished_at_ms - run.started_at_ms, 300 + 500 + 1500);
    EXPECT_TRUE(eventually([&]() { return orchestrator->provisioner().live_count() == 0; }));
}

TEST_F(OrchestratorTest, NonZeroExitFailsWithoutRetry) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("exit7", "echo partial; exit 7"));

    auto run = finish(*orchestrator, submit(*orchestrator, "exit7"));
    EXPECT_EQ(run.state, RunState::FAILED);
    EXPECT_EQ(run.exit_code, 7);
    EXPECT_EQ(run.output, "partial\n");
    EXPECT_EQ(run.provision_attempts, 1u);
}

TEST_F(OrchestratorTest, OutputOverflowStopsRun) {
    auto orchestrator = start(make_config());
    auto def = shell_agent("chatty", "while :; do echo xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx; done");
    def.limits.max_output_bytes = 1024;
    add_agent(*orchestrator, def);

    auto run = finish(*orchestrator, submit(*orchestrator, "chatty"));
    EXPECT_EQ(run.state, RunState::FAILED);
    EXPECT_EQ(run.failure_tag, openfang::runtime::kTagOutputOverflow);
    EXPECT_TRUE(run.output_truncated);
    EXPECT_LE(run.output.size(), 1024u);
    EXPECT_GT(run.output.size(), 0u);
}

TEST_F(OrchestratorTest, CeilingOfOneRunsInSubmissionOrder) {
    auto orchestrator = start(make_config(1));
    add_agent(*orchestrator, shell_agent("step", "sleep 0.2; echo done"));

    auto first = submit(*orchestrator, "step");
    auto second = submit(*orchestrator, "step");
    auto third = submit(*orchestrator, "step");

    ASSERT_TRUE(reaches(*orchestrator, first, RunState::RUNNING));
    EXPECT_EQ(orchestrator->get_run_status(second).run.state, RunState::QUEUED);
    EXPECT_EQ(orchestrator->get_run_status(third).run.state, RunState::QUEUED);

    auto r1 = finish(*orchestrator, first);
    auto r2 = finish(*orchestrator, second);
    auto r3 = finish(*orchestrator, third);
    for (const auto* run : {&r1, &r2, &r3}) {
        EXPECT_EQ(run->state, RunState::SUCCEEDED);
    }
    EXPECT_GE(r2.started_at_ms, r1.finished_at_ms);
    EXPECT_GE(r3.started_at_ms, r2.finished_at_ms);
    EXPECT_EQ(orchestrator->peak_active_runs(), 1u);
}

TEST_F(OrchestratorTest, HigherPriorityDequeuesFirst) {
    auto orchestrator = start(make_config(1));
    add_agent(*orchestrator, shell_agent("blocker", "sleep 0.3"));
    add_agent(*orchestrator, shell_agent("echo", "echo hi"));

    auto blocker = submit(*orchestrator, "blocker");
    ASSERT_TRUE(reaches(*orchestrator, blocker, RunState::RUNNING));
    auto low = submit(*orchestrator, "echo", "", 0);
    auto high = submit(*orchestrator, "echo", "", 10);

    auto low_run = finish(*orchestrator, low);
    auto high_run = finish(*orchestrator, high);
    EXPECT_EQ(high_run.state, RunState::SUCCEEDED);
    EXPECT_GE(low_run.started_at_ms, high_run.finished_at_ms);
}

TEST_F(OrchestratorTest, ConcurrentSubmissionsNeverExceedCeiling) {
    auto orchestrator = start(make_config(2));
    add_agent(*orchestrator, shell_agent("quick", "sleep 0.05; echo ok"));

    std::vector<std::string> ids(24);
    std::vector<std::thread> clients;
    for (int c = 0; c < 8; ++c) {
        clients.emplace_back([&, c]() {
            for (int i = 0; i < 3; ++i) {
                RunRequest request;
                request.agent_id = "quick";
                ids[static_cast<size_t>(c * 3 + i)] = orchestrator->submit_run(request).run_id;
            }
        });
    }
    for (auto& client : clients) {
        client.join();
    }

    for (const auto& id : ids) {
        ASSERT_FALSE(id.empty());
        EXPECT_EQ(finish(*orchestrator, id, 30000ms).state, RunState::SUCCEEDED);
    }
    EXPECT_LE(orchestrator->peak_active_runs(), 2u);
    EXPECT_TRUE(eventually([&]() { return orchestrator->provisioner().live_count() == 0; }));
    EXPECT_EQ(orchestrator->provisioner().released_count(), 24u);
}

TEST_F(OrchestratorTest, CancelQueuedRunNeverStartsIt) {
    auto orchestrator = start(make_config(1));
    add_agent(*orchestrator, shell_agent("blocker", "sleep 5", 10000));
    add_agent(*orchestrator, shell_agent("echo", "echo hi"));

    auto blocker = submit(*orchestrator, "blocker");
    ASSERT_TRUE(reaches(*orchestrator, blocker, RunState::RUNNING));
    auto queued = submit(*orchestrator, "echo");

    auto cancelled = orchestrator->cancel_run(queued);
    ASSERT_TRUE(cancelled.success);
    EXPECT_TRUE(cancelled.effective);
    EXPECT_EQ(cancelled.state, RunState::CANCELLED);

    auto again = orchestrator->cancel_run(queued);
    EXPECT_TRUE(again.success);
    EXPECT_FALSE(again.effective);

    auto cancel_started = std::chrono::steady_clock::now();
    EXPECT_TRUE(orchestrator->cancel_run(blocker).effective);
    auto blocker_run = finish(*orchestrator, blocker);
    EXPECT_EQ(blocker_run.state, RunState::CANCELLED);
    EXPECT_LT(std::chrono::steady_clock::now() - cancel_started, 500ms + 1500ms);

    auto queued_run = orchestrator->get_run_status(queued).run;
    EXPECT_EQ(queued_run.state, RunState::CANCELLED);
    EXPECT_EQ(queued_run.started_at_ms, 0);
    EXPECT_TRUE(queued_run.sandbox.empty());
    EXPECT_TRUE(eventually([&]() { return orchestrator->provisioner().released_count() == 1; }));
}

TEST_F(OrchestratorTest, RejectsWhenQueueIsFull) {
    auto config = make_config(1);
    config.queue_capacity = 1;
    auto orchestrator = start(config);
    add_agent(*orchestrator, shell_agent("blocker", "sleep 5", 10000));

    auto blocker = submit(*orchestrator, "blocker");
    ASSERT_TRUE(reaches(*orchestrator, blocker, RunState::RUNNING));
    auto waiting = submit(*orchestrator, "blocker");

    RunRequest request;
    request.agent_id = "blocker";
    auto rejected = orchestrator->submit_run(request);
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.error, OrchestratorError::QUEUE_FULL);
    EXPECT_EQ(orchestrator->queued_runs(), 1u);

    orchestrator->cancel_run(waiting);
    orchestrator->cancel_run(blocker);
    EXPECT_EQ(finish(*orchestrator, blocker).state, RunState::CANCELLED);
}

TEST_F(OrchestratorTest, UnknownIdsAreNotFound) {
    auto orchestrator = start(make_config());

    RunRequest request;
    request.agent_id = "ghost";
    EXPECT_EQ(orchestrator->submit_run(request).error, OrchestratorError::NOT_FOUND);
    EXPECT_EQ(orchestrator->get_run_status("run-nope").error, OrchestratorError::NOT_FOUND);
    EXPECT_EQ(orchestrator->cancel_run("run-nope").error, OrchestratorError::NOT_FOUND);
    EXPECT_EQ(orchestrator->stream_output("run-nope", 0, 0ms).error, OrchestratorError::NOT_FOUND);
    EXPECT_EQ(orchestrator->remove_agent("ghost").error, OrchestratorError::NOT_FOUND);
}

TEST_F(OrchestratorTest, RejectsInvalidDefinitions) {
    auto orchestrator = start(make_config());

    auto def = shell_agent("valid", "true");
    def.bundle_path = (workspace_.root() / "missing-bundle").string();
    EXPECT_EQ(orchestrator->register_agent(def).error, OrchestratorError::INVALID_ARGUMENT);

    def = shell_agent("escape", "true");
    def.entry_point = "../escape.sh";
    EXPECT_EQ(orchestrator->register_agent(def).error, OrchestratorError::INVALID_ARGUMENT);

    def = shell_agent("zero", "true");
    def.limits.max_output_bytes = 0;
    EXPECT_EQ(orchestrator->register_agent(def).error, OrchestratorError::INVALID_ARGUMENT);
    EXPECT_TRUE(orchestrator->list_agents().empty());
}

TEST_F(OrchestratorTest, ReRegistrationBumpsVersionAndPinsQueuedRuns) {
    auto orchestrator = start(make_config(1));
    add_agent(*orchestrator, shell_agent("blocker", "sleep 0.3"));
    auto def = shell_agent("echo", "echo \"$OPENFANG_AGENT_VERSION\"");

    auto first = orchestrator->register_agent(def);
    ASSERT_TRUE(first.success);
    EXPECT_EQ(first.version, 1u);
    EXPECT_TRUE(first.changed);

    auto same = orchestrator->register_agent(def);
    EXPECT_TRUE(same.success);
    EXPECT_FALSE(same.changed);
    EXPECT_EQ(same.version, 1u);

    auto blocker = submit(*orchestrator, "blocker");
    ASSERT_TRUE(reaches(*orchestrator, blocker, RunState::RUNNING));
    auto pinned = submit(*orchestrator, "echo");

    def.limits.timeout_ms = 7000;
    auto updated = orchestrator->register_agent(def);
    EXPECT_TRUE(updated.changed);
    EXPECT_EQ(updated.version, 2u);
    EXPECT_EQ(orchestrator->get_agent("echo")->version, 2u);

    auto run = finish(*orchestrator, pinned);
    EXPECT_EQ(run.agent.version, 1u);
    EXPECT_EQ(run.output, "1\n");
    EXPECT_EQ(finish(*orchestrator, submit(*orchestrator, "echo")).output, "2\n");
}

TEST_F(OrchestratorTest, RemovalWaitsForActiveRuns) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("sleeper", "sleep 30", 60000));

    auto run_id = submit(*orchestrator, "sleeper");
    ASSERT_TRUE(reaches(*orchestrator, run_id, RunState::RUNNING));
    EXPECT_EQ(orchestrator->remove_agent("sleeper").error, OrchestratorError::AGENT_IN_USE);

    orchestrator->cancel_run(run_id);
    EXPECT_EQ(finish(*orchestrator, run_id).state, RunState::CANCELLED);

    EXPECT_TRUE(orchestrator->remove_agent("sleeper").success);
    EXPECT_FALSE(orchestrator->get_agent("sleeper").has_value());
    RunRequest request;
    request.agent_id = "sleeper";
    EXPECT_EQ(orchestrator->submit_run(request).error, OrchestratorError::NOT_FOUND);

    // History survives removal
    EXPECT_EQ(orchestrator->get_run_status(run_id).run.agent.id, "sleeper");
}

TEST_F(OrchestratorTest, DeadlinePassedWhileQueuedCancelsRun) {
    auto orchestrator = start(make_config(1));
    add_agent(*orchestrator, shell_agent("blocker", "sleep 0.5"));
    add_agent(*orchestrator, shell_agent("echo", "echo hi"));

    auto blocker = submit(*orchestrator, "blocker");
    ASSERT_TRUE(reaches(*orchestrator, blocker, RunState::RUNNING));
    auto late = submit(*orchestrator, "echo", "", 0, 100);

    auto run = finish(*orchestrator, late);
    EXPECT_EQ(run.state, RunState::CANCELLED);
    EXPECT_EQ(run.failure_tag, openfang::runtime::kTagDeadlineExpired);
    EXPECT_EQ(run.started_at_ms, 0);
}

TEST_F(OrchestratorTest, DeadlinePassedWhileEverySlotIsBusy) {
    auto orchestrator = start(make_config(1));
    add_agent(*orchestrator, shell_agent("blocker", "sleep 2", 10000));
    add_agent(*orchestrator, shell_agent("echo", "echo hi"));

    auto blocker = submit(*orchestrator, "blocker");
    ASSERT_TRUE(reaches(*orchestrator, blocker, RunState::RUNNING));
    auto late = submit(*orchestrator, "echo", "", 0, 200);

    ASSERT_TRUE(eventually([&]() {
        return orchestrator->get_run_status(late).run.state == RunState::CANCELLED;
    }, 1200ms));
    EXPECT_EQ(orchestrator->get_run_status(blocker).run.state, RunState::RUNNING);
    EXPECT_EQ(orchestrator->get_run_status(late).run.failure_tag, openfang::runtime::kTagDeadlineExpired);
    EXPECT_EQ(finish(*orchestrator, blocker).state, RunState::SUCCEEDED);
}

TEST_F(OrchestratorTest, RejectsDeadlineBeyondMaximum) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("echo", "echo hi"));

    RunRequest request;
    request.agent_id = "echo";
    request.deadline_ms = std::numeric_limits<uint64_t>::max();
    auto rejected = orchestrator->submit_run(request);
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.error, OrchestratorError::INVALID_ARGUMENT);

    auto run = finish(*orchestrator, submit(*orchestrator, "echo", "", 0, openfang::runtime::kMaxDurationMs));
    EXPECT_EQ(run.state, RunState::SUCCEEDED);
    EXPECT_EQ(run.output, "hi\n");
}

TEST_F(OrchestratorTest, RejectsTimeoutBeyondMaximum) {
    auto orchestrator = start(make_config());
    auto def = shell_agent("forever", "sleep 0.3; echo ok", std::numeric_limits<uint64_t>::max());
    auto rejected = orchestrator->register_agent(def);
    EXPECT_FALSE(rejected.success);
    EXPECT_EQ(rejected.error, OrchestratorError::INVALID_ARGUMENT);

    def.limits.timeout_ms = openfang::runtime::kMaxDurationMs;
    add_agent(*orchestrator, def);
    auto run = finish(*orchestrator, submit(*orchestrator, "forever"));
    EXPECT_EQ(run.state, RunState::SUCCEEDED);
    EXPECT_EQ(run.output, "ok\n");
}

TEST_F(OrchestratorTest, DeadlineBoundsRunningRun) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("slow", "sleep 5", 10000));

    auto run = finish(*orchestrator, submit(*orchestrator, "slow", "", 0, 300));
    EXPECT_EQ(run.state, RunState::TIMED_OUT);
    EXPECT_EQ(run.failure_tag, openfang::runtime::kTagDeadlineExpired);
    EXPECT_LE(run.finished_at_ms - run.submitted_at_ms, 300 + 500 + 1500);
}

TEST_F(OrchestratorTest, StreamsOutputWhileRunning) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("ticker", "echo one; sleep 0.3; echo two"));
    auto run_id = submit(*orchestrator, "ticker");

    std::string collected;
    size_t offset = 0;
    auto until = std::chrono::steady_clock::now() + 10s;
    while (std::chrono::steady_clock::now() < until) {
        auto chunk = orchestrator->stream_output(run_id, offset, 200ms);
        ASSERT_TRUE(chunk.success);
        collected += chunk.data;
        offset = chunk.next_offset;
        if (chunk.terminal) break;
    }
    EXPECT_EQ(collected, "one\ntwo\n");

    auto tail = orchestrator->stream_output(run_id, 4, 0ms);
    EXPECT_EQ(tail.data, "two\n");
    EXPECT_TRUE(tail.terminal);
}

TEST_F(OrchestratorTest, PublishesLifecycleEvents) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("echo", "echo hi"));
    orchestrator->subscribe(1, {EventType::RUN_QUEUED, EventType::RUN_STARTED, EventType::RUN_FINISHED});

    auto run_id = submit(*orchestrator, "echo");
    std::vector<std::string> types;
    ASSERT_TRUE(eventually([&]() {
        for (const auto& event : orchestrator->poll_events(1, 10)) {
            types.push_back(event["type"].get<std::string>());
        }
        return types.size() >= 3;
    }));
    EXPECT_EQ(types, (std::vector<std::string>{"RUN_QUEUED", "RUN_STARTED", "RUN_FINISHED"}));

    orchestrator->unsubscribe(1);
    submit(*orchestrator, "echo");
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(orchestrator->poll_events(1, 10).empty());
}

TEST_F(OrchestratorTest, RegistersBundlesAtStartupIdempotently) {
    auto config = make_config();
    auto bundle = std::filesystem::path(config.agents_dir) / "hello";
    openfang::testing::write_file(bundle / "agent.json", R"({"runtime": "native", "entry": "run.sh"})");
    openfang::testing::write_file(bundle / "run.sh", "#!/bin/sh\necho hello\n", true);

    {
        auto orchestrator = start(config);
        auto def = orchestrator->get_agent("hello");
        ASSERT_TRUE(def.has_value());
        EXPECT_EQ(def->version, 1u);
        EXPECT_EQ(finish(*orchestrator, submit(*orchestrator, "hello")).output, "hello\n");
    }

    auto restarted = start(config);
    EXPECT_EQ(restarted->get_agent("hello")->version, 1u);
    EXPECT_EQ(restarted->list_runs(0).size(), 1u);
}

TEST_F(OrchestratorTest, SecondInstanceOnSameHomeIsRefused) {
    auto config = make_config();
    auto first = start(config);

    Orchestrator second(config);
    std::string error;
    EXPECT_FALSE(second.init(&error));
    EXPECT_NE(error.find("another openfang process"), std::string::npos);

    first->shutdown();
    EXPECT_TRUE(second.init(&error)) << error;
}

TEST_F(OrchestratorTest, ShutdownRejectsNewRuns) {
    auto orchestrator = start(make_config());
    add_agent(*orchestrator, shell_agent("echo", "echo hi"));
    orchestrator->shutdown();
    EXPECT_FALSE(orchestrator->is_running());

    RunRequest request;
    request.agent_id = "echo";
    EXPECT_EQ(orchestrator->submit_run(request).error, OrchestratorError::SHUTTING_DOWN);
}

TEST_F(OrchestratorTest, QueuedRunsAreReadmittedAfterRestart) {
    auto config = make_config(1);
    std::string blocker, q1, q2;
    {
        auto first = start(config);
        add_agent(*first, shell_agent("blocker", "sleep 30", 60000));
        add_agent(*first, shell_agent("echo", "echo again"));
        blocker = submit(*first, "blocker");
        ASSERT_TRUE(reaches(*first, blocker, RunState::RUNNING));
        q1 = submit(*first, "echo");
        q2 = submit(*first, "echo");
        first->shutdown();

        EXPECT_EQ(first->get_run_status(blocker).run.state, RunState::CANCELLED);
        EXPECT_EQ(first->get_run_status(q1).run.state, RunState::QUEUED);
        EXPECT_EQ(first->provisioner().live_count(), 0u);
    }

    auto second = start(config);
    EXPECT_EQ(second->recovery().readmitted, 2u);
    EXPECT_EQ(second->recovery().reconciled, 0u);

    auto r1 = finish(*second, q1);
    auto r2 = finish(*second, q2);
    EXPECT_EQ(r1.state, RunState::SUCCEEDED);
    EXPECT_EQ(r2.state, RunState::SUCCEEDED);
    EXPECT_GE(r2.started_at_ms, r1.finished_at_ms);
    EXPECT_EQ(r1.output, "again\n");
}

// A workload left behind by a crashed process, in its own group and carrying the sandbox marker
pid_t spawn_orphan(const std::string& marker) {
    std::string sleep_path = openfang::core::paths::find_executable("sleep")->string();
    std::string env = std::string(openfang::runtime::kSandboxMarkerEnv) + "=" + marker;
    std::string arg0 = "sleep";
    std::string arg1 = "30";
    char* argv[] = {arg0.data(), arg1.data(), nullptr};
    char* envp[] = {env.data(), nullptr};

    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        execve(sleep_path.c_str(), argv, envp);
        _exit(127);
    }
    setpgid(pid, pid);
    return pid;
}

TEST_F(OrchestratorTest, ReconcilesRunsInterruptedByCrash) {
    auto config = make_config();
    std::filesystem::create_directories(config.sandboxes_dir());
    auto root = std::filesystem::canonical(config.sandboxes_dir()) / "sbx-run-crashed";
    std::filesystem::create_directories(root / "scratch");

    pid_t orphan = spawn_orphan(root.string());
    ASSERT_GT(orphan, 0);
    ASSERT_TRUE(eventually([&]() {
        for (const auto& process : openfang::runtime::find_marked_processes()) {
            if (process.pid == orphan) return true;
        }
        return false;
    }));

    {
        StateStore store(config.state_dir());
        std::string error;
        ASSERT_TRUE(store.init(&error)) << error;

        openfang::runtime::Run running;
        running.id = "run-crashed";
        running.sequence = 7;
        running.agent = shell_agent("echo", "echo hi");
        running.request.agent_id = "echo";
        running.state = RunState::RUNNING;
        running.started_at_ms = openfang::runtime::now_ms();
        running.sandbox.name = "sbx-run-crashed";
        running.sandbox.driver = "process";
        running.sandbox.pgid = orphan;
        running.sandbox.root_dir = root.string();
        ASSERT_TRUE(store.put_run(running).success);

        openfang::runtime::Run provisioning = running;
        provisioning.id = "run-provisioning";
        provisioning.sequence = 8;
        provisioning.state = RunState::PROVISIONING;
        provisioning.sandbox = {};
        ASSERT_TRUE(store.put_run(provisioning).success);
        ASSERT_TRUE(store.put_agent(provisioning.agent).success);
    }

    auto orchestrator = start(config);
    EXPECT_EQ(orchestrator->recovery().reconciled, 2u);

    auto crashed = orchestrator->get_run_status("run-crashed").run;
    EXPECT_EQ(crashed.state, RunState::SANDBOX_ERROR);
    EXPECT_EQ(crashed.failure_tag, openfang::runtime::kTagRecovered);
    EXPECT_NE(crashed.error_message.find("RUNNING"), std::string::npos);
    EXPECT_EQ(orchestrator->get_run_status("run-provisioning").run.state, RunState::SANDBOX_ERROR);

    int status = 0;
    ASSERT_TRUE(eventually([&]() { return waitpid(orphan, &status, WNOHANG) == orphan; }));
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
    EXPECT_FALSE(std::filesystem::exists(root));

    // Admission continues after the recovered sequence numbers
    auto next = submit(*orchestrator, "echo");
    EXPECT_EQ(orchestrator->get_run_status(next).run.sequence, 9u);
    EXPECT_EQ(finish(*orchestrator, next).state, RunState::SUCCEEDED);
}

} // namespace
