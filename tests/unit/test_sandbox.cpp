#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "runtime/adapters/adapters.hpp"
#include "runtime/sandbox/drivers.hpp"
#include "runtime/sandbox/sandbox.hpp"
#include "test_helpers.hpp"

namespace {

using openfang::runtime::ContainerDriver;
using openfang::runtime::ExitStatus;
using openfang::runtime::InvocationSpec;
using openfang::runtime::ProcessDriver;
using openfang::runtime::PythonAdapter;
using openfang::runtime::Sandbox;
using openfang::runtime::SandboxConfig;
using openfang::runtime::SandboxState;
using openfang::runtime::StartError;
using openfang::testing::TempWorkspace;
using namespace std::chrono_literals;

SandboxConfig process_config(const TempWorkspace& workspace, const std::string& name) {
    SandboxConfig config;
    config.name = name;
    config.root_dir = (workspace.root() / "sandboxes" / name).string();
    config.bundle_dir = (workspace.root() / "bundle").string();
    std::filesystem::create_directories(config.bundle_dir);
    return config;
}

InvocationSpec shell(const std::string& script, const std::string& stdin_data = "") {
    InvocationSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.stdin_data = stdin_data;
    return spec;
}

// Read the pipe to EOF and reap the workload
std::string collect(Sandbox& sandbox, ExitStatus* exit) {
    std::string out;
    char buf[4096];
    auto until = std::chrono::steady_clock::now() + 10s;
    bool open = true;
    while (std::chrono::steady_clock::now() < until) {
        if (open) {
            ssize_t n = read(sandbox.output_fd(), buf, sizeof(buf));
            if (n > 0) {
                out.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) open = false;
        }
        if (!open) {
            if (auto status = sandbox.try_wait()) {
                *exit = *status;
                break;
            }
        }
        std::this_thread::sleep_for(5ms);
    }
    return out;
}

TEST(SandboxTest, RunsWorkloadWithPayloadAndReportsExitCode) {
    TempWorkspace workspace("sandbox");
    Sandbox sandbox(process_config(workspace, "sbx-exit"));

    std::string error;
    ASSERT_TRUE(sandbox.create(&error)) << error;
    EXPECT_EQ(sandbox.state(), SandboxState::READY);
    EXPECT_TRUE(std::filesystem::is_directory(sandbox.scratch_dir()));

    StartError start_error;
    ASSERT_TRUE(sandbox.start(shell("cat; echo done; exit 3", "payload-"), &start_error)) << start_error.message;

    ExitStatus exit;
    EXPECT_EQ(collect(sandbox, &exit), "payload-done\n");
    EXPECT_EQ(exit.exit_code, 3);
    EXPECT_FALSE(exit.success());

    sandbox.destroy();
    EXPECT_TRUE(sandbox.destroyed());
    EXPECT_FALSE(std::filesystem::exists(sandbox.config().root_dir));
}

TEST(SandboxTest, WorkloadCarriesMarkerAndRunsInScratch) {
    TempWorkspace workspace("sandbox");
    Sandbox sandbox(process_config(workspace, "sbx-marker"));
    std::string error;
    ASSERT_TRUE(sandbox.create(&error)) << error;

    StartError start_error;
    ASSERT_TRUE(sandbox.start(shell("echo \"$OPENFANG_SANDBOX\"; pwd"), &start_error));

    ExitStatus exit;
    std::string out = collect(sandbox, &exit);
    EXPECT_EQ(out, sandbox.marker() + "\n" + sandbox.scratch_dir() + "\n");
    EXPECT_TRUE(exit.success());
}

TEST(SandboxTest, StartReportsExecFailure) {
    TempWorkspace workspace("sandbox");
    Sandbox sandbox(process_config(workspace, "sbx-missing"));
    std::string error;
    ASSERT_TRUE(sandbox.create(&error));

    InvocationSpec spec;
    spec.argv = {(workspace.root() / "no-such-binary").string()};
    StartError start_error;
    EXPECT_FALSE(sandbox.start(spec, &start_error));
    EXPECT_EQ(start_error.stage, "exec");
    EXPECT_EQ(start_error.err, ENOENT);
    EXPECT_EQ(sandbox.state(), SandboxState::FAILED);
}

TEST(SandboxTest, StartRequiresReadySandbox) {
    TempWorkspace workspace("sandbox");
    Sandbox sandbox(process_config(workspace, "sbx-unready"));

    StartError start_error;
    EXPECT_FALSE(sandbox.start(shell("true"), &start_error));
    EXPECT_EQ(start_error.stage, "state");
}

TEST(SandboxTest, SignalGroupReachesEveryProcess) {
    TempWorkspace workspace("sandbox");
    Sandbox sandbox(process_config(workspace, "sbx-group"));
    std::string error;
    ASSERT_TRUE(sandbox.create(&error));

    StartError start_error;
    ASSERT_TRUE(sandbox.start(shell("sleep 30 & sleep 30"), &start_error));

    auto in_group = [&]() {
        auto marked = openfang::runtime::find_marked_processes();
        return std::count_if(marked.begin(), marked.end(), [&](const auto& p) {
            return p.pgrp == sandbox.pid() && p.marker == sandbox.marker();
        });
    };
    ASSERT_TRUE(openfang::testing::eventually([&]() { return in_group() >= 2; }));

    EXPECT_TRUE(sandbox.signal_group(SIGKILL));
    std::optional<ExitStatus> exit;
    ASSERT_TRUE(openfang::testing::eventually([&]() { return (exit = sandbox.try_wait()).has_value(); }));
    EXPECT_EQ(exit->term_signal, SIGKILL);
    EXPECT_TRUE(openfang::testing::eventually([&]() { return in_group() == 0; }));

    sandbox.destroy();
    EXPECT_FALSE(sandbox.signal_group(SIGTERM));
}

TEST(SandboxTest, KillMarkedGroupIgnoresForeignGroups) {
    EXPECT_FALSE(openfang::runtime::kill_marked_group(getpgrp(), "/not/a/sandbox"));
    EXPECT_FALSE(openfang::runtime::kill_marked_group(-1, "/not/a/sandbox"));
}

TEST(SandboxTest, ReportsDegradedIsolationWithoutNamespacesOrCgroups) {
    TempWorkspace workspace("sandbox");
    Sandbox sandbox(process_config(workspace, "sbx-degraded"));
    std::string error;
    ASSERT_TRUE(sandbox.create(&error));

    const auto& isolation = sandbox.isolation_status();
    EXPECT_TRUE(isolation.is_degraded());
    EXPECT_FALSE(isolation.mnt_namespace);
    EXPECT_FALSE(isolation.cgroup_limits);
    EXPECT_NE(isolation.degraded_reason.find("cgroup"), std::string::npos);
}

TEST(SandboxTest, ToRefDescribesLiveSandbox) {
    TempWorkspace workspace("sandbox");
    Sandbox sandbox(process_config(workspace, "sbx-ref"));
    std::string error;
    ASSERT_TRUE(sandbox.create(&error));
    StartError start_error;
    ASSERT_TRUE(sandbox.start(shell("sleep 5"), &start_error));

    auto ref = sandbox.to_ref();
    EXPECT_EQ(ref.name, "sbx-ref");
    EXPECT_EQ(ref.driver, "process");
    EXPECT_EQ(ref.pgid, sandbox.pid());
    EXPECT_EQ(ref.root_dir, sandbox.marker());
}

TEST(DriversTest, ProcessDriverPassesInvocationThrough) {
    TempWorkspace workspace("drivers");
    ProcessDriver driver(false);
    SandboxConfig config = process_config(workspace, "sbx-pass");
    driver.configure(config);
    EXPECT_EQ(config.driver, "process");
    EXPECT_FALSE(config.enable_namespaces);

    Sandbox sandbox(config);
    auto ctx = driver.context_for(sandbox, "run-1");
    EXPECT_EQ(ctx.bundle_dir, config.bundle_dir);
    EXPECT_EQ(ctx.scratch_dir, sandbox.scratch_dir());

    openfang::runtime::AgentDefinition def;
    def.runtime = openfang::runtime::RuntimeKind::PYTHON;
    def.entry_point = "main.py";
    auto spec = PythonAdapter{"python3"}.build_invocation(def, "", ctx);
    auto wrapped = driver.wrap(sandbox, def, spec);
    EXPECT_EQ(wrapped.argv, spec.argv);
    EXPECT_EQ(driver.required_executable(PythonAdapter{"python3"}, def), "python3");
}

TEST(DriversTest, ContainerDriverBuildsEngineInvocation) {
    TempWorkspace workspace("drivers");
    ContainerDriver driver("docker", {{"python", "registry.local/py:3.12"}});

    SandboxConfig config = process_config(workspace, "sbx-run-7");
    config.bundle_dir = "/opt/agents/echo";
    config.limits.memory_limit_bytes = 256ull * 1024 * 1024;
    driver.configure(config);
    EXPECT_EQ(config.container_name, "openfang-sbx-run-7");
    EXPECT_EQ(config.driver, "container");

    Sandbox sandbox(config);
    openfang::runtime::AgentDefinition def;
    def.id = "echo";
    def.runtime = openfang::runtime::RuntimeKind::PYTHON;
    def.entry_point = "main.py";

    auto ctx = driver.context_for(sandbox, "run-7");
    EXPECT_EQ(ctx.bundle_dir, "/agent");
    EXPECT_EQ(ctx.scratch_dir, "/scratch");

    auto wrapped = driver.wrap(sandbox, def, PythonAdapter{"python3"}.build_invocation(def, "in", ctx));
    const auto& argv = wrapped.argv;
    ASSERT_GE(argv.size(), 4u);
    EXPECT_EQ(argv[0], "docker");
    EXPECT_EQ(argv[1], "run");

    auto find = [&](const std::string& value) { return std::find(argv.begin(), argv.end(), value); };
    auto network = find("--network");
    ASSERT_NE(network, argv.end());
    EXPECT_EQ(*(network + 1), "none");
    EXPECT_NE(find("/opt/agents/echo:/agent:ro"), argv.end());
    EXPECT_NE(find(std::to_string(256ull * 1024 * 1024)), argv.end());

    auto image = find("registry.local/py:3.12");
    ASSERT_NE(image, argv.end());
    EXPECT_EQ(std::vector<std::string>(image + 1, argv.end()),
        (std::vector<std::string>{"python3", "-u", "/agent/main.py"}));
    EXPECT_EQ(wrapped.stdin_data, "in");
    EXPECT_EQ(wrapped.working_dir, sandbox.scratch_dir());
    EXPECT_EQ(driver.required_executable(PythonAdapter{"python3"}, def), "docker");
}

TEST(DriversTest, ContainerImagesFallBackToDefaults) {
    ContainerDriver driver("podman", {});
    EXPECT_EQ(driver.image_for(openfang::runtime::RuntimeKind::JAVA), "eclipse-temurin:21-jdk");
    EXPECT_EQ(driver.image_for(openfang::runtime::RuntimeKind::NATIVE), "debian:bookworm-slim");
}

} // namespace
