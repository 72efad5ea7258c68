#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "runtime/adapters/adapters.hpp"
#include "runtime/sandbox/sandbox.hpp"

namespace openfang::runtime {

/**
 * Isolation technology behind the provisioner.
 *
 * A driver decides how the bundle and scratch space are seen by the
 * workload, which host executable must exist, and how an adapter's
 * invocation is turned into what the host actually executes.
 */
class SandboxDriver {
public:
    virtual ~SandboxDriver() = default;

    virtual const char* name() const = 0;

    // Host executable needed to run def; empty if none
    virtual std::string required_executable(const RuntimeAdapter& adapter,
                                            const AgentDefinition& def) const = 0;

    // Driver-specific sandbox settings (namespaces, container name)
    virtual void configure(SandboxConfig& config) const = 0;

    virtual InvocationContext context_for(const Sandbox& sandbox, const std::string& run_id) const = 0;

    virtual InvocationSpec wrap(const Sandbox& sandbox, const AgentDefinition& def,
                                InvocationSpec spec) const = 0;

    // Extra cleanup beyond the sandbox's own process group and directories
    virtual void teardown(const SandboxRef& ref) const { (void)ref; }
};

// Host processes in their own process group
class ProcessDriver final : public SandboxDriver {
public:
    explicit ProcessDriver(bool enable_namespaces);

    const char* name() const override { return "process"; }
    std::string required_executable(const RuntimeAdapter& adapter,
                                    const AgentDefinition& def) const override;
    void configure(SandboxConfig& config) const override;
    InvocationContext context_for(const Sandbox& sandbox, const std::string& run_id) const override;
    InvocationSpec wrap(const Sandbox& sandbox, const AgentDefinition& def,
                        InvocationSpec spec) const override;

private:
    bool enable_namespaces_;
};

// One container per run, driven through the container engine's CLI
class ContainerDriver final : public SandboxDriver {
public:
    static constexpr const char* kBundleMount = "/agent";
    static constexpr const char* kScratchMount = "/scratch";

    ContainerDriver(std::string cli, std::map<std::string, std::string> images);

    const char* name() const override { return "container"; }
    std::string required_executable(const RuntimeAdapter& adapter,
                                    const AgentDefinition& def) const override;
    void configure(SandboxConfig& config) const override;
    InvocationContext context_for(const Sandbox& sandbox, const std::string& run_id) const override;
    InvocationSpec wrap(const Sandbox& sandbox, const AgentDefinition& def,
                        InvocationSpec spec) const override;
    void teardown(const SandboxRef& ref) const override;

    std::string image_for(RuntimeKind kind) const;

private:
    std::string cli_;
    std::map<std::string, std::string> images_;
};

// Default images keyed by runtime kind name
std::map<std::string, std::string> default_container_images();

// Run a short host command to completion (output discarded); returns its exit code or -1
int run_host_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace openfang::runtime
