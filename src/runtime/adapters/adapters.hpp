#pragma once
#include <map>
#include <string>
#include <variant>
#include <vector>
#include "runtime/agent/types.hpp"

namespace openfang::runtime {

// Where the bundle and scratch space appear from inside the sandbox
struct InvocationContext {
    std::string run_id;
    std::string bundle_dir;
    std::string scratch_dir;
};

// Launcher executables for each toolchain
struct Toolchains {
    std::string python = "python3";
    std::string node = "node";
    std::string java = "java";
    std::string go = "go";
};

// Concrete launch description produced by an adapter
struct InvocationSpec {
    std::vector<std::string> argv;              // argv[0] is the program
    std::map<std::string, std::string> env;
    std::string working_dir;
    std::string stdin_data;                     // Written to stdin, then stdin is closed

    // False for runtimes that reserve large virtual address ranges (JVM, V8, Go),
    // where an RLIMIT_AS ceiling would break startup.
    bool address_space_limit_safe = true;

    const std::string& program() const { return argv.front(); }
};

/**
 * Runtime adapters.
 *
 * Each adapter is a pure translator from an AgentDefinition to an
 * InvocationSpec; none of them touches sandbox lifecycle. The payload is
 * always delivered on stdin. Entry points are resolved under the bundle dir.
 */
struct PythonAdapter {
    std::string launcher;
    InvocationSpec build_invocation(const AgentDefinition& def, const std::string& payload,
                                    const InvocationContext& ctx) const;
};

struct NodeAdapter {
    std::string launcher;
    InvocationSpec build_invocation(const AgentDefinition& def, const std::string& payload,
                                    const InvocationContext& ctx) const;
};

// *.jar -> java -jar, *.java -> single-file source launch, otherwise a main class on the bundle classpath
struct JavaAdapter {
    std::string launcher;
    InvocationSpec build_invocation(const AgentDefinition& def, const std::string& payload,
                                    const InvocationContext& ctx) const;
};

// *.go files or package directories -> go run; anything else is a prebuilt binary
struct GoAdapter {
    std::string launcher;
    InvocationSpec build_invocation(const AgentDefinition& def, const std::string& payload,
                                    const InvocationContext& ctx) const;
};

struct NativeAdapter {
    InvocationSpec build_invocation(const AgentDefinition& def, const std::string& payload,
                                    const InvocationContext& ctx) const;
};

using RuntimeAdapter = std::variant<JavaAdapter, NodeAdapter, GoAdapter, PythonAdapter, NativeAdapter>;

RuntimeAdapter make_adapter(RuntimeKind kind, const Toolchains& toolchains);

InvocationSpec build_invocation(const RuntimeAdapter& adapter, const AgentDefinition& def,
                                const std::string& payload, const InvocationContext& ctx);

// Launcher the host must provide to run def; empty when the entry point is itself executable
std::string required_launcher(const RuntimeAdapter& adapter, const AgentDefinition& def);

} // namespace openfang::runtime
