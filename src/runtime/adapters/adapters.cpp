#include "runtime/adapters/adapters.hpp"
#include <filesystem>
#include <type_traits>

namespace openfang::runtime {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_go_source(const std::string& entry) {
    return ends_with(entry, ".go") || ends_with(entry, "/") || entry == ".";
}

std::string in_bundle(const InvocationContext& ctx, const std::string& entry) {
    return (std::filesystem::path(ctx.bundle_dir) / entry).lexically_normal().string();
}

// Heap ceiling leaving headroom under the sandbox memory limit
uint64_t heap_megabytes(const ResourceLimits& limits) {
    uint64_t mb = (limits.memory_limit_bytes / (1024 * 1024)) * 3 / 4;
    return mb < 16 ? 16 : mb;
}

InvocationSpec base_spec(const AgentDefinition& def, const std::string& payload,
                         const InvocationContext& ctx) {
    InvocationSpec spec;
    spec.working_dir = ctx.scratch_dir;
    spec.stdin_data = payload;

    // Agent-declared variables first; reserved ones below always win
    for (const auto& [key, value] : def.env) {
        spec.env[key] = value;
    }
    spec.env["HOME"] = ctx.scratch_dir;
    spec.env["TMPDIR"] = ctx.scratch_dir;
    spec.env["LANG"] = "C.UTF-8";
    spec.env["OPENFANG_RUN_ID"] = ctx.run_id;
    spec.env["OPENFANG_AGENT_ID"] = def.id;
    spec.env["OPENFANG_AGENT_VERSION"] = std::to_string(def.version);
    spec.env["OPENFANG_BUNDLE"] = ctx.bundle_dir;
    spec.env["OPENFANG_SCRATCH"] = ctx.scratch_dir;
    return spec;
}

void append_args(InvocationSpec& spec, const AgentDefinition& def) {
    spec.argv.insert(spec.argv.end(), def.args.begin(), def.args.end());
}

} // namespace

InvocationSpec PythonAdapter::build_invocation(const AgentDefinition& def, const std::string& payload,
                                               const InvocationContext& ctx) const {
    InvocationSpec spec = base_spec(def, payload, ctx);
    spec.argv = {launcher, "-u", in_bundle(ctx, def.entry_point)};
    append_args(spec, def);
    spec.env["PYTHONDONTWRITEBYTECODE"] = "1";
    spec.env["PYTHONUNBUFFERED"] = "1";
    return spec;
}

InvocationSpec NodeAdapter::build_invocation(const AgentDefinition& def, const std::string& payload,
                                             const InvocationContext& ctx) const {
    InvocationSpec spec = base_spec(def, payload, ctx);
    spec.argv = {launcher,
                 "--max-old-space-size=" + std::to_string(heap_megabytes(def.limits)),
                 in_bundle(ctx, def.entry_point)};
    append_args(spec, def);
    spec.address_space_limit_safe = false;
    return spec;
}

InvocationSpec JavaAdapter::build_invocation(const AgentDefinition& def, const std::string& payload,
                                             const InvocationContext& ctx) const {
    InvocationSpec spec = base_spec(def, payload, ctx);
    std::string heap = "-Xmx" + std::to_string(heap_megabytes(def.limits)) + "m";

    if (ends_with(def.entry_point, ".jar")) {
        spec.argv = {launcher, heap, "-jar", in_bundle(ctx, def.entry_point)};
    } else if (ends_with(def.entry_point, ".java")) {
        spec.argv = {launcher, heap, in_bundle(ctx, def.entry_point)};
    } else {
        spec.argv = {launcher, heap, "-cp", ctx.bundle_dir, def.entry_point};
    }
    append_args(spec, def);
    spec.env["JAVA_TOOL_OPTIONS"] = "-Djava.io.tmpdir=" + ctx.scratch_dir;
    spec.address_space_limit_safe = false;
    return spec;
}

InvocationSpec GoAdapter::build_invocation(const AgentDefinition& def, const std::string& payload,
                                           const InvocationContext& ctx) const {
    InvocationSpec spec = base_spec(def, payload, ctx);
    const std::string& entry = def.entry_point;

    if (is_go_source(entry)) {
        spec.argv = {launcher, "run", in_bundle(ctx, entry)};
        spec.env["GOCACHE"] = ctx.scratch_dir + "/.gocache";
        spec.env["GOPATH"] = ctx.scratch_dir + "/go";
        spec.env["GOTMPDIR"] = ctx.scratch_dir;
        spec.env["GOFLAGS"] = "-buildvcs=false";
    } else {
        spec.argv = {in_bundle(ctx, entry)};
    }
    append_args(spec, def);
    spec.address_space_limit_safe = false;
    return spec;
}

InvocationSpec NativeAdapter::build_invocation(const AgentDefinition& def, const std::string& payload,
                                               const InvocationContext& ctx) const {
    InvocationSpec spec = base_spec(def, payload, ctx);
    spec.argv = {in_bundle(ctx, def.entry_point)};
    append_args(spec, def);
    return spec;
}

RuntimeAdapter make_adapter(RuntimeKind kind, const Toolchains& toolchains) {
    switch (kind) {
        case RuntimeKind::JAVA:   return JavaAdapter{toolchains.java};
        case RuntimeKind::NODE:   return NodeAdapter{toolchains.node};
        case RuntimeKind::GO:     return GoAdapter{toolchains.go};
        case RuntimeKind::PYTHON: return PythonAdapter{toolchains.python};
        case RuntimeKind::NATIVE:
        default:
            return NativeAdapter{};
    }
}

InvocationSpec build_invocation(const RuntimeAdapter& adapter, const AgentDefinition& def,
                                const std::string& payload, const InvocationContext& ctx) {
    return std::visit([&](const auto& a) { return a.build_invocation(def, payload, ctx); }, adapter);
}

std::string required_launcher(const RuntimeAdapter& adapter, const AgentDefinition& def) {
    return std::visit([&](const auto& a) -> std::string {
        using Adapter = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<Adapter, NativeAdapter>) {
            return {};
        } else if constexpr (std::is_same_v<Adapter, GoAdapter>) {
            // Prebuilt binaries run without the toolchain
            return is_go_source(def.entry_point) ? a.launcher : std::string();
        } else {
            return a.launcher;
        }
    }, adapter);
}

} // namespace openfang::runtime
