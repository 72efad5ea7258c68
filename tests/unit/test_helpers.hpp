#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include "core/ids.hpp"
#include "core/paths.hpp"
#include "runtime/agent/types.hpp"

namespace openfang::testing {

// Scratch directory under the test's working directory, removed on scope exit
class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& tag) {
        auto path = std::filesystem::current_path() / (".tmp_" + tag + "_" + core::generate_run_id());
        std::filesystem::create_directories(path);
        root_ = std::filesystem::canonical(path);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void write_file(const std::filesystem::path& path, const std::string& content, bool executable = false) {
    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }
    if (executable) {
        using std::filesystem::perms;
        std::filesystem::permissions(path,
            perms::owner_all | perms::group_read | perms::group_exec | perms::others_read | perms::others_exec,
            std::filesystem::perm_options::replace);
    }
}

// Native agent whose entry point is a /bin/sh script inside <bundles>/<id>
inline runtime::AgentDefinition shell_agent(const std::filesystem::path& bundles, const std::string& id,
                                            const std::string& script, uint64_t timeout_ms = 5000) {
    auto dir = bundles / id;
    write_file(dir / "run.sh", "#!/bin/sh\n" + script + "\n", true);

    runtime::AgentDefinition def;
    def.id = id;
    def.runtime = runtime::RuntimeKind::NATIVE;
    def.entry_point = "run.sh";
    def.bundle_path = dir.string();
    def.limits.timeout_ms = timeout_ms;
    return def;
}

inline bool has_executable(const std::string& name) {
    return core::paths::find_executable(name).has_value();
}

// Poll until pred holds or timeout passes
inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace openfang::testing
