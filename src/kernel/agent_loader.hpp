#pragma once
#include <optional>
#include <string>
#include <vector>
#include "runtime/agent/types.hpp"

namespace openfang::kernel {

inline constexpr const char* kManifestName = "agent.json";

struct LoadResult {
    bool success = false;
    runtime::AgentDefinition definition;
    std::string error;
};

// Parse <bundle_dir>/agent.json. The id defaults to the directory name.
LoadResult load_manifest(const std::string& bundle_dir, const runtime::ResourceLimits& default_limits);

// Every bundle directly under root; invalid manifests are logged and skipped
std::vector<runtime::AgentDefinition> scan_bundles(const std::string& root,
                                                   const runtime::ResourceLimits& default_limits);

} // namespace openfang::kernel
