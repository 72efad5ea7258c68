#include "kernel/agent_loader.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace openfang::kernel {

LoadResult load_manifest(const std::string& bundle_dir, const runtime::ResourceLimits& default_limits) {
    LoadResult result;
    std::error_code ec;
    fs::path dir = fs::canonical(bundle_dir, ec);
    if (ec) {
        result.error = "bundle not found: " + bundle_dir;
        return result;
    }

    fs::path manifest = dir / kManifestName;
    std::ifstream in(manifest);
    if (!in) {
        result.error = "missing " + manifest.string();
        return result;
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        result.error = manifest.string() + ": " + e.what();
        return result;
    }
    if (!j.is_object()) {
        result.error = manifest.string() + ": manifest must be a JSON object";
        return result;
    }

    if (!j.contains("id")) {
        j["id"] = dir.filename().string();
    }
    // Bundle location is where the manifest was found, never what it claims
    j["bundle_path"] = dir.string();
    j.erase("version");
    j.erase("registered_at_ms");

    std::string error;
    auto def = runtime::AgentDefinition::from_json(j, default_limits, &error);
    if (!def) {
        result.error = manifest.string() + ": " + error;
        return result;
    }

    result.success = true;
    result.definition = std::move(*def);
    return result;
}

std::vector<runtime::AgentDefinition> scan_bundles(const std::string& root,
                                                   const runtime::ResourceLimits& default_limits) {
    std::vector<runtime::AgentDefinition> found;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::debug("Agent bundle dir {} not present", root);
        return found;
    }

    std::vector<fs::path> dirs;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (entry.is_directory() && fs::exists(entry.path() / kManifestName)) {
            dirs.push_back(entry.path());
        }
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        auto loaded = load_manifest(dir.string(), default_limits);
        if (!loaded.success) {
            spdlog::warn("Skipping agent bundle: {}", loaded.error);
            continue;
        }
        found.push_back(std::move(loaded.definition));
    }
    return found;
}

} // namespace openfang::kernel
