#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace openfang::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Common search roots for project-relative assets.
std::vector<std::filesystem::path> project_search_paths();

// Replace a leading "~" with $HOME.
std::filesystem::path expand_home(const std::string& path);

// Locate an executable: absolute/relative paths are checked directly, bare names via $PATH.
std::optional<std::filesystem::path> find_executable(const std::string& name);

} // namespace openfang::core::paths
