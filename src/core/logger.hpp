#pragma once
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace openfang::core {

// Initialize logging with console output, plus a rotating file when log_dir is set
void init_logger(const std::filesystem::path& log_dir = {});

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace|debug|info|warn|error|off"; unknown names map to info
spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace openfang::core
