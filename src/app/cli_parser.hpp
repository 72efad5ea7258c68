#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace openfang::app::cli {

enum class Command {
    START,
    RUN,
    AGENTS,
    RUNS,
    STATUS
};

struct CliOptions {
    Command command = Command::START;
    std::string agent_id;               // run
    std::string run_id;                 // status
    std::string payload;
    int32_t priority = 0;
    std::optional<uint64_t> deadline_ms;
    size_t limit = 20;                  // runs
    bool json = false;                  // Machine-readable output
    std::optional<std::string> home;    // Overrides OPENFANG_HOME
};

struct ParseResult {
    bool success = false;
    CliOptions options;
    std::string code;
    std::string error;
    std::string hint;
};

ParseResult parse_and_validate(int argc, char* argv[]);

const char* usage();

} // namespace openfang::app::cli
