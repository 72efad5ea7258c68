#include "app/cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <vector>
#include "runtime/agent/types.hpp"

namespace openfang::app::cli {

namespace {

ParseResult fail(std::string code, std::string error, std::string hint = {}) {
    ParseResult result;
    result.code = std::move(code);
    result.error = std::move(error);
    result.hint = std::move(hint);
    return result;
}

template <typename T>
bool parse_number(const std::string& text, T& out) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

} // namespace

const char* usage() {
    return "Usage:\n"
           "  openfang start\n"
           "  openfang run <agent-id> [--payload TEXT] [--priority N] [--deadline-ms N]\n"
           "  openfang agents [--json]\n"
           "  openfang runs [--limit N] [--json]\n"
           "  openfang status <run-id> [--json]\n"
           "Global: --home DIR (default $OPENFANG_HOME or /data)\n";
}

ParseResult parse_and_validate(int argc, char* argv[]) {
    if (argc < 2) {
        return fail("missing_command", "No command provided.", "Try 'openfang start'.");
    }

    CliOptions options;
    std::string command = argv[1];
    if (command == "start") {
        options.command = Command::START;
    } else if (command == "run") {
        options.command = Command::RUN;
    } else if (command == "agents") {
        options.command = Command::AGENTS;
    } else if (command == "runs") {
        options.command = Command::RUNS;
    } else if (command == "status") {
        options.command = Command::STATUS;
    } else {
        return fail("unknown_command", "Unknown command: " + command);
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    std::vector<std::string> positional;
    std::optional<std::string> payload, priority, deadline, limit;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](std::optional<std::string>& slot) {
            if (i + 1 >= args.size()) return false;
            slot = args[++i];
            return true;
        };

        if (arg == "--payload") {
            if (!value(payload)) return fail("missing_value", "Missing value for --payload");
        } else if (arg == "--priority") {
            if (!value(priority)) return fail("missing_value", "Missing value for --priority");
        } else if (arg == "--deadline-ms") {
            if (!value(deadline)) return fail("missing_value", "Missing value for --deadline-ms");
        } else if (arg == "--limit") {
            if (!value(limit)) return fail("missing_value", "Missing value for --limit");
        } else if (arg == "--home") {
            if (!value(options.home)) return fail("missing_value", "Missing value for --home");
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            return fail("unknown_argument", "Unknown argument: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    size_t expected = 0;
    if (options.command == Command::RUN || options.command == Command::STATUS) {
        expected = 1;
    }
    if (positional.size() < expected) {
        return fail("missing_argument",
            options.command == Command::RUN ? "Missing agent id" : "Missing run id");
    }
    if (positional.size() > expected) {
        return fail("unexpected_argument", "Unexpected argument: " + positional[expected]);
    }

    if (options.command == Command::RUN) {
        options.agent_id = positional[0];
    } else if (options.command == Command::STATUS) {
        options.run_id = positional[0];
    }

    if ((payload || priority || deadline) && options.command != Command::RUN) {
        return fail("invalid_flag", "--payload, --priority and --deadline-ms only apply to 'run'");
    }
    if (limit && options.command != Command::RUNS) {
        return fail("invalid_flag", "--limit only applies to 'runs'");
    }

    if (payload) options.payload = *payload;
    if (priority && !parse_number(*priority, options.priority)) {
        return fail("invalid_integer", "Invalid number for --priority", "Provide a signed 32-bit integer.");
    }
    if (deadline) {
        uint64_t ms = 0;
        if (!parse_number(*deadline, ms) || ms == 0 || ms > runtime::kMaxDurationMs) {
            return fail("invalid_integer", "Invalid number for --deadline-ms",
                "Provide a positive integer up to " + std::to_string(runtime::kMaxDurationMs) + ".");
        }
        options.deadline_ms = ms;
    }
    if (limit) {
        size_t n = 0;
        if (!parse_number(*limit, n) || n == 0) {
            return fail("invalid_integer", "Invalid number for --limit", "Provide a positive integer.");
        }
        options.limit = n;
    }

    ParseResult result;
    result.success = true;
    result.options = std::move(options);
    return result;
}

} // namespace openfang::app::cli
