#include "core/logger.hpp"
#include <memory>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace openfang::core {

namespace {
constexpr size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;
}

void init_logger(const std::filesystem::path& log_dir) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!log_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            file_error = ec.message();
        } else {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    (log_dir / "openfang.log").string(), kMaxLogFileBytes, kMaxLogFiles));
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("openfang", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled ({}): {}", log_dir.string(), file_error);
    }
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum level_from_string(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace openfang::core
