#include "kernel/config.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace openfang::kernel {

namespace {

template <typename T>
bool read_unsigned(const json& value, T& out) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        return false;
    }
    uint64_t v = value.get<uint64_t>();
    if (v > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

bool read_string(const json& value, std::string& out) {
    if (!value.is_string()) {
        return false;
    }
    out = value.get<std::string>();
    return true;
}

template <typename T>
void env_unsigned(const char* key, T& out) {
    int64_t v = core::config::get_env_int(key, -1);
    if (v < 0) {
        return;
    }
    if (static_cast<uint64_t>(v) > std::numeric_limits<T>::max()) {
        spdlog::warn("Ignoring {}={}: out of range", key, v);
        return;
    }
    out = static_cast<T>(v);
}

void env_string(const char* key, std::string& out) {
    auto v = core::config::get_env(key);
    if (!v.empty()) {
        out = v;
    }
}

} // namespace

std::string OrchestratorConfig::state_dir() const {
    return (fs::path(home) / "state").string();
}

std::string OrchestratorConfig::sandboxes_dir() const {
    return (fs::path(home) / "sandboxes").string();
}

std::string OrchestratorConfig::logs_dir() const {
    return (fs::path(home) / "logs").string();
}

std::string OrchestratorConfig::lock_path() const {
    return (fs::path(home) / "openfang.lock").string();
}

std::string OrchestratorConfig::config_file() const {
    return (fs::path(home) / "config.json").string();
}

json OrchestratorConfig::to_json() const {
    return json{
        {"home", home},
        {"agents_dir", agents_dir},
        {"port", port},
        {"max_concurrent_runs", max_concurrent_runs},
        {"queue_capacity", queue_capacity},
        {"grace_period_ms", grace_period_ms},
        {"provision_retries", provision_retries},
        {"retry_backoff_ms", retry_backoff_ms},
        {"retry_backoff_multiplier", retry_backoff_multiplier},
        {"retry_backoff_max_ms", retry_backoff_max_ms},
        {"max_sandboxes", max_sandboxes},
        {"default_limits", default_limits.to_json()},
        {"sandbox_driver", sandbox_driver},
        {"container_cli", container_cli},
        {"container_images", container_images},
        {"launchers", {
            {"python", toolchains.python},
            {"node", toolchains.node},
            {"java", toolchains.java},
            {"go", toolchains.go}
        }},
        {"enable_isolation", enable_isolation},
        {"cgroup_root", cgroup_root},
        {"log_level", log_level}
    };
}

void OrchestratorConfig::apply_json(const json& j, std::vector<std::string>* warnings) {
    auto warn = [&](const std::string& message) {
        if (warnings) warnings->push_back(message);
    };

    if (!j.is_object()) {
        warn("config must be a JSON object");
        return;
    }

    for (const auto& [key, value] : j.items()) {
        bool ok = true;
        if (key == "agents_dir") {
            ok = read_string(value, agents_dir);
        } else if (key == "port") {
            ok = read_unsigned(value, port);
        } else if (key == "max_concurrent_runs") {
            ok = read_unsigned(value, max_concurrent_runs) && max_concurrent_runs > 0;
            if (!ok) max_concurrent_runs = OrchestratorConfig{}.max_concurrent_runs;
        } else if (key == "queue_capacity") {
            ok = read_unsigned(value, queue_capacity);
        } else if (key == "grace_period_ms") {
            ok = read_unsigned(value, grace_period_ms);
        } else if (key == "provision_retries") {
            ok = read_unsigned(value, provision_retries);
        } else if (key == "retry_backoff_ms") {
            ok = read_unsigned(value, retry_backoff_ms);
        } else if (key == "retry_backoff_multiplier") {
            ok = value.is_number() && value.get<double>() >= 1.0;
            if (ok) retry_backoff_multiplier = value.get<double>();
        } else if (key == "retry_backoff_max_ms") {
            ok = read_unsigned(value, retry_backoff_max_ms);
        } else if (key == "max_sandboxes") {
            ok = read_unsigned(value, max_sandboxes);
        } else if (key == "default_limits") {
            ok = value.is_object();
            if (ok) {
                std::string error;
                if (auto limits = runtime::ResourceLimits::from_json(value, default_limits, &error)) {
                    default_limits = *limits;
                } else {
                    warn("default_limits: " + error);
                }
            }
        } else if (key == "sandbox_driver") {
            std::string driver;
            ok = read_string(value, driver) && (driver == "process" || driver == "container");
            if (ok) sandbox_driver = driver;
        } else if (key == "container_cli") {
            ok = read_string(value, container_cli);
        } else if (key == "container_images") {
            ok = value.is_object();
            if (ok) {
                for (const auto& [kind, image] : value.items()) {
                    if (runtime::runtime_kind_from_string(kind) && image.is_string()) {
                        container_images[kind] = image.get<std::string>();
                    } else {
                        warn("container_images." + kind + ": ignored");
                    }
                }
            }
        } else if (key == "launchers") {
            ok = value.is_object();
            std::pair<const char*, std::string*> launchers[] = {
                {"python", &toolchains.python},
                {"node", &toolchains.node},
                {"java", &toolchains.java},
                {"go", &toolchains.go}
            };
            for (auto& [kind, target] : launchers) {
                if (ok && value.contains(kind) && !read_string(value[kind], *target)) {
                    warn(std::string("launchers.") + kind + ": expected a string");
                }
            }
        } else if (key == "enable_isolation") {
            ok = value.is_boolean();
            if (ok) enable_isolation = value.get<bool>();
        } else if (key == "cgroup_root") {
            ok = read_string(value, cgroup_root);
        } else if (key == "log_level") {
            ok = read_string(value, log_level);
        } else if (key == "home") {
            warn("home cannot be set from the config file it lives in; ignored");
            continue;
        } else {
            warn("unknown config key '" + key + "' ignored");
            continue;
        }
        if (!ok) {
            warn("invalid value for '" + key + "', keeping default");
        }
    }
}

void OrchestratorConfig::apply_env() {
    env_string("OPENFANG_AGENTS_DIR", agents_dir);
    env_unsigned("OPENFANG_PORT", port);
    env_unsigned("OPENFANG_MAX_CONCURRENT_RUNS", max_concurrent_runs);
    if (max_concurrent_runs == 0) {
        max_concurrent_runs = 1;
    }
    env_unsigned("OPENFANG_QUEUE_CAPACITY", queue_capacity);
    env_unsigned("OPENFANG_GRACE_PERIOD_MS", grace_period_ms);
    env_unsigned("OPENFANG_PROVISION_RETRIES", provision_retries);
    env_unsigned("OPENFANG_RETRY_BACKOFF_MS", retry_backoff_ms);
    env_unsigned("OPENFANG_MAX_SANDBOXES", max_sandboxes);

    std::string driver = core::config::get_env("OPENFANG_SANDBOX_DRIVER");
    if (driver == "process" || driver == "container") {
        sandbox_driver = driver;
    } else if (!driver.empty()) {
        spdlog::warn("Ignoring OPENFANG_SANDBOX_DRIVER={}: expected process or container", driver);
    }
    env_string("OPENFANG_CONTAINER_CLI", container_cli);
    env_string("OPENFANG_CGROUP_ROOT", cgroup_root);

    std::string isolation = core::config::get_env("OPENFANG_ENABLE_ISOLATION");
    if (isolation == "0" || isolation == "false") {
        enable_isolation = false;
    } else if (isolation == "1" || isolation == "true") {
        enable_isolation = true;
    }

    env_string("OPENFANG_PYTHON", toolchains.python);
    env_string("OPENFANG_NODE", toolchains.node);
    env_string("OPENFANG_JAVA", toolchains.java);
    env_string("OPENFANG_GO", toolchains.go);
    env_string("OPENFANG_LOG", log_level);
}

OrchestratorConfig OrchestratorConfig::load() {
    OrchestratorConfig config;
    config.home = core::paths::expand_home(core::config::get_env_or("OPENFANG_HOME", config.home)).string();

    std::error_code ec;
    if (fs::exists(config.config_file(), ec)) {
        std::ifstream file(config.config_file());
        try {
            json j = json::parse(file);
            std::vector<std::string> warnings;
            config.apply_json(j, &warnings);
            for (const auto& warning : warnings) {
                spdlog::warn("{}: {}", config.config_file(), warning);
            }
        } catch (const json::parse_error& e) {
            spdlog::warn("Ignoring {}: {}", config.config_file(), e.what());
        }
    }

    config.apply_env();
    config.agents_dir = core::paths::expand_home(config.agents_dir).string();
    return config;
}

} // namespace openfang::kernel
