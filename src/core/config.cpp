#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cstdlib>

namespace fs = std::filesystem;

static const char* KNOWN_BACKENDS[] = {"auto", "tmutil", "cachedir-tag"};

bool is_known_backend(const std::string& name) {
    return std::any_of(std::begin(KNOWN_BACKENDS), std::end(KNOWN_BACKENDS),
                       [&name](const char* b) { return name == b; });
}

fs::path get_config_dir() {
    const char* env = std::getenv(CONFIG_DIR_ENV);
    if (env && *env) {
        return expand_home(env);
    }
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_settings_path(const fs::path& config_dir) {
    return config_dir / SETTINGS_FILE;
}

Config::Config() : root_(platform::home_dir()), jobs_(DEFAULT_JOBS) {}

void Config::set_jobs(int jobs) {
    jobs_ = std::clamp(jobs, 1, MAX_JOBS);
}

Result<void> Config::set_backend(const std::string& backend) {
    if (!is_known_backend(backend)) {
        return Result<void>::Err("Unknown backend '" + backend +
                                 "' (expected auto, tmutil or cachedir-tag)");
    }
    backend_ = backend;
    return Result<void>::Ok();
}

Result<Config> Config::load(const fs::path& config_dir) {
    Config config;
    config.config_dir_ = config_dir;

    fs::path settings_path = get_settings_path(config_dir);
    std::error_code ec;
    if (!fs::exists(settings_path, ec)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(settings_path.string());
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("config: " + settings_path.string() +
                                       " must be a mapping");
        }

        if (root["root"]) {
            std::string r = root["root"].as<std::string>("");
            if (!r.empty()) {
                config.root_ = expand_home(r);
            }
        }

        config.set_jobs(root["jobs"].as<int>(DEFAULT_JOBS));

        auto backend_result = config.set_backend(root["backend"].as<std::string>("auto"));
        if (backend_result.is_err()) {
            return Result<Config>::Err("config: " + backend_result.error);
        }

        std::string log_file = root["log_file"].as<std::string>("");
        if (!log_file.empty()) {
            config.log_file_ = expand_home(log_file);
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("config: failed to parse ") +
                                   settings_path.string() + ": " + e.what());
    }
}
