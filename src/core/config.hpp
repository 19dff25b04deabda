#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Tool settings from <config_dir>/config.yaml. The file is optional; a
// missing file yields the defaults. Rules live in separate plain-text
// files handled by the rule store.
class Config {
public:
    // Load settings from config.yaml under `config_dir`.
    static Result<Config> load(const fs::path& config_dir);

    // Accessors
    const fs::path& config_dir() const { return config_dir_; }
    const fs::path& root() const { return root_; }
    int jobs() const { return jobs_; }
    const std::string& backend() const { return backend_; }
    const fs::path& log_file() const { return log_file_; }

    // Command-line overrides
    void set_root(const fs::path& root) { root_ = root; }
    void set_jobs(int jobs);
    Result<void> set_backend(const std::string& backend);

public:
    Config();

private:
    fs::path config_dir_;
    fs::path root_;
    int jobs_;
    std::string backend_ = "auto";
    fs::path log_file_;
};

// True for "auto", "tmutil" and "cachedir-tag".
bool is_known_backend(const std::string& name);

// Config directory: DEPSWEEP_CONFIG_DIR if set, else ~/.depsweep
fs::path get_config_dir();
fs::path get_settings_path(const fs::path& config_dir);
