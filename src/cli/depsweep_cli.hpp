#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <ostream>
#include <chrono>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <exclusion/backend.hpp>
#include <exclusion/applier.hpp>

namespace fs = std::filesystem;

struct CliOptions {
    enum Mode { RUN, LIST, HELP, VERSION } mode = RUN;
    bool dry_run = false;
    bool color = true;
    std::optional<fs::path> root;
    std::optional<fs::path> config_dir;
    std::optional<int> jobs;
    std::optional<std::string> backend;
};

// Parse argv[1..]. Unknown flags and missing or invalid values are errors.
Result<CliOptions> parse_args(const std::vector<std::string>& args);

void print_usage(std::ostream& out);

struct RunSummary {
    size_t matches = 0;
    size_t excluded = 0;
    size_t already_excluded = 0;
    size_t would_exclude = 0;
    size_t failed = 0;
    uint64_t bytes_excluded = 0;
    size_t unreadable = 0;
    bool cancelled = false;
};

// One depsweep run: load settings and rules, walk, apply exclusions,
// print status lines and a summary. run() returns the process exit code.
class DepsweepCLI {
public:
    DepsweepCLI(CliOptions options, std::ostream& out);

    int run();

    // Use this backend instead of the one named by the config
    void set_backend(std::unique_ptr<ExclusionBackend> backend);

    // Cancel token raised by SIGINT; exposed so callers can cancel too
    CancelToken& cancel_token() { return cancel_; }

    const RunSummary& summary() const { return summary_; }

private:
    CliOptions options_;
    std::ostream& out_;
    std::unique_ptr<ExclusionBackend> backend_;
    CancelToken cancel_{false};
    RunSummary summary_;

    Result<Config> resolve_config();
    void print_outcome(const Match& match, const ExclusionOutcome& outcome);
    void print_summary(const WalkReport& report, std::chrono::milliseconds elapsed);
};
