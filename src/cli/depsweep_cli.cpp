#include "depsweep_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/format.hpp>
#include <core/log.hpp>
#include <core/rule_store.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <walker/rule_matcher.hpp>
#include <walker/walk.hpp>
#include <fmt/format.h>
#include <iostream>

void print_usage(std::ostream& out) {
    out << theme::section("Usage");
    out << theme::color::BLUE << "    depsweep" << theme::color::RESET
        << theme::color::BROWN << " [options]" << theme::color::RESET << "\n\n";
    out << theme::color::DIM
        << "    Exclude dependency directories under your home folder from backups.\n"
        << "    A directory is excluded when its name matches a sentinel rule and the\n"
        << "    rule's sentinel file sits beside it (node_modules next to package.json).\n"
        << theme::color::RESET;

    out << theme::section("Options");
    auto row = [&out](const std::string& flag, const std::string& help) {
        out << theme::color::BLUE << fmt::format("    {:<22}", flag) << theme::color::RESET
            << theme::color::DIM << help << theme::color::RESET << "\n";
    };
    row("--root <dir>", "Directory to scan (default: home directory)");
    row("--config-dir <dir>", "Rule directory (default: ~/.depsweep)");
    row("-j, --jobs <n>", "Walker threads (default: 1)");
    row("--backend <name>", "auto, tmutil or cachedir-tag");
    row("--dry-run", "Report what would be excluded, change nothing");
    row("--list", "Print matched paths only");
    row("--no-color", "Plain output");
    row("--version", "Show version");
    row("--help", "Show this help");
    out << "\n";
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= args.size() || args[i + 1].empty()) {
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string v;
        if (arg == "--help" || arg == "-h") {
            opts.mode = CliOptions::HELP;
        } else if (arg == "--version") {
            opts.mode = CliOptions::VERSION;
        } else if (arg == "--list") {
            opts.mode = CliOptions::LIST;
        } else if (arg == "--dry-run" || arg == "-n") {
            opts.dry_run = true;
        } else if (arg == "--no-color") {
            opts.color = false;
        } else if (arg == "--root") {
            if (!value(v)) return Result<CliOptions>::Err("--root needs a directory");
            opts.root = expand_home(v);
        } else if (arg == "--config-dir") {
            if (!value(v)) return Result<CliOptions>::Err("--config-dir needs a directory");
            opts.config_dir = expand_home(v);
        } else if (arg == "-j" || arg == "--jobs") {
            if (!value(v)) return Result<CliOptions>::Err(arg + " needs a number");
            int jobs = safe_stoi(v, -1);
            if (jobs < 1 || std::to_string(jobs) != v) {
                return Result<CliOptions>::Err("Invalid job count: " + v);
            }
            opts.jobs = jobs;
        } else if (arg == "--backend") {
            if (!value(v)) return Result<CliOptions>::Err("--backend needs a name");
            if (!is_known_backend(v)) {
                return Result<CliOptions>::Err("Unknown backend: " + v);
            }
            opts.backend = v;
        } else {
            return Result<CliOptions>::Err("Unknown option: " + arg);
        }
    }

    return Result<CliOptions>::Ok(opts);
}

DepsweepCLI::DepsweepCLI(CliOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

void DepsweepCLI::set_backend(std::unique_ptr<ExclusionBackend> backend) {
    backend_ = std::move(backend);
}

Result<Config> DepsweepCLI::resolve_config() {
    fs::path config_dir = options_.config_dir ? *options_.config_dir : get_config_dir();

    auto loaded = Config::load(config_dir);
    if (loaded.is_err()) {
        return loaded;
    }

    Config config = loaded.value;
    if (options_.root) config.set_root(*options_.root);
    if (options_.jobs) config.set_jobs(*options_.jobs);
    if (options_.backend) {
        auto set = config.set_backend(*options_.backend);
        if (set.is_err()) {
            return Result<Config>::Err(set.error);
        }
    }
    config.set_root(normalize_root(config.root()));
    return Result<Config>::Ok(config);
}

void DepsweepCLI::print_outcome(const Match& match, const ExclusionOutcome& outcome) {
    const std::string path = match.path.string();
    switch (outcome.status) {
    case ExclusionOutcome::EXCLUDED:
        summary_.excluded++;
        summary_.bytes_excluded += outcome.size_bytes;
        out_ << theme::ok(fmt::format("Excluded {} {}", path,
                                      theme::dim("(" + format_size(outcome.size_bytes) + ")")));
        break;
    case ExclusionOutcome::WOULD_EXCLUDE:
        summary_.would_exclude++;
        summary_.bytes_excluded += outcome.size_bytes;
        out_ << theme::step(fmt::format("Would exclude {} {}", path,
                                        theme::dim("(" + format_size(outcome.size_bytes) + ")")));
        break;
    case ExclusionOutcome::ALREADY_EXCLUDED:
        summary_.already_excluded++;
        out_ << theme::info(fmt::format("Already excluded {}", theme::dim(path)));
        break;
    case ExclusionOutcome::FAILED:
        summary_.failed++;
        out_ << theme::fail(fmt::format("Failed {}: {}", path, outcome.reason));
        break;
    }
}

void DepsweepCLI::print_summary(const WalkReport& report, std::chrono::milliseconds elapsed) {
    for (const auto& issue : report.issues) {
        out_ << theme::warn(fmt::format("Unreadable {}: {}", issue.path.string(), issue.message));
    }

    out_ << theme::section("Summary");
    out_ << theme::kv("matches", std::to_string(summary_.matches));
    if (options_.dry_run) {
        out_ << theme::kv("would exclude", std::to_string(summary_.would_exclude));
    } else {
        out_ << theme::kv("excluded", std::to_string(summary_.excluded));
    }
    out_ << theme::kv("already excluded", std::to_string(summary_.already_excluded));
    if (summary_.failed > 0) {
        out_ << theme::kv("failed", theme::red(std::to_string(summary_.failed)));
    }
    out_ << theme::kv(options_.dry_run ? "reclaimable" : "reclaimed",
                      format_size(summary_.bytes_excluded));
    if (summary_.unreadable > 0) {
        out_ << theme::kv("unreadable", theme::yellow(std::to_string(summary_.unreadable)));
    }
    out_ << theme::kv("directories", std::to_string(report.stats.directories_listed));
    out_ << theme::kv("elapsed", format_elapsed(elapsed));
    if (summary_.cancelled) {
        out_ << theme::warn("Interrupted: results are partial");
    }
    out_ << "\n";
}

int DepsweepCLI::run() {
    summary_ = RunSummary{};

    auto config_result = resolve_config();
    if (config_result.is_err()) {
        out_ << theme::fail(config_result.error);
        return EXIT_FATAL;
    }
    const Config& config = config_result.value;

    if (!config.log_file().empty()) {
        set_log_path(config.log_file());
    }
    depsweep_log(fmt::format("depsweep {} root={} config={} jobs={}", DEPSWEEP_VERSION,
                             config.root().string(), config.config_dir().string(),
                             config.jobs()));

    auto rules = load_rules(config.config_dir(), config.root());
    if (rules.is_err()) {
        out_ << theme::fail(rules.error);
        return EXIT_FATAL;
    }

    const bool list_only = options_.mode == CliOptions::LIST;
    if (!list_only && !backend_) {
        auto made = make_backend(config.backend());
        if (made.is_err()) {
            out_ << theme::fail(made.error);
            return EXIT_FATAL;
        }
        backend_ = std::move(made.value);
    }

    if (!list_only) {
        out_ << theme::section(options_.dry_run ? "depsweep (dry run)" : "depsweep");
        out_ << theme::kv("root", config.root().string());
        out_ << theme::kv("rules", fmt::format("{} sentinel, {} skip, {} fixed",
                                               rules.value.sentinels.size(),
                                               rules.value.skip_paths.size(),
                                               rules.value.fixed_paths.size()));
        out_ << theme::kv("backend", backend_->name());
        out_ << "\n";
    }

    std::unique_ptr<ExclusionApplier> applier;
    if (backend_) {
        applier = std::make_unique<ExclusionApplier>(*backend_, options_.dry_run);
    }

    // Matches arrive one at a time even from the parallel walker
    auto on_match = [&](const Match& m) {
        summary_.matches++;
        if (list_only) {
            out_ << m.path.string() << "\n";
            return;
        }
        print_outcome(m, applier->apply(m.path));
    };

    WalkOptions walk_options;
    walk_options.jobs = config.jobs();
    walk_options.cancel = &cancel_;

    auto started = std::chrono::steady_clock::now();
    Result<WalkReport> report = [&] {
        platform::InterruptGuard guard(cancel_);
        return walk_tree(config.root(), rules.value, walk_options, on_match);
    }();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (report.is_err()) {
        out_ << theme::fail(report.error);
        return EXIT_FATAL;
    }

    summary_.unreadable = report.value.issues.size();
    summary_.cancelled = report.value.cancelled;

    depsweep_log(fmt::format("Finished: {} matches, {} excluded, {} already, {} failed, "
                             "{} unreadable, cancelled={}",
                             summary_.matches, summary_.excluded, summary_.already_excluded,
                             summary_.failed, summary_.unreadable, summary_.cancelled));

    if (list_only) {
        // Keep stdout to bare paths so the list can be piped
        for (const auto& issue : report.value.issues) {
            std::cerr << theme::warn(fmt::format("Unreadable {}: {}",
                                                 issue.path.string(), issue.message));
        }
    } else {
        print_summary(report.value, elapsed);
    }

    return summary_.cancelled ? EXIT_CANCELLED : EXIT_OK;
}
