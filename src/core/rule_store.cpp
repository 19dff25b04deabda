#include "rule_store.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

const std::string& default_skip_paths_content() {
    static const std::string content =
        "# Paths relative to the scan root that are never entered.\n"
        "# One path per line; absolute paths are used as-is.\n"
        ".Trash\n"
        "Library\n";
    return content;
}

const std::string& default_sentinels_content() {
    static const std::string content = R"(# <directory> <sentinel file beside it>  [# comment]
# A directory is excluded when its parent also contains the sentinel file.
.build              Package.swift        # Swift
.gradle             build.gradle         # Gradle
.gradle             build.gradle.kts     # Gradle Kotlin
build               build.gradle         # Gradle
build               build.gradle.kts     # Gradle Kotlin
.dart_tool          pubspec.yaml         # Flutter (Dart)
.packages           pubspec.yaml         # Pub (Dart)
.stack-work         stack.yaml           # Stack (Haskell)
.tox                tox.ini              # Tox (Python)
.nox                noxfile.py           # Nox (Python)
.venv               requirements.txt     # virtualenv (Python)
.venv               pyproject.toml       # virtualenv (Python)
venv                requirements.txt     # virtualenv (Python)
venv                pyproject.toml       # virtualenv (Python)
bower_components    bower.json           # Bower (JavaScript)
node_modules        package.json         # npm, Yarn (NodeJS)
.next               next.config.js       # Next.js
target              Cargo.toml           # Cargo (Rust)
target              pom.xml              # Maven
vendor              composer.json        # Composer (PHP)
vendor              Gemfile              # Bundler (Ruby)
vendor              go.mod               # Go Modules
Carthage            Cartfile             # Carthage
Pods                Podfile              # CocoaPods
deps                mix.exs              # Mix (Elixir)
_build              mix.exs              # Mix (Elixir)
.terraform          main.tf              # Terraform
.terragrunt-cache   terragrunt.hcl       # Terragrunt
cdk.out             cdk.json             # AWS CDK
)";
    return content;
}

Result<void> ensure_config_dir(const fs::path& config_dir) {
    std::error_code ec;
    fs::create_directories(config_dir, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("config: cannot create {}: {}",
                                             config_dir.string(), ec.message()));
    }
    if (!fs::is_directory(config_dir, ec)) {
        return Result<void>::Err(fmt::format("config: {} is not a directory",
                                             config_dir.string()));
    }
    return Result<void>::Ok();
}

static Result<void> write_defaults(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("config: cannot create " + path.string());
    }
    out << content;
    out.close();
    if (!out) {
        return Result<void>::Err("config: failed writing " + path.string());
    }
    depsweep_log("Created default " + path.string());
    return Result<void>::Ok();
}

Result<std::vector<std::string>> read_rule_lines(const fs::path& path,
                                                 const std::string* defaults) {
    using LinesResult = Result<std::vector<std::string>>;

    std::error_code ec;
    bool present = fs::exists(path, ec);
    if (ec) {
        return LinesResult::Err(fmt::format("config: cannot stat {}: {}",
                                            path.string(), ec.message()));
    }

    if (!present) {
        if (!defaults) {
            return LinesResult::Ok({});
        }
        auto written = write_defaults(path, *defaults);
        if (written.is_err()) {
            return LinesResult::Err(written.error);
        }
    }

    if (fs::is_directory(path, ec)) {
        return LinesResult::Err("config: " + path.string() + " is a directory");
    }

    std::ifstream file(path);
    if (!file) {
        return LinesResult::Err("config: cannot read " + path.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }
        lines.push_back(line);
    }
    if (file.bad()) {
        return LinesResult::Err("config: I/O error reading " + path.string());
    }
    return LinesResult::Ok(std::move(lines));
}

// Relative entries hang off `root`; absolute ones stand alone.
static fs::path resolve_against(const fs::path& root, const std::string& entry) {
    fs::path p(entry);
    if (p.is_absolute()) {
        return normalize_path(p);
    }
    return normalize_path(root / p);
}

Result<std::set<fs::path>> load_or_init_skip_paths(const fs::path& config_dir,
                                                   const fs::path& root) {
    using SetResult = Result<std::set<fs::path>>;

    auto dir = ensure_config_dir(config_dir);
    if (dir.is_err()) {
        return SetResult::Err(dir.error);
    }

    auto lines = read_rule_lines(config_dir / SKIP_PATHS_FILE, &default_skip_paths_content());
    if (lines.is_err()) {
        return SetResult::Err(lines.error);
    }

    std::set<fs::path> paths;
    for (const auto& line : lines.value) {
        paths.insert(resolve_against(root, line));
    }
    return SetResult::Ok(std::move(paths));
}

bool parse_sentinel_line(const std::string& line, SentinelRule& out) {
    // Everything from the first "#" on is a comment
    auto tokens = split_whitespace(line.substr(0, line.find('#')));

    if (tokens.size() < 2) {
        return false;
    }
    out.directory = tokens[0];
    out.marker = tokens[1];
    return true;
}

Result<std::vector<SentinelRule>> load_or_init_sentinel_rules(const fs::path& config_dir) {
    using RulesResult = Result<std::vector<SentinelRule>>;

    auto dir = ensure_config_dir(config_dir);
    if (dir.is_err()) {
        return RulesResult::Err(dir.error);
    }

    fs::path path = config_dir / SENTINELS_FILE;
    auto lines = read_rule_lines(path, &default_sentinels_content());
    if (lines.is_err()) {
        return RulesResult::Err(lines.error);
    }

    std::vector<SentinelRule> rules;
    for (const auto& line : lines.value) {
        SentinelRule rule;
        if (!parse_sentinel_line(line, rule)) {
            depsweep_log(fmt::format("Ignoring malformed sentinel line in {}: '{}'",
                                     path.string(), line));
            continue;
        }
        if (std::find(rules.begin(), rules.end(), rule) == rules.end()) {
            rules.push_back(rule);
        }
    }
    return RulesResult::Ok(std::move(rules));
}

Result<std::set<fs::path>> load_fixed_paths(const fs::path& config_dir,
                                            const fs::path& root) {
    using SetResult = Result<std::set<fs::path>>;

    auto lines = read_rule_lines(config_dir / FIXED_PATHS_FILE, nullptr);
    if (lines.is_err()) {
        return SetResult::Err(lines.error);
    }

    std::set<fs::path> paths;
    for (const auto& line : lines.value) {
        paths.insert(resolve_against(root, line));
    }
    return SetResult::Ok(std::move(paths));
}

Result<RuleSet> load_rules(const fs::path& config_dir, const fs::path& root) {
    fs::path norm_root = normalize_root(root);

    auto skips = load_or_init_skip_paths(config_dir, norm_root);
    if (skips.is_err()) {
        return Result<RuleSet>::Err(skips.error);
    }
    auto sentinels = load_or_init_sentinel_rules(config_dir);
    if (sentinels.is_err()) {
        return Result<RuleSet>::Err(sentinels.error);
    }
    auto fixed = load_fixed_paths(config_dir, norm_root);
    if (fixed.is_err()) {
        return Result<RuleSet>::Err(fixed.error);
    }

    RuleSet rules;
    rules.skip_paths = std::move(skips.value);
    rules.sentinels = std::move(sentinels.value);
    rules.fixed_paths = std::move(fixed.value);

    depsweep_log(fmt::format("Loaded rules from {}: {} skip, {} sentinel, {} fixed",
                             config_dir.string(), rules.skip_paths.size(),
                             rules.sentinels.size(), rules.fixed_paths.size()));
    return Result<RuleSet>::Ok(std::move(rules));
}
