#pragma once

#include <string>
#include <vector>
#include <set>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Rule files under the config directory. Each file is either present
// (read as-is) or absent, in which case the skip-paths and sentinel files
// are first written with built-in defaults. The fixed-paths file is
// optional and never created.
//
// All loaders fail with a "config: ..." error when the directory cannot
// be created or a file cannot be written or read.

// Built-in file contents, written on first run.
const std::string& default_skip_paths_content();
const std::string& default_sentinels_content();

// Creates `config_dir` if missing.
Result<void> ensure_config_dir(const fs::path& config_dir);

// Non-blank, non-comment lines of `path`, trimmed. Writes `defaults`
// first when the file is absent and `defaults` is non-null.
Result<std::vector<std::string>> read_rule_lines(const fs::path& path,
                                                 const std::string* defaults);

// Skip paths, resolved against `root` and normalized.
Result<std::set<fs::path>> load_or_init_skip_paths(const fs::path& config_dir,
                                                   const fs::path& root);

// Sentinel pairs in file order, duplicates dropped. Lines with fewer than
// two tokens are logged and ignored.
Result<std::vector<SentinelRule>> load_or_init_sentinel_rules(const fs::path& config_dir);

// Fixed paths, resolved against `root`. Absent file gives an empty set.
Result<std::set<fs::path>> load_fixed_paths(const fs::path& config_dir,
                                            const fs::path& root);

// All three rule sets for a walk rooted at `root`.
Result<RuleSet> load_rules(const fs::path& config_dir, const fs::path& root);

// Parse one sentinel line ("<dir> <marker> [# comment]"). False if malformed.
bool parse_sentinel_line(const std::string& line, SentinelRule& out);
