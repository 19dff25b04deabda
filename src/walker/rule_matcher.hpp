#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// What to do with one entry found while listing a directory.
enum class Verdict {
    IGNORE,    // not a directory, or a symlink nothing matched
    SKIP,      // under a skip path: not entered, not emitted
    MATCH,     // emitted, not entered
    DESCEND,   // plain directory: list it later
};

// Evaluates the rule checks for a directory entry, in order:
// skip path, sentinel, fixed path. The first check that applies wins.
class RuleMatcher {
public:
    explicit RuleMatcher(const RuleSet& rules);

    // True if `root` equals or lies beneath a skip path.
    bool root_is_skipped(const fs::path& root) const;

    // Classify `entry`, a child of a directory whose entry names are
    // `siblings`. On MATCH, `out` receives the match.
    Verdict classify(const fs::directory_entry& entry,
                     const std::unordered_set<std::string>& siblings,
                     Match& out) const;

private:
    const RuleSet& rules_;
    std::unordered_map<std::string, std::vector<std::string>> markers_by_dir_;

    std::optional<std::string> sentinel_for(const std::string& name,
                                            const std::unordered_set<std::string>& siblings) const;
};

// One directory expanded against the rules.
struct Listing {
    std::vector<Match> matches;
    std::vector<fs::path> descend;   // in listing order
    uint64_t skipped = 0;
    std::optional<WalkIssue> issue;  // set when the directory could not be read
};

// Read `dir` once and classify every child. A read error yields an empty
// listing with `issue` set; partial listings are discarded.
Listing list_directory(const fs::path& dir, const RuleMatcher& matcher);

// Validate the root and list it. Any failure here is a fatal "walk: ..."
// error. A root inside a skip path gives an empty listing.
Result<Listing> open_root(const fs::path& root, const RuleMatcher& matcher);
