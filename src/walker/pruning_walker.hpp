#pragma once

#include <deque>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "rule_matcher.hpp"

namespace fs = std::filesystem;

// Single-threaded depth-first walk that hands out matches one at a time.
//
//   PruningWalker walker(root, rules);
//   auto opened = walker.open();          // fatal errors surface here
//   while (auto m = walker.next()) { ... }
//
// A walker is consumed once; walking again means constructing a new one.
// `rules` must outlive the walker.
class PruningWalker {
public:
    PruningWalker(const fs::path& root, const RuleSet& rules,
                  const CancelToken* cancel = nullptr);

    // Validate and list the root. Must be called before next().
    Result<void> open();

    // Next match in discovery order, or nullopt when the walk is exhausted
    // or was cancelled.
    std::optional<Match> next();

    const fs::path& root() const { return root_; }
    const std::vector<WalkIssue>& issues() const { return issues_; }
    const WalkStats& stats() const { return stats_; }
    bool cancelled() const { return cancelled_; }

private:
    fs::path root_;
    RuleMatcher matcher_;
    const CancelToken* cancel_;

    std::vector<fs::path> stack_;     // directories still to list
    std::deque<Match> pending_;       // matches found but not yet handed out
    std::vector<WalkIssue> issues_;
    WalkStats stats_;
    bool opened_ = false;
    bool cancelled_ = false;

    void absorb(Listing&& listing);
};
