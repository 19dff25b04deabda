#pragma once

#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct WalkOptions {
    int jobs = 1;                         // >1 selects the parallel walker
    const CancelToken* cancel = nullptr;
};

// Walk `root` once against `rules`, calling `on_match` for every match as it
// is found (serialized) and returning the full report. Fails only when the
// root itself cannot be walked; unreadable subdirectories land in
// WalkReport::issues.
Result<WalkReport> walk_tree(const fs::path& root, const RuleSet& rules,
                             const WalkOptions& options = {},
                             const MatchCallback& on_match = nullptr);
