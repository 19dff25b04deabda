#pragma once

#include <string>
#include <vector>
#include <set>
#include <atomic>
#include <functional>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Rules ───────────────────────────────────────────────────

// A directory named `directory` is a dependency folder when `marker`
// sits beside it in the same parent.
struct SentinelRule {
    std::string directory;   // e.g. "node_modules"
    std::string marker;      // e.g. "package.json"

    bool operator==(const SentinelRule& o) const {
        return directory == o.directory && marker == o.marker;
    }
};

// Everything the walker needs to decide skip / match / descend.
// Paths are absolute and lexically normal, without trailing separators.
struct RuleSet {
    std::set<fs::path> skip_paths;
    std::vector<SentinelRule> sentinels;      // file order, no duplicates
    std::set<fs::path> fixed_paths;
};

// ── Walk output ─────────────────────────────────────────────

struct Match {
    enum Kind { SENTINEL, FIXED } kind;
    fs::path path;
    std::string rule;        // "node_modules (package.json)" or "fixed"
};

// A directory that could not be listed. The subtree is dropped.
struct WalkIssue {
    fs::path path;
    std::string message;
};

struct WalkStats {
    uint64_t directories_listed = 0;
    uint64_t skipped = 0;
    uint64_t matched = 0;
};

struct WalkReport {
    std::vector<Match> matches;
    std::vector<WalkIssue> issues;
    WalkStats stats;
    bool cancelled = false;
};

// Raised from a signal handler or another thread; walkers poll it
// before scheduling each directory.
using CancelToken = std::atomic<bool>;

using MatchCallback = std::function<void(const Match&)>;
