#pragma once

#include <mutex>
#include <condition_variable>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "rule_matcher.hpp"

namespace fs = std::filesystem;

// Fans a walk out over sibling directories on `jobs` worker threads.
//
// Every child of a directory is classified while the parent is listed, so a
// skipped or matched directory is never scheduled. Matches are recorded in
// the report and passed to `on_match` one at a time: the callback never runs
// concurrently with itself.
//
// On cancellation no new directory is taken from the queue; listings already
// in flight finish and their matches are kept.
class ParallelWalker {
public:
    ParallelWalker(const fs::path& root, const RuleSet& rules, int jobs,
                   const CancelToken* cancel = nullptr);

    Result<WalkReport> run(const MatchCallback& on_match = nullptr);

private:
    fs::path root_;
    RuleMatcher matcher_;
    int jobs_;
    const CancelToken* cancel_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<fs::path> work_;
    int active_ = 0;
    WalkReport report_;

    std::mutex emit_mutex_;
    const MatchCallback* on_match_ = nullptr;

    bool cancel_requested() const { return cancel_ && cancel_->load(); }
    void worker_loop();
    void absorb(Listing&& listing);   // mutex_ held
    void emit(const std::vector<Match>& matches);
};
