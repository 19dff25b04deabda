#include "parallel_walker.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

ParallelWalker::ParallelWalker(const fs::path& root, const RuleSet& rules, int jobs,
                               const CancelToken* cancel)
    : root_(normalize_root(root)), matcher_(rules),
      jobs_(std::clamp(jobs, 1, MAX_JOBS)), cancel_(cancel) {}

Result<WalkReport> ParallelWalker::run(const MatchCallback& on_match) {
    on_match_ = &on_match;

    auto root_listing = open_root(root_, matcher_);
    if (root_listing.is_err()) {
        return Result<WalkReport>::Err(root_listing.error);
    }

    std::vector<Match> first;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report_ = WalkReport{};
        report_.stats.directories_listed++;
        first = root_listing.value.matches;
        absorb(std::move(root_listing.value));
    }
    emit(first);

    depsweep_log(fmt::format("Parallel walk of {} with {} workers", root_.string(), jobs_));

    std::vector<std::thread> workers;
    for (int i = 0; i < jobs_; i++) {
        workers.emplace_back(&ParallelWalker::worker_loop, this);
    }
    for (auto& t : workers) {
        t.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (report_.cancelled) {
        depsweep_log(fmt::format("Walk cancelled with {} directories unvisited", work_.size()));
        work_.clear();
    }
    on_match_ = nullptr;
    return Result<WalkReport>::Ok(std::move(report_));
}

void ParallelWalker::absorb(Listing&& listing) {
    if (listing.issue) {
        depsweep_log(fmt::format("Cannot read {}: {}",
                                 listing.issue->path.string(), listing.issue->message));
        report_.issues.push_back(std::move(*listing.issue));
        return;
    }

    report_.stats.skipped += listing.skipped;
    for (auto& m : listing.matches) {
        report_.stats.matched++;
        depsweep_log(fmt::format("Match {} [{}]", m.path.string(), m.rule));
        report_.matches.push_back(std::move(m));
    }
    for (auto it = listing.descend.rbegin(); it != listing.descend.rend(); ++it) {
        work_.push_back(std::move(*it));
    }
}

void ParallelWalker::emit(const std::vector<Match>& matches) {
    if (matches.empty() || !on_match_ || !*on_match_) {
        return;
    }
    std::lock_guard<std::mutex> lock(emit_mutex_);
    for (const auto& m : matches) {
        (*on_match_)(m);
    }
}

void ParallelWalker::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] {
            return !work_.empty() || active_ == 0 || cancel_requested();
        });

        if (cancel_requested()) {
            // A worker still listing re-checks here and flags anything it queued
            if (!work_.empty()) {
                report_.cancelled = true;
            }
            cv_.notify_all();
            return;
        }
        if (work_.empty()) {
            // Nothing queued and nobody listing: the walk is complete
            cv_.notify_all();
            return;
        }

        fs::path dir = std::move(work_.back());
        work_.pop_back();
        active_++;
        lock.unlock();

        Listing listing = list_directory(dir, matcher_);
        std::vector<Match> found = listing.matches;

        lock.lock();
        active_--;
        report_.stats.directories_listed++;
        absorb(std::move(listing));
        cv_.notify_all();

        lock.unlock();
        emit(found);
        lock.lock();
    }
}
