#include "pruning_walker.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

PruningWalker::PruningWalker(const fs::path& root, const RuleSet& rules,
                             const CancelToken* cancel)
    : root_(normalize_root(root)), matcher_(rules), cancel_(cancel) {}

Result<void> PruningWalker::open() {
    if (opened_) {
        return Result<void>::Err("walk: walker already opened");
    }

    auto listing = open_root(root_, matcher_);
    if (listing.is_err()) {
        return Result<void>::Err(listing.error);
    }

    opened_ = true;
    stats_.directories_listed++;
    absorb(std::move(listing.value));
    return Result<void>::Ok();
}

void PruningWalker::absorb(Listing&& listing) {
    if (listing.issue) {
        depsweep_log(fmt::format("Cannot read {}: {}",
                                 listing.issue->path.string(), listing.issue->message));
        issues_.push_back(std::move(*listing.issue));
        return;
    }

    stats_.skipped += listing.skipped;
    for (auto& m : listing.matches) {
        stats_.matched++;
        depsweep_log(fmt::format("Match {} [{}]", m.path.string(), m.rule));
        pending_.push_back(std::move(m));
    }

    // Reverse so the first listed child is popped first
    for (auto it = listing.descend.rbegin(); it != listing.descend.rend(); ++it) {
        stack_.push_back(std::move(*it));
    }
}

std::optional<Match> PruningWalker::next() {
    if (!opened_) {
        return std::nullopt;
    }

    while (pending_.empty()) {
        if (stack_.empty()) {
            return std::nullopt;
        }
        if (cancel_ && cancel_->load()) {
            if (!cancelled_) {
                depsweep_log(fmt::format("Walk cancelled with {} directories unvisited",
                                         stack_.size()));
            }
            cancelled_ = true;
            stack_.clear();
            return std::nullopt;
        }

        fs::path dir = std::move(stack_.back());
        stack_.pop_back();
        stats_.directories_listed++;
        absorb(list_directory(dir, matcher_));
    }

    Match m = std::move(pending_.front());
    pending_.pop_front();
    return m;
}
