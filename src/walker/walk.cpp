#include "walk.hpp"
#include "pruning_walker.hpp"
#include "parallel_walker.hpp"

Result<WalkReport> walk_tree(const fs::path& root, const RuleSet& rules,
                             const WalkOptions& options,
                             const MatchCallback& on_match) {
    if (options.jobs > 1) {
        ParallelWalker walker(root, rules, options.jobs, options.cancel);
        return walker.run(on_match);
    }

    PruningWalker walker(root, rules, options.cancel);
    auto opened = walker.open();
    if (opened.is_err()) {
        return Result<WalkReport>::Err(opened.error);
    }

    WalkReport report;
    while (auto m = walker.next()) {
        if (on_match) {
            on_match(*m);
        }
        report.matches.push_back(std::move(*m));
    }
    report.issues = walker.issues();
    report.stats = walker.stats();
    report.cancelled = walker.cancelled();
    return Result<WalkReport>::Ok(std::move(report));
}
