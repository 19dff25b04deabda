#include "rule_matcher.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

RuleMatcher::RuleMatcher(const RuleSet& rules) : rules_(rules) {
    for (const auto& rule : rules_.sentinels) {
        markers_by_dir_[rule.directory].push_back(rule.marker);
    }
}

bool RuleMatcher::root_is_skipped(const fs::path& root) const {
    for (const auto& skip : rules_.skip_paths) {
        if (is_within(root, skip)) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> RuleMatcher::sentinel_for(
        const std::string& name,
        const std::unordered_set<std::string>& siblings) const {
    auto it = markers_by_dir_.find(name);
    if (it == markers_by_dir_.end()) {
        return std::nullopt;
    }
    for (const auto& marker : it->second) {
        if (siblings.count(marker)) {
            return marker;
        }
    }
    return std::nullopt;
}

Verdict RuleMatcher::classify(const fs::directory_entry& entry,
                              const std::unordered_set<std::string>& siblings,
                              Match& out) const {
    std::error_code ec;
    // is_directory follows symlinks: a link to a directory is a candidate
    if (!entry.is_directory(ec) || ec) {
        return Verdict::IGNORE;
    }
    bool is_link = entry.is_symlink(ec);
    if (ec) {
        return Verdict::IGNORE;
    }

    const fs::path& path = entry.path();

    // Traversal only ever reaches a skip path's descendants through the
    // skip path itself, so an exact lookup is enough once the root is clear.
    if (rules_.skip_paths.count(path)) {
        return Verdict::SKIP;
    }

    std::string name = path.filename().string();
    if (auto marker = sentinel_for(name, siblings)) {
        out.kind = Match::SENTINEL;
        out.path = path;
        out.rule = fmt::format("{} ({})", name, *marker);
        return Verdict::MATCH;
    }

    if (rules_.fixed_paths.count(path)) {
        out.kind = Match::FIXED;
        out.path = path;
        out.rule = "fixed";
        return Verdict::MATCH;
    }

    return is_link ? Verdict::IGNORE : Verdict::DESCEND;
}

Listing list_directory(const fs::path& dir, const RuleMatcher& matcher) {
    Listing listing;

    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::none, ec);
    std::vector<fs::directory_entry> entries;
    std::unordered_set<std::string> names;

    if (!ec) {
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            entries.push_back(*it);
            names.insert(it->path().filename().string());
        }
    }

    if (ec) {
        listing.issue = WalkIssue{dir, ec.message()};
        return listing;
    }

    for (const auto& entry : entries) {
        Match match;
        switch (matcher.classify(entry, names, match)) {
        case Verdict::SKIP:
            listing.skipped++;
            depsweep_log("Skip " + entry.path().string());
            break;
        case Verdict::MATCH:
            listing.matches.push_back(std::move(match));
            break;
        case Verdict::DESCEND:
            listing.descend.push_back(entry.path());
            break;
        case Verdict::IGNORE:
            break;
        }
    }
    return listing;
}

Result<Listing> open_root(const fs::path& root, const RuleMatcher& matcher) {
    std::error_code ec;
    auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        return Result<Listing>::Err(fmt::format("walk: root {} does not exist", root.string()));
    }
    if (!fs::is_directory(st)) {
        return Result<Listing>::Err(fmt::format("walk: root {} is not a directory", root.string()));
    }

    if (matcher.root_is_skipped(root)) {
        depsweep_log("Root " + root.string() + " lies in a skip path; nothing to walk");
        return Result<Listing>::Ok(Listing{});
    }

    Listing listing = list_directory(root, matcher);
    if (listing.issue) {
        return Result<Listing>::Err(fmt::format("walk: cannot read root {}: {}",
                                                root.string(), listing.issue->message));
    }
    return Result<Listing>::Ok(std::move(listing));
}
