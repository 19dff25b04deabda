#pragma once

#include "temp_tree.hpp"
#include <core/types.hpp>
#include <core/utils.hpp>
#include <walker/walk.hpp>
#include <string>
#include <vector>

// Builds rule sets rooted at test_dir and collects walk results as sets.
class WalkerTest : public TempTreeTest {
protected:
    RuleSet rules;

    void SetUp() override {
        TempTreeTest::SetUp();
        rules = RuleSet{};
    }

    void sentinel(const std::string& dir, const std::string& marker) {
        rules.sentinels.push_back({dir, marker});
    }

    void skip(const std::string& rel) {
        rules.skip_paths.insert(normalize_path(test_dir / rel));
    }

    void fixed(const std::string& rel) {
        rules.fixed_paths.insert(normalize_path(test_dir / rel));
    }

    WalkReport walk(int jobs = 1, const CancelToken* cancel = nullptr,
                    const MatchCallback& cb = nullptr) {
        WalkOptions opts;
        opts.jobs = jobs;
        opts.cancel = cancel;
        auto result = walk_tree(test_dir, rules, opts, cb);
        EXPECT_TRUE(result.is_ok()) << result.error;
        return result.value;
    }

    std::set<fs::path> matched(int jobs = 1) {
        std::set<fs::path> out;
        for (const auto& m : walk(jobs).matches) {
            EXPECT_TRUE(out.insert(m.path).second) << "duplicate match " << m.path;
        }
        return out;
    }

    std::set<fs::path> expect(std::initializer_list<const char*> rels) const {
        std::set<fs::path> out;
        for (const char* r : rels) out.insert(path_of(r));
        return out;
    }
};
