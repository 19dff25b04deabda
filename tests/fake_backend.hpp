#pragma once

#include <exclusion/backend.hpp>
#include <set>
#include <string>
#include <vector>

// In-memory exclusion state that records every call.
class FakeBackend : public ExclusionBackend {
public:
    std::set<fs::path> excluded;
    std::set<fs::path> fail_query;
    std::set<fs::path> fail_add;
    std::vector<fs::path> add_calls;
    int query_calls = 0;

    std::string name() const override { return "fake"; }

    Result<bool> is_excluded(const fs::path& path) override {
        query_calls++;
        if (fail_query.count(path)) {
            return Result<bool>::Err("query refused");
        }
        return Result<bool>::Ok(excluded.count(path) > 0);
    }

    Result<void> add_exclusion(const fs::path& path) override {
        add_calls.push_back(path);
        if (fail_add.count(path)) {
            return Result<void>::Err("permission denied");
        }
        excluded.insert(path);
        return Result<void>::Ok();
    }
};
