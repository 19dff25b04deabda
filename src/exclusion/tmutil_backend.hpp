#pragma once

#include "backend.hpp"

// Time Machine exclusions through `tmutil isexcluded` / `tmutil addexclusion`.
// Exclusions are sticky: they follow the item if it is moved.
class TimeMachineBackend : public ExclusionBackend {
public:
    std::string name() const override { return "tmutil"; }

    Result<bool> is_excluded(const fs::path& path) override;
    Result<void> add_exclusion(const fs::path& path) override;
};

// True if `tmutil isexcluded` output reports the item as excluded.
bool tmutil_reports_excluded(const std::string& output);
