#pragma once

#include <string>
#include <cstdint>
#include <filesystem>
#include "backend.hpp"

namespace fs = std::filesystem;

struct ExclusionOutcome {
    enum Status {
        ALREADY_EXCLUDED,
        EXCLUDED,
        WOULD_EXCLUDE,   // dry run
        FAILED,
    } status;
    uint64_t size_bytes = 0;   // EXCLUDED / WOULD_EXCLUDE only
    std::string reason;        // FAILED only

    static ExclusionOutcome already_excluded() { return {ALREADY_EXCLUDED, 0, ""}; }
    static ExclusionOutcome excluded(uint64_t size) { return {EXCLUDED, size, ""}; }
    static ExclusionOutcome would_exclude(uint64_t size) { return {WOULD_EXCLUDE, size, ""}; }
    static ExclusionOutcome failed(const std::string& why) { return {FAILED, 0, why}; }
};

// Applies exclusions for matched paths through a backend: query first,
// add only if not yet excluded, then measure what was newly excluded.
// Per-path failures come back as FAILED outcomes and never throw.
class ExclusionApplier {
public:
    ExclusionApplier(ExclusionBackend& backend, bool dry_run = false);

    ExclusionOutcome apply(const fs::path& path);

private:
    ExclusionBackend& backend_;
    bool dry_run_;

    uint64_t measure(const fs::path& path) const;
};
