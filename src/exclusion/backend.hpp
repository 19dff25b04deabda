#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// A backup mechanism's per-path exclusion flag. Implementations are not
// required to be safe for concurrent use.
class ExclusionBackend {
public:
    virtual ~ExclusionBackend() = default;

    virtual std::string name() const = 0;

    // Current exclusion state of `path`.
    virtual Result<bool> is_excluded(const fs::path& path) = 0;

    // Mark `path` excluded. Must be idempotent.
    virtual Result<void> add_exclusion(const fs::path& path) = 0;
};

// Backend for a config/CLI name: "tmutil", "cachedir-tag", or "auto"
// (tmutil on macOS, cachedir-tag elsewhere).
Result<std::unique_ptr<ExclusionBackend>> make_backend(const std::string& name);
