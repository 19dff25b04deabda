#pragma once

#include "backend.hpp"

// Cache Directory Tagging: a directory holding a CACHEDIR.TAG file that
// starts with the standard signature is skipped by tar --exclude-caches,
// borg --exclude-caches and restic --exclude-caches.
class CacheDirTagBackend : public ExclusionBackend {
public:
    std::string name() const override { return "cachedir-tag"; }

    Result<bool> is_excluded(const fs::path& path) override;
    Result<void> add_exclusion(const fs::path& path) override;
};

// Full CACHEDIR.TAG contents written by add_exclusion.
const std::string& cachedir_tag_content();
