#pragma once

#include <cstdint>
#include <filesystem>
#include <core/types.hpp>

// Bytes allocated on disk for `path` and everything beneath it, like
// `du -s`: counts st_blocks * 512, does not follow symlinks, counts each
// hard-linked inode once. Unreadable subdirectories are left out.
Result<uint64_t> disk_usage(const std::filesystem::path& path);
