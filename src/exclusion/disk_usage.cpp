#include "disk_usage.hpp"
#include <fmt/format.h>
#include <set>
#include <utility>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

struct UsageCounter {
    uint64_t bytes = 0;
    std::set<std::pair<dev_t, ino_t>> seen_links;

    bool add(const fs::path& p) {
        struct stat st;
        if (lstat(p.c_str(), &st) != 0) {
            return false;
        }
        if (st.st_nlink > 1 && !S_ISDIR(st.st_mode)) {
            if (!seen_links.insert({st.st_dev, st.st_ino}).second) {
                return true;
            }
        }
        bytes += static_cast<uint64_t>(st.st_blocks) * 512;
        return true;
    }
};

} // namespace

Result<uint64_t> disk_usage(const fs::path& path) {
    UsageCounter counter;
    if (!counter.add(path)) {
        return Result<uint64_t>::Err(fmt::format("cannot stat {}: {}",
                                                 path.string(), std::strerror(errno)));
    }

    std::error_code ec;
    if (fs::is_symlink(path, ec) || !fs::is_directory(path, ec)) {
        return Result<uint64_t>::Ok(counter.bytes);
    }

    fs::recursive_directory_iterator it(
        path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<uint64_t>::Err(fmt::format("cannot read {}: {}",
                                                 path.string(), ec.message()));
    }
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        counter.add(it->path());
    }
    if (ec) {
        return Result<uint64_t>::Err(fmt::format("error sizing {}: {}",
                                                 path.string(), ec.message()));
    }
    return Result<uint64_t>::Ok(counter.bytes);
}
