#include "cachedir_tag_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fstream>

const std::string& cachedir_tag_content() {
    static const std::string content =
        std::string(CACHEDIR_TAG_SIGNATURE) + "\n"
        "# This file is a cache directory tag created by depsweep.\n"
        "# For information about cache directory tags, see:\n"
        "#\thttps://bford.info/cachedir/\n";
    return content;
}

Result<bool> CacheDirTagBackend::is_excluded(const fs::path& path) {
    fs::path tag = path / CACHEDIR_TAG_NAME;

    std::error_code ec;
    if (!fs::is_regular_file(tag, ec)) {
        return Result<bool>::Ok(false);
    }

    std::ifstream in(tag, std::ios::binary);
    if (!in) {
        return Result<bool>::Err("cannot read " + tag.string());
    }

    // Only the leading signature counts; the rest of the file is free-form
    const size_t sig_len = std::strlen(CACHEDIR_TAG_SIGNATURE);
    std::string head(sig_len, '\0');
    in.read(&head[0], static_cast<std::streamsize>(sig_len));
    if (static_cast<size_t>(in.gcount()) != sig_len) {
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Ok(head == CACHEDIR_TAG_SIGNATURE);
}

Result<void> CacheDirTagBackend::add_exclusion(const fs::path& path) {
    std::error_code ec;
    if (fs::is_symlink(path, ec)) {
        return Result<void>::Err("refusing to tag through symlink " + path.string());
    }
    if (!fs::is_directory(path, ec)) {
        return Result<void>::Err(path.string() + " is not a directory");
    }

    fs::path tag = path / CACHEDIR_TAG_NAME;
    std::ofstream out(tag, std::ios::trunc);
    if (!out) {
        return Result<void>::Err(fmt::format("cannot write {}: {}", tag.string(),
                                             std::strerror(errno)));
    }
    out << cachedir_tag_content();
    out.close();
    if (!out) {
        return Result<void>::Err("failed writing " + tag.string());
    }
    depsweep_log("Wrote " + tag.string());
    return Result<void>::Ok();
}
