#include "backend.hpp"
#include "tmutil_backend.hpp"
#include "cachedir_tag_backend.hpp"
#include <platform/platform.hpp>

Result<std::unique_ptr<ExclusionBackend>> make_backend(const std::string& name) {
    using BackendResult = Result<std::unique_ptr<ExclusionBackend>>;

    std::string resolved = name;
    if (resolved == "auto") {
        resolved = platform::is_macos() ? "tmutil" : "cachedir-tag";
    }

    if (resolved == "tmutil") {
        return BackendResult::Ok(std::make_unique<TimeMachineBackend>());
    }
    if (resolved == "cachedir-tag") {
        return BackendResult::Ok(std::make_unique<CacheDirTagBackend>());
    }
    return BackendResult::Err("Unknown backend '" + name + "'");
}
