#include "tmutil_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

bool tmutil_reports_excluded(const std::string& output) {
    // "[Excluded]    /Users/me/src/app/node_modules"
    return output.find(TMUTIL_EXCLUDED_TOKEN) != std::string::npos;
}

static std::string failure_text(const platform::CommandResult& r) {
    std::string text = r.get_output();
    trim(text);
    if (text.empty()) {
        text = r.exit_code == 127 ? "tmutil not found" : fmt::format("exit {}", r.exit_code);
    }
    return text;
}

Result<bool> TimeMachineBackend::is_excluded(const fs::path& path) {
    auto r = platform::run_command(TMUTIL_BIN, {"isexcluded", path.string()});
    depsweep_log(fmt::format("tmutil isexcluded {} -> exit={}", path.string(), r.exit_code));
    if (r.failed()) {
        return Result<bool>::Err("tmutil isexcluded: " + failure_text(r));
    }
    return Result<bool>::Ok(tmutil_reports_excluded(r.stdout_data));
}

Result<void> TimeMachineBackend::add_exclusion(const fs::path& path) {
    auto r = platform::run_command(TMUTIL_BIN, {"addexclusion", path.string()});
    depsweep_log(fmt::format("tmutil addexclusion {} -> exit={}", path.string(), r.exit_code));
    if (r.failed()) {
        return Result<void>::Err("tmutil addexclusion: " + failure_text(r));
    }
    return Result<void>::Ok();
}
