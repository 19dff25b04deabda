#include "applier.hpp"
#include "disk_usage.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ExclusionApplier::ExclusionApplier(ExclusionBackend& backend, bool dry_run)
    : backend_(backend), dry_run_(dry_run) {}

uint64_t ExclusionApplier::measure(const fs::path& path) const {
    auto usage = disk_usage(path);
    if (usage.is_err()) {
        // Size is informational only
        depsweep_log("Size unavailable: " + usage.error);
        return 0;
    }
    return usage.value;
}

ExclusionOutcome ExclusionApplier::apply(const fs::path& path) {
    auto state = backend_.is_excluded(path);
    if (state.is_err()) {
        depsweep_log(fmt::format("[{}] query failed for {}: {}",
                                 backend_.name(), path.string(), state.error));
        return ExclusionOutcome::failed(state.error);
    }
    if (state.value) {
        return ExclusionOutcome::already_excluded();
    }

    if (dry_run_) {
        return ExclusionOutcome::would_exclude(measure(path));
    }

    auto added = backend_.add_exclusion(path);
    if (added.is_err()) {
        depsweep_log(fmt::format("[{}] exclusion failed for {}: {}",
                                 backend_.name(), path.string(), added.error));
        return ExclusionOutcome::failed(added.error);
    }

    depsweep_log(fmt::format("[{}] excluded {}", backend_.name(), path.string()));
    return ExclusionOutcome::excluded(measure(path));
}
