#include "resourceLimiter.h"
#include <sys/resource.h>
#include <bits/stdc++.h>
using namespace std;

// ============================================================================
// Backends
// ============================================================================

LimitStatus RlimitBackend::apply(const ResourceLimits& limits) const {
    struct rlimit rl;

    // Soft below hard: the soft limit raises SIGXCPU, the hard one SIGKILLs a child that ignores it
    rl.rlim_cur = cpu_seconds_for(limits.time_limit_ms);
    rl.rlim_max = rl.rlim_cur + 1;
    if (setrlimit(RLIMIT_CPU, &rl) != 0) return LimitStatus::Failed;

    rl.rlim_cur = rl.rlim_max = limits.memory_limit_bytes;
    if (setrlimit(RLIMIT_AS, &rl) != 0) return LimitStatus::Failed;

    // One byte past the output ceiling is enough to tell that the output was cut
    rl.rlim_cur = rl.rlim_max = output_file_ceiling(limits);
    if (setrlimit(RLIMIT_FSIZE, &rl) != 0) return LimitStatus::Failed;

    rl.rlim_cur = rl.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &rl) != 0) return LimitStatus::Failed;

    return LimitStatus::Applied;
}

unique_ptr<LimitBackend> make_default_backend() {
#if defined(__linux__) || defined(__unix__) || defined(__APPLE__)
    return make_unique<RlimitBackend>();
#else
    return make_unique<NoopBackend>();
#endif
}

long cpu_seconds_for(long time_limit_ms) {
    return max(1L, (time_limit_ms + 999) / 1000);
}

long long output_file_ceiling(const ResourceLimits& limits) {
    return limits.output_limit_bytes + 1;
}

// ============================================================================
// ResourceLimiter
// ============================================================================

ResourceLimiter::ResourceLimiter(const Config& config, unique_ptr<LimitBackend> limit_backend)
    : defaults(config.default_limits), hard_caps(config.hard_limits), backend(move(limit_backend)) {
    if (!backend) {
        backend = make_unique<NoopBackend>();
    }
}

ResourceLimits ResourceLimiter::effective_limits(const LimitOverride& override_limits) const {
    auto pick = [](auto requested, auto fallback, auto cap) {
        using T = decltype(fallback);
        T value = (requested.has_value() && *requested > 0) ? static_cast<T>(*requested) : fallback;
        return min(value, static_cast<T>(cap));
    };

    ResourceLimits limits;
    limits.time_limit_ms = pick(override_limits.time_limit_ms, defaults.time_limit_ms, hard_caps.time_limit_ms);
    limits.memory_limit_bytes = pick(override_limits.memory_limit_bytes, defaults.memory_limit_bytes, hard_caps.memory_limit_bytes);
    limits.output_limit_bytes = pick(override_limits.output_limit_bytes, defaults.output_limit_bytes, hard_caps.output_limit_bytes);
    return limits;
}

LimitStatus ResourceLimiter::apply(const ResourceLimits& limits) const {
    return backend->apply(limits);
}
