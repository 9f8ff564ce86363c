#ifndef RESOURCE_LIMITER_H
#define RESOURCE_LIMITER_H

#include <bits/stdc++.h>
#include "../common/common.h"
using namespace std;

enum class LimitStatus {
    Applied,
    Unsupported,
    Failed
};

// Platform mechanism that installs ceilings on the calling process.
// apply() runs in a freshly forked child: it must stay async-signal-safe.
class LimitBackend {
public:
    virtual ~LimitBackend() = default;
    virtual bool supported() const = 0;
    virtual LimitStatus apply(const ResourceLimits& limits) const = 0;
    virtual string name() const = 0;
};

// setrlimit: CPU seconds (rounded up, SIGXCPU before SIGKILL), address space,
// size of any file the child writes, no core dumps
class RlimitBackend : public LimitBackend {
public:
    bool supported() const override { return true; }
    LimitStatus apply(const ResourceLimits& limits) const override;
    string name() const override { return "rlimit"; }
};

// Platforms without per-process ceilings: wall clock and output cap only
class NoopBackend : public LimitBackend {
public:
    bool supported() const override { return false; }
    LimitStatus apply(const ResourceLimits&) const override { return LimitStatus::Unsupported; }
    string name() const override { return "none"; }
};

unique_ptr<LimitBackend> make_default_backend();

// CPU ceiling in whole seconds, rounded up, at least 1
long cpu_seconds_for(long time_limit_ms);

// Largest file the child may write (RLIMIT_FSIZE)
long long output_file_ceiling(const ResourceLimits& limits);

class ResourceLimiter {
private:
    ResourceLimits defaults;
    ResourceLimits hard_caps;
    unique_ptr<LimitBackend> backend;

public:
    ResourceLimiter(const Config& config, unique_ptr<LimitBackend> limit_backend = make_default_backend());

    // Override over defaults field by field, clamped to the administrative caps
    ResourceLimits effective_limits(const LimitOverride& override_limits = LimitOverride()) const;

    // Called in the child between fork and exec
    LimitStatus apply(const ResourceLimits& limits) const;

    bool supported() const { return backend->supported(); }
    string backend_name() const { return backend->name(); }
};

#endif // RESOURCE_LIMITER_H
