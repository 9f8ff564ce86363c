#ifndef EXECUTOR_H
#define EXECUTOR_H

#include <bits/stdc++.h>
#include "../common/common.h"
#include "../security/pathGuard.h"
#include "resourceLimiter.h"
#include "subprocess.h"
using namespace std;

const string TRUNCATION_MARKER = "\n... (output truncated)";
const string SHORT_TRUNCATION_MARKER = "...";

// Keeps at most a quarter of the ceiling and appends TRUNCATION_MARKER, never exceeding the ceiling.
// Below the marker's size the short marker is used; a truncated result always ends in a marker.
// content holds the beginning of the output, total_size its full length.
string cap_output(const string& content, size_t total_size, long long ceiling, bool& truncated);

// Outcome tag for a process that ran to completion (not timed out)
Outcome classify_outcome(const ProcessOutcome& process, const ResourceLimits& limits);

class Executor {
private:
    const Config& config;
    const PathGuard& guard;
    const ResourceLimiter& limiter;

public:
    Executor(const Config& config, const PathGuard& guard, const ResourceLimiter& limiter);

    // Never throws; the child is gone when this returns
    ExecutionResult run(const string& binary, const string& input_data,
                        const LimitOverride& override_limits = LimitOverride(),
                        const RequestContext* ctx = nullptr) const;
};

#endif // EXECUTOR_H
