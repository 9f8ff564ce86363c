#include <bits/stdc++.h>
#include "request.h"
using namespace std;

string tool_name(const Request& request) {
    return visit(overloaded{
        [](const CompileRequest&) { return string("compile"); },
        [](const RunRequest&) { return string("run"); },
        [](const CompareRequest&) { return string("compare"); },
        [](const DebugRequest&) { return string("debug"); },
        [](const CompileAndRunRequest&) { return string("compile_and_run"); }
    }, request);
}

LimitOverride make_override(const optional<long>& time_limit_ms, const optional<long>& memory_limit_mb) {
    LimitOverride override_limits;
    if (time_limit_ms) override_limits.time_limit_ms = *time_limit_ms;
    if (memory_limit_mb) {
        // Saturate instead of overflowing; the limiter clamps to the hard cap afterwards
        const long long megabyte = 1024LL * 1024;
        long long mb = min<long long>(*memory_limit_mb, numeric_limits<long long>::max() / megabyte);
        override_limits.memory_limit_bytes = mb * megabyte;
    }
    return override_limits;
}
