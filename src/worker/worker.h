#ifndef WORKER_H
#define WORKER_H

#include <bits/stdc++.h>
#include "../common/common.h"
#include "../common/request.h"
#include "../common/jsonProcess.h"
#include "../security/pathGuard.h"
#include "resourceLimiter.h"
#include "compiler.h"
#include "executor.h"
#include "debugger.h"
using namespace std;

class Worker {
private:
    const Config config;
    PathGuard guard;
    ResourceLimiter limiter;
    Compiler compiler;
    Executor executor;
    Debugger debugger;

public:
    // Throws IoError when the managed temp tree cannot be created
    explicit Worker(const Config& config, unique_ptr<LimitBackend> backend = make_default_backend());
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    CompileResult compile(const CompileRequest& request, const RequestContext& ctx) const;
    ExecutionResult run(const RunRequest& request, const RequestContext& ctx) const;
    ComparisonResult compare(const CompareRequest& request, const RequestContext& ctx) const;
    DebugResult debug(const DebugRequest& request, const RequestContext& ctx) const;
    CompileAndRunResult compile_and_run(const CompileAndRunRequest& request, const RequestContext& ctx) const;

    // Dispatches to the matching stage and serializes its result
    json handle(const Request& request, const RequestContext& ctx) const;

    // One JSON request in, one JSON response out; never throws for bad input
    string handle_line(const string& line) const;

    RequestContext make_context(const string& tool, const string& arguments) const;

    const PathGuard& path_guard() const { return guard; }
    const ResourceLimiter& resource_limiter() const { return limiter; }
};

#endif // WORKER_H
