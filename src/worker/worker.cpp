#include "worker.h"
#include "comparator.h"
#include <bits/stdc++.h>

using namespace std;

// ============================================================================
// Worker constructor
// ============================================================================

Worker::Worker(const Config& config, unique_ptr<LimitBackend> backend)
    : config(config),
      guard(this->config.temp_dir, this->config.allowed_roots),
      limiter(this->config, move(backend)),
      compiler(this->config, guard),
      executor(this->config, guard, limiter),
      debugger(this->config, guard, limiter) {
    log_line("Worker", "Temp root " + guard.temp_root().string() + ", resource limits: " + limiter.backend_name());
}

RequestContext Worker::make_context(const string& tool, const string& arguments) const {
    RequestContext ctx;
    ctx.session_id = "session_" + to_string(time(nullptr)) + "_" + PathGuard::generate_token().substr(0, 8);
    ctx.start_time = chrono::steady_clock::now();
    ctx.tool = tool;
    ctx.arguments = arguments;
    return ctx;
}

// ============================================================================
// Operations
// ============================================================================

CompileResult Worker::compile(const CompileRequest& request, const RequestContext& ctx) const {
    return compiler.compile(request.source, request.name, &ctx);
}

ExecutionResult Worker::run(const RunRequest& request, const RequestContext& ctx) const {
    return executor.run(request.binary, request.input, make_override(request.time_limit_ms, request.memory_limit_mb), &ctx);
}

ComparisonResult Worker::compare(const CompareRequest& request, const RequestContext&) const {
    return compare_outputs(request.actual, request.expected, request.ignore_whitespace, request.ignore_case);
}

DebugResult Worker::debug(const DebugRequest& request, const RequestContext& ctx) const {
    return debugger.debug(request.binary, request.script, &ctx);
}

CompileAndRunResult Worker::compile_and_run(const CompileAndRunRequest& request, const RequestContext& ctx) const {
    CompileAndRunResult result;

    string name = request.name.value_or("program_" + ctx.session_id);
    result.compile = compiler.compile(request.source, name, &ctx);
    if (!result.compile.success) {
        return result;
    }

    result.run = executor.run(result.compile.executable, request.input,
                              make_override(request.time_limit_ms, request.memory_limit_mb), &ctx);

    if (request.expected_output && !request.expected_output->empty() && !result.run->stdout_data.empty()) {
        result.comparison = compare_outputs(result.run->stdout_data, *request.expected_output);
    }
    return result;
}

// ============================================================================
// Dispatch
// ============================================================================

json Worker::handle(const Request& request, const RequestContext& ctx) const {
    return visit(overloaded{
        [&](const CompileRequest& r) { return to_json(compile(r, ctx)); },
        [&](const RunRequest& r) { return to_json(run(r, ctx)); },
        [&](const CompareRequest& r) { return to_json(compare(r, ctx)); },
        [&](const DebugRequest& r) { return to_json(debug(r, ctx)); },
        [&](const CompileAndRunRequest& r) { return to_json(compile_and_run(r, ctx)); }
    }, request);
}

string Worker::handle_line(const string& line) const {
    json response;
    try {
        json parsed = json::parse(line);
        Request request = parse_request(parsed);

        string tool = tool_name(request);
        RequestContext ctx = make_context(tool, parsed.contains("arguments") ? parsed.at("arguments").dump() : "{}");
        log_line("Worker", "Received " + tool + " request", &ctx);

        response["session"] = ctx.session_id;
        response["tool"] = tool;
        response["result"] = handle(request, ctx);

        long elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - ctx.start_time).count();
        log_line("Worker", "Finished " + tool + " request in " + to_string(elapsed) + "ms", &ctx);
    } catch (const json::exception& e) {
        log_line("Worker", string("Bad request: ") + e.what(), nullptr, true);
        response = {{"error", string("Malformed request: ") + e.what()}};
    } catch (const RequestError& e) {
        log_line("Worker", string("Bad request: ") + e.what(), nullptr, true);
        response = {{"error", e.what()}};
    }
    // Program output is arbitrary bytes, invalid UTF-8 is replaced rather than thrown on
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}
