#include "debugger.h"
#include "subprocess.h"
#include <bits/stdc++.h>
using namespace std;

namespace fs = filesystem;

Debugger::Debugger(const Config& config, const PathGuard& guard, const ResourceLimiter& limiter)
    : config(config), guard(guard), limiter(limiter) {}

ResourceLimits Debugger::session_limits() const {
    return {config.debug_timeout_ms, config.hard_limits.memory_limit_bytes, config.hard_limits.output_limit_bytes};
}

DebugResult Debugger::debug(const string& binary, const optional<string>& script, const RequestContext* ctx) const {
    DebugResult result;

    auto fail = [&](ErrorKind kind, const string& message) {
        result.success = false;
        result.error_kind = kind;
        result.error = message;
        log_line("Debugger", message, ctx, true);
        return result;
    };

    string reason;
    if (!guard.validate_command(binary, CommandKind::Artifact, &reason)) {
        return fail(ErrorKind::SecurityViolation, "Unsafe executable path: " + reason);
    }
    if (!guard.validate_command(config.gdb_path, CommandKind::SingleBinary, &reason)) {
        return fail(ErrorKind::SecurityViolation, "Refusing debugger path: " + reason);
    }

    // The script is removed however we leave
    TempFiles temp_files;
    fs::path script_file;
    try {
        script_file = temp_files.add(guard.secure_temp_path("gdb", ".gdb"));
        write_file(script_file.string(), script.has_value() && !script->empty() ? *script : DEFAULT_GDB_SCRIPT);
    } catch (const exception& e) {
        return fail(ErrorKind::IOFailure, string("Cannot write debugger script: ") + e.what());
    }

    SpawnOptions options;
    options.argv = {config.gdb_path, "--batch", "-nx", "-x", script_file.string(), guard.resolve_artifact(binary).string()};
    options.working_dir = (guard.temp_root() / "execute").string();
    options.timeout_ms = config.debug_timeout_ms;
    options.capture_limit = config.default_limits.output_limit_bytes;
    options.limiter = &limiter;
    options.limits = session_limits();

    log_line("Debugger", "Debugging " + options.argv.back(), ctx);

    ProcessOutcome process;
    try {
        process = run_process(options);
    } catch (const exception& e) {
        return fail(ErrorKind::IOFailure, string("Debugger process failed: ") + e.what());
    }

    if (!process.started) {
        bool missing = process.spawn_errno == ENOENT || process.spawn_errno == EACCES;
        return fail(missing ? ErrorKind::ToolUnavailable : ErrorKind::IOFailure, "Cannot start debugger: " + process.spawn_error);
    }

    result.transcript = process.stdout_data;
    result.stderr_data = process.stderr_data;

    if (process.timed_out) {
        return fail(ErrorKind::ExecutionTimeout, "Debugger timed out (" + to_string(config.debug_timeout_ms / 1000) + "s)");
    }

    result.exit_code = process.exited() ? process.exit_code() : -process.term_signal();
    if (result.exit_code != 0) {
        return fail(ErrorKind::RuntimeFailure, "Debugger exited with code " + to_string(result.exit_code));
    }

    result.success = true;
    return result;
}
