#include "executor.h"
#include <sys/resource.h>
#include <sys/wait.h>
#include <signal.h>
#include <bits/stdc++.h>
using namespace std;

namespace fs = filesystem;

namespace {

bool mentions_allocation_failure(const string& text) {
    static const vector<string> markers = {"std::bad_alloc", "out of memory", "Cannot allocate memory", "memory exhausted"};
    for (const auto& marker : markers) {
        if (text.find(marker) != string::npos) return true;
    }
    return false;
}

}

// ============================================================================
// Output capping
// ============================================================================

string cap_output(const string& content, size_t total_size, long long ceiling, bool& truncated) {
    truncated = false;
    if (ceiling <= 0 || (long long)total_size <= ceiling) {
        return content;
    }

    truncated = true;

    // Ceilings too small for the full marker get the short one, cut to the ceiling if need be
    const string& marker = (long long)TRUNCATION_MARKER.size() <= ceiling ? TRUNCATION_MARKER : SHORT_TRUNCATION_MARKER;
    long long marker_size = min<long long>(marker.size(), ceiling);
    long long keep = min(ceiling / 4, ceiling - marker_size);

    string capped = content.substr(0, (size_t)min<long long>(keep, content.size()));
    capped += marker.substr(0, (size_t)marker_size);
    return capped;
}

// ============================================================================
// Verdict
// ============================================================================

Outcome classify_outcome(const ProcessOutcome& process, const ResourceLimits& limits) {
    long long memory_bytes = (long long)process.peak_memory_kb() * 1024;
    int sig = process.term_signal();

    // Check limits first
    if (sig == SIGXCPU || process.cpu_time_ms() > limits.time_limit_ms) return Outcome::Timeout;
    if (memory_bytes > limits.memory_limit_bytes) return Outcome::ResourceExceeded;

    if (process.exited() && process.exit_code() == 0) return Outcome::Ok;

    // RLIMIT_AS shows up as a failed allocation inside the child
    if (mentions_allocation_failure(process.stderr_data)) return Outcome::ResourceExceeded;
    if ((sig == SIGSEGV || sig == SIGKILL || sig == SIGBUS) && memory_bytes * 10 >= limits.memory_limit_bytes * 9) {
        return Outcome::ResourceExceeded;
    }

    return Outcome::NonZeroExit;
}

// ============================================================================
// Execute binary
// ============================================================================

Executor::Executor(const Config& config, const PathGuard& guard, const ResourceLimiter& limiter)
    : config(config), guard(guard), limiter(limiter) {}

ExecutionResult Executor::run(const string& binary, const string& input_data,
                              const LimitOverride& override_limits, const RequestContext* ctx) const {
    ExecutionResult result;
    result.limits = limiter.effective_limits(override_limits);
    result.limits_enforced = limiter.supported();

    auto fail = [&](ErrorKind kind, const string& message) {
        result.success = false;
        result.error_kind = kind;
        result.error = message;
        log_line("Executor", message, ctx, true);
        return result;
    };

    string reason;
    if (!guard.validate_command(binary, CommandKind::Artifact, &reason)) {
        return fail(ErrorKind::SecurityViolation, "Unsafe executable path: " + reason);
    }

    TempFiles temp_files;
    fs::path input_file, output_file;
    try {
        input_file = temp_files.add(guard.secure_temp_path("inputs", ".in"));
        output_file = temp_files.add(guard.secure_temp_path("outputs", ".out"));
        write_file(input_file.string(), input_data);
    } catch (const exception& e) {
        return fail(ErrorKind::IOFailure, string("Cannot prepare input/output files: ") + e.what());
    }

    const ResourceLimits& limits = result.limits;

    SpawnOptions options;
    options.argv = {guard.resolve_artifact(binary).string()};
    options.working_dir = (guard.temp_root() / "execute").string();
    options.stdin_path = input_file.string();
    options.stdout_path = output_file.string();
    options.timeout_ms = limits.time_limit_ms + config.grace_ms;
    options.capture_limit = limits.output_limit_bytes;
    options.limiter = &limiter;
    options.limits = limits;

    log_line("Executor", "Running " + options.argv[0] + " (time " + to_string(limits.time_limit_ms) + "ms, memory " +
             to_string(limits.memory_limit_bytes / (1024 * 1024)) + "MB" + (limiter.supported() ? "" : ", limits unsupported") + ")", ctx);

    ProcessOutcome process;
    try {
        process = run_process(options);
    } catch (const exception& e) {
        return fail(ErrorKind::IOFailure, string("Execution failed: ") + e.what());
    }

    if (!process.started) {
        result.outcome = Outcome::NotStarted;
        bool missing = process.spawn_errno == ENOENT || process.spawn_errno == EACCES || process.spawn_errno == ENOEXEC;
        return fail(missing ? ErrorKind::ToolUnavailable : ErrorKind::IOFailure, "Cannot start program: " + process.spawn_error);
    }

    if (process.limits_degraded) result.limits_enforced = false;
    result.memory_kb = process.peak_memory_kb();
    result.signal = process.term_signal();
    result.exit_code = process.exited() ? process.exit_code() : -process.term_signal();

    // The pipe reader stopped at the ceiling, so a truncated stream counts as one byte over it
    bool stderr_truncated = false;
    size_t stderr_size = process.stderr_data.size() + (process.stderr_truncated ? 1 : 0);
    result.stderr_data = cap_output(process.stderr_data, stderr_size, limits.output_limit_bytes, stderr_truncated);

    // Timeout (wall clock, SIGXCPU or CPU time over the limit): partial output is
    // discarded, elapsed time is the ceiling itself
    if (process.timed_out || classify_outcome(process, limits) == Outcome::Timeout) {
        result.outcome = Outcome::Timeout;
        result.elapsed_ms = limits.time_limit_ms;
        result.exit_code = -1;
        return fail(ErrorKind::ExecutionTimeout, "Time limit exceeded (" + to_string(limits.time_limit_ms) + "ms)");
    }

    result.elapsed_ms = process.elapsed_ms;

    try {
        size_t total_size = 0;
        string content = read_file_prefix(output_file.string(), (size_t)limits.output_limit_bytes, total_size);
        result.stdout_data = cap_output(content, total_size, limits.output_limit_bytes, result.stdout_truncated);
    } catch (const exception& e) {
        return fail(ErrorKind::IOFailure, string("Cannot read program output: ") + e.what());
    }

    result.outcome = classify_outcome(process, limits);
    result.success = result.exit_code == 0 && result.outcome == Outcome::Ok;

    if (result.outcome == Outcome::ResourceExceeded) {
        return fail(ErrorKind::ResourceExceeded, "Memory limit exceeded (" + to_string(limits.memory_limit_bytes / (1024 * 1024)) + "MB)");
    }
    if (result.outcome == Outcome::NonZeroExit) {
        string how = result.signal != 0 ? "killed by signal " + to_string(result.signal) : "exit code " + to_string(result.exit_code);
        return fail(ErrorKind::RuntimeFailure, "Program failed: " + how);
    }

    log_line("Executor", "Finished in " + to_string(result.elapsed_ms) + "ms, " + to_string(result.memory_kb) + "KB", ctx);
    return result;
}
