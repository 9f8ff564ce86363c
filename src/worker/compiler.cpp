#include "compiler.h"
#include "subprocess.h"
#include <unistd.h>
#include <bits/stdc++.h>
using namespace std;

namespace fs = filesystem;

Compiler::Compiler(const Config& config, const PathGuard& guard) : config(config), guard(guard) {}

vector<string> Compiler::build_command(const string& source_path, const string& output_path) const {
    vector<string> command = {
        config.compiler_path,
        source_path,
        "-std=" + config.cpp_standard,
        config.optimization_level,
        "-o", output_path
    };
    command.insert(command.end(), config.warning_flags.begin(), config.warning_flags.end());
    return command;
}

// ============================================================================
// Compile
// ============================================================================

CompileResult Compiler::compile(const string& source, const optional<string>& name, const RequestContext* ctx) const {
    CompileResult result;

    auto fail = [&](ErrorKind kind, const string& message) {
        result.success = false;
        result.executable.clear();
        result.error_kind = kind;
        result.error = message;
        log_line("Compiler", message, ctx, true);
        return result;
    };

    string reason;
    if (!guard.validate_command(config.compiler_path, CommandKind::SingleBinary, &reason)) {
        return fail(ErrorKind::SecurityViolation, "Refusing compiler path: " + reason);
    }

    fs::path source_path, executable_path;
    try {
        // A caller-chosen name is kept readable but always gets a random token
        source_path = guard.secure_temp_path("sources", ".cpp", name.value_or(""));
        executable_path = guard.temp_root() / "execute" / source_path.stem();
        write_file(source_path.string(), source);
    } catch (const InvalidNameError& e) {
        return fail(ErrorKind::SecurityViolation, string("Invalid program name: ") + e.what());
    } catch (const exception& e) {
        return fail(ErrorKind::IOFailure, string("Cannot prepare source file: ") + e.what());
    }

    log_line("Compiler", "Compiling " + source_path.filename().string(), ctx);

    SpawnOptions options;
    options.argv = build_command(source_path.string(), executable_path.string());
    options.working_dir = source_path.parent_path().string();
    options.timeout_ms = config.compile_timeout_ms;
    options.capture_limit = config.hard_limits.output_limit_bytes;

    ProcessOutcome outcome;
    try {
        outcome = run_process(options);
    } catch (const exception& e) {
        return fail(ErrorKind::IOFailure, string("Compiler process failed: ") + e.what());
    }

    result.stdout_data = outcome.stdout_data;
    result.stderr_data = outcome.stderr_data;

    if (!outcome.started) {
        bool missing = outcome.spawn_errno == ENOENT || outcome.spawn_errno == EACCES;
        return fail(missing ? ErrorKind::ToolUnavailable : ErrorKind::IOFailure, "Cannot start compiler: " + outcome.spawn_error);
    }

    error_code ec;
    if (outcome.timed_out) {
        fs::remove(executable_path, ec);
        result.exit_code = -1;
        return fail(ErrorKind::CompileFailure, "Compilation timed out (" + to_string(config.compile_timeout_ms / 1000) + "s)");
    }

    result.exit_code = outcome.exited() ? outcome.exit_code() : -outcome.term_signal();
    if (result.exit_code != 0) {
        fs::remove(executable_path, ec);
        return fail(ErrorKind::CompileFailure, "Compilation failed with exit code " + to_string(result.exit_code));
    }

    if (!fs::is_regular_file(executable_path, ec) || access(executable_path.c_str(), X_OK) != 0) {
        return fail(ErrorKind::IOFailure, "Compiler reported success but produced no executable");
    }

    result.success = true;
    result.executable = executable_path.string();
    log_line("Compiler", "Built " + result.executable, ctx);
    return result;
}
