#ifndef COMMON_H
#define COMMON_H

#include <bits/stdc++.h>
using namespace std;

// ============================================================================
// Error taxonomy
// ============================================================================

enum class ErrorKind {
    None,
    SecurityViolation,
    CompileFailure,
    ExecutionTimeout,
    ResourceExceeded,
    RuntimeFailure,
    IOFailure,
    ToolUnavailable
};

// How an execution concluded. NotStarted: no process was ever spawned.
enum class Outcome {
    Ok,
    NonZeroExit,
    Timeout,
    ResourceExceeded,
    NotStarted
};

string error_kind_name(ErrorKind kind);
string outcome_name(Outcome outcome);

class InvalidNameError : public runtime_error {
public:
    explicit InvalidNameError(const string& what) : runtime_error(what) {}
};

class IoError : public runtime_error {
public:
    explicit IoError(const string& what) : runtime_error(what) {}
};

class ConfigError : public runtime_error {
public:
    explicit ConfigError(const string& what) : runtime_error(what) {}
};

class RequestError : public runtime_error {
public:
    explicit RequestError(const string& what) : runtime_error(what) {}
};

// ============================================================================
// Limits
// ============================================================================

struct ResourceLimits {
    long time_limit_ms;
    long long memory_limit_bytes;
    long long output_limit_bytes;
};

// Smallest configurable output ceiling, room for the truncation marker and some output
const long long MIN_OUTPUT_LIMIT_BYTES = 256;

// Per-request override, any field may be omitted
struct LimitOverride {
    optional<long> time_limit_ms;
    optional<long long> memory_limit_bytes;
    optional<long long> output_limit_bytes;
};

// ============================================================================
// Configuration (read once at startup, immutable afterwards)
// ============================================================================

struct Config {
    // compilation
    string compiler_path = "g++";
    string cpp_standard = "c++17";
    string optimization_level = "-O2";
    vector<string> warning_flags = {"-Wall", "-Wextra", "-Werror"};
    long compile_timeout_ms = 30000;

    // execution defaults and administrative caps
    ResourceLimits default_limits = {1000, 256LL * 1024 * 1024, 65536};
    ResourceLimits hard_limits = {10000, 1024LL * 1024 * 1024, 1024 * 1024};
    long grace_ms = 1000;

    // debugger
    string gdb_path = "gdb";
    long debug_timeout_ms = 60000;

    // managed temp tree
    string temp_dir;
    vector<string> allowed_roots;
};

// ============================================================================
// Stage results
// ============================================================================

struct CompileResult {
    bool success = false;
    string executable;          // present only on success
    string stdout_data;
    string stderr_data;
    int exit_code = -1;
    ErrorKind error_kind = ErrorKind::None;
    string error;
};

struct ExecutionResult {
    bool success = false;
    Outcome outcome = Outcome::NotStarted;
    string stdout_data;
    bool stdout_truncated = false;
    string stderr_data;
    long elapsed_ms = 0;
    long memory_kb = 0;
    int exit_code = -1;
    int signal = 0;
    bool limits_enforced = false;
    ResourceLimits limits = {0, 0, 0};
    ErrorKind error_kind = ErrorKind::None;
    string error;
};

struct Difference {
    int line;
    string actual;
    string expected;
};

struct ComparisonResult {
    bool match = false;
    vector<Difference> differences;
    int actual_line_count = 0;
    int expected_line_count = 0;
};

struct DebugResult {
    bool success = false;
    string transcript;
    string stderr_data;
    int exit_code = -1;
    ErrorKind error_kind = ErrorKind::None;
    string error;
};

struct CompileAndRunResult {
    CompileResult compile;
    optional<ExecutionResult> run;
    optional<ComparisonResult> comparison;
};

// ============================================================================
// Request context (one per tool invocation, never shared)
// ============================================================================

struct RequestContext {
    string session_id;
    chrono::steady_clock::time_point start_time;
    string tool;
    string arguments;   // serialized arguments, for diagnostics only
};

// ============================================================================
// Logging
// ============================================================================

void set_verbose(bool verbose);
bool is_verbose();

// Progress lines go to cout unless redirected (oi_worker keeps stdout for responses)
void set_log_stream(ostream& stream);

// Prints "[tag][session] message" on cout (or cerr when is_error)
void log_line(const string& tag, const string& message, const RequestContext* ctx = nullptr, bool is_error = false);

#endif // COMMON_H
