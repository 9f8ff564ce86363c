#include <bits/stdc++.h>
#include "common.h"
using namespace std;

namespace {
atomic<bool> verbose_logging(true);
mutex log_mutex;
ostream* log_stream = &cout;
}

string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::SecurityViolation: return "SecurityViolation";
        case ErrorKind::CompileFailure: return "CompileFailure";
        case ErrorKind::ExecutionTimeout: return "ExecutionTimeout";
        case ErrorKind::ResourceExceeded: return "ResourceExceeded";
        case ErrorKind::RuntimeFailure: return "RuntimeFailure";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::ToolUnavailable: return "ToolUnavailable";
    }
    return "Unknown";
}

string outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::Ok: return "Ok";
        case Outcome::NonZeroExit: return "NonZeroExit";
        case Outcome::Timeout: return "Timeout";
        case Outcome::ResourceExceeded: return "ResourceExceeded";
        case Outcome::NotStarted: return "NotStarted";
    }
    return "Unknown";
}

// ============================================================================
// Logging
// ============================================================================

void set_verbose(bool verbose) {
    verbose_logging = verbose;
}

bool is_verbose() {
    return verbose_logging;
}

void set_log_stream(ostream& stream) {
    lock_guard<mutex> lock(log_mutex);
    log_stream = &stream;
}

void log_line(const string& tag, const string& message, const RequestContext* ctx, bool is_error) {
    if (!verbose_logging && !is_error) return;

    stringstream ss;
    ss << "[" << tag << "]";
    if (ctx != nullptr && !ctx->session_id.empty()) ss << "[" << ctx->session_id << "]";
    ss << " " << message;

    // Lines from concurrent requests must not interleave
    lock_guard<mutex> lock(log_mutex);
    if (is_error) {
        cerr << ss.str() << endl;
    } else {
        *log_stream << ss.str() << endl;
    }
}
