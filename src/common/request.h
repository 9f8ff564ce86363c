#ifndef REQUEST_H
#define REQUEST_H

#include <bits/stdc++.h>
#include "common.h"
using namespace std;

// ============================================================================
// Tool requests (the closed set of operations the worker serves)
// ============================================================================

struct CompileRequest {
    string source;
    optional<string> name;
};

struct RunRequest {
    string binary;
    string input;
    optional<long> time_limit_ms;
    optional<long> memory_limit_mb;
};

struct CompareRequest {
    string actual;
    string expected;
    bool ignore_whitespace = true;
    bool ignore_case = false;
};

struct DebugRequest {
    string binary;
    optional<string> script;
};

struct CompileAndRunRequest {
    string source;
    string input;
    optional<string> expected_output;
    optional<string> name;
    optional<long> time_limit_ms;
    optional<long> memory_limit_mb;
};

using Request = variant<CompileRequest, RunRequest, CompareRequest, DebugRequest, CompileAndRunRequest>;

// visit(overloaded{...}, request): one lambda per alternative, missing ones fail to compile
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// "compile", "run", "compare", "debug", "compile_and_run"
string tool_name(const Request& request);

// Caller-facing units (ms, MB) to an override of the process ceilings
LimitOverride make_override(const optional<long>& time_limit_ms, const optional<long>& memory_limit_mb);

#endif // REQUEST_H
