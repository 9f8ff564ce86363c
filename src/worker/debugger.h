#ifndef DEBUGGER_H
#define DEBUGGER_H

#include <bits/stdc++.h>
#include "../common/common.h"
#include "../security/pathGuard.h"
#include "resourceLimiter.h"
using namespace std;

// Break at main, run, then dump the stack, registers and a few instructions
const string DEFAULT_GDB_SCRIPT =
    "set pagination off\n"
    "break main\n"
    "run\n"
    "backtrace\n"
    "info registers\n"
    "x/10i $pc\n"
    "quit\n";

class Debugger {
private:
    const Config& config;
    const PathGuard& guard;
    const ResourceLimiter& limiter;

public:
    Debugger(const Config& config, const PathGuard& guard, const ResourceLimiter& limiter);

    // Ceilings for gdb and, through inheritance, the program it runs: CPU up to the
    // session budget, memory and file size at the administrative caps
    ResourceLimits session_limits() const;

    // Runs gdb in batch mode with the script (or DEFAULT_GDB_SCRIPT) against binary
    DebugResult debug(const string& binary, const optional<string>& script = nullopt, const RequestContext* ctx = nullptr) const;
};

#endif // DEBUGGER_H
