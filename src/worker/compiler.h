#ifndef COMPILER_H
#define COMPILER_H

#include <bits/stdc++.h>
#include "../common/common.h"
#include "../security/pathGuard.h"
using namespace std;

class Compiler {
private:
    const Config& config;
    const PathGuard& guard;

public:
    Compiler(const Config& config, const PathGuard& guard);

    // Writes the source under sources/, builds it into execute/.
    // Never throws: every failure is reported in the result.
    CompileResult compile(const string& source, const optional<string>& name = nullopt, const RequestContext* ctx = nullptr) const;

    // Fixed argument vector, no shell involved
    vector<string> build_command(const string& source_path, const string& output_path) const;
};

#endif // COMPILER_H
