#ifndef JSON_PROCESS_H
#define JSON_PROCESS_H

#include <bits/stdc++.h>
#include <nlohmann/json.hpp>
#include "common.h"
#include "request.h"
using namespace std;

using json = nlohmann::json;

// Throws ConfigError when the file is missing, unparseable or inconsistent
Config read_config(string config_path);
Config parse_config(const json& config);

// {"tool": name, "arguments": {...}}. Throws RequestError.
Request parse_request(const json& request);

json to_json(const ResourceLimits& limits);
json to_json(const CompileResult& result);
json to_json(const ExecutionResult& result);
json to_json(const ComparisonResult& result);
json to_json(const DebugResult& result);
json to_json(const CompileAndRunResult& result);

#endif
