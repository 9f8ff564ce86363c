#include <bits/stdc++.h>
#include "common.h"
#include "jsonProcess.h"
#include <nlohmann/json.hpp>
using namespace std;

using json = nlohmann::json;

namespace {

const long long MEGABYTE = 1024LL * 1024;

const json& section_of(const json& config, const char* name) {
    static const json empty = json::object();
    if (!config.contains(name)) return empty;
    const json& section = config.at(name);
    if (!section.is_object()) {
        throw ConfigError(string("Section '") + name + "' must be an object");
    }
    return section;
}

template<typename T>
T config_value(const json& section, const char* key, T fallback) {
    if (!section.contains(key)) return fallback;
    try {
        return section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(string("Invalid value for '") + key + "': " + e.what());
    }
}

template<typename T>
T required_field(const json& arguments, const char* key) {
    if (!arguments.contains(key)) {
        throw RequestError(string("Missing argument '") + key + "'");
    }
    try {
        return arguments.at(key).get<T>();
    } catch (const json::exception& e) {
        throw RequestError(string("Invalid argument '") + key + "': " + e.what());
    }
}

template<typename T>
optional<T> optional_field(const json& arguments, const char* key) {
    if (!arguments.contains(key) || arguments.at(key).is_null()) return nullopt;
    try {
        return arguments.at(key).get<T>();
    } catch (const json::exception& e) {
        throw RequestError(string("Invalid argument '") + key + "': " + e.what());
    }
}

long long megabytes_value(const json& section, const char* key, long long fallback_bytes) {
    long long mb = config_value(section, key, fallback_bytes / MEGABYTE);
    if (mb > numeric_limits<long long>::max() / MEGABYTE) {
        throw ConfigError(string("Value for '") + key + "' is too large");
    }
    return mb * MEGABYTE;
}

void require_positive(long long value, const string& what) {
    if (value <= 0) {
        throw ConfigError(what + " must be positive");
    }
}

json optional_string(const string& value, bool present) {
    return present ? json(value) : json(nullptr);
}

}

// ============================================================================
// Read configuration
// ============================================================================

Config read_config(string config_path) {
    ifstream file(config_path);

    if (!file.is_open()) {
        throw ConfigError("Cannot open " + config_path);
    }

    json config;
    try {
        file >> config;
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse " + config_path + ": " + e.what());
    }
    file.close();

    return parse_config(config);
}

Config parse_config(const json& config) {
    if (!config.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    Config result;

    const json& compilation = section_of(config, "compilation");
    result.compiler_path = config_value(compilation, "compiler_path", result.compiler_path);
    result.cpp_standard = config_value(compilation, "cpp_standard", result.cpp_standard);
    result.optimization_level = config_value(compilation, "optimization_level", result.optimization_level);
    result.warning_flags = config_value(compilation, "warning_flags", result.warning_flags);
    result.compile_timeout_ms = config_value(compilation, "timeout_ms", result.compile_timeout_ms);

    const json& execution = section_of(config, "execution");
    result.default_limits.time_limit_ms = config_value(execution, "max_time", result.default_limits.time_limit_ms);
    result.default_limits.memory_limit_bytes = megabytes_value(execution, "max_memory", result.default_limits.memory_limit_bytes);
    result.default_limits.output_limit_bytes = config_value(execution, "max_output_size", result.default_limits.output_limit_bytes);
    result.hard_limits.time_limit_ms = config_value(execution, "hard_max_time", result.hard_limits.time_limit_ms);
    result.hard_limits.memory_limit_bytes = megabytes_value(execution, "hard_max_memory", result.hard_limits.memory_limit_bytes);
    result.hard_limits.output_limit_bytes = config_value(execution, "hard_max_output_size", result.hard_limits.output_limit_bytes);
    result.grace_ms = config_value(execution, "grace_ms", result.grace_ms);

    const json& debugger = section_of(config, "debugger");
    result.gdb_path = config_value(debugger, "gdb_path", result.gdb_path);
    result.debug_timeout_ms = config_value(debugger, "timeout_ms", result.debug_timeout_ms);

    const json& paths = section_of(config, "paths");
    result.temp_dir = config_value(paths, "temp_dir", result.temp_dir);

    const json& security = section_of(config, "security");
    result.allowed_roots = config_value(security, "allowed_roots", result.allowed_roots);

    // Consistency checks
    if (result.compiler_path.empty()) throw ConfigError("compilation.compiler_path is empty");
    if (result.gdb_path.empty()) throw ConfigError("debugger.gdb_path is empty");
    require_positive(result.compile_timeout_ms, "compilation.timeout_ms");
    require_positive(result.debug_timeout_ms, "debugger.timeout_ms");
    require_positive(result.default_limits.time_limit_ms, "execution.max_time");
    require_positive(result.default_limits.memory_limit_bytes, "execution.max_memory");
    require_positive(result.default_limits.output_limit_bytes, "execution.max_output_size");
    require_positive(result.hard_limits.time_limit_ms, "execution.hard_max_time");
    require_positive(result.hard_limits.memory_limit_bytes, "execution.hard_max_memory");
    require_positive(result.hard_limits.output_limit_bytes, "execution.hard_max_output_size");
    if (result.grace_ms < 0) throw ConfigError("execution.grace_ms must not be negative");
    if (result.default_limits.output_limit_bytes < MIN_OUTPUT_LIMIT_BYTES) {
        throw ConfigError("execution.max_output_size must be at least " + to_string(MIN_OUTPUT_LIMIT_BYTES));
    }

    if (result.default_limits.time_limit_ms > result.hard_limits.time_limit_ms ||
        result.default_limits.memory_limit_bytes > result.hard_limits.memory_limit_bytes ||
        result.default_limits.output_limit_bytes > result.hard_limits.output_limit_bytes) {
        throw ConfigError("Default execution limits exceed the hard limits");
    }

    return result;
}

// ============================================================================
// Parse requests
// ============================================================================

Request parse_request(const json& request) {
    if (!request.is_object()) {
        throw RequestError("Request must be a JSON object");
    }
    string tool = required_field<string>(request, "tool");

    json arguments = request.contains("arguments") ? request.at("arguments") : json::object();
    if (!arguments.is_object()) {
        throw RequestError("'arguments' must be an object");
    }

    if (tool == "compile") {
        CompileRequest compile;
        compile.source = required_field<string>(arguments, "source");
        compile.name = optional_field<string>(arguments, "name");
        return compile;
    }
    if (tool == "run") {
        RunRequest run;
        run.binary = required_field<string>(arguments, "binary");
        run.input = optional_field<string>(arguments, "input").value_or("");
        run.time_limit_ms = optional_field<long>(arguments, "time_limit_ms");
        run.memory_limit_mb = optional_field<long>(arguments, "memory_limit_mb");
        return run;
    }
    if (tool == "compare") {
        CompareRequest compare;
        compare.actual = required_field<string>(arguments, "actual");
        compare.expected = required_field<string>(arguments, "expected");
        compare.ignore_whitespace = optional_field<bool>(arguments, "ignore_whitespace").value_or(true);
        compare.ignore_case = optional_field<bool>(arguments, "ignore_case").value_or(false);
        return compare;
    }
    if (tool == "debug") {
        DebugRequest debug;
        debug.binary = required_field<string>(arguments, "binary");
        debug.script = optional_field<string>(arguments, "script");
        return debug;
    }
    if (tool == "compile_and_run") {
        CompileAndRunRequest pipeline;
        pipeline.source = required_field<string>(arguments, "source");
        pipeline.input = optional_field<string>(arguments, "input").value_or("");
        pipeline.expected_output = optional_field<string>(arguments, "expected_output");
        pipeline.name = optional_field<string>(arguments, "name");
        pipeline.time_limit_ms = optional_field<long>(arguments, "time_limit_ms");
        pipeline.memory_limit_mb = optional_field<long>(arguments, "memory_limit_mb");
        return pipeline;
    }

    throw RequestError("Unknown tool: " + tool);
}

// ============================================================================
// Serialize results
// ============================================================================

json to_json(const ResourceLimits& limits) {
    return {
        {"time_limit_ms", limits.time_limit_ms},
        {"memory_limit_mb", limits.memory_limit_bytes / MEGABYTE},
        {"output_limit_bytes", limits.output_limit_bytes}
    };
}

json to_json(const CompileResult& result) {
    return {
        {"success", result.success},
        {"artifact", optional_string(result.executable, result.success)},
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"exit_code", result.exit_code},
        {"error_kind", error_kind_name(result.error_kind)},
        {"error", result.error}
    };
}

json to_json(const ExecutionResult& result) {
    bool has_output = result.outcome != Outcome::Timeout && result.outcome != Outcome::NotStarted;
    return {
        {"success", result.success},
        {"stdout", optional_string(result.stdout_data, has_output)},
        {"stdout_truncated", result.stdout_truncated},
        {"stderr", result.stderr_data},
        {"elapsed_ms", result.elapsed_ms},
        {"memory_kb", result.memory_kb},
        {"exit_code", result.exit_code},
        {"signal", result.signal},
        {"outcome", outcome_name(result.outcome)},
        {"limits_enforced", result.limits_enforced},
        {"limits", to_json(result.limits)},
        {"error_kind", error_kind_name(result.error_kind)},
        {"error", result.error}
    };
}

json to_json(const ComparisonResult& result) {
    json differences = json::array();
    for (const auto& difference : result.differences) {
        differences.push_back({
            {"line", difference.line},
            {"actual", difference.actual},
            {"expected", difference.expected}
        });
    }
    return {
        {"match", result.match},
        {"differences", differences},
        {"actual_line_count", result.actual_line_count},
        {"expected_line_count", result.expected_line_count}
    };
}

json to_json(const DebugResult& result) {
    return {
        {"success", result.success},
        {"transcript", result.transcript},
        {"stderr", result.stderr_data},
        {"exit_code", result.exit_code},
        {"error_kind", error_kind_name(result.error_kind)},
        {"error", result.error}
    };
}

json to_json(const CompileAndRunResult& result) {
    json output = {{"compile", to_json(result.compile)}};
    output["run"] = result.run ? to_json(*result.run) : json(nullptr);
    output["comparison"] = result.comparison ? to_json(*result.comparison) : json(nullptr);
    return output;
}
