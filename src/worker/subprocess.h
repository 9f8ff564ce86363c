#ifndef SUBPROCESS_H
#define SUBPROCESS_H

#include <bits/stdc++.h>
#include <sys/resource.h>
#include "../common/common.h"
#include "resourceLimiter.h"
using namespace std;

struct SpawnOptions {
    vector<string> argv;            // argv[0] is looked up in PATH when it has no '/'
    string working_dir;             // empty: inherit
    string stdin_path;              // empty: /dev/null
    string stdout_path;             // empty: capture through a pipe
    long timeout_ms = 30000;        // wall clock
    size_t capture_limit = 1 << 20; // per captured stream, the rest is drained and dropped
    const ResourceLimiter* limiter = nullptr;
    ResourceLimits limits = {0, 0, 0};
};

struct ProcessOutcome {
    bool started = false;
    int spawn_errno = 0;
    string spawn_error;
    bool limits_degraded = false;
    bool timed_out = false;
    int status = 0;
    struct rusage usage = {};
    long elapsed_ms = 0;
    string stdout_data;
    string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    bool exited() const;
    int exit_code() const;      // -1 when terminated by a signal
    int term_signal() const;    // 0 when exited normally
    long peak_memory_kb() const;
    long cpu_time_ms() const;   // user + system
};

// Owns a file descriptor, closes it on destruction
class UniqueFd {
private:
    int fd;

public:
    explicit UniqueFd(int descriptor = -1) : fd(descriptor) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    int get() const { return fd; }
    int release();
    void reset(int descriptor = -1);
    bool valid() const { return fd >= 0; }
};

// Removes request-scoped temp files on every exit path
class TempFiles {
private:
    vector<filesystem::path> paths;

public:
    TempFiles() = default;
    TempFiles(const TempFiles&) = delete;
    TempFiles& operator=(const TempFiles&) = delete;
    ~TempFiles();

    filesystem::path add(filesystem::path path);
};

// Spawns one child in its own process group, feeds/captures its streams and waits
// for it with a hard wall-clock deadline. The child and its process group are
// gone when this returns, whatever happened (including exceptions).
ProcessOutcome run_process(const SpawnOptions& options);

// Writes content to path (binary, truncating). Throws IoError.
void write_file(const string& path, const string& content);

// Reads at most max_bytes from path; total_size receives the full file size. Throws IoError.
string read_file_prefix(const string& path, size_t max_bytes, size_t& total_size);

#endif // SUBPROCESS_H
