#include "subprocess.h"
#include <sys/resource.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <bits/stdc++.h>
using namespace std;

namespace {

// Written by the child on the status pipe; the pipe closes silently on a successful exec
enum ChildStage : int {
    STAGE_REDIRECT = 1,
    STAGE_LIMITS = 2,
    STAGE_EXEC = 3
};

struct ChildReport {
    int stage;
    int error;
};

struct ChildPlan {
    char* const* argv;
    const char* working_dir;
    const char* stdin_path;
    const char* stdout_path;
    int stdout_fd;
    int stderr_fd;
    int report_fd;
    const ResourceLimiter* limiter;
    ResourceLimits limits;
};

// Kills the child's process group and reaps it unless it was already reaped
class ChildGuard {
private:
    pid_t pid;
    bool reaped;

public:
    explicit ChildGuard(pid_t child) : pid(child), reaped(false) {}
    ~ChildGuard() {
        if (reaped) return;
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
    }
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void mark_reaped() { reaped = true; }
};

struct CaptureStream {
    int fd;
    string* sink;
    bool* truncated;
    bool open;
};

long elapsed_since(chrono::steady_clock::time_point start) {
    return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
}

bool report_from_child(int fd, int stage, int error) {
    ChildReport report{stage, error};
    return write(fd, &report, sizeof(report)) == (ssize_t)sizeof(report);
}

// ============================================================================
// Child side (between fork and exec: async-signal-safe calls only)
// ============================================================================

[[noreturn]] void exec_child(const ChildPlan& plan) {
    auto fail = [&](int stage) {
        report_from_child(plan.report_fd, stage, errno);
        _exit(127);
    };

    setpgid(0, 0);

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
    signal(SIGPIPE, SIG_DFL);

    if (plan.working_dir != nullptr && chdir(plan.working_dir) != 0) fail(STAGE_REDIRECT);

    int input_fd = open(plan.stdin_path, O_RDONLY);
    if (input_fd < 0) fail(STAGE_REDIRECT);
    if (dup2(input_fd, STDIN_FILENO) < 0) fail(STAGE_REDIRECT);
    close(input_fd);

    if (plan.stdout_path != nullptr) {
        int output_fd = open(plan.stdout_path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (output_fd < 0) fail(STAGE_REDIRECT);
        if (dup2(output_fd, STDOUT_FILENO) < 0) fail(STAGE_REDIRECT);
        close(output_fd);
    } else if (dup2(plan.stdout_fd, STDOUT_FILENO) < 0) {
        fail(STAGE_REDIRECT);
    }

    if (dup2(plan.stderr_fd, STDERR_FILENO) < 0) fail(STAGE_REDIRECT);

    // Failing to install limits is not fatal, the parent reports degraded enforcement
    if (plan.limiter != nullptr && plan.limiter->apply(plan.limits) == LimitStatus::Failed) {
        if (!report_from_child(plan.report_fd, STAGE_LIMITS, errno)) _exit(126);
    }

    // Writes past the file size ceiling fail with EFBIG instead of killing the child;
    // the parent sees the oversized output as truncated
    if (plan.limiter != nullptr) signal(SIGXFSZ, SIG_IGN);

    execvp(plan.argv[0], plan.argv);
    fail(STAGE_EXEC);
    _exit(127);
}

// ============================================================================
// Parent side
// ============================================================================

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

bool any_open(const vector<CaptureStream>& streams) {
    for (const auto& stream : streams) {
        if (stream.open) return true;
    }
    return false;
}

// Waits up to wait_ms for data and reads whatever is available
void pump_streams(vector<CaptureStream>& streams, int wait_ms, size_t limit) {
    vector<pollfd> fds;
    vector<CaptureStream*> polled;
    for (auto& stream : streams) {
        if (!stream.open) continue;
        fds.push_back({stream.fd, POLLIN, 0});
        polled.push_back(&stream);
    }

    int ready = poll(fds.empty() ? nullptr : fds.data(), fds.size(), wait_ms);
    if (ready <= 0) return;

    char buffer[65536];
    for (size_t i = 0; i < fds.size(); ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        CaptureStream& stream = *polled[i];

        while (true) {
            ssize_t n = read(stream.fd, buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = stream.sink->size() < limit ? limit - stream.sink->size() : 0;
                size_t kept = min(room, (size_t)n);
                stream.sink->append(buffer, kept);
                if (kept < (size_t)n) *stream.truncated = true;
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
            stream.open = false;
            break;
        }
    }
}

string stage_name(int stage) {
    switch (stage) {
        case STAGE_REDIRECT: return "redirect";
        case STAGE_LIMITS: return "resource limits";
        case STAGE_EXEC: return "exec";
    }
    return "spawn";
}

}

// ============================================================================
// UniqueFd
// ============================================================================

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
}

int UniqueFd::release() {
    int descriptor = fd;
    fd = -1;
    return descriptor;
}

void UniqueFd::reset(int descriptor) {
    if (fd >= 0) close(fd);
    fd = descriptor;
}

// ============================================================================
// TempFiles
// ============================================================================

TempFiles::~TempFiles() {
    for (const auto& path : paths) {
        error_code ec;
        filesystem::remove(path, ec);
    }
}

filesystem::path TempFiles::add(filesystem::path path) {
    paths.push_back(move(path));
    return paths.back();
}

// ============================================================================
// ProcessOutcome
// ============================================================================

bool ProcessOutcome::exited() const {
    return started && !timed_out && WIFEXITED(status);
}

int ProcessOutcome::exit_code() const {
    return exited() ? WEXITSTATUS(status) : -1;
}

int ProcessOutcome::term_signal() const {
    return (started && WIFSIGNALED(status)) ? WTERMSIG(status) : 0;
}

long ProcessOutcome::peak_memory_kb() const {
#ifdef __APPLE__
    return usage.ru_maxrss / 1024;
#else
    return usage.ru_maxrss;
#endif
}

long ProcessOutcome::cpu_time_ms() const {
    return (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000L +
           (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000L;
}

// ============================================================================
// Run a process
// ============================================================================

ProcessOutcome run_process(const SpawnOptions& options) {
    ProcessOutcome outcome;
    if (options.argv.empty()) {
        outcome.spawn_errno = EINVAL;
        outcome.spawn_error = "empty argument vector";
        return outcome;
    }

    // Everything the child touches is prepared before fork
    vector<char*> argv_ptrs;
    for (const auto& arg : options.argv) argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
    argv_ptrs.push_back(nullptr);
    string stdin_path = options.stdin_path.empty() ? "/dev/null" : options.stdin_path;
    bool capture_stdout = options.stdout_path.empty();

    UniqueFd out_read, out_write, err_read, err_write, report_read, report_write;
    auto make_pipe = [](UniqueFd& read_end, UniqueFd& write_end) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) return false;
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
        return true;
    };
    if ((capture_stdout && !make_pipe(out_read, out_write)) ||
        !make_pipe(err_read, err_write) || !make_pipe(report_read, report_write)) {
        outcome.spawn_errno = errno;
        outcome.spawn_error = "pipe failed: " + string(strerror(errno));
        return outcome;
    }

    ChildPlan plan;
    plan.argv = argv_ptrs.data();
    plan.working_dir = options.working_dir.empty() ? nullptr : options.working_dir.c_str();
    plan.stdin_path = stdin_path.c_str();
    plan.stdout_path = capture_stdout ? nullptr : options.stdout_path.c_str();
    plan.stdout_fd = out_write.get();
    plan.stderr_fd = err_write.get();
    plan.report_fd = report_write.get();
    plan.limiter = options.limiter;
    plan.limits = options.limits;

    auto start_time = chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        outcome.spawn_errno = errno;
        outcome.spawn_error = "fork failed: " + string(strerror(errno));
        return outcome;
    }
    if (pid == 0) {
        exec_child(plan);
    }

    ChildGuard guard(pid);
    setpgid(pid, pid);  // the child does the same, whichever runs first wins
    out_write.reset();
    err_write.reset();
    report_write.reset();

    // Status pipe: EOF on exec, a report otherwise
    optional<ChildReport> fatal_report;
    while (true) {
        ChildReport report;
        ssize_t n = read(report_read.get(), &report, sizeof(report));
        if (n < 0 && errno == EINTR) continue;
        if (n != (ssize_t)sizeof(report)) break;
        if (report.stage == STAGE_LIMITS) {
            outcome.limits_degraded = true;
        } else {
            fatal_report = report;
        }
    }

    if (fatal_report) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        guard.mark_reaped();
        outcome.spawn_errno = fatal_report->error;
        outcome.spawn_error = stage_name(fatal_report->stage) + " failed for " + options.argv[0] + ": " + strerror(fatal_report->error);
        return outcome;
    }
    outcome.started = true;

    vector<CaptureStream> streams;
    if (capture_stdout) {
        set_nonblocking(out_read.get());
        streams.push_back({out_read.get(), &outcome.stdout_data, &outcome.stdout_truncated, true});
    }
    set_nonblocking(err_read.get());
    streams.push_back({err_read.get(), &outcome.stderr_data, &outcome.stderr_truncated, true});

    // Monitor: poll the pipes in short slices, check for exit and for the deadline
    while (true) {
        long remaining = options.timeout_ms - elapsed_since(start_time);
        pump_streams(streams, (int)max(0L, min(remaining, 10L)), options.capture_limit);

        int status = 0;
        struct rusage usage;
        pid_t result = wait4(pid, &status, WNOHANG, &usage);
        if (result == pid) {
            guard.mark_reaped();
            outcome.status = status;
            outcome.usage = usage;
            break;
        }
        if (result < 0 && errno != EINTR) {
            throw runtime_error("wait4 failed: " + string(strerror(errno)));
        }

        if (elapsed_since(start_time) >= options.timeout_ms) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {}
            guard.mark_reaped();
            outcome.status = status;
            outcome.usage = usage;
            outcome.timed_out = true;
            break;
        }
    }
    outcome.elapsed_ms = elapsed_since(start_time);

    // Leftover members of the group would keep the pipes open
    kill(-pid, SIGKILL);

    auto drain_start = chrono::steady_clock::now();
    while (any_open(streams) && elapsed_since(drain_start) < 200) {
        pump_streams(streams, 10, options.capture_limit);
    }

    return outcome;
}

// ============================================================================
// File helpers
// ============================================================================

void write_file(const string& path, const string& content) {
    ofstream file(path, ios::binary | ios::trunc);
    if (!file) {
        throw IoError("Cannot create " + path);
    }
    file.write(content.data(), content.size());
    if (!file) {
        throw IoError("Cannot write " + path);
    }
}

string read_file_prefix(const string& path, size_t max_bytes, size_t& total_size) {
    ifstream file(path, ios::binary);
    if (!file) {
        throw IoError("Cannot open " + path);
    }

    file.seekg(0, ios::end);
    streamoff size = file.tellg();
    if (size < 0) {
        throw IoError("Cannot determine size of " + path);
    }
    total_size = (size_t)size;
    file.seekg(0, ios::beg);

    string content(min(total_size, max_bytes), '\0');
    file.read(&content[0], content.size());
    content.resize((size_t)file.gcount());
    return content;
}
