#include <gtest/gtest.h>
#include <sys/stat.h>
#include <bits/stdc++.h>
#include "src/worker/compiler.h"
#include "src/worker/debugger.h"
#include "testUtils.h"
using namespace std;

namespace fs = filesystem;

class DebuggerTest : public ::testing::Test {
protected:
    TestTree tree;
    Config config;
    unique_ptr<PathGuard> guard;
    unique_ptr<ResourceLimiter> limiter;
    unique_ptr<Debugger> debugger;

    void SetUp() override {
        set_verbose(false);
        config = make_test_config(tree);
        config.debug_timeout_ms = 20000;
        guard = make_unique<PathGuard>(config.temp_dir);
        limiter = make_unique<ResourceLimiter>(config);
        debugger = make_unique<Debugger>(config, *guard, *limiter);
    }

    // A managed executable that needs no compiler
    string script_binary() {
        fs::path binary = guard->temp_root() / "execute" / "script_prog";
        ofstream(binary) << "#!/bin/sh\nexit 0\n";
        chmod(binary.c_str(), 0755);
        return binary.string();
    }
};

TEST_F(DebuggerTest, MissingDebuggerIsToolUnavailable) {
    config.gdb_path = "oi-runner-no-such-gdb";
    DebugResult result = debugger->debug(script_binary());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::ToolUnavailable);
    EXPECT_TRUE(fs::is_empty(guard->temp_root() / "gdb"));
}

TEST_F(DebuggerTest, RefusesBinaryOutsideManagedTree) {
    DebugResult result = debugger->debug("/bin/true");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::SecurityViolation);
}

TEST_F(DebuggerTest, RefusesDebuggerPathWithShellSyntax) {
    config.gdb_path = "gdb;id";
    DebugResult result = debugger->debug(script_binary());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::SecurityViolation);
}

TEST_F(DebuggerTest, SessionLimitsFollowConfig) {
    ResourceLimits limits = debugger->session_limits();
    EXPECT_EQ(limits.time_limit_ms, 20000);
    EXPECT_EQ(limits.memory_limit_bytes, config.hard_limits.memory_limit_bytes);
    EXPECT_EQ(limits.output_limit_bytes, config.hard_limits.output_limit_bytes);
}

// A stand-in debugger that reports the ceilings it was started under; the
// program gdb would run inherits the same ones
TEST_F(DebuggerTest, SessionRunsUnderLimits) {
    fs::path fake_gdb = tree.path / "fake_gdb";
    ofstream(fake_gdb) << "#!/bin/sh\nulimit -t\nulimit -v\n";
    chmod(fake_gdb.c_str(), 0755);
    config.gdb_path = fake_gdb.string();

    DebugResult result = debugger->debug(script_binary());
    ASSERT_TRUE(result.success) << result.error << "\n" << result.stderr_data;

    stringstream transcript(result.transcript);
    string cpu_seconds, memory_kb;
    transcript >> cpu_seconds >> memory_kb;
    EXPECT_EQ(cpu_seconds, to_string(cpu_seconds_for(config.debug_timeout_ms)));
    EXPECT_EQ(memory_kb, to_string(config.hard_limits.memory_limit_bytes / 1024));
}

TEST_F(DebuggerTest, RunsScriptAndCleansUp) {
    if (!tool_available("gdb") || !tool_available("g++")) {
        GTEST_SKIP() << "gdb or g++ not available";
    }
    Compiler compiler(config, *guard);
    CompileResult built = compiler.compile(PROGRAM_EXIT_7, string("debuggee"));
    ASSERT_TRUE(built.success) << built.stderr_data;

    DebugResult result = debugger->debug(built.executable, string("echo oi-runner-marker\\n\nquit\n"));
    EXPECT_TRUE(result.success) << result.error << "\n" << result.stderr_data;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.transcript.find("oi-runner-marker"), string::npos);
    EXPECT_TRUE(fs::is_empty(guard->temp_root() / "gdb"));
}

TEST(DebuggerScriptTest, DefaultScriptInspectsMain) {
    EXPECT_NE(DEFAULT_GDB_SCRIPT.find("break main"), string::npos);
    EXPECT_NE(DEFAULT_GDB_SCRIPT.find("backtrace"), string::npos);
    EXPECT_EQ(DEFAULT_GDB_SCRIPT.rfind("quit\n"), DEFAULT_GDB_SCRIPT.size() - 5);
}
