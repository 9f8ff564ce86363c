#include <gtest/gtest.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <bits/stdc++.h>
#include "src/worker/resourceLimiter.h"
#include "testUtils.h"
using namespace std;

namespace {

const long long MB = 1024LL * 1024;

Config limiter_config() {
    Config config;
    config.default_limits = {1000, 256 * MB, 65536};
    config.hard_limits = {10000, 1024 * MB, 1024 * 1024};
    return config;
}

}

TEST(ResourceLimiterTest, DefaultsWithoutOverride) {
    ResourceLimiter limiter(limiter_config());
    ResourceLimits limits = limiter.effective_limits();
    EXPECT_EQ(limits.time_limit_ms, 1000);
    EXPECT_EQ(limits.memory_limit_bytes, 256 * MB);
    EXPECT_EQ(limits.output_limit_bytes, 65536);
}

TEST(ResourceLimiterTest, OverrideReplacesOnlyGivenFields) {
    ResourceLimiter limiter(limiter_config());
    LimitOverride request;
    request.time_limit_ms = 2500;
    ResourceLimits limits = limiter.effective_limits(request);
    EXPECT_EQ(limits.time_limit_ms, 2500);
    EXPECT_EQ(limits.memory_limit_bytes, 256 * MB);
    EXPECT_EQ(limits.output_limit_bytes, 65536);

    request = LimitOverride();
    request.memory_limit_bytes = 64 * MB;
    limits = limiter.effective_limits(request);
    EXPECT_EQ(limits.time_limit_ms, 1000);
    EXPECT_EQ(limits.memory_limit_bytes, 64 * MB);
}

TEST(ResourceLimiterTest, OverrideClampedToHardCaps) {
    ResourceLimiter limiter(limiter_config());
    LimitOverride request;
    request.time_limit_ms = 3600 * 1000;
    request.memory_limit_bytes = 64 * 1024 * MB;
    request.output_limit_bytes = 1LL << 40;
    ResourceLimits limits = limiter.effective_limits(request);
    EXPECT_EQ(limits.time_limit_ms, 10000);
    EXPECT_EQ(limits.memory_limit_bytes, 1024 * MB);
    EXPECT_EQ(limits.output_limit_bytes, 1024 * 1024);
}

TEST(ResourceLimiterTest, NonPositiveOverrideIgnored) {
    ResourceLimiter limiter(limiter_config());
    LimitOverride request;
    request.time_limit_ms = 0;
    request.memory_limit_bytes = -5;
    ResourceLimits limits = limiter.effective_limits(request);
    EXPECT_EQ(limits.time_limit_ms, 1000);
    EXPECT_EQ(limits.memory_limit_bytes, 256 * MB);
}

TEST(ResourceLimiterTest, CpuSecondsRoundUp) {
    EXPECT_EQ(cpu_seconds_for(1), 1);
    EXPECT_EQ(cpu_seconds_for(1000), 1);
    EXPECT_EQ(cpu_seconds_for(1001), 2);
    EXPECT_EQ(cpu_seconds_for(2500), 3);
    EXPECT_EQ(cpu_seconds_for(0), 1);
}

TEST(ResourceLimiterTest, OutputFileCeilingJustAboveLimit) {
    EXPECT_EQ(output_file_ceiling({1000, 256 * MB, 65536}), 65537);
    EXPECT_EQ(output_file_ceiling({1000, 256 * MB, 1000}), 1001);
}

TEST(ResourceLimiterTest, NoopBackendReportsUnsupported) {
    ResourceLimiter limiter(limiter_config(), make_unique<NoopBackend>());
    EXPECT_FALSE(limiter.supported());
    EXPECT_EQ(limiter.backend_name(), "none");
    EXPECT_EQ(limiter.apply(limiter.effective_limits()), LimitStatus::Unsupported);
}

TEST(ResourceLimiterTest, NullBackendFallsBackToNoop) {
    ResourceLimiter limiter(limiter_config(), nullptr);
    EXPECT_FALSE(limiter.supported());
}

TEST(ResourceLimiterTest, RlimitBackendInstallsCeilings) {
    ResourceLimiter limiter(limiter_config(), make_unique<RlimitBackend>());
    ASSERT_TRUE(limiter.supported());
    EXPECT_EQ(limiter.backend_name(), "rlimit");

    LimitOverride request;
    request.time_limit_ms = 2500;
    request.memory_limit_bytes = 128 * MB;
    ResourceLimits limits = limiter.effective_limits(request);

    // Applied in a throwaway child, the exit code tells which check failed
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        if (limiter.apply(limits) != LimitStatus::Applied) _exit(10);
        struct rlimit rl;
        // Soft CPU limit below the hard one, so SIGXCPU arrives before SIGKILL
        if (getrlimit(RLIMIT_CPU, &rl) != 0 || rl.rlim_cur != 3 || rl.rlim_max != 4) _exit(11);
        if (getrlimit(RLIMIT_AS, &rl) != 0 || rl.rlim_cur != (rlim_t)(128 * MB)) _exit(12);
        if (getrlimit(RLIMIT_CORE, &rl) != 0 || rl.rlim_cur != 0) _exit(13);
        if (getrlimit(RLIMIT_FSIZE, &rl) != 0 || rl.rlim_cur != (rlim_t)(65536 + 1)) _exit(14);
        _exit(0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
