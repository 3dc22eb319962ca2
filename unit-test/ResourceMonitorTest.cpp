#include "gtest/gtest.h"
#include "resource_monitor.hpp"

using namespace std;
using namespace std::chrono;
using namespace codebox;

static const int64_t MB = 1024 * 1024;

class ResourceMonitorTest : public ::testing::Test {
protected:
    resource_monitor monitor{seconds(1), 64 * MB};

    static resource_sample sample(milliseconds elapsed, int64_t memory) {
        return {elapsed, memory};
    }
};

TEST_F(ResourceMonitorTest, StaysRunningUnderLimitsTest) {
    EXPECT_EQ(monitor.observe(sample(milliseconds(50), 10 * MB)), run_state::RUNNING);
    EXPECT_EQ(monitor.observe(sample(milliseconds(999), 64 * MB - 1)), run_state::RUNNING);
    EXPECT_FALSE(monitor.should_kill());
    EXPECT_EQ(monitor.samples(), 2u);
    EXPECT_EQ(monitor.peak_memory(), 64 * MB - 1);
}

TEST_F(ResourceMonitorTest, TimeoutAtLimitTest) {
    EXPECT_EQ(monitor.observe(sample(milliseconds(500), MB)), run_state::RUNNING);
    EXPECT_EQ(monitor.observe(sample(milliseconds(1000), MB)), run_state::TIMED_OUT);
    EXPECT_TRUE(monitor.should_kill());
    EXPECT_EQ(monitor.outcome(), run_state::TIMED_OUT);
}

TEST_F(ResourceMonitorTest, MemoryExceededAtLimitTest) {
    EXPECT_EQ(monitor.observe(sample(milliseconds(100), 64 * MB)), run_state::MEMORY_EXCEEDED);
    EXPECT_TRUE(monitor.should_kill());
}

TEST_F(ResourceMonitorTest, BothCrossedInSameSampleIsMemoryExceededTest) {
    EXPECT_EQ(monitor.observe(sample(milliseconds(200), MB)), run_state::RUNNING);
    EXPECT_EQ(monitor.observe(sample(milliseconds(1200), 128 * MB)), run_state::MEMORY_EXCEEDED);
    EXPECT_EQ(monitor.outcome(), run_state::MEMORY_EXCEEDED);
}

TEST_F(ResourceMonitorTest, TimeCrossedEarlierIsTimedOutTest) {
    EXPECT_EQ(monitor.observe(sample(milliseconds(1000), MB)), run_state::TIMED_OUT);
    // 之后的采样不会改写结论，只更新峰值内存
    EXPECT_EQ(monitor.observe(sample(milliseconds(1050), 128 * MB)), run_state::TIMED_OUT);
    EXPECT_EQ(monitor.outcome(), run_state::TIMED_OUT);
    EXPECT_EQ(monitor.peak_memory(), 128 * MB);
    EXPECT_EQ(monitor.samples(), 1u);
}

TEST_F(ResourceMonitorTest, TieBreakIsDeterministicTest) {
    for (int i = 0; i < 100; ++i) {
        resource_monitor m(seconds(1), 64 * MB);
        m.observe(sample(milliseconds(10 * i), MB));
        EXPECT_EQ(m.observe(sample(seconds(2), 65 * MB)), run_state::MEMORY_EXCEEDED);
    }
}

TEST_F(ResourceMonitorTest, NormalExitCompletesTest) {
    monitor.observe(sample(milliseconds(50), MB));
    EXPECT_EQ(monitor.worker_exited(false), run_state::COMPLETED);
    monitor.terminate();
    EXPECT_EQ(monitor.state(), run_state::TERMINATED);
    EXPECT_EQ(monitor.outcome(), run_state::COMPLETED);
}

TEST_F(ResourceMonitorTest, AbnormalExitCrashesTest) {
    EXPECT_EQ(monitor.worker_exited(true), run_state::CRASHED);
    monitor.terminate();
    EXPECT_EQ(monitor.outcome(), run_state::CRASHED);
}

TEST_F(ResourceMonitorTest, ExitAfterKillKeepsOutcomeTest) {
    monitor.observe(sample(milliseconds(1500), MB));
    // 被 SIGKILL 杀死的 worker 总是异常退出
    EXPECT_EQ(monitor.worker_exited(true), run_state::TIMED_OUT);
    monitor.terminate();
    EXPECT_EQ(monitor.state(), run_state::TERMINATED);
    EXPECT_EQ(monitor.outcome(), run_state::TIMED_OUT);
}

TEST_F(ResourceMonitorTest, KernelEnforcedLimitTest) {
    EXPECT_EQ(monitor.limit_enforced(run_state::TIMED_OUT), run_state::TIMED_OUT);
    EXPECT_EQ(monitor.limit_enforced(run_state::MEMORY_EXCEEDED), run_state::TIMED_OUT);
}

TEST_F(ResourceMonitorTest, TerminateWhileRunningIsCrashTest) {
    monitor.terminate();
    EXPECT_EQ(monitor.state(), run_state::TERMINATED);
    EXPECT_EQ(monitor.outcome(), run_state::CRASHED);
}

TEST_F(ResourceMonitorTest, RecordPeakTest) {
    monitor.observe(sample(milliseconds(50), 10 * MB));
    monitor.record_peak(5 * MB);
    EXPECT_EQ(monitor.peak_memory(), 10 * MB);
    monitor.record_peak(20 * MB);
    EXPECT_EQ(monitor.peak_memory(), 20 * MB);
}

TEST(ResourceMonitorStateTest, StateNamesTest) {
    EXPECT_STREQ(get_state_name(run_state::RUNNING), "running");
    EXPECT_STREQ(get_state_name(run_state::TIMED_OUT), "timed-out");
    EXPECT_STREQ(get_state_name(run_state::MEMORY_EXCEEDED), "memory-exceeded");
    EXPECT_STREQ(get_state_name(run_state::TERMINATED), "terminated");
}
