#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

#include "beacon/utils/SystemMetrics.hpp"
#include "ProcfsFixture.hpp"

namespace beacon {
namespace test {

using utils::CpuTimes;
using utils::MemoryInfo;
using utils::SamplerError;
using utils::SystemMetricsCollector;

TEST(CpuTimesParseTest, ReadsAggregateLine) {
    std::istringstream in(kDefaultStat);
    CpuTimes times = SystemMetricsCollector::parse_cpu_times(in);

    EXPECT_EQ(times.user, 4705u);
    EXPECT_EQ(times.nice, 150u);
    EXPECT_EQ(times.system, 1120u);
    EXPECT_EQ(times.idle, 16250u);
    EXPECT_EQ(times.iowait, 520u);
    EXPECT_EQ(times.irq, 20u);
    EXPECT_EQ(times.softirq, 35u);
    EXPECT_EQ(times.steal, 0u);
    EXPECT_EQ(times.total(), 22800u);
    EXPECT_EQ(times.idle_all(), 16770u);
    EXPECT_EQ(times.busy(), 6030u);
}

TEST(CpuTimesParseTest, GuestFieldsAreNotCountedTwice) {
    std::istringstream in("cpu  100 10 20 300 5 1 2 3 40 4\n");
    CpuTimes times = SystemMetricsCollector::parse_cpu_times(in);

    EXPECT_EQ(times.total(), 441u);
}

TEST(CpuTimesParseTest, AcceptsOldKernelWithFourFields) {
    std::istringstream in("cpu 10 20 30 40\n");
    CpuTimes times = SystemMetricsCollector::parse_cpu_times(in);

    EXPECT_EQ(times.idle, 40u);
    EXPECT_EQ(times.iowait, 0u);
    EXPECT_EQ(times.total(), 100u);
}

TEST(CpuTimesParseTest, SkipsLinesBeforeAggregate) {
    std::istringstream in("btime 1700000000\ncpu 1 2 3 4 5 6 7 8\n");
    CpuTimes times = SystemMetricsCollector::parse_cpu_times(in);

    EXPECT_EQ(times.steal, 8u);
}

TEST(CpuTimesParseTest, RejectsTruncatedLine) {
    std::istringstream in("cpu 10 20\n");
    EXPECT_THROW(SystemMetricsCollector::parse_cpu_times(in), SamplerError);
}

TEST(CpuTimesParseTest, RejectsMissingAggregate) {
    std::istringstream in("cpu0 1 2 3 4\nintr 5\n");
    EXPECT_THROW(SystemMetricsCollector::parse_cpu_times(in), SamplerError);
}

TEST(MemInfoParseTest, UsesMemAvailable) {
    std::istringstream in(kDefaultMeminfo);
    MemoryInfo info = SystemMetricsCollector::parse_meminfo(in);

    EXPECT_EQ(info.total_kb, 4194304u);
    EXPECT_EQ(info.available_kb, 1048576u);
    EXPECT_DOUBLE_EQ(SystemMetricsCollector::memory_percent(info), 75.0);
}

TEST(MemInfoParseTest, FallsBackWithoutMemAvailable) {
    std::istringstream in(
        "MemTotal:        4194304 kB\n"
        "MemFree:          524288 kB\n"
        "Buffers:          131072 kB\n"
        "Cached:           262144 kB\n");
    MemoryInfo info = SystemMetricsCollector::parse_meminfo(in);

    EXPECT_EQ(info.available_kb, 917504u);
    EXPECT_DOUBLE_EQ(SystemMetricsCollector::memory_percent(info), 78.1);
}

TEST(MemInfoParseTest, RejectsMissingTotal) {
    std::istringstream in("MemFree: 1024 kB\nMemAvailable: 2048 kB\n");
    EXPECT_THROW(SystemMetricsCollector::parse_meminfo(in), SamplerError);
}

TEST(MemInfoParseTest, RejectsZeroTotal) {
    std::istringstream in("MemTotal: 0 kB\nMemAvailable: 0 kB\n");
    EXPECT_THROW(SystemMetricsCollector::parse_meminfo(in), SamplerError);
}

TEST(CpuPercentTest, BusyShareOfElapsedJiffies) {
    CpuTimes before;
    before.user = 100;
    before.system = 50;
    before.idle = 800;
    before.iowait = 50;

    CpuTimes after = before;
    after.user = 300;
    after.system = 100;
    after.idle = 1100;
    after.iowait = 100;

    EXPECT_DOUBLE_EQ(SystemMetricsCollector::cpu_percent(before, after), 41.7);
}

TEST(CpuPercentTest, NoElapsedTimeIsZero) {
    CpuTimes times;
    times.user = 10;
    times.idle = 90;

    EXPECT_DOUBLE_EQ(SystemMetricsCollector::cpu_percent(times, times), 0.0);
}

TEST(CpuPercentTest, FullyBusyIsHundred) {
    CpuTimes before;
    before.user = 10;
    before.idle = 90;

    CpuTimes after = before;
    after.user = 110;

    EXPECT_DOUBLE_EQ(SystemMetricsCollector::cpu_percent(before, after), 100.0);
}

TEST(CpuPercentTest, CounterResetIsZero) {
    CpuTimes before;
    before.user = 500;
    before.idle = 500;

    CpuTimes after;
    after.user = 10;
    after.idle = 10;

    EXPECT_DOUBLE_EQ(SystemMetricsCollector::cpu_percent(before, after), 0.0);
}

TEST(SystemMetricsCollectorTest, ReadsFromProcRoot) {
    ProcfsFixture procfs;
    SystemMetricsCollector collector(procfs.root(), std::chrono::milliseconds(0));

    utils::SystemMetrics metrics = collector.get_system_metrics();

    // Unchanged stat file between the two reads means no elapsed jiffies
    EXPECT_DOUBLE_EQ(metrics.cpu_usage, 0.0);
    EXPECT_DOUBLE_EQ(metrics.memory_usage, 75.0);
}

TEST(SystemMetricsCollectorTest, MissingStatThrows) {
    ProcfsFixture procfs;
    procfs.remove("stat");
    SystemMetricsCollector collector(procfs.root(), std::chrono::milliseconds(0));

    EXPECT_THROW(collector.get_cpu_usage(), SamplerError);
}

TEST(SystemMetricsCollectorTest, MissingMeminfoThrows) {
    ProcfsFixture procfs;
    procfs.remove("meminfo");
    SystemMetricsCollector collector(procfs.root(), std::chrono::milliseconds(0));

    EXPECT_THROW(collector.get_memory_usage(), SamplerError);
}

TEST(SystemMetricsCollectorTest, HonorsSampleWindow) {
    ProcfsFixture procfs;
    SystemMetricsCollector collector(procfs.root(), std::chrono::milliseconds(200));

    auto start = std::chrono::steady_clock::now();
    collector.get_cpu_usage();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
}

TEST(SystemMetricsCollectorTest, LiveProcfsIsInRange) {
    if (!std::ifstream("/proc/stat").is_open() || !std::ifstream("/proc/meminfo").is_open()) {
        GTEST_SKIP() << "procfs not available";
    }
    SystemMetricsCollector collector("/proc", std::chrono::milliseconds(100));

    utils::SystemMetrics metrics = collector.get_system_metrics();

    EXPECT_GE(metrics.cpu_usage, 0.0);
    EXPECT_LE(metrics.cpu_usage, 100.0);
    EXPECT_GT(metrics.memory_usage, 0.0);
    EXPECT_LE(metrics.memory_usage, 100.0);
}

} // namespace test
} // namespace beacon
