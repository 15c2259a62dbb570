#include "SystemMetrics.h"
#include <gtest/gtest.h>
#include <sstream>

TEST(ParseCpuStat, SumsFields) {
    std::istringstream in("cpu  100 5 50 800 20 3 2 1 0 0\ncpu0 1 2 3 4 5 6 7 8\n");
    CpuTimes times;
    ASSERT_TRUE(parse_cpu_stat(in, times));
    EXPECT_EQ(820u, times.idle);
    EXPECT_EQ(981u, times.total);
}

TEST(ParseCpuStat, RejectsOtherLines) {
    std::istringstream per_core("cpu0 1 2 3 4 5 6 7 8\n");
    CpuTimes times;
    EXPECT_FALSE(parse_cpu_stat(per_core, times));

    std::istringstream empty("");
    EXPECT_FALSE(parse_cpu_stat(empty, times));
}

TEST(ParseMeminfo, ReadsFields) {
    std::istringstream in(
        "MemTotal:       16000000 kB\n"
        "MemFree:         1000000 kB\n"
        "MemAvailable:    8000000 kB\n"
        "SwapTotal:       2000000 kB\n"
        "SwapFree:        1500000 kB\n");
    MemInfo mem;
    ASSERT_TRUE(parse_meminfo(in, mem));
    EXPECT_EQ(16000000u, mem.total_kb);
    EXPECT_EQ(8000000u, mem.available_kb);
    EXPECT_EQ(2000000u, mem.swap_total_kb);
    EXPECT_EQ(1500000u, mem.swap_free_kb);
}

TEST(ParseMeminfo, RequiresTotal) {
    std::istringstream in("MemFree: 1000 kB\n");
    MemInfo mem;
    EXPECT_FALSE(parse_meminfo(in, mem));
}

TEST(FormatBytes, Units) {
    EXPECT_EQ("0 B", format_bytes(0));
    EXPECT_EQ("512 B", format_bytes(512));
    EXPECT_EQ("1.50 KB", format_bytes(1536));
    EXPECT_EQ("1.00 MB", format_bytes(1024 * 1024));
    EXPECT_EQ("2.00 GB", format_bytes(2ULL * 1024 * 1024 * 1024));
}

TEST(FormatUptime, DayPrefixes) {
    EXPECT_EQ("00:00", format_uptime(59));
    EXPECT_EQ("01:01", format_uptime(3660));
    EXPECT_EQ("1 day, 02:03", format_uptime(86400 + 2 * 3600 + 3 * 60));
    EXPECT_EQ("3 days 00:10", format_uptime(3 * 86400 + 600));
}

TEST(SystemMetrics, CollectPublishesCoreLabels) {
    SensorStore store;
    SystemMetrics metrics(store);
    SensorValues values = metrics.Collect();
    EXPECT_EQ(1u, values.count("cpu_usage_percent"));
    EXPECT_EQ(1u, values.count("mem_usage_percent"));
    EXPECT_EQ(1u, values.count("system_uptime"));
}
