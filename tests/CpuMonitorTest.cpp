#include <gtest/gtest.h>
#include "CpuMonitor.h"
#include "Logger.h"
#include <cstdio>
#include <fstream>
#include <unistd.h>

TEST(CpuMonitorTest, ParsesModernCpuLine)
{
	CpuTimes t;
	ASSERT_TRUE(ProcStatCpuProbe::ParseCpuLine("cpu  100 0 50 800 50 0 0 0 0 0", t));
	EXPECT_EQ(t.total, 1000u);
	// idle + iowait
	EXPECT_EQ(t.busy, 150u);
}

TEST(CpuMonitorTest, ParsesOldFourFieldLine)
{
	CpuTimes t;
	ASSERT_TRUE(ProcStatCpuProbe::ParseCpuLine("cpu 10 20 30 40", t));
	EXPECT_EQ(t.total, 100u);
	EXPECT_EQ(t.busy, 60u);
}

TEST(CpuMonitorTest, RejectsOtherLines)
{
	CpuTimes t;
	EXPECT_FALSE(ProcStatCpuProbe::ParseCpuLine("cpu0 1 2 3 4 5", t));
	EXPECT_FALSE(ProcStatCpuProbe::ParseCpuLine("intr 12345", t));
	EXPECT_FALSE(ProcStatCpuProbe::ParseCpuLine("cpu 1 2", t));
	EXPECT_FALSE(ProcStatCpuProbe::ParseCpuLine("", t));
}

TEST(CpuMonitorTest, UtilizationOfDelta)
{
	CpuTimes prev{100, 1000};
	CpuTimes cur{150, 1100};
	EXPECT_DOUBLE_EQ(ProcStatCpuProbe::Utilization(prev, cur), 50.0);

	// no progress / counter went backwards
	EXPECT_DOUBLE_EQ(ProcStatCpuProbe::Utilization(prev, prev), 0.0);
	EXPECT_DOUBLE_EQ(ProcStatCpuProbe::Utilization(cur, prev), 0.0);
}

TEST(CpuMonitorTest, FirstSampleIsZeroThenDelta)
{
	InitLogger(LOG_ERROR);
	std::string path = std::string(::testing::TempDir()) + "synguard_stat_" + std::to_string(getpid());

	{
		std::ofstream f(path);
		f << "cpu  100 0 0 900 0 0 0 0 0 0\ncpu0 100 0 0 900 0 0 0 0 0 0\n";
	}
	ProcStatCpuProbe probe(path);
	EXPECT_DOUBLE_EQ(probe.Sample(), 0.0);

	{
		std::ofstream f(path, std::ios::trunc);
		f << "cpu  175 0 0 925 0 0 0 0 0 0\n";
	}
	EXPECT_DOUBLE_EQ(probe.Sample(), 75.0);
	std::remove(path.c_str());
}

TEST(CpuMonitorTest, UnreadableFileReportsZero)
{
	InitLogger(LOG_ERROR);
	ProcStatCpuProbe probe("/nonexistent/stat");
	EXPECT_DOUBLE_EQ(probe.Sample(), 0.0);
	EXPECT_DOUBLE_EQ(probe.Sample(), 0.0);
}
