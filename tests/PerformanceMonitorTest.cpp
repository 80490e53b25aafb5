#include "PerformanceMonitor.h"

#include <gtest/gtest.h>

namespace
{
	// Frames evenly spaced over [startMs, startMs + count * intervalMs)
	void recordFrames(PerformanceMonitor& monitor, qint64 startMs, int count, qint64 intervalMs, double memoryMB = 10.0)
	{
		for (int i = 0; i < count; ++i)
			monitor.recordFrame(startMs + i * intervalMs, 5.0, memoryMB);
	}
}

TEST(PerformanceMonitor, SamplesAtConfiguredInterval)
{
	PerformanceMonitor monitor(500);
	EXPECT_TRUE(monitor.recordFrame(0, 4.0, 10.0).has_value());
	EXPECT_FALSE(monitor.recordFrame(100, 4.0, 10.0).has_value());
	EXPECT_FALSE(monitor.recordFrame(499, 4.0, 10.0).has_value());

	auto sample = monitor.recordFrame(500, 6.0, 12.0);
	ASSERT_TRUE(sample.has_value());
	EXPECT_DOUBLE_EQ(sample->fps, 4.0);
	EXPECT_DOUBLE_EQ(sample->renderTimeMs, 6.0);
	EXPECT_DOUBLE_EQ(sample->memoryMB, 12.0);
}

TEST(PerformanceMonitor, CountsFramesInTheLastSecond)
{
	PerformanceMonitor monitor;
	recordFrames(monitor, 0, 10, 100);
	EXPECT_DOUBLE_EQ(monitor.fps(), 10.0);

	monitor.recordFrame(1000, 5.0, 10.0);
	EXPECT_DOUBLE_EQ(monitor.fps(), 10.0);

	monitor.recordFrame(3000, 5.0, 10.0);
	EXPECT_DOUBLE_EQ(monitor.fps(), 1.0);
}

TEST(PerformanceMonitor, LowFrameRateOnlyDuringContinuousRendering)
{
	PerformanceMonitor monitor;
	recordFrames(monitor, 0, 5, 200);

	EXPECT_TRUE(monitor.evaluate(1000, false, false).isEmpty());
	EXPECT_TRUE(monitor.evaluate(1000, true, true).isEmpty());

	auto warnings = monitor.evaluate(1000, false, true);
	ASSERT_EQ(warnings.size(), 1);
	EXPECT_EQ(warnings.front().kind, PerformanceWarning::Kind::LowFrameRate);
	EXPECT_FALSE(warnings.front().suggestion.isEmpty());

	// disarmed until the rate recovers
	EXPECT_TRUE(monitor.evaluate(20000, false, true).isEmpty());
}

TEST(PerformanceMonitor, LowFrameRateRearmsAfterRecovery)
{
	PerformanceMonitor monitor;
	recordFrames(monitor, 0, 5, 200);
	ASSERT_EQ(monitor.evaluate(1000, false, true).size(), 1);

	recordFrames(monitor, 20000, 25, 40);
	EXPECT_GE(monitor.fps(), PerformanceMonitor::kRecoveredFps);
	EXPECT_TRUE(monitor.evaluate(21000, false, true).isEmpty());

	recordFrames(monitor, 23000, 5, 200);
	EXPECT_DOUBLE_EQ(monitor.fps(), 5.0);
	EXPECT_EQ(monitor.evaluate(24000, false, true).size(), 1);
}

TEST(PerformanceMonitor, HighMemoryWarningsAreThrottled)
{
	PerformanceMonitor monitor;
	monitor.recordFrame(0, 5.0, 450.0);

	auto warnings = monitor.evaluate(0, true, false);
	ASSERT_EQ(warnings.size(), 1);
	EXPECT_EQ(warnings.front().kind, PerformanceWarning::Kind::HighMemory);

	EXPECT_TRUE(monitor.evaluate(5000, true, false).isEmpty());
	EXPECT_EQ(monitor.evaluate(10000, true, false).size(), 1);
}

TEST(PerformanceMonitor, LargeVolumeWarning)
{
	PerformanceMonitor monitor;
	EXPECT_FALSE(monitor.checkVolume(0, 100, 50.0).has_value());

	auto warning = monitor.checkVolume(0, 301, 10.0);
	ASSERT_TRUE(warning.has_value());
	EXPECT_EQ(warning->kind, PerformanceWarning::Kind::LargeVolume);
	EXPECT_TRUE(warning->message.contains("301"));

	// shares the cooldown with the other warnings
	EXPECT_FALSE(monitor.checkVolume(100, 400, 400.0).has_value());

	PerformanceMonitor other;
	EXPECT_TRUE(other.checkVolume(0, 10, 350.0).has_value());
}

TEST(PerformanceMonitor, ResetClearsHistory)
{
	PerformanceMonitor monitor;
	recordFrames(monitor, 0, 5, 200);
	ASSERT_EQ(monitor.evaluate(1000, false, true).size(), 1);

	monitor.reset();
	EXPECT_DOUBLE_EQ(monitor.fps(), 0.0);
	EXPECT_TRUE(monitor.recordFrame(1100, 5.0, 10.0).has_value());
	EXPECT_EQ(monitor.evaluate(1200, false, true).size(), 1);
}
