#include "QualityScheduler.h"

#include <gtest/gtest.h>

TEST(QualityScheduler, HighQualityUsesFullResolution)
{
	const RenderPlan plan = QualityScheduler::plan(QSize(640, 480), 0.5, false, QualityTier::High);
	EXPECT_EQ(plan.size, QSize(640, 480));
	EXPECT_DOUBLE_EQ(plan.stepSize, 0.5);
	EXPECT_TRUE(plan.cacheable);
}

TEST(QualityScheduler, InteractionHalvesResolutionAndDoublesStep)
{
	const RenderPlan idle = QualityScheduler::plan(QSize(640, 480), 0.5, false, QualityTier::High);
	const RenderPlan dragging = QualityScheduler::plan(QSize(640, 480), 0.5, true, QualityTier::High);

	EXPECT_EQ(dragging.size.width() * 2, idle.size.width());
	EXPECT_EQ(dragging.size.height() * 2, idle.size.height());
	EXPECT_DOUBLE_EQ(dragging.stepSize, idle.stepSize * 2.0);
	EXPECT_FALSE(dragging.cacheable);
}

TEST(QualityScheduler, LowTierMatchesInteraction)
{
	const RenderPlan low = QualityScheduler::plan(QSize(101, 99), 0.25, false, QualityTier::Low);
	EXPECT_EQ(low.size, QSize(50, 49));
	EXPECT_DOUBLE_EQ(low.stepSize, 0.5);
	EXPECT_FALSE(low.cacheable);
}

TEST(QualityScheduler, MediumTierScalesWithoutChangingStep)
{
	const RenderPlan medium = QualityScheduler::plan(QSize(101, 99), 0.5, false, QualityTier::Medium);
	EXPECT_EQ(medium.size, QSize(75, 74));
	EXPECT_DOUBLE_EQ(medium.stepSize, 0.5);
	EXPECT_DOUBLE_EQ(medium.scale, 0.75);
	EXPECT_FALSE(medium.cacheable);
}

TEST(QualityScheduler, InteractionOverridesMedium)
{
	const RenderPlan plan = QualityScheduler::plan(QSize(200, 100), 0.5, true, QualityTier::Medium);
	EXPECT_EQ(plan.size, QSize(100, 50));
	EXPECT_DOUBLE_EQ(plan.stepSize, 1.0);
}

TEST(QualityScheduler, NeverProducesEmptySize)
{
	const RenderPlan plan = QualityScheduler::plan(QSize(1, 1), 0.5, true, QualityTier::Low);
	EXPECT_EQ(plan.size, QSize(1, 1));
}
