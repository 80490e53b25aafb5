#include "RenderCache.h"

#include <gtest/gtest.h>

namespace
{
	QImage tile(int seed)
	{
		QImage image(4, 4, QImage::Format_RGBA8888);
		image.fill(QColor(seed % 256, 0, 0, 255));
		return image;
	}

	QString key(int i)
	{
		return QStringLiteral("key-%1").arg(i);
	}
}

TEST(RenderCache, NeverExceedsCapacity)
{
	RenderCache cache;
	for (int i = 0; i < 50; ++i) {
		cache.insert(key(i), tile(i));
		EXPECT_LE(cache.size(), RenderCache::kCapacity);
	}
	EXPECT_EQ(cache.size(), RenderCache::kCapacity);
}

TEST(RenderCache, TwentyFirstInsertEvictsEarliest)
{
	RenderCache cache;
	for (int i = 0; i < RenderCache::kCapacity; ++i)
		cache.insert(key(i), tile(i));

	cache.insert(key(99), tile(99));

	EXPECT_EQ(cache.size(), RenderCache::kCapacity);
	EXPECT_FALSE(cache.contains(key(0)));
	for (int i = 1; i < RenderCache::kCapacity; ++i)
		EXPECT_TRUE(cache.contains(key(i)));
	EXPECT_TRUE(cache.contains(key(99)));
}

TEST(RenderCache, ReadDoesNotRefreshEntry)
{
	RenderCache cache;
	for (int i = 0; i < RenderCache::kCapacity; ++i)
		cache.insert(key(i), tile(i));

	QImage hit;
	ASSERT_TRUE(cache.lookup(key(0), &hit));
	EXPECT_EQ(hit, tile(0));

	cache.insert(key(99), tile(99));
	EXPECT_FALSE(cache.contains(key(0)));
	EXPECT_TRUE(cache.contains(key(1)));
}

TEST(RenderCache, ClearEmptiesEverything)
{
	RenderCache cache;
	cache.insert(key(1), tile(1));
	cache.insert(key(2), tile(2));
	cache.clear();
	EXPECT_EQ(cache.size(), 0);
	EXPECT_FALSE(cache.lookup(key(1), nullptr));
}

TEST(RenderCache, KeyRoundsPositionToOneDecimal)
{
	VolumeCamera a;
	a.setPosition({ 1.04, 2.0, 30.01 });
	VolumeCamera b;
	b.setPosition({ 1.01, 1.98, 29.96 });
	VolumeCamera c;
	c.setPosition({ 1.2, 2.0, 30.0 });

	const QString ka = RenderCache::keyFor(a, RenderMode::Volumetric, QualityTier::High);
	EXPECT_EQ(ka, RenderCache::keyFor(b, RenderMode::Volumetric, QualityTier::High));
	EXPECT_NE(ka, RenderCache::keyFor(c, RenderMode::Volumetric, QualityTier::High));
	EXPECT_NE(ka, RenderCache::keyFor(a, RenderMode::MaximumIntensity, QualityTier::High));
	EXPECT_NE(ka, RenderCache::keyFor(a, RenderMode::Volumetric, QualityTier::Medium));
}
