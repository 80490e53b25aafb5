#include "SoftwareRayCaster.h"
#include "TestVolumes.h"

#include <gtest/gtest.h>

using namespace testvolumes;

namespace
{
	constexpr int kSize = 33;
	constexpr int kCenter = kSize / 2;

	QImage renderVolume(const ScalarVolumePtr& volume, const RenderSettings& settings,
		const QString& preset = TransferFunctionStore::kBone)
	{
		VolumeCamera camera;
		camera.resetToVolume(*volume);
		TransferFunctionStore store;
		store.setPreset(preset);
		return SoftwareRayCaster::render(*volume, camera, store.active(), settings,
			QSize(kSize, kSize), settings.stepSize);
	}

	RenderSettings isoSettings(double isoValue)
	{
		RenderSettings settings;
		settings.mode = RenderMode::Isosurface;
		settings.isoValue = isoValue;
		return settings;
	}
}

TEST(SoftwareRayCaster, BonePresetProducesVisiblePixels)
{
	auto volume = gradient(10, 10, 5);
	ASSERT_DOUBLE_EQ(volume->scalarMin(), 0.0);
	ASSERT_DOUBLE_EQ(volume->scalarMax(), 1000.0);

	RenderSettings settings;
	settings.mode = RenderMode::Volumetric;
	const QImage image = renderVolume(volume, settings);

	EXPECT_EQ(image.size(), QSize(kSize, kSize));
	EXPECT_EQ(image.format(), QImage::Format_RGBA8888);
	EXPECT_TRUE(anyAlpha(image));
	EXPECT_GT(alphaAt(image, kCenter, kCenter), 0);
}

TEST(SoftwareRayCaster, RaysMissingTheVolumeAreTransparent)
{
	RenderSettings settings;
	settings.mode = RenderMode::Volumetric;
	const QImage image = renderVolume(uniform(800.0f), settings);

	EXPECT_EQ(alphaAt(image, 0, 0), 0);
	EXPECT_EQ(alphaAt(image, kSize - 1, kSize - 1), 0);
}

TEST(SoftwareRayCaster, IsosurfaceShowsValuesNearThreshold)
{
	EXPECT_EQ(alphaAt(renderVolume(uniform(500.0f), isoSettings(500.0)), kCenter, kCenter), 255);
	EXPECT_GT(alphaAt(renderVolume(uniform(520.0f), isoSettings(500.0)), kCenter, kCenter), 0);
}

TEST(SoftwareRayCaster, IsosurfaceHidesValuesFarFromThreshold)
{
	EXPECT_EQ(alphaAt(renderVolume(uniform(560.0f), isoSettings(500.0)), kCenter, kCenter), 0);
	EXPECT_EQ(alphaAt(renderVolume(uniform(900.0f), isoSettings(500.0)), kCenter, kCenter), 0);
	EXPECT_EQ(alphaAt(renderVolume(uniform(100.0f), isoSettings(500.0)), kCenter, kCenter), 0);
}

TEST(SoftwareRayCaster, MaximumIntensityIsOpaqueGray)
{
	RenderSettings settings;
	settings.mode = RenderMode::MaximumIntensity;
	const QImage image = renderVolume(gradient(), settings);

	const uchar* px = image.constScanLine(kCenter) + kCenter * 4;
	EXPECT_EQ(px[3], 255);
	EXPECT_EQ(px[0], px[1]);
	EXPECT_EQ(px[1], px[2]);
	EXPECT_GT(px[0], 100);
	EXPECT_LT(px[0], 160);
	EXPECT_EQ(alphaAt(image, 0, 0), 0);
}

TEST(SoftwareRayCaster, BrightnessScalesColorOnly)
{
	RenderSettings normal;
	normal.mode = RenderMode::Volumetric;
	RenderSettings dark = normal;
	dark.brightness = 0.0;

	const QImage a = renderVolume(gradient(), normal);
	const QImage b = renderVolume(gradient(), dark);

	const uchar* pa = a.constScanLine(kCenter) + kCenter * 4;
	const uchar* pb = b.constScanLine(kCenter) + kCenter * 4;
	EXPECT_GT(pa[0], 0);
	EXPECT_EQ(pb[0], 0);
	EXPECT_EQ(pb[1], 0);
	EXPECT_EQ(pb[2], 0);
	EXPECT_EQ(pa[3], pb[3]);
}

TEST(SoftwareRayCaster, RejectsEmptyOutput)
{
	auto volume = gradient();
	VolumeCamera camera;
	camera.resetToVolume(*volume);
	TransferFunctionStore store;
	EXPECT_THROW(SoftwareRayCaster::render(*volume, camera, store.active(), RenderSettings(), QSize(0, 10), 0.5),
		std::invalid_argument);
}

TEST(SoftwareRayCaster, TrilinearSampleInterpolates)
{
	auto volume = gradient(10, 2, 2);
	EXPECT_NEAR(SoftwareRayCaster::sample(*volume, 4.5, 0.0, 0.0), 500.0, 1e-3);
	EXPECT_NEAR(SoftwareRayCaster::sample(*volume, -3.0, 0.5, 0.5), 0.0, 1e-6);
	EXPECT_NEAR(SoftwareRayCaster::sample(*volume, 42.0, 1.0, 1.0), 1000.0, 1e-3);
}
