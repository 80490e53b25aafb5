#include "TestVolumes.h"
#include "VolumeCamera.h"

#include <gtest/gtest.h>

#include <cmath>

TEST(VolumeCamera, ResetFramesVolume)
{
	auto volume = testvolumes::gradient(10, 10, 5);
	VolumeCamera camera;
	camera.setViewAngle(30.0);
	camera.resetToVolume(*volume);

	EXPECT_DOUBLE_EQ(camera.target()[0], 5.0);
	EXPECT_DOUBLE_EQ(camera.target()[1], 5.0);
	EXPECT_DOUBLE_EQ(camera.target()[2], 2.5);
	EXPECT_DOUBLE_EQ(camera.position()[0], 5.0);
	EXPECT_DOUBLE_EQ(camera.position()[1], 5.0);
	EXPECT_DOUBLE_EQ(camera.position()[2], 2.5 + 10.0 * VolumeCamera::kResetDistanceFactor);
	EXPECT_DOUBLE_EQ(camera.viewAngle(), 45.0);
	EXPECT_EQ(camera.up(), (VolumeCamera::Vec3{ { 0.0, 1.0, 0.0 } }));
}

TEST(VolumeCamera, OrbitPreservesDistance)
{
	auto volume = testvolumes::gradient();
	VolumeCamera camera;
	camera.resetToVolume(*volume);
	const double r = camera.distance();

	camera.orbit(37.0, -12.0);
	EXPECT_NEAR(camera.distance(), r, 1e-9);
	camera.orbit(-200.0, 45.0);
	EXPECT_NEAR(camera.distance(), r, 1e-9);
}

TEST(VolumeCamera, AzimuthFollowsHorizontalDrag)
{
	auto volume = testvolumes::gradient();
	VolumeCamera camera;
	camera.resetToVolume(*volume);

	double previous = camera.azimuth();
	for (int i = 0; i < 5; ++i) {
		camera.orbit(10.0, 0.0);
		EXPECT_GT(camera.azimuth(), previous);
		previous = camera.azimuth();
	}
	EXPECT_NEAR(previous, 50 * VolumeCamera::kRadiansPerPixel, 1e-9);
	EXPECT_NEAR(camera.polar(), M_PI / 2, 1e-9);
}

TEST(VolumeCamera, PolarAngleIsClamped)
{
	auto volume = testvolumes::gradient();
	VolumeCamera camera;
	camera.resetToVolume(*volume);

	camera.orbit(0.0, 10000.0);
	EXPECT_NEAR(camera.polar(), M_PI - VolumeCamera::kPolarLimit, 1e-9);
	camera.orbit(0.0, -10000.0);
	EXPECT_NEAR(camera.polar(), VolumeCamera::kPolarLimit, 1e-9);
}
