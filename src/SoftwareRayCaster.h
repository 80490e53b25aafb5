#pragma once

#include "RenderSettings.h"
#include "TransferFunction.h"
#include "VolumeCamera.h"

#include <QImage>
#include <QSize>

class ScalarVolume;

// CPU ray caster. Produces an RGBA8888 image of the requested size; the
// caller scales it onto the output surface.
class SoftwareRayCaster
{
public:
	// Half-width of the isosurface band as a fraction of the isovalue
	static constexpr double kIsoBandFraction = 0.05;
	static constexpr double kMinIsoBand = 0.005;
	static constexpr double kOpaqueThreshold = 0.999;

	static QImage render(const ScalarVolume& volume, const VolumeCamera& camera,
		const TransferFunction& tf, const RenderSettings& settings,
		const QSize& size, double stepSize);

	// The function actually used for shading: tf itself, or the derived
	// isosurface band in isosurface mode.
	static TransferFunction shadingFunction(const ScalarVolume& volume,
		const TransferFunction& tf, const RenderSettings& settings);

	// Trilinear sample at a continuous voxel coordinate, clamped to the grid.
	static double sample(const ScalarVolume& volume, double x, double y, double z);
};
