#include "SoftwareRayCaster.h"
#include "ScalarVolume.h"

#include <vtkMath.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace
{
	using Vec3 = std::array<double, 3>;

	Vec3 sub(const Vec3& a, const Vec3& b) { return { a[0] - b[0], a[1] - b[1], a[2] - b[2] }; }

	Vec3 normalized(Vec3 v)
	{
		vtkMath::Normalize(v.data());
		return v;
	}

	Vec3 cross(const Vec3& a, const Vec3& b)
	{
		Vec3 c;
		vtkMath::Cross(a.data(), b.data(), c.data());
		return c;
	}

	// Slab test against the box [0, extent]. Returns false on a miss.
	bool intersectBox(const Vec3& origin, const Vec3& dir, const Vec3& extent, double& tNear, double& tFar)
	{
		tNear = 0.0;
		tFar = std::numeric_limits<double>::max();
		for (int i = 0; i < 3; ++i) {
			if (std::abs(dir[i]) < 1e-12) {
				if (origin[i] < 0.0 || origin[i] > extent[i])
					return false;
				continue;
			}
			double t0 = (0.0 - origin[i]) / dir[i];
			double t1 = (extent[i] - origin[i]) / dir[i];
			if (t0 > t1)
				std::swap(t0, t1);
			tNear = std::max(tNear, t0);
			tFar = std::min(tFar, t1);
			if (tNear > tFar)
				return false;
		}
		return true;
	}

	uchar toByte(double v)
	{
		return static_cast<uchar>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
	}
}

double SoftwareRayCaster::sample(const ScalarVolume& volume, double x, double y, double z)
{
	x = std::clamp(x, 0.0, volume.width() - 1.0);
	y = std::clamp(y, 0.0, volume.height() - 1.0);
	z = std::clamp(z, 0.0, volume.depth() - 1.0);

	const int x0 = static_cast<int>(x);
	const int y0 = static_cast<int>(y);
	const int z0 = static_cast<int>(z);
	const int x1 = std::min(x0 + 1, volume.width() - 1);
	const int y1 = std::min(y0 + 1, volume.height() - 1);
	const int z1 = std::min(z0 + 1, volume.depth() - 1);
	const double fx = x - x0;
	const double fy = y - y0;
	const double fz = z - z0;

	const double c00 = volume.voxel(x0, y0, z0) * (1 - fx) + volume.voxel(x1, y0, z0) * fx;
	const double c10 = volume.voxel(x0, y1, z0) * (1 - fx) + volume.voxel(x1, y1, z0) * fx;
	const double c01 = volume.voxel(x0, y0, z1) * (1 - fx) + volume.voxel(x1, y0, z1) * fx;
	const double c11 = volume.voxel(x0, y1, z1) * (1 - fx) + volume.voxel(x1, y1, z1) * fx;
	const double c0 = c00 * (1 - fy) + c10 * fy;
	const double c1 = c01 * (1 - fy) + c11 * fy;
	return c0 * (1 - fz) + c1 * fz;
}

TransferFunction SoftwareRayCaster::shadingFunction(const ScalarVolume& volume,
	const TransferFunction& tf, const RenderSettings& settings)
{
	if (settings.mode != RenderMode::Isosurface)
		return tf;

	const double range = volume.scalarRange();
	double halfWidth = kMinIsoBand;
	if (range > 0.0)
		halfWidth = std::max(kMinIsoBand, kIsoBandFraction * std::abs(settings.isoValue) / range);
	return TransferFunction::isosurface(volume.normalize(settings.isoValue), halfWidth, tf);
}

QImage SoftwareRayCaster::render(const ScalarVolume& volume, const VolumeCamera& camera,
	const TransferFunction& tf, const RenderSettings& settings,
	const QSize& size, double stepSize)
{
	if (size.isEmpty())
		throw std::invalid_argument("Render size must be non-empty");
	if (!(stepSize > 0.0))
		throw std::invalid_argument("Step size must be positive");

	QImage image(size, QImage::Format_RGBA8888);
	image.fill(Qt::transparent);

	const Vec3 origin = camera.position();
	const Vec3 forward = normalized(sub(camera.target(), origin));
	const Vec3 right = normalized(cross(forward, camera.up()));
	const Vec3 up = cross(right, forward);

	const double tanHalf = std::tan(vtkMath::RadiansFromDegrees(camera.viewAngle()) * 0.5);
	const double aspect = static_cast<double>(size.width()) / size.height();
	const Vec3 extent = volume.physicalExtent();
	const auto& spacing = volume.spacing();

	const TransferFunction shading = shadingFunction(volume, tf, settings);
	const bool mip = settings.mode == RenderMode::MaximumIntensity;
	const double brightness = settings.brightness;

	for (int j = 0; j < size.height(); ++j) {
		uchar* line = image.scanLine(j);
		const double ndcY = 1.0 - 2.0 * (j + 0.5) / size.height();

		for (int i = 0; i < size.width(); ++i) {
			const double ndcX = 2.0 * (i + 0.5) / size.width() - 1.0;

			Vec3 dir;
			for (int k = 0; k < 3; ++k)
				dir[k] = forward[k] + right[k] * ndcX * tanHalf * aspect + up[k] * ndcY * tanHalf;
			dir = normalized(dir);

			double tNear = 0.0;
			double tFar = 0.0;
			if (!intersectBox(origin, dir, extent, tNear, tFar))
				continue;

			// first sample half a step inside; short segments get their midpoint
			double t = tNear + stepSize * 0.5;
			if (t > tFar)
				t = (tNear + tFar) * 0.5;

			double maxValue = -std::numeric_limits<double>::max();
			double accum[3] = { 0.0, 0.0, 0.0 };
			double alpha = 0.0;

			for (; t <= tFar; t += stepSize) {
				// world y runs bottom-up, frame rows run top-down
				const double vx = (origin[0] + dir[0] * t) / spacing[0] - 0.5;
				const double vy = (extent[1] - (origin[1] + dir[1] * t)) / spacing[1] - 0.5;
				const double vz = (origin[2] + dir[2] * t) / spacing[2] - 0.5;
				const double value = sample(volume, vx, vy, vz);

				if (mip) {
					maxValue = std::max(maxValue, value);
					continue;
				}

				const double n = volume.normalize(value);
				double a = shading.opacityAt(n);
				if (a <= 0.0)
					continue;
				a = 1.0 - std::pow(1.0 - a, stepSize);

				const auto color = shading.colorAt(n);
				const double weight = (1.0 - alpha) * a;
				accum[0] += weight * color[0];
				accum[1] += weight * color[1];
				accum[2] += weight * color[2];
				alpha += weight;
				if (alpha >= kOpaqueThreshold)
					break;
			}

			uchar* px = line + i * 4;
			if (mip) {
				double gray = volume.normalize(maxValue);
				gray = std::clamp((gray - 0.5) * settings.contrast + 0.5, 0.0, 1.0);
				px[0] = px[1] = px[2] = toByte(gray * brightness);
				px[3] = 255;
			}
			else if (alpha > 0.0) {
				px[0] = toByte(accum[0] / alpha * brightness);
				px[1] = toByte(accum[1] / alpha * brightness);
				px[2] = toByte(accum[2] / alpha * brightness);
				px[3] = toByte(alpha);
			}
		}
	}
	return image;
}
