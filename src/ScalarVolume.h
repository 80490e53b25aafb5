#pragma once

#include "FrameSource.h"

#include <array>
#include <memory>
#include <stdexcept>
#include <vector>

class VolumeLoadError : public std::runtime_error
{
public:
	explicit VolumeLoadError(const std::string& message)
		: std::runtime_error(message) {}
};

// Immutable 3D scalar field. Samples are stored x-fastest:
// index = x + y * width + z * width * height.
class ScalarVolume
{
public:
	using Spacing = std::array<double, 3>;

	ScalarVolume(int width, int height, int depth, const Spacing& spacing,
		std::vector<float> samples, const FrameSourceList& sources = FrameSourceList());

	int width() const { return m_dims[0]; }
	int height() const { return m_dims[1]; }
	int depth() const { return m_dims[2]; }
	const std::array<int, 3>& dimensions() const { return m_dims; }
	const Spacing& spacing() const { return m_spacing; }

	double scalarMin() const { return m_min; }
	double scalarMax() const { return m_max; }
	double scalarRange() const { return m_max - m_min; }

	// Maps a native intensity into [0,1] over the scalar range.
	// A constant volume maps everything to 0.
	double normalize(double value) const
	{
		const double range = scalarRange();
		return range > 0.0 ? (value - m_min) / range : 0.0;
	}

	float voxel(int x, int y, int z) const
	{
		return m_samples[static_cast<size_t>(x) + static_cast<size_t>(y) * m_dims[0]
			+ static_cast<size_t>(z) * m_dims[0] * m_dims[1]];
	}

	const std::vector<float>& samples() const { return m_samples; }
	const FrameSourceList& sources() const { return m_sources; }

	size_t voxelCount() const;
	// Physical size along each axis (dimension times spacing).
	std::array<double, 3> physicalExtent() const;
	std::array<double, 3> center() const;
	// Estimated device memory for a single-component float texture, in MiB.
	double estimatedMemoryMB() const;

private:
	std::array<int, 3> m_dims;
	Spacing m_spacing;
	std::vector<float> m_samples;
	FrameSourceList m_sources;
	double m_min = 0.0;
	double m_max = 0.0;
};

using ScalarVolumePtr = std::shared_ptr<const ScalarVolume>;
