#include "ScalarVolume.h"

#include <algorithm>
#include <sstream>

ScalarVolume::ScalarVolume(int width, int height, int depth, const Spacing& spacing,
	std::vector<float> samples, const FrameSourceList& sources)
	: m_dims{ width, height, depth }
	, m_spacing(spacing)
	, m_samples(std::move(samples))
	, m_sources(sources)
{
	if (width <= 0 || height <= 0 || depth <= 0) {
		std::ostringstream msg;
		msg << "Invalid volume dimensions " << width << "x" << height << "x" << depth;
		throw VolumeLoadError(msg.str());
	}
	for (double s : m_spacing) {
		if (!(s > 0.0))
			throw VolumeLoadError("Volume spacing must be positive");
	}
	if (m_samples.size() != voxelCount()) {
		std::ostringstream msg;
		msg << "Volume data size mismatch: expected " << voxelCount()
			<< " samples, got " << m_samples.size();
		throw VolumeLoadError(msg.str());
	}

	const auto range = std::minmax_element(m_samples.begin(), m_samples.end());
	m_min = *range.first;
	m_max = *range.second;
}

size_t ScalarVolume::voxelCount() const
{
	return static_cast<size_t>(m_dims[0]) * m_dims[1] * m_dims[2];
}

std::array<double, 3> ScalarVolume::physicalExtent() const
{
	return { m_dims[0] * m_spacing[0], m_dims[1] * m_spacing[1], m_dims[2] * m_spacing[2] };
}

std::array<double, 3> ScalarVolume::center() const
{
	const auto extent = physicalExtent();
	return { extent[0] * 0.5, extent[1] * 0.5, extent[2] * 0.5 };
}

double ScalarVolume::estimatedMemoryMB() const
{
	return static_cast<double>(voxelCount()) * sizeof(float) / (1024.0 * 1024.0);
}
