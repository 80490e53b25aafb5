#include "VolumeCamera.h"
#include "ScalarVolume.h"

#include <vtkMath.h>

#include <algorithm>
#include <cmath>

VolumeCamera::VolumeCamera()
	: m_position{ { 0.0, 0.0, 1.0 } }
	, m_target{ { 0.0, 0.0, 0.0 } }
	, m_up{ { 0.0, 1.0, 0.0 } }
	, m_viewAngle(kDefaultViewAngle)
{
}

double VolumeCamera::distance() const
{
	return std::sqrt(vtkMath::Distance2BetweenPoints(m_position.data(), m_target.data()));
}

double VolumeCamera::azimuth() const
{
	return std::atan2(m_position[0] - m_target[0], m_position[2] - m_target[2]);
}

double VolumeCamera::polar() const
{
	const double r = distance();
	if (r <= 0.0)
		return 0.0;
	return std::acos(std::clamp((m_position[1] - m_target[1]) / r, -1.0, 1.0));
}

void VolumeCamera::orbit(double dx, double dy)
{
	const double r = distance();
	if (r <= 0.0)
		return;

	const double theta = azimuth() + dx * kRadiansPerPixel;
	const double phi = std::clamp(polar() + dy * kRadiansPerPixel,
		kPolarLimit, vtkMath::Pi() - kPolarLimit);

	m_position[0] = m_target[0] + r * std::sin(phi) * std::sin(theta);
	m_position[1] = m_target[1] + r * std::cos(phi);
	m_position[2] = m_target[2] + r * std::sin(phi) * std::cos(theta);
}

void VolumeCamera::resetToVolume(const ScalarVolume& volume)
{
	const auto extent = volume.physicalExtent();
	const double maxExtent = std::max({ extent[0], extent[1], extent[2] });

	m_target = volume.center();
	m_position = m_target;
	m_position[2] += maxExtent * kResetDistanceFactor;
	m_up = { 0.0, 1.0, 0.0 };
	m_viewAngle = kDefaultViewAngle;
}

bool VolumeCamera::operator==(const VolumeCamera& other) const
{
	return m_position == other.m_position && m_target == other.m_target
		&& m_up == other.m_up && m_viewAngle == other.m_viewAngle;
}
