#pragma once

#include <array>

class ScalarVolume;

// Perspective camera orbiting a target point. Angles are in radians except
// the vertical field of view, which is in degrees like vtkCamera.
class VolumeCamera
{
public:
	using Vec3 = std::array<double, 3>;

	static constexpr double kRadiansPerPixel = 0.01;
	static constexpr double kPolarLimit = 0.1;
	static constexpr double kDefaultViewAngle = 45.0;
	// Distance from the volume center on reset, in multiples of the largest extent
	static constexpr double kResetDistanceFactor = 2.0;

	VolumeCamera();

	const Vec3& position() const { return m_position; }
	const Vec3& target() const { return m_target; }
	const Vec3& up() const { return m_up; }
	double viewAngle() const { return m_viewAngle; }

	void setPosition(const Vec3& p) { m_position = p; }
	void setTarget(const Vec3& t) { m_target = t; }
	void setUp(const Vec3& u) { m_up = u; }
	void setViewAngle(double degrees) { m_viewAngle = degrees; }

	// Rotates the position about the target; dx drives azimuth, dy the polar angle.
	void orbit(double dx, double dy);
	void resetToVolume(const ScalarVolume& volume);

	double distance() const;
	// Angle about the vertical axis, atan2(x, z) of the target-relative position.
	double azimuth() const;
	double polar() const;

	bool operator==(const VolumeCamera& other) const;
	bool operator!=(const VolumeCamera& other) const { return !(*this == other); }

private:
	Vec3 m_position;
	Vec3 m_target;
	Vec3 m_up;
	double m_viewAngle;
};
