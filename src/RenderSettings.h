#pragma once

#include <QMetaType>
#include <QString>

enum class RenderMode
{
	MaximumIntensity,
	Volumetric,
	Isosurface
};

enum class QualityTier
{
	Low,
	Medium,
	High
};

struct RenderSettings
{
	RenderMode mode = RenderMode::Volumetric;
	// world units between samples along a ray
	double stepSize = 0.5;
	double brightness = 1.0;
	// applied to the MIP grayscale ramp around mid-gray
	double contrast = 1.0;
	// native scalar units, isosurface mode only
	double isoValue = 0.0;

	bool operator==(const RenderSettings& other) const
	{
		return mode == other.mode && stepSize == other.stepSize && brightness == other.brightness
			&& contrast == other.contrast && isoValue == other.isoValue;
	}
	bool operator!=(const RenderSettings& other) const { return !(*this == other); }
};

QString renderModeName(RenderMode mode);
// Accepts the names produced by renderModeName; throws std::invalid_argument otherwise.
RenderMode renderModeFromName(const QString& name);

QString qualityTierName(QualityTier tier);
QualityTier qualityTierFromName(const QString& name);

Q_DECLARE_METATYPE(RenderMode)
Q_DECLARE_METATYPE(QualityTier)
