#include "RenderSettings.h"

#include <stdexcept>

QString renderModeName(RenderMode mode)
{
	switch (mode) {
	case RenderMode::MaximumIntensity:
		return QStringLiteral("mip");
	case RenderMode::Volumetric:
		return QStringLiteral("volume");
	case RenderMode::Isosurface:
		return QStringLiteral("isosurface");
	}
	return QString();
}

RenderMode renderModeFromName(const QString& name)
{
	const QString key = name.trimmed().toLower();
	if (key == "mip")
		return RenderMode::MaximumIntensity;
	if (key == "volume")
		return RenderMode::Volumetric;
	if (key == "isosurface")
		return RenderMode::Isosurface;
	throw std::invalid_argument("Unknown render mode: " + name.toStdString());
}

QString qualityTierName(QualityTier tier)
{
	switch (tier) {
	case QualityTier::Low:
		return QStringLiteral("low");
	case QualityTier::Medium:
		return QStringLiteral("medium");
	case QualityTier::High:
		return QStringLiteral("high");
	}
	return QString();
}

QualityTier qualityTierFromName(const QString& name)
{
	const QString key = name.trimmed().toLower();
	if (key == "low")
		return QualityTier::Low;
	if (key == "medium")
		return QualityTier::Medium;
	if (key == "high")
		return QualityTier::High;
	throw std::invalid_argument("Unknown quality tier: " + name.toStdString());
}
