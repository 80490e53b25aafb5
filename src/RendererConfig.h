#pragma once

#include "RenderSettings.h"

class QSettings;

struct RendererConfig
{
	bool preloadHardware = false;
	bool forceSoftware = false;
	bool useWorker = true;
	bool progressiveLoading = false;
	// volumes deeper than this load in stages even when progressiveLoading is off
	int progressiveDepthThreshold = 150;
	QualityTier quality = QualityTier::High;
	double stepSize = 0.5;
	int autoRotationIntervalMs = 16;
	int performanceIntervalMs = 500;

	static RendererConfig load(QSettings& settings);
	void save(QSettings& settings) const;
};
