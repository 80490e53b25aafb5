#include "QualityScheduler.h"

#include <algorithm>
#include <cmath>

RenderPlan QualityScheduler::plan(const QSize& surface, double stepSize, bool interacting, QualityTier tier)
{
	RenderPlan result;
	result.stepSize = stepSize;

	if (interacting || tier == QualityTier::Low) {
		result.scale = 0.5;
		result.stepSize = stepSize * 2.0;
	}
	else if (tier == QualityTier::Medium) {
		result.scale = 0.75;
	}
	else {
		result.scale = 1.0;
		result.cacheable = true;
	}

	const int w = static_cast<int>(std::floor(surface.width() * result.scale));
	const int h = static_cast<int>(std::floor(surface.height() * result.scale));
	result.size = QSize(std::max(1, w), std::max(1, h));
	return result;
}
