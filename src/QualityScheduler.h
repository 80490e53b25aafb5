#pragma once

#include "RenderSettings.h"

#include <QSize>

struct RenderPlan
{
	QSize size;
	double stepSize = 0.5;
	// fraction of the surface resolution, used for the GPU sample distance
	double scale = 1.0;
	bool cacheable = false;
};

// Chooses output resolution and ray step from interaction state and tier.
class QualityScheduler
{
public:
	static RenderPlan plan(const QSize& surface, double stepSize, bool interacting, QualityTier tier);
};
