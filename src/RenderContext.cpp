#include "RenderContext.h"

#include <algorithm>

void RenderContext::create(const RenderSettings& settings, QualityTier quality)
{
	m_volume.reset();
	m_camera = VolumeCamera();
	m_transferFunctions = TransferFunctionStore();
	m_settings = settings;
	m_quality = quality;
	m_opacityScale = 1.0;
	m_interacting = false;
	m_alive = true;
}

void RenderContext::dispose()
{
	m_volume.reset();
	m_interacting = false;
	m_alive = false;
}

void RenderContext::setOpacityScale(double scale)
{
	m_opacityScale = std::clamp(scale, 0.0, 1.0);
}

TransferFunction RenderContext::effectiveTransferFunction() const
{
	if (m_opacityScale == 1.0)
		return m_transferFunctions.active();
	return m_transferFunctions.active().withOpacityScale(m_opacityScale);
}
