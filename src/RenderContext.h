#pragma once

#include "RenderSettings.h"
#include "ScalarVolume.h"
#include "TransferFunction.h"
#include "VolumeCamera.h"

#include <QSize>

// Owns the per-session rendering state shared by the controller and the
// active backend. Nothing in here is global; create() and dispose() bracket
// the lifetime explicitly.
class RenderContext
{
public:
	RenderContext() = default;
	RenderContext(const RenderContext&) = delete;
	RenderContext& operator=(const RenderContext&) = delete;

	void create(const RenderSettings& settings = RenderSettings(), QualityTier quality = QualityTier::High);
	void dispose();
	bool isAlive() const { return m_alive; }

	ScalarVolumePtr volume() const { return m_volume; }
	bool hasVolume() const { return m_volume != nullptr; }
	void setVolume(const ScalarVolumePtr& volume) { m_volume = volume; }

	VolumeCamera& camera() { return m_camera; }
	const VolumeCamera& camera() const { return m_camera; }

	TransferFunctionStore& transferFunctions() { return m_transferFunctions; }
	const TransferFunctionStore& transferFunctions() const { return m_transferFunctions; }

	RenderSettings& settings() { return m_settings; }
	const RenderSettings& settings() const { return m_settings; }

	QualityTier quality() const { return m_quality; }
	void setQuality(QualityTier tier) { m_quality = tier; }

	// Multiplier on the active transfer function's opacity, clamped to [0,1]
	double opacityScale() const { return m_opacityScale; }
	void setOpacityScale(double scale);
	// Active function with the opacity scale applied
	TransferFunction effectiveTransferFunction() const;

	bool isInteracting() const { return m_interacting; }
	void setInteracting(bool interacting) { m_interacting = interacting; }

	QSize surfaceSize() const { return m_surfaceSize; }
	void setSurfaceSize(const QSize& size) { m_surfaceSize = size; }

private:
	bool m_alive = false;
	ScalarVolumePtr m_volume;
	VolumeCamera m_camera;
	TransferFunctionStore m_transferFunctions;
	RenderSettings m_settings;
	QualityTier m_quality = QualityTier::High;
	double m_opacityScale = 1.0;
	bool m_interacting = false;
	QSize m_surfaceSize{ 512, 512 };
};
