#pragma once

#include "RenderBackend.h"
#include "VolumeAssembler.h"

#include <QObject>
#include <QPoint>
#include <QSize>
#include <QTimer>

class BackendSelector;
class RenderContext;

// Entry point used by the UI. Translates pointer input and control changes
// into camera and settings updates and forwards them to whichever backend
// the selector has made active.
class InteractionController : public QObject
{
	Q_OBJECT
public:
	InteractionController(RenderContext& context, BackendSelector& selector, QObject* parent = nullptr);
	~InteractionController() override;

	// Returns true when a volume is ready afterwards. Failures are reported
	// through errorOccurred and leave no partial volume behind.
	bool loadVolume(const FrameSourceList& frames);

	void pointerDown(const QPoint& pos);
	void pointerMove(const QPoint& pos);
	void pointerUp(const QPoint& pos);

	bool isLoading() const { return m_loading; }
	bool isDisposed() const { return m_disposed; }
	bool hasPendingRender() const { return m_renderTimer.isActive(); }
	bool isAutoRotating() const;

	RenderBackend* backend() const;
	RenderContext& context() { return m_context; }

public slots:
	void setRenderMode(RenderMode mode);
	void setPreset(const QString& name);
	void setOpacity(double scale);
	void setQuality(QualityTier tier);
	void setBrightness(double brightness);
	void setContrast(double contrast);
	void setIsoValue(double value);
	void setStepSize(double step);
	void setSurfaceSize(const QSize& size);

	void resetCamera();
	void startAutoRotation();
	void stopAutoRotation();

	// Coalesces into one render on the next event loop pass.
	void requestRender();
	void renderNow();

	void dispose();

signals:
	void frameReady(const QImage& image);
	void loadingChanged(bool loading);
	void loadProgress(int percent);
	void volumeChanged();
	void stageLoaded(QualityTier tier, double progress);
	void errorOccurred(const QString& message);
	void performanceSampled(const PerformanceSample& sample);
	void performanceWarning(const PerformanceWarning& warning);
	void softwareSurfaceRequired();

private slots:
	void onBackendChanged(RenderBackend* backend);
	void onBackendLoadFailed(const QString& message);

private:
	template <typename Fn>
	void dispatch(Fn&& fn);
	void setLoading(bool loading);

	RenderContext& m_context;
	BackendSelector& m_selector;
	VolumeAssembler m_assembler;
	QTimer m_renderTimer;
	QPoint m_lastPointer;
	bool m_loading = false;
	bool m_disposed = false;
};
