#pragma once

#include "QualityScheduler.h"
#include "RenderBackend.h"
#include "RenderCache.h"
#include "RenderWorker.h"

#include <QTimer>

#include <functional>
#include <memory>

// CPU rendering path. Frames are produced by SoftwareRayCaster, either on a
// RenderWorkerHost thread or synchronously when no worker is available.
class SoftwareBackend : public RenderBackend
{
	Q_OBJECT
public:
	using WorkerFactory = std::function<std::unique_ptr<RenderWorkerHost>()>;

	// Without a factory every frame is rendered on the calling thread.
	explicit SoftwareBackend(RenderContext& context, WorkerFactory workerFactory = WorkerFactory(),
		QObject* parent = nullptr);
	~SoftwareBackend() override;

	Kind kind() const override { return Kind::Software; }

	void initialize() override;
	void loadVolume(const ScalarVolumePtr& volume) override;
	void render() override;

	void setRenderMode(RenderMode mode) override;
	void setTransferFunction(const TransferFunction& tf) override;
	void setOpacity(double scale) override;
	void setQuality(QualityTier tier) override;
	void applySettings() override;

	void resetCamera() override;
	void startAutoRotation() override;
	void stopAutoRotation() override;
	bool isAutoRotating() const override { return m_rotationTimer.isActive(); }

	void clearCache() override;
	void dispose() override;

	void setAutoRotationInterval(int ms) { m_rotationTimer.setInterval(ms); }

	// Fresh frames only; cache hits are not counted
	int renderCount() const { return m_renderCount; }
	int cacheHitCount() const { return m_cacheHits; }
	double lastRenderTimeMs() const { return m_lastRenderTimeMs; }
	const RenderPlan& lastPlan() const { return m_lastPlan; }
	const RenderCache& cache() const { return m_cache; }
	const QImage& lastFrame() const { return m_lastFrame; }
	bool isRenderInFlight() const { return m_inFlight; }
	bool usesWorker() const { return m_worker != nullptr; }

private slots:
	void onWorkerRendered(const RenderReply& reply);
	void onWorkerFailed(quint64 id, const QString& message);
	void onRotationTick();

private:
	void ensureWorker();
	void invalidate();
	void finishFrame(const QImage& image, double renderTimeMs);
	void present(const QImage& image);
	// Renders once if a request was dropped while the last one was in flight.
	void renderDropped();

	WorkerFactory m_workerFactory;
	std::unique_ptr<RenderWorkerHost> m_worker;
	bool m_workerAttempted = false;

	RenderCache m_cache;
	QTimer m_rotationTimer;

	bool m_inFlight = false;
	bool m_renderDropped = false;
	quint64 m_nextRequestId = 1;
	quint64 m_pendingId = 0;
	QString m_pendingKey;
	bool m_pendingCacheable = false;
	// bumped whenever cached frames become invalid, so late frames are not stored
	quint64 m_generation = 0;
	quint64 m_pendingGeneration = 0;

	RenderPlan m_lastPlan;
	int m_renderCount = 0;
	int m_cacheHits = 0;
	double m_lastRenderTimeMs = 0.0;
	QImage m_lastFrame;
	bool m_disposed = false;
};
