#include "SoftwareBackend.h"
#include "Logging.h"
#include "RenderContext.h"
#include "SoftwareRayCaster.h"

#include <QElapsedTimer>

SoftwareBackend::SoftwareBackend(RenderContext& context, WorkerFactory workerFactory, QObject* parent)
	: RenderBackend(context, parent)
	, m_workerFactory(std::move(workerFactory))
{
	m_rotationTimer.setInterval(16);
	connect(&m_rotationTimer, &QTimer::timeout, this, &SoftwareBackend::onRotationTick);
}

SoftwareBackend::~SoftwareBackend()
{
	dispose();
}

void SoftwareBackend::initialize()
{
	m_disposed = false;
	qCInfo(lcBackend) << "software backend ready";
}

void SoftwareBackend::ensureWorker()
{
	if (m_workerAttempted || !m_workerFactory)
		return;
	m_workerAttempted = true;

	try {
		m_worker = m_workerFactory();
	}
	catch (const std::exception& e) {
		qCWarning(lcWorker) << "worker unavailable, rendering on the GUI thread:" << e.what();
		m_worker.reset();
	}
	if (!m_worker)
		return;

	connect(m_worker.get(), &RenderWorkerHost::rendered, this, &SoftwareBackend::onWorkerRendered);
	connect(m_worker.get(), &RenderWorkerHost::failed, this, &SoftwareBackend::onWorkerFailed);
}

void SoftwareBackend::invalidate()
{
	m_cache.clear();
	++m_generation;
}

void SoftwareBackend::loadVolume(const ScalarVolumePtr& volume)
{
	invalidate();
	// a reply for the previous volume can no longer be matched
	m_inFlight = false;
	m_pendingId = 0;
	m_renderDropped = false;
	if (volume)
		qCInfo(lcBackend) << "software volume" << volume->width() << volume->height() << volume->depth();
}

void SoftwareBackend::render()
{
	if (m_disposed || !m_context.hasVolume())
		return;

	if (m_inFlight) {
		// dropped, not queued; one follow-up render runs when the reply lands
		qCDebug(lcRender) << "render in flight, request dropped";
		m_renderDropped = true;
		return;
	}

	const RenderSettings& settings = m_context.settings();
	const bool interacting = m_context.isInteracting();
	m_lastPlan = QualityScheduler::plan(m_context.surfaceSize(), settings.stepSize, interacting, m_context.quality());

	const QString key = RenderCache::keyFor(m_context.camera(), settings.mode, m_context.quality());
	if (!interacting && m_lastPlan.cacheable) {
		QImage cached;
		if (m_cache.lookup(key, &cached)) {
			++m_cacheHits;
			qCDebug(lcRender) << "cache hit" << key;
			present(cached);
			return;
		}
	}

	m_pendingKey = key;
	m_pendingCacheable = m_lastPlan.cacheable && !interacting;
	m_pendingGeneration = m_generation;

	ensureWorker();
	if (m_worker) {
		RenderRequest request;
		request.id = m_nextRequestId++;
		request.volume = m_context.volume();
		request.camera = m_context.camera();
		request.transferFunction = m_context.effectiveTransferFunction();
		request.settings = settings;
		request.size = m_lastPlan.size;
		request.stepSize = m_lastPlan.stepSize;

		m_inFlight = true;
		m_pendingId = request.id;
		m_worker->post(request);
		return;
	}

	m_inFlight = true;
	try {
		QElapsedTimer timer;
		timer.start();
		const QImage image = SoftwareRayCaster::render(*m_context.volume(), m_context.camera(),
			m_context.effectiveTransferFunction(), settings, m_lastPlan.size, m_lastPlan.stepSize);
		finishFrame(image, timer.nsecsElapsed() / 1.0e6);
	}
	catch (const std::exception& e) {
		qCWarning(lcRender) << "software render failed:" << e.what();
	}
	m_inFlight = false;
}

void SoftwareBackend::onWorkerRendered(const RenderReply& reply)
{
	if (m_disposed || reply.id != m_pendingId) {
		qCDebug(lcWorker) << "discarding stale frame" << reply.id;
		return;
	}
	m_inFlight = false;
	m_pendingId = 0;
	finishFrame(reply.image, reply.renderTimeMs);
	renderDropped();
}

void SoftwareBackend::onWorkerFailed(quint64 id, const QString& message)
{
	if (id != m_pendingId)
		return;
	m_inFlight = false;
	m_pendingId = 0;
	qCWarning(lcWorker) << "worker render failed:" << message;
	renderDropped();
}

void SoftwareBackend::renderDropped()
{
	if (!m_renderDropped || m_disposed)
		return;
	m_renderDropped = false;
	render();
}

void SoftwareBackend::finishFrame(const QImage& image, double renderTimeMs)
{
	++m_renderCount;
	m_lastRenderTimeMs = renderTimeMs;
	if (m_pendingCacheable && m_pendingGeneration == m_generation)
		m_cache.insert(m_pendingKey, image);
	qCDebug(lcRender) << "frame" << image.size() << "in" << renderTimeMs << "ms";
	present(image);
}

void SoftwareBackend::present(const QImage& image)
{
	m_lastFrame = image;
	emit frameReady(image);
}

void SoftwareBackend::setRenderMode(RenderMode mode)
{
	Q_UNUSED(mode);
	invalidate();
}

void SoftwareBackend::setTransferFunction(const TransferFunction& tf)
{
	Q_UNUSED(tf);
	invalidate();
}

void SoftwareBackend::setOpacity(double scale)
{
	Q_UNUSED(scale);
	invalidate();
}

void SoftwareBackend::setQuality(QualityTier tier)
{
	// tier is part of the cache key
	Q_UNUSED(tier);
}

void SoftwareBackend::applySettings()
{
	invalidate();
}

void SoftwareBackend::resetCamera()
{
	if (m_context.hasVolume())
		m_context.camera().resetToVolume(*m_context.volume());
}

void SoftwareBackend::startAutoRotation()
{
	if (!m_disposed)
		m_rotationTimer.start();
}

void SoftwareBackend::stopAutoRotation()
{
	m_rotationTimer.stop();
}

void SoftwareBackend::onRotationTick()
{
	m_context.camera().orbit(1.0, 0.0);
	render();
}

void SoftwareBackend::clearCache()
{
	invalidate();
}

void SoftwareBackend::dispose()
{
	if (m_disposed)
		return;
	m_disposed = true;

	stopAutoRotation();
	if (m_worker) {
		disconnect(m_worker.get(), nullptr, this, nullptr);
		m_worker->terminate();
		m_worker.reset();
	}
	invalidate();
	m_inFlight = false;
	m_pendingId = 0;
	m_renderDropped = false;
	qCInfo(lcBackend) << "software backend disposed";
}
