#include "InteractionController.h"
#include "BackendSelector.h"
#include "Logging.h"
#include "RenderContext.h"

#include <algorithm>

InteractionController::InteractionController(RenderContext& context, BackendSelector& selector, QObject* parent)
	: QObject(parent)
	, m_context(context)
	, m_selector(selector)
{
	qRegisterMetaType<PerformanceSample>();
	qRegisterMetaType<PerformanceWarning>();
	qRegisterMetaType<QualityTier>();

	m_renderTimer.setSingleShot(true);
	m_renderTimer.setInterval(0);
	connect(&m_renderTimer, &QTimer::timeout, this, &InteractionController::renderNow);

	connect(&m_selector, &BackendSelector::backendChanged, this, &InteractionController::onBackendChanged);
	connect(&m_selector, &BackendSelector::fellBackToSoftware, this, [this](const QString& reason) {
		qCInfo(lcUi) << "software surface enabled:" << reason;
		emit softwareSurfaceRequired();
	});

	if (m_selector.current())
		onBackendChanged(m_selector.current());
}

InteractionController::~InteractionController()
{
	dispose();
}

RenderBackend* InteractionController::backend() const
{
	return m_selector.current();
}

bool InteractionController::isAutoRotating() const
{
	RenderBackend* b = m_selector.current();
	return b && b->isAutoRotating();
}

void InteractionController::onBackendChanged(RenderBackend* backend)
{
	if (!backend || m_disposed)
		return;

	connect(backend, &RenderBackend::frameReady, this, &InteractionController::frameReady, Qt::UniqueConnection);
	connect(backend, &RenderBackend::stageLoaded, this, &InteractionController::stageLoaded, Qt::UniqueConnection);
	connect(backend, &RenderBackend::performanceSampled, this, &InteractionController::performanceSampled, Qt::UniqueConnection);
	connect(backend, &RenderBackend::performanceWarning, this, &InteractionController::performanceWarning, Qt::UniqueConnection);
	connect(backend, &RenderBackend::loadFailed, this, &InteractionController::onBackendLoadFailed, Qt::UniqueConnection);

	// a replacement backend starts from the current state
	if (backend->kind() == RenderBackend::Kind::Software && m_context.hasVolume()) {
		backend->loadVolume(m_context.volume());
		requestRender();
	}
}

void InteractionController::onBackendLoadFailed(const QString& message)
{
	emit errorOccurred(message);
	m_selector.fallBackToSoftware(message);
}

template <typename Fn>
void InteractionController::dispatch(Fn&& fn)
{
	if (m_disposed)
		return;
	RenderBackend* b = m_selector.active();
	if (!b)
		return;

	try {
		fn(*b);
	}
	catch (const std::exception& e) {
		const QString message = QString::fromStdString(e.what());
		if (b->kind() == RenderBackend::Kind::Hardware) {
			emit errorOccurred(message);
			// the software backend receives the volume through backendChanged
			m_selector.fallBackToSoftware(message);
		}
		else {
			qCWarning(lcRender) << "software backend error:" << message;
		}
	}
}

void InteractionController::setLoading(bool loading)
{
	if (m_loading == loading)
		return;
	m_loading = loading;
	emit loadingChanged(loading);
}

bool InteractionController::loadVolume(const FrameSourceList& frames)
{
	if (m_disposed)
		return false;

	if (frames.isEmpty()) {
		qCInfo(lcUi) << "no frames to load";
		setLoading(false);
		return m_context.hasVolume();
	}

	setLoading(true);
	emit loadProgress(0);

	ScalarVolumePtr volume;
	try {
		volume = m_assembler.assemble(frames, [this](int loaded, int total) {
			emit loadProgress(total > 0 ? loaded * 100 / total : 100);
		});
	}
	catch (const std::exception& e) {
		qCWarning(lcAssembler) << "volume load failed:" << e.what();
		setLoading(false);
		emit errorOccurred(QString::fromStdString(e.what()));
		return false;
	}

	if (!volume) {
		setLoading(false);
		return false;
	}
	if (volume == m_context.volume()) {
		setLoading(false);
		return true;
	}

	m_context.setVolume(volume);
	m_context.camera().resetToVolume(*volume);
	m_context.settings().isoValue = volume->scalarMin() + volume->scalarRange() * 0.5;

	dispatch([&volume](RenderBackend& b) {
		b.loadVolume(volume);
		b.resetCamera();
	});

	setLoading(false);
	emit loadProgress(100);
	emit volumeChanged();
	requestRender();
	return true;
}

void InteractionController::pointerDown(const QPoint& pos)
{
	if (m_disposed)
		return;
	m_lastPointer = pos;
	m_context.setInteracting(true);
	stopAutoRotation();
}

void InteractionController::pointerMove(const QPoint& pos)
{
	if (m_disposed || !m_context.isInteracting())
		return;
	const QPoint delta = pos - m_lastPointer;
	m_lastPointer = pos;
	if (delta.isNull())
		return;

	m_context.camera().orbit(delta.x(), delta.y());
	requestRender();
}

void InteractionController::pointerUp(const QPoint& pos)
{
	if (m_disposed || !m_context.isInteracting())
		return;
	m_lastPointer = pos;
	m_context.setInteracting(false);
	dispatch([](RenderBackend& b) { b.clearCache(); });
	requestRender();
}

void InteractionController::setRenderMode(RenderMode mode)
{
	m_context.settings().mode = mode;
	dispatch([mode](RenderBackend& b) { b.setRenderMode(mode); });
	requestRender();
}

void InteractionController::setPreset(const QString& name)
{
	if (!m_context.transferFunctions().hasPreset(name)) {
		emit errorOccurred(tr("Unknown preset: %1").arg(name));
		return;
	}
	m_context.transferFunctions().setPreset(name);
	const TransferFunction tf = m_context.effectiveTransferFunction();
	dispatch([&tf](RenderBackend& b) { b.setTransferFunction(tf); });
	requestRender();
}

void InteractionController::setOpacity(double scale)
{
	m_context.setOpacityScale(scale);
	const double clamped = m_context.opacityScale();
	dispatch([clamped](RenderBackend& b) { b.setOpacity(clamped); });
	requestRender();
}

void InteractionController::setQuality(QualityTier tier)
{
	m_context.setQuality(tier);
	dispatch([tier](RenderBackend& b) { b.setQuality(tier); });
	requestRender();
}

void InteractionController::setBrightness(double brightness)
{
	m_context.settings().brightness = std::max(0.0, brightness);
	dispatch([](RenderBackend& b) { b.applySettings(); });
	requestRender();
}

void InteractionController::setContrast(double contrast)
{
	m_context.settings().contrast = std::max(0.0, contrast);
	dispatch([](RenderBackend& b) { b.applySettings(); });
	requestRender();
}

void InteractionController::setIsoValue(double value)
{
	m_context.settings().isoValue = value;
	dispatch([](RenderBackend& b) { b.applySettings(); });
	requestRender();
}

void InteractionController::setStepSize(double step)
{
	if (!(step > 0.0))
		return;
	m_context.settings().stepSize = step;
	dispatch([](RenderBackend& b) { b.applySettings(); });
	requestRender();
}

void InteractionController::setSurfaceSize(const QSize& size)
{
	if (size.isEmpty() || size == m_context.surfaceSize())
		return;
	m_context.setSurfaceSize(size);
	// cached frames were rendered for the old size; a resize must not
	// initialize a deferred GPU backend, so no dispatch here
	if (RenderBackend* b = m_selector.current())
		b->clearCache();
	requestRender();
}

void InteractionController::resetCamera()
{
	if (!m_context.hasVolume())
		return;
	dispatch([](RenderBackend& b) { b.resetCamera(); });
	requestRender();
}

void InteractionController::startAutoRotation()
{
	if (!m_context.hasVolume())
		return;
	dispatch([](RenderBackend& b) { b.startAutoRotation(); });
}

void InteractionController::stopAutoRotation()
{
	RenderBackend* b = m_selector.current();
	if (b)
		b->stopAutoRotation();
}

void InteractionController::requestRender()
{
	if (m_disposed || !m_context.hasVolume())
		return;
	m_renderTimer.start();
}

void InteractionController::renderNow()
{
	m_renderTimer.stop();
	if (m_disposed || !m_context.hasVolume())
		return;
	dispatch([](RenderBackend& b) { b.render(); });
}

void InteractionController::dispose()
{
	if (m_disposed)
		return;
	m_disposed = true;
	m_renderTimer.stop();

	// rotation first, then the worker and GPU resources, then cached frames
	if (RenderBackend* b = m_selector.current()) {
		b->stopAutoRotation();
		disconnect(b, nullptr, this, nullptr);
	}
	m_selector.dispose();
	m_assembler.reset();
	m_context.dispose();
	qCInfo(lcUi) << "interaction controller disposed";
}
