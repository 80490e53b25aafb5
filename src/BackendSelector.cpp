#include "BackendSelector.h"
#include "Logging.h"

BackendSelector::BackendSelector(std::shared_ptr<const CapabilityProbe> probe,
	BackendFactory hardwareFactory, BackendFactory softwareFactory, QObject* parent)
	: QObject(parent)
	, m_probe(std::move(probe))
	, m_hardwareFactory(std::move(hardwareFactory))
	, m_softwareFactory(std::move(softwareFactory))
{
}

BackendSelector::~BackendSelector()
{
	dispose();
}

void BackendSelector::setState(State state)
{
	if (m_state == state)
		return;
	m_state = state;
	emit stateChanged(state);
}

void BackendSelector::select(bool preloadHardware, bool forceSoftware)
{
	if (m_state != State::Unselected) {
		qCDebug(lcBackend) << "backend already selected";
		return;
	}
	setState(State::Detecting);

	if (forceSoftware || !m_probe || !m_hardwareFactory) {
		fallBackToSoftware(QStringLiteral("GPU rendering disabled"));
		return;
	}

	m_report = m_probe->probe();
	if (!m_report.suitable) {
		fallBackToSoftware(m_report.reason);
		return;
	}

	try {
		m_backend = m_hardwareFactory();
	}
	catch (const std::exception& e) {
		fallBackToSoftware(QString::fromStdString(e.what()));
		return;
	}
	if (!m_backend) {
		fallBackToSoftware(QStringLiteral("No GPU backend available"));
		return;
	}

	setState(State::HardwareActive);
	emit backendChanged(m_backend.get());

	if (preloadHardware)
		initializeHardware();
}

RenderBackend* BackendSelector::active()
{
	if (m_state == State::HardwareActive && !m_hardwareReady)
		initializeHardware();
	return m_backend.get();
}

bool BackendSelector::initializeHardware()
{
	++m_hardwareInitAttempts;
	try {
		m_backend->initialize();
		m_hardwareReady = true;
		qCInfo(lcBackend) << "using GPU backend";
		return true;
	}
	catch (const std::exception& e) {
		fallBackToSoftware(QString::fromStdString(e.what()));
		return false;
	}
}

void BackendSelector::releaseBackend()
{
	if (!m_backend)
		return;
	m_backend->dispose();
	// may be called from inside one of the backend's own signals
	m_backend.release()->deleteLater();
}

void BackendSelector::fallBackToSoftware(const QString& reason)
{
	if (m_state == State::SoftwareActive)
		return;

	qCWarning(lcBackend) << "falling back to software rendering:" << reason;
	releaseBackend();
	m_hardwareReady = false;
	m_fallbackReason = reason;

	if (m_softwareFactory) {
		m_backend = m_softwareFactory();
		m_backend->initialize();
	}
	setState(State::SoftwareActive);
	emit fellBackToSoftware(reason);
	emit backendChanged(m_backend.get());
}

void BackendSelector::dispose()
{
	if (m_backend) {
		m_backend->dispose();
		m_backend.reset();
	}
	m_hardwareReady = false;
}
