#pragma once

#include "CapabilityProbe.h"
#include "RenderBackend.h"

#include <QObject>

#include <functional>
#include <memory>

// Chooses between the GPU and CPU backends once per session. Falling back
// to software is permanent: hardware is never probed or initialized again.
class BackendSelector : public QObject
{
	Q_OBJECT
public:
	enum class State
	{
		Unselected,
		Detecting,
		HardwareActive,
		SoftwareActive
	};
	Q_ENUM(State)

	using BackendFactory = std::function<std::unique_ptr<RenderBackend>()>;

	BackendSelector(std::shared_ptr<const CapabilityProbe> probe,
		BackendFactory hardwareFactory, BackendFactory softwareFactory, QObject* parent = nullptr);
	~BackendSelector() override;

	// With preloadHardware the GPU backend is initialized here, otherwise on
	// the first call to active().
	void select(bool preloadHardware, bool forceSoftware = false);

	// The backend to use, initializing a deferred hardware backend first.
	RenderBackend* active();
	// The current backend without side effects.
	RenderBackend* current() const { return m_backend.get(); }

	State state() const { return m_state; }
	bool isSoftware() const { return m_state == State::SoftwareActive; }
	int hardwareInitAttempts() const { return m_hardwareInitAttempts; }
	const CapabilityReport& report() const { return m_report; }
	const QString& fallbackReason() const { return m_fallbackReason; }

	void fallBackToSoftware(const QString& reason);
	void dispose();

signals:
	void stateChanged(BackendSelector::State state);
	void backendChanged(RenderBackend* backend);
	void fellBackToSoftware(const QString& reason);

private:
	void setState(State state);
	bool initializeHardware();
	void releaseBackend();

	std::shared_ptr<const CapabilityProbe> m_probe;
	BackendFactory m_hardwareFactory;
	BackendFactory m_softwareFactory;

	std::unique_ptr<RenderBackend> m_backend;
	State m_state = State::Unselected;
	bool m_hardwareReady = false;
	int m_hardwareInitAttempts = 0;
	CapabilityReport m_report;
	QString m_fallbackReason;
};
