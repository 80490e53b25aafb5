#pragma once

#include "CapabilityProbe.h"
#include "RenderBackend.h"

#include <memory>

// Records calls and can be told to fail initialization.
struct FakeBackendLog
{
	int created = 0;
	int initialized = 0;
	int disposed = 0;
	int volumesLoaded = 0;
	int renders = 0;
	bool failInitialize = false;
	bool failLoad = false;
};

class FakeBackend : public RenderBackend
{
public:
	FakeBackend(RenderContext& context, Kind kind, std::shared_ptr<FakeBackendLog> log)
		: RenderBackend(context), m_kind(kind), m_log(std::move(log))
	{
		++m_log->created;
	}

	Kind kind() const override { return m_kind; }

	void initialize() override
	{
		++m_log->initialized;
		if (m_log->failInitialize)
			throw BackendError("context creation failed");
	}

	void loadVolume(const ScalarVolumePtr&) override
	{
		if (m_log->failLoad)
			throw BackendError("volume texture upload failed");
		++m_log->volumesLoaded;
	}

	void render() override { ++m_log->renders; }

	void setRenderMode(RenderMode) override {}
	void setTransferFunction(const TransferFunction&) override {}
	void setOpacity(double) override {}
	void setQuality(QualityTier) override {}
	void applySettings() override {}

	void resetCamera() override {}
	void startAutoRotation() override { m_rotating = true; }
	void stopAutoRotation() override { m_rotating = false; }
	bool isAutoRotating() const override { return m_rotating; }

	void dispose() override { ++m_log->disposed; }

private:
	Kind m_kind;
	std::shared_ptr<FakeBackendLog> m_log;
	bool m_rotating = false;
};

class FakeProbe : public CapabilityProbe
{
public:
	explicit FakeProbe(bool suitable)
	{
		m_report.suitable = suitable;
		m_report.majorVersion = suitable ? 4 : 2;
		m_report.minorVersion = 1;
		if (!suitable)
			m_report.reason = QStringLiteral("OpenGL 2.1 is below the required 3.2");
	}

	CapabilityReport probe() const override
	{
		++m_calls;
		return m_report;
	}

	int calls() const { return m_calls; }

private:
	CapabilityReport m_report;
	mutable int m_calls = 0;
};
