#pragma once

#include "RenderSettings.h"
#include "ScalarVolume.h"
#include "TransferFunction.h"

#include <QImage>
#include <QMetaType>
#include <QObject>
#include <QString>

#include <stdexcept>

class RenderContext;

class BackendError : public std::runtime_error
{
public:
	explicit BackendError(const std::string& message)
		: std::runtime_error(message) {}
};

struct PerformanceSample
{
	double fps = 0.0;
	double renderTimeMs = 0.0;
	double memoryMB = 0.0;
};

struct PerformanceWarning
{
	enum class Kind
	{
		LowFrameRate,
		LargeVolume,
		HighMemory
	};

	Kind kind = Kind::LowFrameRate;
	QString message;
	QString suggestion;
};

Q_DECLARE_METATYPE(PerformanceSample)
Q_DECLARE_METATYPE(PerformanceWarning)

// Common surface of the hardware and software renderers. State such as the
// camera and settings lives in the RenderContext; the setters tell the
// backend what changed.
class RenderBackend : public QObject
{
	Q_OBJECT
public:
	enum class Kind
	{
		Hardware,
		Software
	};

	explicit RenderBackend(RenderContext& context, QObject* parent = nullptr)
		: QObject(parent), m_context(context) {}
	~RenderBackend() override = default;

	virtual Kind kind() const = 0;

	// Throws BackendError when the backend cannot run here.
	virtual void initialize() = 0;
	virtual void loadVolume(const ScalarVolumePtr& volume) = 0;
	virtual void render() = 0;

	virtual void setRenderMode(RenderMode mode) = 0;
	virtual void setTransferFunction(const TransferFunction& tf) = 0;
	virtual void setOpacity(double scale) = 0;
	virtual void setQuality(QualityTier tier) = 0;
	// Brightness, contrast, isovalue or step size changed
	virtual void applySettings() = 0;

	virtual void resetCamera() = 0;
	virtual void startAutoRotation() = 0;
	virtual void stopAutoRotation() = 0;
	virtual bool isAutoRotating() const = 0;

	virtual void clearCache() {}
	virtual void dispose() = 0;

signals:
	// Software frames; the hardware backend draws into its own window
	void frameReady(const QImage& image);
	void stageLoaded(QualityTier tier, double progress);
	void loadFailed(const QString& message);
	void performanceSampled(const PerformanceSample& sample);
	void performanceWarning(const PerformanceWarning& warning);

protected:
	RenderContext& m_context;
};
