#pragma once

#include "RenderBackend.h"

#include <QList>
#include <QtGlobal>

#include <deque>
#include <optional>

// Frame-rate bookkeeping and warning throttling for the hardware path.
// Timestamps are supplied by the caller in milliseconds.
class PerformanceMonitor
{
public:
	static constexpr double kLowFps = 15.0;
	static constexpr double kRecoveredFps = 20.0;
	static constexpr double kHighMemoryMB = 400.0;
	static constexpr double kLargeVolumeMB = 300.0;
	static constexpr int kLargeVolumeDepth = 300;
	static constexpr qint64 kWarningCooldownMs = 10000;

	explicit PerformanceMonitor(int sampleIntervalMs = 500);

	// Returns a sample when the sampling interval has elapsed since the last one.
	std::optional<PerformanceSample> recordFrame(qint64 nowMs, double renderTimeMs, double memoryMB);

	// Low frame rate is only meaningful while frames are produced continuously.
	QList<PerformanceWarning> evaluate(qint64 nowMs, bool interacting, bool continuous);
	std::optional<PerformanceWarning> checkVolume(qint64 nowMs, int depth, double memoryMB);

	double fps() const { return static_cast<double>(m_frames.size()); }
	void reset();

private:
	bool takeWarningSlot(qint64 nowMs);

	int m_sampleIntervalMs;
	std::deque<qint64> m_frames;
	qint64 m_lastSampleMs = -1;
	qint64 m_lastWarningMs = -1;
	bool m_lowFpsArmed = true;
	PerformanceSample m_last;
};
