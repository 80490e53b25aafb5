#include "PerformanceMonitor.h"

PerformanceMonitor::PerformanceMonitor(int sampleIntervalMs)
	: m_sampleIntervalMs(sampleIntervalMs)
{
}

void PerformanceMonitor::reset()
{
	m_frames.clear();
	m_lastSampleMs = -1;
	m_lastWarningMs = -1;
	m_lowFpsArmed = true;
	m_last = PerformanceSample();
}

std::optional<PerformanceSample> PerformanceMonitor::recordFrame(qint64 nowMs, double renderTimeMs, double memoryMB)
{
	m_frames.push_back(nowMs);
	while (!m_frames.empty() && nowMs - m_frames.front() >= 1000)
		m_frames.pop_front();

	m_last.fps = fps();
	m_last.renderTimeMs = renderTimeMs;
	m_last.memoryMB = memoryMB;

	if (m_lastSampleMs >= 0 && nowMs - m_lastSampleMs < m_sampleIntervalMs)
		return std::nullopt;
	m_lastSampleMs = nowMs;
	return m_last;
}

bool PerformanceMonitor::takeWarningSlot(qint64 nowMs)
{
	if (m_lastWarningMs >= 0 && nowMs - m_lastWarningMs < kWarningCooldownMs)
		return false;
	m_lastWarningMs = nowMs;
	return true;
}

QList<PerformanceWarning> PerformanceMonitor::evaluate(qint64 nowMs, bool interacting, bool continuous)
{
	QList<PerformanceWarning> warnings;

	if (m_last.fps >= kRecoveredFps)
		m_lowFpsArmed = true;

	if (continuous && !interacting && m_lowFpsArmed && m_last.fps < kLowFps && takeWarningSlot(nowMs)) {
		m_lowFpsArmed = false;
		PerformanceWarning w;
		w.kind = PerformanceWarning::Kind::LowFrameRate;
		w.message = QStringLiteral("Rendering at %1 fps").arg(m_last.fps, 0, 'f', 0);
		w.suggestion = QStringLiteral("Lower the rendering quality");
		warnings.append(w);
	}

	if (m_last.memoryMB > kHighMemoryMB && takeWarningSlot(nowMs)) {
		PerformanceWarning w;
		w.kind = PerformanceWarning::Kind::HighMemory;
		w.message = QStringLiteral("Volume uses %1 MB of GPU memory").arg(m_last.memoryMB, 0, 'f', 0);
		w.suggestion = QStringLiteral("Close other volumes or load fewer frames");
		warnings.append(w);
	}
	return warnings;
}

std::optional<PerformanceWarning> PerformanceMonitor::checkVolume(qint64 nowMs, int depth, double memoryMB)
{
	if (depth <= kLargeVolumeDepth && memoryMB <= kLargeVolumeMB)
		return std::nullopt;
	if (!takeWarningSlot(nowMs))
		return std::nullopt;

	PerformanceWarning w;
	w.kind = PerformanceWarning::Kind::LargeVolume;
	w.message = QStringLiteral("Large volume: %1 slices, %2 MB").arg(depth).arg(memoryMB, 0, 'f', 0);
	w.suggestion = QStringLiteral("Use low quality while rotating");
	return w;
}
