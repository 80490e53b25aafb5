#include "RendererConfig.h"
#include "Logging.h"

#include <QSettings>

#include <stdexcept>

RendererConfig RendererConfig::load(QSettings& settings)
{
	RendererConfig config;
	settings.beginGroup(QStringLiteral("renderer"));
	config.preloadHardware = settings.value("preloadHardware", config.preloadHardware).toBool();
	config.forceSoftware = settings.value("forceSoftware", config.forceSoftware).toBool();
	config.useWorker = settings.value("useWorker", config.useWorker).toBool();
	config.progressiveLoading = settings.value("progressiveLoading", config.progressiveLoading).toBool();
	config.progressiveDepthThreshold = settings.value("progressiveDepthThreshold", config.progressiveDepthThreshold).toInt();
	config.stepSize = settings.value("stepSize", config.stepSize).toDouble();
	config.autoRotationIntervalMs = settings.value("autoRotationIntervalMs", config.autoRotationIntervalMs).toInt();
	config.performanceIntervalMs = settings.value("performanceIntervalMs", config.performanceIntervalMs).toInt();

	const QString quality = settings.value("quality", qualityTierName(config.quality)).toString();
	try {
		config.quality = qualityTierFromName(quality);
	}
	catch (const std::invalid_argument& e) {
		qCWarning(lcUi) << "ignoring stored quality:" << e.what();
	}
	settings.endGroup();

	if (!(config.stepSize > 0.0))
		config.stepSize = RendererConfig().stepSize;
	if (config.autoRotationIntervalMs <= 0)
		config.autoRotationIntervalMs = RendererConfig().autoRotationIntervalMs;
	if (config.performanceIntervalMs <= 0)
		config.performanceIntervalMs = RendererConfig().performanceIntervalMs;
	return config;
}

void RendererConfig::save(QSettings& settings) const
{
	settings.beginGroup(QStringLiteral("renderer"));
	settings.setValue("preloadHardware", preloadHardware);
	settings.setValue("forceSoftware", forceSoftware);
	settings.setValue("useWorker", useWorker);
	settings.setValue("progressiveLoading", progressiveLoading);
	settings.setValue("progressiveDepthThreshold", progressiveDepthThreshold);
	settings.setValue("quality", qualityTierName(quality));
	settings.setValue("stepSize", stepSize);
	settings.setValue("autoRotationIntervalMs", autoRotationIntervalMs);
	settings.setValue("performanceIntervalMs", performanceIntervalMs);
	settings.endGroup();
}
