#pragma once

#include <QFrame>

#include "RenderSettings.h"
#include "ui_VolumeControlsWidget.h"

class VolumeControlsWidget : public QFrame
{
	Q_OBJECT
public:
	explicit VolumeControlsWidget(QWidget* parent = nullptr);

	void setPresetNames(const QStringList& names, const QString& current);

public slots:
	// Maps the isovalue slider onto the loaded volume's intensities.
	void setScalarRange(double min, double max);
	void setIsoValue(double value);
	void setQuality(QualityTier tier);
	void setAutoRotating(bool on);

signals:
	void renderModeChanged(RenderMode mode);
	void presetChanged(const QString& name);
	void qualityChanged(QualityTier tier);
	void opacityChanged(double scale);
	void brightnessChanged(double brightness);
	void contrastChanged(double contrast);
	void isoValueChanged(double value);
	void autoRotationToggled(bool on);
	void resetCameraRequested();

private:
	double isoFromSlider(int position) const;
	void updateIsoLabel(double value);

	Ui::VolumeControlsWidget ui;
	double m_scalarMin = 0.0;
	double m_scalarMax = 1.0;
};
