#include "VolumeControlsWidget.h"

#include <QSignalBlocker>

#include <cmath>

VolumeControlsWidget::VolumeControlsWidget(QWidget* parent)
	: QFrame(parent)
{
	ui.setupUi(this);

	ui.comboMode->addItem(tr("Maximum intensity"), static_cast<int>(RenderMode::MaximumIntensity));
	ui.comboMode->addItem(tr("Volume"), static_cast<int>(RenderMode::Volumetric));
	ui.comboMode->addItem(tr("Isosurface"), static_cast<int>(RenderMode::Isosurface));
	ui.comboMode->setCurrentIndex(1);

	ui.comboQuality->addItem(tr("Low"), static_cast<int>(QualityTier::Low));
	ui.comboQuality->addItem(tr("Medium"), static_cast<int>(QualityTier::Medium));
	ui.comboQuality->addItem(tr("High"), static_cast<int>(QualityTier::High));
	ui.comboQuality->setCurrentIndex(2);

	connect(ui.comboMode, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
		const RenderMode mode = static_cast<RenderMode>(ui.comboMode->currentData().toInt());
		ui.sliderIso->setEnabled(mode == RenderMode::Isosurface);
		emit renderModeChanged(mode);
	});
	connect(ui.comboPreset, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
		emit presetChanged(ui.comboPreset->currentText());
	});
	connect(ui.comboQuality, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int) {
		emit qualityChanged(static_cast<QualityTier>(ui.comboQuality->currentData().toInt()));
	});

	connect(ui.sliderOpacity, &QSlider::valueChanged, this, [this](int v) {
		ui.labelOpacityValue->setText(QString::number(v) + "%");
		emit opacityChanged(v / 100.0);
	});
	connect(ui.sliderBrightness, &QSlider::valueChanged, this, [this](int v) {
		ui.labelBrightnessValue->setText(QString::number(v / 100.0, 'f', 2));
		emit brightnessChanged(v / 100.0);
	});
	connect(ui.sliderContrast, &QSlider::valueChanged, this, [this](int v) {
		ui.labelContrastValue->setText(QString::number(v / 100.0, 'f', 2));
		emit contrastChanged(v / 100.0);
	});
	connect(ui.sliderIso, &QSlider::valueChanged, this, [this](int v) {
		const double value = isoFromSlider(v);
		updateIsoLabel(value);
		emit isoValueChanged(value);
	});

	connect(ui.checkAutoRotate, &QCheckBox::toggled, this, &VolumeControlsWidget::autoRotationToggled);
	connect(ui.btnResetCamera, &QPushButton::clicked, this, &VolumeControlsWidget::resetCameraRequested);

	ui.sliderIso->setEnabled(false);
}

void VolumeControlsWidget::setPresetNames(const QStringList& names, const QString& current)
{
	QSignalBlocker blocker(ui.comboPreset);
	ui.comboPreset->clear();
	ui.comboPreset->addItems(names);
	ui.comboPreset->setCurrentText(current);
}

double VolumeControlsWidget::isoFromSlider(int position) const
{
	const double t = static_cast<double>(position) / ui.sliderIso->maximum();
	return m_scalarMin + t * (m_scalarMax - m_scalarMin);
}

void VolumeControlsWidget::updateIsoLabel(double value)
{
	ui.labelIsoValue->setText(QString::number(value, 'f', 1));
}

void VolumeControlsWidget::setScalarRange(double min, double max)
{
	m_scalarMin = min;
	m_scalarMax = max;
}

void VolumeControlsWidget::setIsoValue(double value)
{
	const double range = m_scalarMax - m_scalarMin;
	const int position = range > 0.0
		? static_cast<int>(std::lround((value - m_scalarMin) / range * ui.sliderIso->maximum()))
		: 0;
	QSignalBlocker blocker(ui.sliderIso);
	ui.sliderIso->setValue(position);
	updateIsoLabel(value);
}

void VolumeControlsWidget::setQuality(QualityTier tier)
{
	QSignalBlocker blocker(ui.comboQuality);
	ui.comboQuality->setCurrentIndex(ui.comboQuality->findData(static_cast<int>(tier)));
}

void VolumeControlsWidget::setAutoRotating(bool on)
{
	QSignalBlocker blocker(ui.checkAutoRotate);
	ui.checkAutoRotate->setChecked(on);
}
