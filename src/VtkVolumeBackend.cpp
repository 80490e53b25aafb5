#include "VtkVolumeBackend.h"
#include "Logging.h"
#include "QualityScheduler.h"
#include "RenderContext.h"

#include <vtkCamera.h>
#include <vtkColorTransferFunction.h>
#include <vtkContourValues.h>
#include <vtkFloatArray.h>
#include <vtkGPUVolumeRayCastMapper.h>
#include <vtkImageData.h>
#include <vtkPiecewiseFunction.h>
#include <vtkPointData.h>
#include <vtkRenderWindow.h>
#include <vtkRenderer.h>
#include <vtkVolume.h>
#include <vtkVolumeProperty.h>

#include <algorithm>
#include <sstream>

namespace
{
	struct Stage
	{
		int factor;
		QualityTier tier;
		double progress;
	};

	const Stage kStages[] = {
		{ 4, QualityTier::Low, 0.3 },
		{ 2, QualityTier::Medium, 0.6 },
		{ 1, QualityTier::High, 1.0 },
	};
	constexpr int kStageCount = 3;
}

VtkVolumeBackend::VtkVolumeBackend(RenderContext& context, vtkRenderWindow* window,
	const RendererConfig& config, QObject* parent)
	: RenderBackend(context, parent)
	, m_window(window)
	, m_config(config)
	, m_monitor(config.performanceIntervalMs)
{
	m_rotationTimer.setInterval(config.autoRotationIntervalMs);
	connect(&m_rotationTimer, &QTimer::timeout, this, &VtkVolumeBackend::onRotationTick);
	m_clock.start();
}

VtkVolumeBackend::~VtkVolumeBackend()
{
	dispose();
}

double VtkVolumeBackend::sampleDistanceFor(QualityTier tier)
{
	switch (tier) {
	case QualityTier::Low:
		return 1.5;
	case QualityTier::Medium:
		return 0.8;
	case QualityTier::High:
		return 0.4;
	}
	return 0.4;
}

void VtkVolumeBackend::initialize()
{
	if (m_initialized)
		return;
	if (!m_window)
		throw BackendError("No render window for GPU volume rendering");

	m_renderer = vtkSmartPointer<vtkRenderer>::New();
	m_renderer->SetBackground(0.0, 0.0, 0.0);

	m_mapper = vtkSmartPointer<vtkGPUVolumeRayCastMapper>::New();
	m_mapper->SetBlendModeToComposite();

	m_colorTF = vtkSmartPointer<vtkColorTransferFunction>::New();
	m_scalarOpacity = vtkSmartPointer<vtkPiecewiseFunction>::New();

	m_volumeProperty = vtkSmartPointer<vtkVolumeProperty>::New();
	m_volumeProperty->ShadeOff();
	m_volumeProperty->SetInterpolationTypeToLinear();
	m_volumeProperty->SetColor(m_colorTF);
	m_volumeProperty->SetScalarOpacity(m_scalarOpacity);

	m_volume = vtkSmartPointer<vtkVolume>::New();
	m_volume->SetMapper(m_mapper);
	m_volume->SetProperty(m_volumeProperty);

	m_window->AddRenderer(m_renderer);
	applyQuality(m_context.quality());
	m_initialized = true;
	qCInfo(lcBackend) << "GPU volume backend initialized";
}

void VtkVolumeBackend::validate(const ScalarVolume& volume)
{
	const auto& dims = volume.dimensions();
	for (int d : dims) {
		if (d <= 0 || d > kMaxDimension) {
			std::ostringstream msg;
			msg << "Volume dimension " << d << " outside 1.." << kMaxDimension;
			throw BackendError(msg.str());
		}
	}
	for (double s : volume.spacing()) {
		if (!(s > 0.0))
			throw BackendError("Volume spacing must be positive");
	}
	const double memory = volume.estimatedMemoryMB();
	if (memory > kMaxMemoryMB) {
		std::ostringstream msg;
		msg << "Volume needs " << static_cast<int>(memory) << " MB, limit is " << kMaxMemoryMB << " MB";
		throw BackendError(msg.str());
	}
}

vtkSmartPointer<vtkImageData> VtkVolumeBackend::toImageData(const ScalarVolume& volume, int factor)
{
	factor = std::max(1, factor);
	const int w = std::max(1, volume.width() / factor);
	const int h = std::max(1, volume.height() / factor);
	const int d = std::max(1, volume.depth() / factor);
	const auto& spacing = volume.spacing();

	auto scalars = vtkSmartPointer<vtkFloatArray>::New();
	scalars->SetName("intensity");
	scalars->SetNumberOfComponents(1);
	scalars->SetNumberOfTuples(static_cast<vtkIdType>(w) * h * d);

	vtkIdType index = 0;
	for (int z = 0; z < d; ++z) {
		for (int y = 0; y < h; ++y) {
			// frame rows are top-down, VTK rows bottom-up
			const int srcY = std::min(volume.height() - 1, (h - 1 - y) * factor);
			for (int x = 0; x < w; ++x)
				scalars->SetValue(index++, volume.voxel(x * factor, srcY, z * factor));
		}
	}

	auto image = vtkSmartPointer<vtkImageData>::New();
	image->SetDimensions(w, h, d);
	image->SetSpacing(spacing[0] * factor, spacing[1] * factor, spacing[2] * factor);
	// voxel centers at (i + 0.5) * spacing, matching the software caster's box
	image->SetOrigin(spacing[0] * factor * 0.5, spacing[1] * factor * 0.5, spacing[2] * factor * 0.5);
	image->GetPointData()->SetScalars(scalars);
	return image;
}

void VtkVolumeBackend::loadVolume(const ScalarVolumePtr& volume)
{
	if (!volume)
		return;
	initialize();
	validate(*volume);

	m_source = volume;
	m_memoryMB = volume->estimatedMemoryMB();
	++m_loadGeneration;
	m_monitor.reset();

	if (m_memoryMB > kMemoryWarningMB)
		qCWarning(lcBackend) << "volume needs" << m_memoryMB << "MB of GPU memory";
	if (auto warning = m_monitor.checkVolume(m_clock.elapsed(), volume->depth(), m_memoryMB))
		emit performanceWarning(*warning);

	applyTransferFunction();
	applySettings();

	const bool staged = m_config.progressiveLoading || volume->depth() > m_config.progressiveDepthThreshold;
	loadStage(staged ? 0 : kStageCount - 1, m_loadGeneration);
}

void VtkVolumeBackend::loadStage(int stage, quint64 generation)
{
	if (generation != m_loadGeneration || !m_source || !m_initialized)
		return;

	const Stage& s = kStages[stage];
	m_image = toImageData(*m_source, s.factor);
	m_mapper->SetInputData(m_image);
	m_volumeProperty->SetScalarOpacityUnitDistance(
		(m_image->GetSpacing()[0] + m_image->GetSpacing()[1] + m_image->GetSpacing()[2]) / 3.0 / std::max(m_opacity, 1e-3));

	if (!m_renderer->HasViewProp(m_volume))
		m_renderer->AddVolume(m_volume);

	applyQuality(s.factor == 1 ? m_context.quality() : s.tier);
	qCInfo(lcBackend) << "loaded stage" << stage << "factor" << s.factor;
	emit stageLoaded(s.tier, s.progress);
	render();

	if (stage + 1 < kStageCount) {
		QPointer<VtkVolumeBackend> self(this);
		QTimer::singleShot(kStageDelayMs, this, [self, stage, generation]() {
			if (!self)
				return;
			try {
				self->loadStage(stage + 1, generation);
			}
			catch (const std::exception& e) {
				qCWarning(lcBackend) << "staged load failed:" << e.what();
				emit self->loadFailed(QString::fromStdString(e.what()));
			}
		});
	}
}

void VtkVolumeBackend::applyTransferFunction()
{
	if (!m_initialized || !m_source)
		return;

	const TransferFunction tf = m_context.transferFunctions().active();
	const double lo = m_source->scalarMin();
	const double range = m_source->scalarRange();
	const double brightness = m_context.settings().brightness;

	m_scalarOpacity->RemoveAllPoints();
	for (const OpacityPoint& p : tf.opacityPoints())
		m_scalarOpacity->AddPoint(lo + p.intensity * range, p.opacity);

	m_colorTF->RemoveAllPoints();
	for (const ColorPoint& p : tf.colorPoints()) {
		m_colorTF->AddRGBPoint(lo + p.intensity * range,
			std::min(1.0, p.r * brightness),
			std::min(1.0, p.g * brightness),
			std::min(1.0, p.b * brightness));
	}
}

void VtkVolumeBackend::applyQuality(QualityTier tier)
{
	if (!m_mapper)
		return;
	m_mapper->SetSampleDistance(sampleDistanceFor(tier));
	m_mapper->SetAutoAdjustSampleDistances(tier == QualityTier::High ? 0 : 1);
}

void VtkVolumeBackend::setRenderMode(RenderMode mode)
{
	if (!m_initialized)
		return;
	switch (mode) {
	case RenderMode::MaximumIntensity:
		m_mapper->SetBlendModeToMaximumIntensity();
		break;
	case RenderMode::Volumetric:
		m_mapper->SetBlendModeToComposite();
		break;
	case RenderMode::Isosurface:
		m_mapper->SetBlendModeToIsoSurface();
		m_volumeProperty->GetIsoSurfaceValues()->SetValue(0, m_context.settings().isoValue);
		break;
	}
}

void VtkVolumeBackend::setTransferFunction(const TransferFunction& tf)
{
	Q_UNUSED(tf);
	applyTransferFunction();
}

void VtkVolumeBackend::setOpacity(double scale)
{
	m_opacity = std::clamp(scale, 0.0, 1.0);
	if (!m_initialized || !m_image)
		return;
	const double* spacing = m_image->GetSpacing();
	const double meanSpacing = (spacing[0] + spacing[1] + spacing[2]) / 3.0;
	m_volumeProperty->SetScalarOpacityUnitDistance(meanSpacing / std::max(m_opacity, 1e-3));
}

void VtkVolumeBackend::setQuality(QualityTier tier)
{
	applyQuality(tier);
}

void VtkVolumeBackend::applySettings()
{
	if (!m_initialized)
		return;
	setRenderMode(m_context.settings().mode);
	applyTransferFunction();
}

void VtkVolumeBackend::syncCameraToVtk()
{
	vtkCamera* camera = m_renderer->GetActiveCamera();
	const VolumeCamera& model = m_context.camera();
	camera->SetPosition(model.position().data());
	camera->SetFocalPoint(model.target().data());
	camera->SetViewUp(model.up().data());
	camera->SetViewAngle(model.viewAngle());
	camera->OrthogonalizeViewUp();
	m_renderer->ResetCameraClippingRange();
}

void VtkVolumeBackend::syncCameraFromVtk()
{
	vtkCamera* camera = m_renderer->GetActiveCamera();
	VolumeCamera& model = m_context.camera();
	const double* p = camera->GetPosition();
	const double* f = camera->GetFocalPoint();
	const double* u = camera->GetViewUp();
	model.setPosition({ p[0], p[1], p[2] });
	model.setTarget({ f[0], f[1], f[2] });
	model.setUp({ u[0], u[1], u[2] });
}

void VtkVolumeBackend::resetCamera()
{
	if (m_context.hasVolume())
		m_context.camera().resetToVolume(*m_context.volume());
}

void VtkVolumeBackend::render()
{
	if (!m_initialized || !m_image || !m_window)
		return;

	const RenderPlan plan = QualityScheduler::plan(m_context.surfaceSize(), m_context.settings().stepSize,
		m_context.isInteracting(), m_context.quality());
	m_mapper->SetImageSampleDistance(1.0 / plan.scale);

	syncCameraToVtk();

	QElapsedTimer timer;
	timer.start();
	m_window->Render();
	recordFrame(timer.nsecsElapsed() / 1.0e6);
}

void VtkVolumeBackend::recordFrame(double renderTimeMs)
{
	const qint64 now = m_clock.elapsed();
	if (auto sample = m_monitor.recordFrame(now, renderTimeMs, m_memoryMB)) {
		emit performanceSampled(*sample);
		for (const PerformanceWarning& warning : m_monitor.evaluate(now, m_context.isInteracting(), isAutoRotating()))
			emit performanceWarning(warning);
	}
}

void VtkVolumeBackend::startAutoRotation()
{
	if (m_initialized)
		m_rotationTimer.start();
}

void VtkVolumeBackend::stopAutoRotation()
{
	m_rotationTimer.stop();
}

void VtkVolumeBackend::onRotationTick()
{
	if (!m_initialized)
		return;
	syncCameraToVtk();
	m_renderer->GetActiveCamera()->Azimuth(1.0);
	syncCameraFromVtk();
	render();
}

void VtkVolumeBackend::dispose()
{
	stopAutoRotation();
	++m_loadGeneration;
	if (!m_initialized)
		return;

	m_renderer->RemoveAllViewProps();
	if (m_window)
		m_window->RemoveRenderer(m_renderer);
	m_mapper->RemoveAllInputs();
	m_image = nullptr;
	m_source.reset();
	m_volume = nullptr;
	m_mapper = nullptr;
	m_volumeProperty = nullptr;
	m_renderer = nullptr;
	m_initialized = false;
	qCInfo(lcBackend) << "GPU volume backend disposed";
}
