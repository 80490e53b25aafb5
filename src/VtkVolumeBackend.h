#ifndef VTKVOLUMEBACKEND_H
#define VTKVOLUMEBACKEND_H

#include "PerformanceMonitor.h"
#include "RenderBackend.h"
#include "RendererConfig.h"

#include <QElapsedTimer>
#include <QPointer>
#include <QTimer>

#include <vtkSmartPointer.h>
#include <vtkWeakPointer.h>

class vtkColorTransferFunction;
class vtkGPUVolumeRayCastMapper;
class vtkImageData;
class vtkPiecewiseFunction;
class vtkRenderWindow;
class vtkRenderer;
class vtkVolume;
class vtkVolumeProperty;

// GPU ray casting through vtkGPUVolumeRayCastMapper, drawing into a render
// window owned by the viewport.
class VtkVolumeBackend : public RenderBackend
{
	Q_OBJECT
public:
	static constexpr int kMaxDimension = 2048;
	static constexpr double kMaxMemoryMB = 1000.0;
	static constexpr double kMemoryWarningMB = 500.0;
	static constexpr int kStageDelayMs = 100;

	VtkVolumeBackend(RenderContext& context, vtkRenderWindow* window,
		const RendererConfig& config = RendererConfig(), QObject* parent = nullptr);
	~VtkVolumeBackend() override;

	Kind kind() const override { return Kind::Hardware; }

	void initialize() override;
	void loadVolume(const ScalarVolumePtr& volume) override;
	void render() override;

	void setRenderMode(RenderMode mode) override;
	void setTransferFunction(const TransferFunction& tf) override;
	void setOpacity(double scale) override;
	void setQuality(QualityTier tier) override;
	void applySettings() override;

	void resetCamera() override;
	void startAutoRotation() override;
	void stopAutoRotation() override;
	bool isAutoRotating() const override { return m_rotationTimer.isActive(); }

	void dispose() override;

	// Throws BackendError for volumes the GPU path refuses.
	static void validate(const ScalarVolume& volume);
	// Nearest-neighbour copy keeping every factor-th voxel, rows flipped to
	// VTK's bottom-up order and spacing scaled by factor.
	static vtkSmartPointer<vtkImageData> toImageData(const ScalarVolume& volume, int factor);
	static double sampleDistanceFor(QualityTier tier);

private slots:
	void onRotationTick();

private:
	void loadStage(int stage, quint64 generation);
	void applyTransferFunction();
	void applyQuality(QualityTier tier);
	void syncCameraToVtk();
	void syncCameraFromVtk();
	void recordFrame(double renderTimeMs);

	vtkWeakPointer<vtkRenderWindow> m_window;
	RendererConfig m_config;

	vtkSmartPointer<vtkRenderer> m_renderer;
	vtkSmartPointer<vtkGPUVolumeRayCastMapper> m_mapper;
	vtkSmartPointer<vtkVolumeProperty> m_volumeProperty;
	vtkSmartPointer<vtkVolume> m_volume;
	vtkSmartPointer<vtkColorTransferFunction> m_colorTF;
	vtkSmartPointer<vtkPiecewiseFunction> m_scalarOpacity;
	vtkSmartPointer<vtkImageData> m_image;

	ScalarVolumePtr m_source;
	quint64 m_loadGeneration = 0;
	double m_opacity = 1.0;
	double m_memoryMB = 0.0;

	QTimer m_rotationTimer;
	QElapsedTimer m_clock;
	PerformanceMonitor m_monitor;
	bool m_initialized = false;
};

#endif // VTKVOLUMEBACKEND_H
