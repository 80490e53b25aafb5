#pragma once

#include <QStackedWidget>

#include <vtkGenericOpenGLRenderWindow.h>
#include <vtkSmartPointer.h>

class QVTKOpenGLNativeWidget;
class VolumeCanvas;

// Hosts the GPU render window and the software canvas on top of each other.
// Only one is visible; pointer input from either is re-emitted uniformly.
class VolumeViewport : public QStackedWidget
{
	Q_OBJECT
public:
	explicit VolumeViewport(QWidget* parent = nullptr);
	~VolumeViewport() override;

	vtkGenericOpenGLRenderWindow* renderWindow() const { return m_renderWindow; }
	VolumeCanvas* canvas() const { return m_canvas; }
	bool isSoftwareSurface() const;

public slots:
	void showSoftwareSurface();
	void showHardwareSurface();
	void setFrame(const QImage& image);

signals:
	void pointerPressed(const QPoint& pos);
	void pointerMoved(const QPoint& pos);
	void pointerReleased(const QPoint& pos);
	void surfaceResized(const QSize& size);

protected:
	bool eventFilter(QObject* watched, QEvent* event) override;

private:
	QVTKOpenGLNativeWidget* m_vtkWidget = nullptr;
	VolumeCanvas* m_canvas = nullptr;
	vtkSmartPointer<vtkGenericOpenGLRenderWindow> m_renderWindow;
};
