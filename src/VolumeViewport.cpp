#include "VolumeViewport.h"
#include "VolumeCanvas.h"

#include <QMouseEvent>
#include <QResizeEvent>
#include <QVTKOpenGLNativeWidget.h>

#include <vtkGenericOpenGLRenderWindow.h>

VolumeViewport::VolumeViewport(QWidget* parent)
	: QStackedWidget(parent)
{
	m_renderWindow = vtkSmartPointer<vtkGenericOpenGLRenderWindow>::New();

	m_vtkWidget = new QVTKOpenGLNativeWidget(this);
	m_vtkWidget->setRenderWindow(m_renderWindow); // mount VTK window into Qt widget
	// camera is driven by InteractionController, not the VTK interactor
	m_vtkWidget->installEventFilter(this);

	m_canvas = new VolumeCanvas(this);
	connect(m_canvas, &VolumeCanvas::pointerPressed, this, &VolumeViewport::pointerPressed);
	connect(m_canvas, &VolumeCanvas::pointerMoved, this, &VolumeViewport::pointerMoved);
	connect(m_canvas, &VolumeCanvas::pointerReleased, this, &VolumeViewport::pointerReleased);
	connect(m_canvas, &VolumeCanvas::surfaceResized, this, &VolumeViewport::surfaceResized);

	addWidget(m_vtkWidget);
	addWidget(m_canvas);
	setCurrentWidget(m_vtkWidget);
}

VolumeViewport::~VolumeViewport() = default;

bool VolumeViewport::isSoftwareSurface() const
{
	return currentWidget() == m_canvas;
}

void VolumeViewport::showSoftwareSurface()
{
	setCurrentWidget(m_canvas);
	emit surfaceResized(m_canvas->size());
}

void VolumeViewport::showHardwareSurface()
{
	setCurrentWidget(m_vtkWidget);
	emit surfaceResized(m_vtkWidget->size());
}

void VolumeViewport::setFrame(const QImage& image)
{
	m_canvas->setFrame(image);
}

bool VolumeViewport::eventFilter(QObject* watched, QEvent* event)
{
	if (watched != m_vtkWidget)
		return QStackedWidget::eventFilter(watched, event);

	switch (event->type()) {
		case QEvent::MouseButtonPress: {
			auto* me = static_cast<QMouseEvent*>(event);
			if (me->button() == Qt::LeftButton)
				emit pointerPressed(me->pos());
			return true;
		}
		case QEvent::MouseMove: {
			auto* me = static_cast<QMouseEvent*>(event);
			if (me->buttons() & Qt::LeftButton)
				emit pointerMoved(me->pos());
			return true;
		}
		case QEvent::MouseButtonRelease: {
			auto* me = static_cast<QMouseEvent*>(event);
			if (me->button() == Qt::LeftButton)
				emit pointerReleased(me->pos());
			return true;
		}
		case QEvent::MouseButtonDblClick:
		case QEvent::Wheel:
			return true;
		case QEvent::Resize:
			emit surfaceResized(static_cast<QResizeEvent*>(event)->size());
			break;
		default:
			break;
	}
	return QStackedWidget::eventFilter(watched, event);
}
