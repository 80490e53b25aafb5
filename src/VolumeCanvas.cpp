#include "VolumeCanvas.h"

#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>

VolumeCanvas::VolumeCanvas(QWidget* parent)
	: QWidget(parent)
{
	setAttribute(Qt::WA_OpaquePaintEvent);
	setMinimumSize(64, 64);
}

void VolumeCanvas::setFrame(const QImage& image)
{
	m_frame = image;
	update();
}

void VolumeCanvas::clear()
{
	m_frame = QImage();
	update();
}

void VolumeCanvas::paintEvent(QPaintEvent* event)
{
	Q_UNUSED(event);
	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);
	if (m_frame.isNull())
		return;

	painter.setRenderHint(QPainter::SmoothPixmapTransform, m_frame.size() != size());
	painter.drawImage(rect(), m_frame);
}

void VolumeCanvas::mousePressEvent(QMouseEvent* event)
{
	if (event->button() == Qt::LeftButton)
		emit pointerPressed(event->pos());
	QWidget::mousePressEvent(event);
}

void VolumeCanvas::mouseMoveEvent(QMouseEvent* event)
{
	if (event->buttons() & Qt::LeftButton)
		emit pointerMoved(event->pos());
	QWidget::mouseMoveEvent(event);
}

void VolumeCanvas::mouseReleaseEvent(QMouseEvent* event)
{
	if (event->button() == Qt::LeftButton)
		emit pointerReleased(event->pos());
	QWidget::mouseReleaseEvent(event);
}

void VolumeCanvas::resizeEvent(QResizeEvent* event)
{
	QWidget::resizeEvent(event);
	emit surfaceResized(event->size());
}
