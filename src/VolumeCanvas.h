#pragma once

#include <QImage>
#include <QWidget>

// Plain 2D surface for software frames. Frames are scaled to the widget,
// so reduced-resolution renders still fill it.
class VolumeCanvas : public QWidget
{
	Q_OBJECT
public:
	explicit VolumeCanvas(QWidget* parent = nullptr);

	const QImage& frame() const { return m_frame; }

public slots:
	void setFrame(const QImage& image);
	void clear();

signals:
	void pointerPressed(const QPoint& pos);
	void pointerMoved(const QPoint& pos);
	void pointerReleased(const QPoint& pos);
	void surfaceResized(const QSize& size);

protected:
	void paintEvent(QPaintEvent* event) override;
	void mousePressEvent(QMouseEvent* event) override;
	void mouseMoveEvent(QMouseEvent* event) override;
	void mouseReleaseEvent(QMouseEvent* event) override;
	void resizeEvent(QResizeEvent* event) override;

private:
	QImage m_frame;
};
