#pragma once

#include "RenderSettings.h"
#include "ScalarVolume.h"
#include "TransferFunction.h"
#include "VolumeCamera.h"

#include <QImage>
#include <QMetaType>
#include <QSize>

// Everything the worker needs, copied so the GUI thread can keep mutating
// its own state while a frame is being computed.
struct RenderRequest
{
	quint64 id = 0;
	ScalarVolumePtr volume;
	VolumeCamera camera;
	TransferFunction transferFunction;
	RenderSettings settings;
	QSize size;
	double stepSize = 0.5;
};

struct RenderReply
{
	quint64 id = 0;
	QImage image;
	double renderTimeMs = 0.0;
};

Q_DECLARE_METATYPE(RenderRequest)
Q_DECLARE_METATYPE(RenderReply)
