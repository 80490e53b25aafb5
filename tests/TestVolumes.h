#pragma once

#include "FrameSource.h"
#include "ScalarVolume.h"

#include <QBuffer>
#include <QImage>

#include <memory>

namespace testvolumes
{
	// Intensity rises linearly along x from 0 to 1000.
	inline ScalarVolumePtr gradient(int w = 10, int h = 10, int d = 5)
	{
		std::vector<float> samples(static_cast<size_t>(w) * h * d);
		for (int z = 0; z < d; ++z)
			for (int y = 0; y < h; ++y)
				for (int x = 0; x < w; ++x)
					samples[x + y * w + z * w * h] = 1000.0f * x / (w - 1);
		return std::make_shared<const ScalarVolume>(w, h, d, ScalarVolume::Spacing{ { 1.0, 1.0, 1.0 } }, std::move(samples));
	}

	// Constant value with one corner at 0 and the opposite at 1000 so the
	// scalar range is always [0, 1000].
	inline ScalarVolumePtr uniform(float value, int w = 10, int h = 10, int d = 5)
	{
		std::vector<float> samples(static_cast<size_t>(w) * h * d, value);
		samples.front() = 0.0f;
		samples.back() = 1000.0f;
		return std::make_shared<const ScalarVolume>(w, h, d, ScalarVolume::Spacing{ { 1.0, 1.0, 1.0 } }, std::move(samples));
	}

	inline QByteArray encodePng(const QImage& image)
	{
		QByteArray bytes;
		QBuffer buffer(&bytes);
		buffer.open(QIODevice::WriteOnly);
		image.save(&buffer, "PNG");
		return bytes;
	}

	inline FrameSource solidFrame(int w, int h, QRgb color)
	{
		QImage image(w, h, QImage::Format_RGB32);
		image.fill(color);
		return FrameSource::fromBytes(encodePng(image));
	}

	// Horizontal gray ramp, dark on the left.
	inline FrameSource rampFrame(int w, int h)
	{
		QImage image(w, h, QImage::Format_RGB32);
		for (int y = 0; y < h; ++y)
			for (int x = 0; x < w; ++x) {
				const int g = x * 255 / (w - 1);
				image.setPixel(x, y, qRgb(g, g, g));
			}
		return FrameSource::fromBytes(encodePng(image));
	}

	inline FrameSourceList rampStack(int w = 10, int h = 10, int d = 5)
	{
		FrameSourceList frames;
		for (int z = 0; z < d; ++z)
			frames.append(rampFrame(w, h));
		return frames;
	}

	inline int alphaAt(const QImage& image, int x, int y)
	{
		return image.constScanLine(y)[x * 4 + 3];
	}

	inline bool anyAlpha(const QImage& image)
	{
		for (int y = 0; y < image.height(); ++y)
			for (int x = 0; x < image.width(); ++x)
				if (alphaAt(image, x, y) > 0)
					return true;
		return false;
	}
}
