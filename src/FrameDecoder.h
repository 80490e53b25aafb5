#ifndef FRAMEDECODER_H
#define FRAMEDECODER_H

#include "FrameSource.h"

#include <QStringList>

#include <array>
#include <stdexcept>
#include <vector>

class QImage;

class FrameDecodeError : public std::runtime_error
{
public:
	explicit FrameDecodeError(const std::string& message)
		: std::runtime_error(message) {}
};

// Grayscale pixels of one decoded source. Multi-frame DICOM files
// produce several slices, everything else produces one.
struct DecodedFrame
{
	int width = 0;
	int height = 0;
	int slices = 1;
	std::array<double, 3> spacing{ { 1.0, 1.0, 1.0 } };
	std::vector<float> pixels;
};

class FrameDecoder
{
public:
	DecodedFrame decode(const FrameSource& source) const;

	// Files of the first DICOM series found under a directory, in reader order.
	static FrameSourceList dicomSeries(const QString& directory);

	static bool isDicomPath(const QString& path);
	static bool isQtImagePath(const QString& path);

private:
	DecodedFrame decodeImage(const QImage& image, const FrameSource& source) const;
	DecodedFrame decodeDicom(const FrameSource& source) const;
	DecodedFrame decodeWithItk(const FrameSource& source) const;
};

#endif // FRAMEDECODER_H
