#include "FrameDecoder.h"
#include "Logging.h"

#include <QFileInfo>
#include <QImage>
#include <QImageReader>

#include <vtkDICOMDirectory.h>
#include <vtkDICOMReader.h>
#include <vtkDataArray.h>
#include <vtkErrorCode.h>
#include <vtkImageData.h>
#include <vtkNew.h>
#include <vtkPointData.h>
#include <vtkStringArray.h>

#include <itkImage.h>
#include <itkImageFileReader.h>
#include <itkImageRegionConstIterator.h>

#include <algorithm>

namespace
{
	std::string describe(const FrameSource& source)
	{
		return source.displayName().toStdString();
	}
}

bool FrameDecoder::isDicomPath(const QString& path)
{
	return path.endsWith(".dcm", Qt::CaseInsensitive) || path.endsWith(".dicom", Qt::CaseInsensitive);
}

bool FrameDecoder::isQtImagePath(const QString& path)
{
	const QByteArray suffix = QFileInfo(path).suffix().toLower().toLatin1();
	return !suffix.isEmpty() && QImageReader::supportedImageFormats().contains(suffix);
}

DecodedFrame FrameDecoder::decode(const FrameSource& source) const
{
	if (source.isInMemory()) {
		QImage image;
		if (!image.loadFromData(source.bytes))
			throw FrameDecodeError("Unable to decode image data for " + describe(source));
		return decodeImage(image, source);
	}

	if (source.path.isEmpty())
		throw FrameDecodeError("Frame source has neither a path nor data");
	if (!QFileInfo::exists(source.path))
		throw FrameDecodeError("Frame file does not exist: " + describe(source));

	if (isDicomPath(source.path))
		return decodeDicom(source);

	if (isQtImagePath(source.path)) {
		QImage image(source.path);
		if (image.isNull())
			throw FrameDecodeError("Unable to read image file " + describe(source));
		return decodeImage(image, source);
	}

	return decodeWithItk(source);
}

DecodedFrame FrameDecoder::decodeImage(const QImage& image, const FrameSource& source) const
{
	const QImage rgb = image.convertToFormat(QImage::Format_ARGB32);
	if (rgb.isNull() || rgb.width() <= 0 || rgb.height() <= 0)
		throw FrameDecodeError("Empty image in " + describe(source));

	DecodedFrame frame;
	frame.width = rgb.width();
	frame.height = rgb.height();
	frame.pixels.resize(static_cast<size_t>(frame.width) * frame.height);

	// grayscale is the plain channel mean
	for (int y = 0; y < frame.height; ++y) {
		const QRgb* line = reinterpret_cast<const QRgb*>(rgb.constScanLine(y));
		float* out = frame.pixels.data() + static_cast<size_t>(y) * frame.width;
		for (int x = 0; x < frame.width; ++x)
			out[x] = (qRed(line[x]) + qGreen(line[x]) + qBlue(line[x])) / 3.0f;
	}
	return frame;
}

DecodedFrame FrameDecoder::decodeDicom(const FrameSource& source) const
{
	auto reader = vtkSmartPointer<vtkDICOMReader>::New();
	reader->SetFileName(source.path.toUtf8().constData());
	reader->SetMemoryRowOrderToFileNative();
	reader->AutoRescaleOn();
	reader->Update();

	if (reader->GetErrorCode() != vtkErrorCode::NoError)
		throw FrameDecodeError("DICOM read failed for " + describe(source));

	vtkImageData* image = reader->GetOutput();
	vtkDataArray* scalars = image ? image->GetPointData()->GetScalars() : nullptr;
	if (!scalars)
		throw FrameDecodeError("DICOM file has no pixel data: " + describe(source));

	int dims[3];
	image->GetDimensions(dims);
	double spacing[3];
	image->GetSpacing(spacing);

	DecodedFrame frame;
	frame.width = dims[0];
	frame.height = dims[1];
	frame.slices = std::max(1, dims[2]);
	frame.spacing = { spacing[0], spacing[1], spacing[2] };

	const vtkIdType count = scalars->GetNumberOfTuples();
	const int components = scalars->GetNumberOfComponents();
	frame.pixels.resize(static_cast<size_t>(count));
	for (vtkIdType i = 0; i < count; ++i) {
		double sum = 0.0;
		for (int c = 0; c < components; ++c)
			sum += scalars->GetComponent(i, c);
		frame.pixels[static_cast<size_t>(i)] = static_cast<float>(sum / components);
	}

	qCDebug(lcAssembler) << "DICOM frame" << source.path << dims[0] << "x" << dims[1] << "x" << dims[2];
	return frame;
}

DecodedFrame FrameDecoder::decodeWithItk(const FrameSource& source) const
{
	using ImageType = itk::Image<float, 2>;
	using ReaderType = itk::ImageFileReader<ImageType>;

	auto reader = ReaderType::New();
	reader->SetFileName(source.path.toStdString());
	try {
		reader->Update();
	}
	catch (const itk::ExceptionObject& e) {
		throw FrameDecodeError("Unable to read " + describe(source) + ": " + e.GetDescription());
	}

	ImageType* image = reader->GetOutput();
	const ImageType::RegionType region = image->GetLargestPossibleRegion();
	const ImageType::SizeType size = region.GetSize();
	const ImageType::SpacingType spacing = image->GetSpacing();

	DecodedFrame frame;
	frame.width = static_cast<int>(size[0]);
	frame.height = static_cast<int>(size[1]);
	frame.spacing = { spacing[0], spacing[1], 1.0 };
	frame.pixels.reserve(static_cast<size_t>(frame.width) * frame.height);

	itk::ImageRegionConstIterator<ImageType> it(image, region);
	for (it.GoToBegin(); !it.IsAtEnd(); ++it)
		frame.pixels.push_back(it.Get());

	if (frame.width <= 0 || frame.height <= 0)
		throw FrameDecodeError("Empty image in " + describe(source));
	return frame;
}

FrameSourceList FrameDecoder::dicomSeries(const QString& directory)
{
	vtkNew<vtkDICOMDirectory> dicomDirectory;
	dicomDirectory->SetDirectoryName(directory.toUtf8().constData());
	dicomDirectory->RequirePixelDataOn();
	dicomDirectory->Update();

	FrameSourceList sources;
	if (dicomDirectory->GetNumberOfSeries() < 1) {
		qCWarning(lcAssembler) << "No DICOM image series found in" << directory;
		return sources;
	}

	vtkStringArray* files = dicomDirectory->GetFileNamesForSeries(0);
	for (vtkIdType i = 0; i < files->GetNumberOfValues(); ++i)
		sources.append(FrameSource::fromFile(QString::fromStdString(files->GetValue(i))));
	return sources;
}
