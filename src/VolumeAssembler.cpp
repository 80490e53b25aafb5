#include "VolumeAssembler.h"
#include "Logging.h"

#include <QElapsedTimer>

#include <sstream>

ScalarVolumePtr VolumeAssembler::assemble(const FrameSourceList& sources, const ProgressCallback& progress)
{
	if (sources.isEmpty()) {
		qCDebug(lcAssembler) << "assemble called with no frames";
		return nullptr;
	}

	if (m_current && m_current->sources() == sources) {
		qCDebug(lcAssembler) << "source list unchanged, reusing volume";
		return m_current;
	}

	QElapsedTimer timer;
	timer.start();

	const int total = sources.size();
	int width = 0;
	int height = 0;
	int depth = 0;
	ScalarVolume::Spacing spacing{ { 1.0, 1.0, 1.0 } };
	std::vector<float> samples;

	for (int i = 0; i < total; ++i) {
		DecodedFrame frame;
		try {
			frame = m_decoder.decode(sources.at(i));
		}
		catch (const FrameDecodeError& e) {
			throw VolumeLoadError(std::string("Failed to load frame ") + std::to_string(i) + ": " + e.what());
		}

		if (i == 0) {
			width = frame.width;
			height = frame.height;
			spacing = frame.spacing;
			samples.reserve(static_cast<size_t>(width) * height * frame.slices * total);
		}
		else if (frame.width != width || frame.height != height) {
			std::ostringstream msg;
			msg << "Frame " << i << " is " << frame.width << "x" << frame.height
				<< ", expected " << width << "x" << height;
			throw VolumeLoadError(msg.str());
		}

		samples.insert(samples.end(), frame.pixels.begin(), frame.pixels.end());
		depth += frame.slices;

		if (progress)
			progress(i + 1, total);
	}

	auto volume = std::make_shared<const ScalarVolume>(width, height, depth, spacing, std::move(samples), sources);
	qCInfo(lcAssembler) << "assembled" << width << "x" << height << "x" << depth
		<< "range" << volume->scalarMin() << volume->scalarMax()
		<< "in" << timer.elapsed() << "ms";

	m_current = volume;
	return m_current;
}
