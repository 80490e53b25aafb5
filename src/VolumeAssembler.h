#pragma once

#include "FrameDecoder.h"
#include "ScalarVolume.h"

#include <functional>

// Stacks decoded frames into a ScalarVolume. Rebuilding with the same
// source list returns the previously assembled volume.
class VolumeAssembler
{
public:
	using ProgressCallback = std::function<void(int loaded, int total)>;

	// Throws VolumeLoadError when any frame fails to decode or the frames
	// disagree on size. An empty list yields no volume.
	ScalarVolumePtr assemble(const FrameSourceList& sources, const ProgressCallback& progress = ProgressCallback());

	ScalarVolumePtr current() const { return m_current; }
	void reset() { m_current.reset(); }

private:
	FrameDecoder m_decoder;
	ScalarVolumePtr m_current;
};
