#pragma once

#include <QString>
#include <QStringList>

struct CapabilityReport
{
	bool suitable = false;
	int majorVersion = 0;
	int minorVersion = 0;
	int max3DTextureSize = 0;
	int maxTextureSize = 0;
	QString vendor;
	QString renderer;
	QString version;
	// why the hardware path is unsuitable, empty when suitable
	QString reason;
	QStringList warnings;

	QString summary() const;
};

class CapabilityProbe
{
public:
	virtual ~CapabilityProbe() = default;
	virtual CapabilityReport probe() const = 0;
};

// Creates a throwaway offscreen OpenGL context and inspects it.
class OpenGLCapabilityProbe : public CapabilityProbe
{
public:
	static constexpr int kRequiredMajor = 3;
	static constexpr int kRequiredMinor = 2;
	static constexpr int kRecommended3DTextureSize = 512;
	static constexpr int kRecommendedTextureSize = 2048;

	CapabilityReport probe() const override;

	// Applies the version and texture limits to a filled-in report.
	static void assess(CapabilityReport& report);
};
