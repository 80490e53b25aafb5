#include "CapabilityProbe.h"
#include "Logging.h"

#include <QOffscreenSurface>
#include <QOpenGLContext>
#include <QOpenGLFunctions>
#include <QSurfaceFormat>

QString CapabilityReport::summary() const
{
	if (vendor.isEmpty() && renderer.isEmpty() && version.isEmpty())
		return QStringLiteral("unavailable");
	return QStringLiteral("%1 | %2 | %3").arg(vendor, renderer, version);
}

void OpenGLCapabilityProbe::assess(CapabilityReport& report)
{
	report.suitable = false;
	report.reason.clear();
	report.warnings.clear();

	const bool versionOk = report.majorVersion > kRequiredMajor
		|| (report.majorVersion == kRequiredMajor && report.minorVersion >= kRequiredMinor);
	if (!versionOk) {
		report.reason = QStringLiteral("OpenGL %1.%2 found, %3.%4 required")
			.arg(report.majorVersion).arg(report.minorVersion).arg(kRequiredMajor).arg(kRequiredMinor);
		return;
	}
	if (report.max3DTextureSize <= 0) {
		report.reason = QStringLiteral("3D textures are not supported");
		return;
	}

	if (report.max3DTextureSize < kRecommended3DTextureSize)
		report.warnings << QStringLiteral("Max 3D texture size is %1").arg(report.max3DTextureSize);
	if (report.maxTextureSize < kRecommendedTextureSize)
		report.warnings << QStringLiteral("Max texture size is %1").arg(report.maxTextureSize);
	report.suitable = true;
}

CapabilityReport OpenGLCapabilityProbe::probe() const
{
	CapabilityReport report;

	QSurfaceFormat fmt;
	fmt.setRenderableType(QSurfaceFormat::OpenGL);
	fmt.setVersion(kRequiredMajor, kRequiredMinor);
	fmt.setProfile(QSurfaceFormat::CoreProfile);

	QOffscreenSurface surface;
	surface.setFormat(fmt);
	surface.create();

	QOpenGLContext ctx;
	ctx.setFormat(fmt);
	if (!ctx.create() || !surface.isValid() || !ctx.makeCurrent(&surface)) {
		report.reason = QStringLiteral("Unable to create an OpenGL context");
		qCWarning(lcBackend) << report.reason;
		return report;
	}

	const QSurfaceFormat actual = ctx.format();
	report.majorVersion = actual.majorVersion();
	report.minorVersion = actual.minorVersion();

	QOpenGLFunctions* f = ctx.functions();
	const char* vendor = reinterpret_cast<const char*>(f->glGetString(GL_VENDOR));
	const char* renderer = reinterpret_cast<const char*>(f->glGetString(GL_RENDERER));
	const char* version = reinterpret_cast<const char*>(f->glGetString(GL_VERSION));
	report.vendor = vendor ? QString::fromLatin1(vendor) : QStringLiteral("?");
	report.renderer = renderer ? QString::fromLatin1(renderer) : QStringLiteral("?");
	report.version = version ? QString::fromLatin1(version) : QStringLiteral("?");

	GLint max3D = 0;
	GLint max2D = 0;
	f->glGetIntegerv(GL_MAX_3D_TEXTURE_SIZE, &max3D);
	f->glGetIntegerv(GL_MAX_TEXTURE_SIZE, &max2D);
	report.max3DTextureSize = max3D;
	report.maxTextureSize = max2D;
	ctx.doneCurrent();

	assess(report);
	qCInfo(lcBackend) << "OpenGL" << report.summary() << (report.suitable ? "suitable" : "unsuitable") << report.reason;
	for (const QString& w : report.warnings)
		qCWarning(lcBackend) << w;
	return report;
}
