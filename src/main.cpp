#include <QApplication>
#include "MainWindow.h"
#include "RendererConfig.h"
#include <QCommandLineParser>
#include <QDebug>
#include <QSettings>
#include <QStyleFactory>
#include <QVTKOpenGLNativeWidget.h>

#include <vtkAutoInit.h>
VTK_MODULE_INIT(vtkRenderingOpenGL2);
VTK_MODULE_INIT(vtkRenderingVolumeOpenGL2);


int main(int argc, char* argv[]) {

	// needed to ensure appropriate OpenGL context is created for VTK rendering.
	QApplication::setAttribute(Qt::AA_EnableHighDpiScaling);
	QSurfaceFormat::setDefaultFormat(QVTKOpenGLNativeWidget::defaultFormat());

	QApplication app(argc, argv);
	QApplication::setApplicationName("MedVolRender");
	QApplication::setOrganizationName("MedVolRender");
	QApplication::setStyle(QStyleFactory::create("Fusion"));

	QCommandLineParser parser;
	parser.setApplicationDescription("Interactive volume rendering of image stacks");
	parser.addHelpOption();
	QCommandLineOption softwareOption("software", "Render on the CPU only.");
	QCommandLineOption noWorkerOption("no-worker", "Render software frames on the GUI thread.");
	QCommandLineOption preloadOption("preload", "Initialize the GPU renderer at startup.");
	QCommandLineOption progressiveOption("progressive", "Load volumes in low, medium and high stages.");
	QCommandLineOption qualityOption("quality", "Initial quality: low, medium or high.", "tier");
	parser.addOptions({ softwareOption, noWorkerOption, preloadOption, progressiveOption, qualityOption });
	parser.addPositionalArgument("frames", "Frame files or a DICOM folder to open.", "[frames...]");
	parser.process(app);

	QSettings settings("MedVolRender", "Renderer");
	RendererConfig config = RendererConfig::load(settings);
	if (parser.isSet(softwareOption))
		config.forceSoftware = true;
	if (parser.isSet(noWorkerOption))
		config.useWorker = false;
	if (parser.isSet(preloadOption))
		config.preloadHardware = true;
	if (parser.isSet(progressiveOption))
		config.progressiveLoading = true;
	if (parser.isSet(qualityOption)) {
		try {
			config.quality = qualityTierFromName(parser.value(qualityOption));
		}
		catch (const std::invalid_argument& e) {
			qWarning() << e.what();
		}
	}

	MainWindow window(config);
	window.show();
	window.openPaths(parser.positionalArguments());
	return app.exec();
}
