#include "MainWindow.h"
#include "ui_MainWindow.h"

#include "BackendSelector.h"
#include "CapabilityProbe.h"
#include "FrameDecoder.h"
#include "InteractionController.h"
#include "Logging.h"
#include "SoftwareBackend.h"
#include "VolumeCanvas.h"
#include "VtkVolumeBackend.h"

#include <QCloseEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QLabel>
#include <QMessageBox>
#include <QMimeData>
#include <QProgressBar>
#include <QSettings>
#include <QStatusBar>
#include <QSysInfo>
#include <QUrl>

#include <vtkVersion.h>   // VTK version macros
#include <itkVersion.h>   // ITK version macros

#ifndef MEDVOLRENDER_VERSION
#define MEDVOLRENDER_VERSION "unknown"
#endif
#ifndef MEDVOLRENDER_VTKDICOM_VERSION
#define MEDVOLRENDER_VTKDICOM_VERSION "unknown"
#endif

MainWindow::MainWindow(const RendererConfig& config, QWidget* parent)
	: QMainWindow(parent), ui(new Ui::MainWindow), m_config(config)
{
	ui->setupUi(this);

	setAcceptDrops(true);

	progressBar = new QProgressBar(this);
	progressBar->setRange(0, 100);
	progressBar->setValue(0);
	progressBar->setVisible(false);
	statusBar()->addPermanentWidget(progressBar);

	performanceLabel = new QLabel(this);
	statusBar()->addPermanentWidget(performanceLabel);

	connect(ui->actionOpen, &QAction::triggered, this, &MainWindow::onActionOpen);
	connect(ui->actionOpenFolder, &QAction::triggered, this, &MainWindow::onActionOpenFolder);
	connect(ui->actionExit, &QAction::triggered, this, &QWidget::close);
	connect(ui->actionAbout, &QAction::triggered, this, &MainWindow::onActionAbout);

	setupRenderer();
	setupPanelConnections();
	loadRecentFiles();
}

MainWindow::~MainWindow()
{
	saveRecentFiles();
	m_controller.reset();
	m_selector.reset();
	delete ui;
}

void MainWindow::setupRenderer()
{
	RenderSettings settings;
	settings.stepSize = m_config.stepSize;
	m_context.create(settings, m_config.quality);

	vtkGenericOpenGLRenderWindow* window = ui->viewport->renderWindow();
	const RendererConfig config = m_config;

	auto hardware = [this, window, config]() -> std::unique_ptr<RenderBackend> {
		return std::make_unique<VtkVolumeBackend>(m_context, window, config);
	};
	auto software = [this, config]() -> std::unique_ptr<RenderBackend> {
		SoftwareBackend::WorkerFactory workers;
		if (config.useWorker)
			workers = []() { return std::make_unique<RenderWorkerHost>(); };
		auto backend = std::make_unique<SoftwareBackend>(m_context, workers);
		backend->setAutoRotationInterval(config.autoRotationIntervalMs);
		return backend;
	};

	m_selector = std::make_unique<BackendSelector>(std::make_shared<OpenGLCapabilityProbe>(), hardware, software);
	m_controller = std::make_unique<InteractionController>(m_context, *m_selector);

	connect(m_controller.get(), &InteractionController::softwareSurfaceRequired,
		ui->viewport, &VolumeViewport::showSoftwareSurface);
	connect(m_controller.get(), &InteractionController::frameReady, ui->viewport, &VolumeViewport::setFrame);
	connect(m_controller.get(), &InteractionController::loadingChanged, this, &MainWindow::onLoadingChanged);
	connect(m_controller.get(), &InteractionController::loadProgress, progressBar, &QProgressBar::setValue);
	connect(m_controller.get(), &InteractionController::volumeChanged, this, &MainWindow::onVolumeChanged);
	connect(m_controller.get(), &InteractionController::errorOccurred, this, &MainWindow::onError);
	connect(m_controller.get(), &InteractionController::performanceSampled, this, &MainWindow::onPerformanceSampled);
	connect(m_controller.get(), &InteractionController::performanceWarning, this, &MainWindow::onPerformanceWarning);
	connect(m_controller.get(), &InteractionController::stageLoaded, this, [this](QualityTier tier, double progress) {
		statusBar()->showMessage(tr("Loaded %1 quality (%2%)")
			.arg(qualityTierName(tier)).arg(qRound(progress * 100)), 2000);
	});

	connect(ui->viewport, &VolumeViewport::pointerPressed, m_controller.get(), &InteractionController::pointerDown);
	connect(ui->viewport, &VolumeViewport::pointerMoved, m_controller.get(), &InteractionController::pointerMove);
	connect(ui->viewport, &VolumeViewport::pointerReleased, m_controller.get(), &InteractionController::pointerUp);
	connect(ui->viewport, &VolumeViewport::surfaceResized, m_controller.get(), &InteractionController::setSurfaceSize);

	m_selector->select(m_config.preloadHardware, m_config.forceSoftware);
	qCInfo(lcUi) << "renderer state" << m_selector->state();
}

void MainWindow::setupPanelConnections()
{
	auto* controls = ui->volumeControlsWidget;
	controls->setPresetNames(m_context.transferFunctions().presetNames(),
		m_context.transferFunctions().activePresetName());
	controls->setQuality(m_context.quality());

	connect(controls, &VolumeControlsWidget::renderModeChanged, m_controller.get(), &InteractionController::setRenderMode);
	connect(controls, &VolumeControlsWidget::presetChanged, m_controller.get(), &InteractionController::setPreset);
	connect(controls, &VolumeControlsWidget::qualityChanged, m_controller.get(), &InteractionController::setQuality);
	connect(controls, &VolumeControlsWidget::opacityChanged, m_controller.get(), &InteractionController::setOpacity);
	connect(controls, &VolumeControlsWidget::brightnessChanged, m_controller.get(), &InteractionController::setBrightness);
	connect(controls, &VolumeControlsWidget::contrastChanged, m_controller.get(), &InteractionController::setContrast);
	connect(controls, &VolumeControlsWidget::isoValueChanged, m_controller.get(), &InteractionController::setIsoValue);
	connect(controls, &VolumeControlsWidget::resetCameraRequested, m_controller.get(), &InteractionController::resetCamera);
	connect(controls, &VolumeControlsWidget::autoRotationToggled, this, [this](bool on) {
		if (on)
			m_controller->startAutoRotation();
		else
			m_controller->stopAutoRotation();
		ui->volumeControlsWidget->setAutoRotating(m_controller->isAutoRotating());
	});

	// dragging stops rotation inside the controller; keep the checkbox honest
	connect(ui->viewport, &VolumeViewport::pointerPressed, this, [this]() {
		ui->volumeControlsWidget->setAutoRotating(false);
	});
}

void MainWindow::onActionOpen()
{
	const QStringList files = QFileDialog::getOpenFileNames(this, tr("Open Frames"), "",
		tr("Images (*.png *.jpg *.jpeg *.bmp *.dcm *.dicom *.nrrd *.mha *.tif *.tiff);;All Files (*)"));
	if (files.isEmpty())
		return;
	openPaths(files);
}

void MainWindow::onActionOpenFolder()
{
	const QString dir = QFileDialog::getExistingDirectory(this, tr("Open DICOM Folder"));
	if (dir.isEmpty())
		return;
	openPaths(QStringList{ dir });
}

void MainWindow::openPaths(const QStringList& paths)
{
	if (paths.isEmpty())
		return;

	if (paths.size() == 1 && QFileInfo(paths.first()).isDir()) {
		const FrameSourceList frames = FrameDecoder::dicomSeries(paths.first());
		if (frames.isEmpty()) {
			QMessageBox::warning(this, tr("Cannot Open Folder"),
				tr("No DICOM image series found in:\n%1").arg(paths.first()));
			return;
		}
		openFrames(frames, paths.first());
		return;
	}

	QStringList sorted = paths;
	sorted.sort();
	FrameSourceList frames;
	for (const QString& path : sorted)
		frames.append(FrameSource::fromFile(path));
	openFrames(frames, sorted.size() == 1 ? sorted.first() : QString());
}

void MainWindow::openFrames(const FrameSourceList& frames, const QString& recentEntry)
{
	if (!m_controller->loadVolume(frames))
		return;
	if (!recentEntry.isEmpty()) {
		addToRecentFiles(recentEntry);
		saveRecentFiles();
	}
}

void MainWindow::onLoadingChanged(bool loading)
{
	progressBar->setVisible(loading);
	if (loading)
		progressBar->setValue(0);
}

void MainWindow::onVolumeChanged()
{
	ScalarVolumePtr volume = m_context.volume();
	if (!volume)
		return;
	ui->volumeControlsWidget->setScalarRange(volume->scalarMin(), volume->scalarMax());
	ui->volumeControlsWidget->setIsoValue(m_context.settings().isoValue);
	statusBar()->showMessage(tr("Volume %1 x %2 x %3, range %4 .. %5")
		.arg(volume->width()).arg(volume->height()).arg(volume->depth())
		.arg(volume->scalarMin()).arg(volume->scalarMax()), 5000);
}

void MainWindow::onPerformanceSampled(const PerformanceSample& sample)
{
	performanceLabel->setText(tr("%1 fps | %2 ms | %3 MB")
		.arg(sample.fps, 0, 'f', 0)
		.arg(sample.renderTimeMs, 0, 'f', 1)
		.arg(sample.memoryMB, 0, 'f', 0));
}

void MainWindow::onPerformanceWarning(const PerformanceWarning& warning)
{
	statusBar()->showMessage(warning.message + " - " + warning.suggestion, 8000);
}

void MainWindow::onError(const QString& message)
{
	QMessageBox::critical(this, tr("Rendering Error"), message);
}

void MainWindow::onActionAbout()
{
	const QString ver = QString::fromUtf8(MEDVOLRENDER_VERSION).trimmed();
	const QString vtkDicomVer = QString::fromUtf8(MEDVOLRENDER_VTKDICOM_VERSION).trimmed();
	const QString os = QSysInfo::prettyProductName();
	const QString arch = QSysInfo::currentCpuArchitecture();

	const QString qtVer = QString::fromLatin1(QT_VERSION_STR);
	const QString vtkVer = QString::fromLatin1(vtkVersion::GetVTKVersionFull());
	const QString itkVer = QStringLiteral("%1.%2.%3")
		.arg(QString::number(ITK_VERSION_MAJOR),
			 QString::number(ITK_VERSION_MINOR),
			 QString::number(ITK_VERSION_PATCH));

	const CapabilityReport& report = m_selector->report();
	const QString backend = m_selector->isSoftware()
		? tr("software (%1)").arg(m_selector->fallbackReason())
		: tr("GPU");

	const QString details = tr(
		"Interactive volume rendering of image stacks.\n\n"
		"Version:   %1\n"
		"OS:        %2 (%3)\n"
		"Qt:        %4\n"
		"VTK:       %5\n"
		"ITK:       %6\n"
		"VTK-DICOM: %7\n"
		"OpenGL:    %8\n"
		"Renderer:  %9")
		.arg(ver, os, arch, qtVer, vtkVer, itkVer, vtkDicomVer, report.summary(), backend);

	QMessageBox::about(this, tr("About MedVolRender"), details);
}

void MainWindow::addToRecentFiles(const QString& filePath)
{
	recentFiles.removeAll(filePath);
	recentFiles.prepend(filePath);
	while (recentFiles.size() > 10)
		recentFiles.removeLast();
	updateRecentFilesMenu();
}

void MainWindow::updateRecentFilesMenu()
{
	// Remove old recent file actions (tagged with a property)
	const QList<QAction*> actions = ui->menuFile->actions();
	for (QAction* action : actions) {
		if (action->property("isRecentFile").toBool() || action->objectName() == "actionClearRecentFiles") {
			ui->menuFile->removeAction(action);
			delete action;
		}
	}

	// recent entries go between the separator and Exit
	QAction* before = ui->actionExit;
	for (const QString& filePath : recentFiles) {
		QAction* action = new QAction(QFileInfo(filePath).fileName(), this);
		action->setProperty("isRecentFile", true);
		action->setToolTip(filePath);
		connect(action, &QAction::triggered, this, [this, filePath]() {
			openPaths(QStringList{ filePath });
		});
		ui->menuFile->insertAction(before, action);
	}

	if (!recentFiles.isEmpty()) {
		QAction* clearAction = new QAction(tr("Clear Recent Files"), this);
		clearAction->setObjectName("actionClearRecentFiles");
		connect(clearAction, &QAction::triggered, this, &MainWindow::clearRecentFiles);
		ui->menuFile->insertAction(before, clearAction);
	}
}

void MainWindow::loadRecentFiles()
{
	QSettings settings("MedVolRender", "RecentFiles");
	recentFiles = settings.value("recentFiles").toStringList();
	updateRecentFilesMenu();
}

void MainWindow::saveRecentFiles()
{
	QSettings settings("MedVolRender", "RecentFiles");
	settings.setValue("recentFiles", recentFiles);
}

void MainWindow::clearRecentFiles()
{
	recentFiles.clear();
	updateRecentFilesMenu();
	saveRecentFiles();
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event)
{
	if (event->mimeData()->hasUrls())
		event->acceptProposedAction();
}

void MainWindow::dropEvent(QDropEvent* event)
{
	QStringList paths;
	for (const QUrl& url : event->mimeData()->urls()) {
		if (url.isLocalFile())
			paths << url.toLocalFile();
	}
	openPaths(paths);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
	// remember the last quality tier; other options are left as configured
	QSettings settings("MedVolRender", "Renderer");
	RendererConfig stored = RendererConfig::load(settings);
	stored.quality = m_context.quality();
	stored.save(settings);

	m_controller->dispose();
	QMainWindow::closeEvent(event);
}
