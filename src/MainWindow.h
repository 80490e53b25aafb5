#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include "FrameSource.h"
#include "RenderBackend.h"
#include "RenderContext.h"
#include "RendererConfig.h"

#include <QMainWindow>
#include <QStringList>

#include <memory>

namespace Ui {
	class MainWindow;
}

class BackendSelector;
class InteractionController;
class QLabel;
class QProgressBar;

class MainWindow : public QMainWindow
{
	Q_OBJECT

public:
	explicit MainWindow(const RendererConfig& config, QWidget* parent = nullptr);
	~MainWindow();

	void openPaths(const QStringList& paths);

protected:
	void dragEnterEvent(QDragEnterEvent* event) override;
	void dropEvent(QDropEvent* event) override;
	void closeEvent(QCloseEvent* event) override;

private slots:
	void onActionOpen();
	void onActionOpenFolder();
	void onActionAbout();
	void clearRecentFiles();
	void onLoadingChanged(bool loading);
	void onVolumeChanged();
	void onPerformanceSampled(const PerformanceSample& sample);
	void onPerformanceWarning(const PerformanceWarning& warning);
	void onError(const QString& message);

private:
	void setupRenderer();
	void setupPanelConnections();
	void openFrames(const FrameSourceList& frames, const QString& recentEntry);
	void addToRecentFiles(const QString& filePath);
	void updateRecentFilesMenu();
	void loadRecentFiles();
	void saveRecentFiles();

	Ui::MainWindow* ui;
	RendererConfig m_config;
	// declared before the selector and controller, which hold references to it
	RenderContext m_context;
	std::unique_ptr<BackendSelector> m_selector;
	std::unique_ptr<InteractionController> m_controller;

	QStringList recentFiles;
	QProgressBar* progressBar = nullptr;
	QLabel* performanceLabel = nullptr;
};

#endif // MAINWINDOW_H
