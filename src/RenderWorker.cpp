#include "RenderWorker.h"
#include "Logging.h"
#include "RenderBackend.h"
#include "SoftwareRayCaster.h"

#include <QElapsedTimer>

void RenderWorker::process(const RenderRequest& request)
{
	if (!request.volume) {
		emit failed(request.id, QStringLiteral("No volume in render request"));
		return;
	}

	try {
		QElapsedTimer timer;
		timer.start();

		RenderReply reply;
		reply.id = request.id;
		reply.image = SoftwareRayCaster::render(*request.volume, request.camera,
			request.transferFunction, request.settings, request.size, request.stepSize);
		reply.renderTimeMs = timer.nsecsElapsed() / 1.0e6;
		emit rendered(reply);
	}
	catch (const std::exception& e) {
		emit failed(request.id, QString::fromStdString(e.what()));
	}
}

RenderWorkerHost::RenderWorkerHost(QObject* parent)
	: QObject(parent)
{
	qRegisterMetaType<RenderRequest>();
	qRegisterMetaType<RenderReply>();

	m_thread.setObjectName(QStringLiteral("RenderWorker"));
	m_thread.start();
	if (!m_thread.isRunning())
		throw BackendError("Unable to start render worker thread");

	// owned by the thread from here on
	m_worker = new RenderWorker;
	m_worker->moveToThread(&m_thread);

	connect(&m_thread, &QThread::finished, m_worker, &QObject::deleteLater);
	connect(this, &RenderWorkerHost::requestPosted, m_worker, &RenderWorker::process, Qt::QueuedConnection);
	connect(m_worker, &RenderWorker::rendered, this, &RenderWorkerHost::rendered, Qt::QueuedConnection);
	connect(m_worker, &RenderWorker::failed, this, &RenderWorkerHost::failed, Qt::QueuedConnection);
	qCInfo(lcWorker) << "render worker started";
}

RenderWorkerHost::~RenderWorkerHost()
{
	terminate();
}

void RenderWorkerHost::post(const RenderRequest& request)
{
	if (!m_thread.isRunning()) {
		qCWarning(lcWorker) << "dropping request" << request.id << "worker not running";
		return;
	}
	emit requestPosted(request);
}

void RenderWorkerHost::terminate()
{
	if (!m_thread.isRunning())
		return;

	// queued replies still in flight target this object and die with it
	disconnect(this, &RenderWorkerHost::requestPosted, nullptr, nullptr);
	m_thread.quit();
	m_thread.wait();
	m_worker = nullptr;
	qCInfo(lcWorker) << "render worker stopped";
}
