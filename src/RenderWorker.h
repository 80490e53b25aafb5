#pragma once

#include "RenderMessages.h"

#include <QObject>
#include <QThread>

// Runs SoftwareRayCaster on whatever thread it lives in.
class RenderWorker : public QObject
{
	Q_OBJECT
public slots:
	void process(const RenderRequest& request);

signals:
	void rendered(const RenderReply& reply);
	void failed(quint64 id, const QString& message);
};

// Owns the background thread and the worker living on it. Requests and
// replies cross the thread boundary only through queued signals.
class RenderWorkerHost : public QObject
{
	Q_OBJECT
public:
	// Throws BackendError if the thread cannot be started.
	explicit RenderWorkerHost(QObject* parent = nullptr);
	~RenderWorkerHost() override;

	void post(const RenderRequest& request);
	// Stops the thread and waits for it; later replies are never delivered.
	void terminate();
	bool isRunning() const { return m_thread.isRunning(); }

signals:
	void rendered(const RenderReply& reply);
	void failed(quint64 id, const QString& message);

	void requestPosted(const RenderRequest& request);

private:
	QThread m_thread;
	RenderWorker* m_worker = nullptr;
};
