#include "RenderWorker.h"
#include "TestVolumes.h"

#include <QEventLoop>
#include <QThread>
#include <QTimer>

#include <gtest/gtest.h>

namespace
{
	RenderRequest makeRequest(quint64 id, const ScalarVolumePtr& volume)
	{
		RenderRequest request;
		request.id = id;
		request.volume = volume;
		if (volume)
			request.camera.resetToVolume(*volume);
		request.transferFunction = TransferFunctionStore().active();
		request.size = QSize(24, 16);
		request.stepSize = 1.0;
		return request;
	}
}

TEST(RenderWorker, RepliesOnHostThreadWithMatchingId)
{
	RenderWorkerHost host;
	ASSERT_TRUE(host.isRunning());

	RenderReply received;
	QThread* deliveredOn = nullptr;
	QEventLoop loop;
	QObject::connect(&host, &RenderWorkerHost::rendered, &loop, [&](const RenderReply& reply) {
		received = reply;
		deliveredOn = QThread::currentThread();
		loop.quit();
	});
	QTimer::singleShot(10000, &loop, &QEventLoop::quit);

	host.post(makeRequest(7, testvolumes::gradient()));
	loop.exec();

	EXPECT_EQ(received.id, 7u);
	EXPECT_EQ(received.image.size(), QSize(24, 16));
	EXPECT_GE(received.renderTimeMs, 0.0);
	EXPECT_EQ(deliveredOn, QThread::currentThread());
}

TEST(RenderWorker, MissingVolumeReportsFailure)
{
	RenderWorkerHost host;

	quint64 failedId = 0;
	QString message;
	QEventLoop loop;
	QObject::connect(&host, &RenderWorkerHost::failed, &loop, [&](quint64 id, const QString& msg) {
		failedId = id;
		message = msg;
		loop.quit();
	});
	QTimer::singleShot(10000, &loop, &QEventLoop::quit);

	host.post(makeRequest(3, nullptr));
	loop.exec();

	EXPECT_EQ(failedId, 3u);
	EXPECT_FALSE(message.isEmpty());
}

TEST(RenderWorker, TerminateStopsThread)
{
	RenderWorkerHost host;
	host.terminate();
	EXPECT_FALSE(host.isRunning());
	// posting after termination is ignored
	EXPECT_NO_THROW(host.post(makeRequest(1, testvolumes::gradient())));
	host.terminate();
}

TEST(RenderWorker, ProcessRunsSynchronouslyWhenCalledDirectly)
{
	RenderWorker worker;
	int renders = 0;
	QObject::connect(&worker, &RenderWorker::rendered, [&renders](const RenderReply& reply) {
		EXPECT_EQ(reply.id, 11u);
		++renders;
	});
	worker.process(makeRequest(11, testvolumes::uniform(400.0f)));
	EXPECT_EQ(renders, 1);
}
