#include "BackendSelector.h"
#include "FakeBackend.h"
#include "RenderContext.h"

#include <gtest/gtest.h>

namespace
{
	class BackendSelectorTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			context.create();
		}

		std::unique_ptr<BackendSelector> makeSelector(std::shared_ptr<FakeProbe> probe)
		{
			auto hw = [this]() -> std::unique_ptr<RenderBackend> {
				return std::make_unique<FakeBackend>(context, RenderBackend::Kind::Hardware, hardware);
			};
			auto sw = [this]() -> std::unique_ptr<RenderBackend> {
				return std::make_unique<FakeBackend>(context, RenderBackend::Kind::Software, software);
			};
			return std::make_unique<BackendSelector>(probe, hw, sw);
		}

		RenderContext context;
		std::shared_ptr<FakeBackendLog> hardware = std::make_shared<FakeBackendLog>();
		std::shared_ptr<FakeBackendLog> software = std::make_shared<FakeBackendLog>();
	};
}

TEST_F(BackendSelectorTest, UnsuitableGpuSelectsSoftwareWithoutInitializingHardware)
{
	auto probe = std::make_shared<FakeProbe>(false);
	auto selector = makeSelector(probe);

	QString reason;
	QObject::connect(selector.get(), &BackendSelector::fellBackToSoftware,
		[&reason](const QString& r) { reason = r; });

	selector->select(true);

	EXPECT_EQ(probe->calls(), 1);
	EXPECT_TRUE(selector->isSoftware());
	EXPECT_EQ(selector->hardwareInitAttempts(), 0);
	EXPECT_EQ(hardware->created, 0);
	EXPECT_EQ(software->initialized, 1);
	ASSERT_TRUE(selector->active());
	EXPECT_EQ(selector->active()->kind(), RenderBackend::Kind::Software);
	EXPECT_TRUE(reason.contains("3.2"));
	EXPECT_EQ(selector->fallbackReason(), reason);
}

TEST_F(BackendSelectorTest, FailedPreloadFallsBackOnce)
{
	hardware->failInitialize = true;
	auto selector = makeSelector(std::make_shared<FakeProbe>(true));

	int fallbacks = 0;
	QObject::connect(selector.get(), &BackendSelector::fellBackToSoftware, [&fallbacks]() { ++fallbacks; });

	selector->select(true);

	EXPECT_EQ(selector->hardwareInitAttempts(), 1);
	EXPECT_EQ(hardware->disposed, 1);
	EXPECT_TRUE(selector->isSoftware());
	EXPECT_EQ(fallbacks, 1);

	// later requests never touch the GPU path again
	selector->active();
	selector->active();
	selector->fallBackToSoftware(QStringLiteral("again"));
	EXPECT_EQ(selector->hardwareInitAttempts(), 1);
	EXPECT_EQ(hardware->initialized, 1);
	EXPECT_EQ(software->created, 1);
	EXPECT_EQ(fallbacks, 1);
}

TEST_F(BackendSelectorTest, DeferredHardwareInitializesOnFirstUse)
{
	auto selector = makeSelector(std::make_shared<FakeProbe>(true));
	selector->select(false);

	EXPECT_EQ(selector->state(), BackendSelector::State::HardwareActive);
	EXPECT_EQ(selector->hardwareInitAttempts(), 0);
	EXPECT_EQ(hardware->initialized, 0);

	RenderBackend* backend = selector->active();
	ASSERT_TRUE(backend);
	EXPECT_EQ(backend->kind(), RenderBackend::Kind::Hardware);
	EXPECT_EQ(selector->hardwareInitAttempts(), 1);

	selector->active();
	EXPECT_EQ(selector->hardwareInitAttempts(), 1);
	EXPECT_EQ(software->created, 0);
}

TEST_F(BackendSelectorTest, DeferredHardwareFailureSwitchesOnFirstUse)
{
	hardware->failInitialize = true;
	auto selector = makeSelector(std::make_shared<FakeProbe>(true));
	selector->select(false);
	EXPECT_FALSE(selector->isSoftware());

	RenderBackend* backend = selector->active();
	ASSERT_TRUE(backend);
	EXPECT_EQ(backend->kind(), RenderBackend::Kind::Software);
	EXPECT_EQ(selector->hardwareInitAttempts(), 1);
	EXPECT_TRUE(selector->fallbackReason().contains("context creation failed"));
}

TEST_F(BackendSelectorTest, ForceSoftwareSkipsProbe)
{
	auto probe = std::make_shared<FakeProbe>(true);
	auto selector = makeSelector(probe);
	selector->select(true, true);

	EXPECT_EQ(probe->calls(), 0);
	EXPECT_TRUE(selector->isSoftware());
	EXPECT_EQ(hardware->created, 0);
}

TEST_F(BackendSelectorTest, SelectRunsOnlyOnce)
{
	auto probe = std::make_shared<FakeProbe>(true);
	auto selector = makeSelector(probe);

	int changes = 0;
	QObject::connect(selector.get(), &BackendSelector::backendChanged, [&changes]() { ++changes; });

	selector->select(true);
	selector->select(true);
	EXPECT_EQ(probe->calls(), 1);
	EXPECT_EQ(hardware->created, 1);
	EXPECT_EQ(changes, 1);
}

TEST_F(BackendSelectorTest, DisposeReleasesBackend)
{
	auto selector = makeSelector(std::make_shared<FakeProbe>(true));
	selector->select(true);
	selector->dispose();
	EXPECT_EQ(hardware->disposed, 1);
	EXPECT_EQ(selector->current(), nullptr);
	selector->dispose();
	EXPECT_EQ(hardware->disposed, 1);
}

TEST(OpenGLCapabilityProbe, RequiresCoreProfileVersion)
{
	CapabilityReport report;
	report.majorVersion = 3;
	report.minorVersion = 1;
	report.max3DTextureSize = 2048;
	report.maxTextureSize = 16384;
	OpenGLCapabilityProbe::assess(report);
	EXPECT_FALSE(report.suitable);
	EXPECT_TRUE(report.reason.contains("3.2"));

	report.minorVersion = 2;
	OpenGLCapabilityProbe::assess(report);
	EXPECT_TRUE(report.suitable);
	EXPECT_TRUE(report.reason.isEmpty());
	EXPECT_TRUE(report.warnings.isEmpty());
}

TEST(OpenGLCapabilityProbe, SmallTextureLimitsOnlyWarn)
{
	CapabilityReport report;
	report.majorVersion = 4;
	report.minorVersion = 5;
	report.max3DTextureSize = 256;
	report.maxTextureSize = 1024;
	OpenGLCapabilityProbe::assess(report);
	EXPECT_TRUE(report.suitable);
	EXPECT_EQ(report.warnings.size(), 2);

	report.max3DTextureSize = 0;
	OpenGLCapabilityProbe::assess(report);
	EXPECT_FALSE(report.suitable);
	EXPECT_FALSE(report.reason.isEmpty());
}
