#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include <string_view>

import Core;

#include "TestHelpers.h"

TEST(CoreLogging, SinkReceivesFormattedMessages)
{
    LogCapture logs;

    Core::Log::Info("created {} with id '{}'", "camera", "cam1");
    Core::Log::Warn("missing {}", 42);
    Core::Log::Error("broken");

    EXPECT_EQ(logs.Count(Core::Log::Level::Info), 1u);
    EXPECT_EQ(logs.Warnings(), 1u);
    EXPECT_EQ(logs.Errors(), 1u);
    EXPECT_TRUE(logs.Contains("created camera with id 'cam1'"));
    EXPECT_TRUE(logs.Contains("missing 42"));
}

TEST(CoreLogging, ClearingSinkStopsCapture)
{
    size_t seen = 0;
    Core::Log::SetSink([&](Core::Log::Level, std::string_view) { ++seen; });
    Core::Log::Info("one");
    Core::Log::SetSink({});
    Core::Log::Info("two");

    EXPECT_EQ(seen, 1u);
}

TEST(CoreLogging, DebugOnlyInDebugBuilds)
{
    LogCapture logs;
    Core::Log::Debug("debug {}", 1);

#ifdef NDEBUG
    EXPECT_EQ(logs.Count(Core::Log::Level::Debug), 0u);
#else
    EXPECT_EQ(logs.Count(Core::Log::Level::Debug), 1u);
#endif
}

TEST(CoreError, CodesHaveNames)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::DuplicateId), "DuplicateId");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::MissingPrecondition), "MissingPrecondition");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::ResourceNotFound), "ResourceNotFound");
}

TEST(CoreTelemetry, FrameStatsAverages)
{
    Core::Telemetry::FrameStats stats;
    EXPECT_DOUBLE_EQ(stats.AverageFps(), 0.0);

    stats.RecordPresent(0.02);
    stats.RecordPresent(0.02);
    EXPECT_EQ(stats.PresentedFrames, 2u);
    EXPECT_NEAR(stats.AverageFrameTimeMs(), 20.0, 1e-9);
    EXPECT_NEAR(stats.AverageFps(), 50.0, 1e-9);

    stats.Reset();
    EXPECT_EQ(stats.PresentedFrames, 0u);
}

TEST(CoreTelemetry, FrameClockFirstTickIsZero)
{
    Core::Telemetry::FrameClock clock;
    EXPECT_DOUBLE_EQ(clock.Tick(), 0.0);
    EXPECT_GE(clock.Tick(), 0.0);
}
