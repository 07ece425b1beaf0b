#include "mcrec/DeviceNegotiator.hpp"
#include "mcrec/MultichannelBackend.hpp"
#include "mcrec/RecordingController.hpp"
#include "mcrec/SimpleBackend.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <new>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mcrec;
using test_utils::FakeAudioSession;
using test_utils::MakeDevice;
using test_utils::MakePlanar;
using test_utils::MemorySinkFactory;
using test_utils::TempDir;

namespace {

class RecordingControllerTest : public ::testing::Test {
protected:
    RecordingControllerTest()
        : session({MakeDevice(1, "Built-in Microphone", 1, 44100), MakeDevice(2, "USB Audio Interface", 4, 48000)})
        , negotiator(session)
        , simple(session, sinks.Factory())
        , multichannel(session, settings, sinks.Factory())
        , controller(session, negotiator, settings, simple, multichannel, dir.Path()) {
        controller.SetStateCallback([this](bool recording) {
            std::lock_guard<std::mutex> lock(transitionsMutex);
            transitions.push_back(recording);
        });
    }

    std::vector<bool> Transitions() {
        std::lock_guard<std::mutex> lock(transitionsMutex);
        return transitions;
    }

    FakeAudioSession session;
    DeviceNegotiator negotiator;
    SettingsSnapshot<ChannelSettings> settings;
    MemorySinkFactory sinks;
    TempDir dir;
    SimpleBackend simple;
    MultichannelBackend multichannel;
    RecordingController controller;

    std::mutex transitionsMutex;
    std::vector<bool> transitions;
};

const std::vector<bool> kAllOn = {true, true, true, true};
const std::vector<float> kUnity = {1.0f, 1.0f, 1.0f, 1.0f};

} // namespace

TEST_F(RecordingControllerTest, StartStopPublishesStateAtBoundaries) {
    EXPECT_FALSE(controller.IsRecording());
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);

    ASSERT_TRUE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    EXPECT_TRUE(controller.IsRecording());
    EXPECT_EQ(controller.GetState(), RecordingController::State::Recording);
    EXPECT_EQ(controller.ActiveMode(), RecordingMode::Multichannel);
    EXPECT_TRUE(session.IsActive());
    EXPECT_TRUE(multichannel.IsRecording());
    EXPECT_FALSE(simple.IsRecording());
    EXPECT_EQ(controller.LastRecordingPath(), sinks.Last()->path);

    controller.Stop();
    EXPECT_FALSE(controller.IsRecording());
    EXPECT_FALSE(controller.ActiveMode());
    EXPECT_FALSE(session.IsActive());
    EXPECT_FALSE(sinks.Last()->open);

    EXPECT_EQ(Transitions(), (std::vector<bool>{true, false}));
}

TEST_F(RecordingControllerTest, StopWhenIdleDoesNothing) {
    controller.Stop();
    controller.Stop();

    EXPECT_FALSE(controller.IsRecording());
    EXPECT_TRUE(Transitions().empty());
    EXPECT_EQ(session.deactivations.load(), 0);
}

TEST_F(RecordingControllerTest, StopTwiceAfterRecording) {
    ASSERT_TRUE(controller.Start(RecordingMode::Simple, {true}, {1.0f}));
    controller.Stop();
    controller.Stop();

    EXPECT_EQ(sinks.Last()->closes, 1);
    EXPECT_EQ(session.deactivations.load(), 1);
    EXPECT_EQ(Transitions(), (std::vector<bool>{true, false}));
}

TEST_F(RecordingControllerTest, StartWhileRecordingIsRejected) {
    ASSERT_TRUE(controller.Start(RecordingMode::Simple, {true}, {1.0f}));
    EXPECT_FALSE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));

    EXPECT_EQ(controller.ActiveMode(), RecordingMode::Simple);
    EXPECT_FALSE(multichannel.IsRecording());
    EXPECT_EQ(sinks.records.size(), 1u);
    EXPECT_EQ(Transitions(), (std::vector<bool>{true}));
    controller.Stop();
}

TEST_F(RecordingControllerTest, StopUsesModeCapturedAtStart) {
    ASSERT_TRUE(controller.Start(RecordingMode::Simple, {true}, {1.0f}));
    ASSERT_TRUE(session.stream);
    auto simpleStream = session.stream;
    EXPECT_FALSE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));

    controller.Stop();
    EXPECT_FALSE(simple.IsRecording());
    EXPECT_FALSE(simpleStream->open);
    EXPECT_EQ(sinks.Last()->format.container, SinkContainer::OggVorbis);
    EXPECT_EQ(sinks.Last()->closes, 1);
}

TEST_F(RecordingControllerTest, ActivationFailureLeavesIdleWithoutFile) {
    session.failActivate = true;

    EXPECT_FALSE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    EXPECT_FALSE(controller.IsRecording());
    EXPECT_FALSE(session.IsActive());
    EXPECT_TRUE(sinks.records.empty());
    EXPECT_EQ(dir.FileCount(), 0u);
    EXPECT_TRUE(Transitions().empty());
}

TEST_F(RecordingControllerTest, NoInputDeviceRejectsStart) {
    session.SetInputs({});

    EXPECT_FALSE(controller.Start(RecordingMode::Simple, {true}, {1.0f}));
    EXPECT_FALSE(controller.IsRecording());
    EXPECT_FALSE(session.IsActive());
    EXPECT_EQ(dir.FileCount(), 0u);
}

TEST_F(RecordingControllerTest, SinkFailureLeavesIdleWithoutFile) {
    sinks.failOpen = true;

    EXPECT_FALSE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    EXPECT_FALSE(controller.IsRecording());
    EXPECT_FALSE(multichannel.IsRecording());
    EXPECT_FALSE(session.IsActive());
    EXPECT_EQ(dir.FileCount(), 0u);

    sinks.failOpen = false;
    EXPECT_TRUE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    controller.Stop();
}

TEST_F(RecordingControllerTest, MultichannelDegradesOnMonoHardware) {
    session.SetInputs({MakeDevice(1, "Built-in Microphone", 1, 44100)});

    std::vector<std::string> warnings;
    negotiator.SetWarningCallback([&warnings](const std::string& message) { warnings.push_back(message); });

    ASSERT_TRUE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    EXPECT_EQ(sinks.Last()->format.channels, 1u);
    EXPECT_EQ(sinks.Last()->format.container, SinkContainer::CafFloat32);
    EXPECT_FALSE(warnings.empty());
    controller.Stop();
}

TEST_F(RecordingControllerTest, ChannelSettingsApplyWhileRecording) {
    ASSERT_TRUE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));

    std::vector<float> planar = MakePlanar({0.4f, 0.4f, 0.4f, 0.4f}, 16);
    ASSERT_TRUE(session.stream->Deliver(planar, 4));

    controller.SetChannelSettings({true, true, false, true}, {1.0f, 1.0f, 1.0f, 0.5f});
    EXPECT_EQ(controller.GetChannelSettings().enabledChannels, (std::vector<bool>{true, true, false, true}));

    planar = MakePlanar({0.4f, 0.4f, 0.4f, 0.4f}, 16);
    ASSERT_TRUE(session.stream->Deliver(planar, 4));
    controller.Stop();

    const std::vector<float> ch2 = sinks.Last()->Channel(2);
    const std::vector<float> ch3 = sinks.Last()->Channel(3);
    ASSERT_EQ(ch2.size(), 32u);
    EXPECT_FLOAT_EQ(ch2[0], 0.4f);
    EXPECT_FLOAT_EQ(ch2[16], 0.0f);
    EXPECT_FLOAT_EQ(ch3[16], 0.2f);

    EXPECT_EQ(controller.LastStats().framesWritten, 32u);
}

TEST_F(RecordingControllerTest, ConcurrentStopsFlipStateOnce) {
    ASSERT_TRUE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this]() { controller.Stop(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_FALSE(controller.IsRecording());
    EXPECT_EQ(Transitions(), (std::vector<bool>{true, false}));
    EXPECT_EQ(sinks.Last()->closes, 1);
}

TEST_F(RecordingControllerTest, RecordsAgainAfterStop) {
    ASSERT_TRUE(controller.Start(RecordingMode::Simple, {true}, {1.0f}));
    controller.Stop();
    ASSERT_TRUE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    EXPECT_EQ(controller.ActiveMode(), RecordingMode::Multichannel);
    controller.Stop();

    EXPECT_EQ(Transitions(), (std::vector<bool>{true, false, true, false}));
    EXPECT_EQ(sinks.records.size(), 2u);
}

TEST_F(RecordingControllerTest, RepeatedSettingsUpdatesKeepRetentionBounded) {
    for (int i = 0; i < 10000; ++i) {
        controller.SetChannelSettings({i % 2 == 0, true, true, true}, kUnity);
    }
    EXPECT_LE(settings.RetainedCount(), 2u);

    ASSERT_TRUE(controller.Start(RecordingMode::Simple, {true}, {1.0f}));
    for (int i = 0; i < 10000; ++i) {
        controller.SetChannelSettings({true}, {static_cast<float>(i % 4)});
    }
    EXPECT_LE(settings.RetainedCount(), 2u);
    controller.Stop();

    ASSERT_TRUE(controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    for (int i = 0; i < 10000; ++i) {
        controller.SetChannelSettings(kAllOn, {1.0f, 1.0f, 1.0f, static_cast<float>(i % 4)});
        if (i % 1000 == 0) {
            std::vector<float> planar = MakePlanar({0.5f, 0.5f, 0.5f, 0.5f}, 8);
            ASSERT_TRUE(session.stream->Deliver(planar, 4));
        }
    }
    EXPECT_LE(settings.RetainedCount(), 2u);
    controller.Stop();

    EXPECT_EQ(settings.RetainedCount(), 1u);
    EXPECT_FLOAT_EQ(controller.GetChannelSettings().channelGains[3], 3.0f);
}

namespace {

// Backend whose start fails with an exception outside std::runtime_error.
class OutOfMemoryBackend : public ICaptureBackend {
public:
    std::string Start(const std::string&) override {
        starts++;
        throw std::bad_alloc();
    }
    void Stop() override { stops++; }
    bool IsRecording() const override { return false; }
    RecordingMode Mode() const override { return RecordingMode::Multichannel; }
    CaptureStats Stats() const override { return {}; }

    int starts = 0;
    int stops = 0;
};

} // namespace

TEST(RecordingControllerFailureTest, AnyBackendExceptionDeactivatesSession) {
    FakeAudioSession session({MakeDevice(2, "USB Audio Interface", 4, 48000)});
    DeviceNegotiator negotiator(session);
    SettingsSnapshot<ChannelSettings> settings;
    MemorySinkFactory sinks;
    TempDir dir;
    SimpleBackend simple(session, sinks.Factory());
    OutOfMemoryBackend failing;
    RecordingController controller(session, negotiator, settings, simple, failing, dir.Path());

    bool started = true;
    EXPECT_NO_THROW(started = controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    EXPECT_FALSE(started);
    EXPECT_EQ(failing.starts, 1);
    EXPECT_EQ(failing.stops, 1);
    EXPECT_FALSE(controller.IsRecording());
    EXPECT_FALSE(session.IsActive());
}

TEST(RecordingControllerFailureTest, OversizedWriterBufferFailsCleanly) {
    FakeAudioSession session({MakeDevice(2, "USB Audio Interface", 4, 48000)});
    DeviceNegotiator negotiator(session);
    SettingsSnapshot<ChannelSettings> settings;
    MemorySinkFactory sinks;
    TempDir dir;
    SimpleBackend simple(session, sinks.Factory());
    MultichannelBackend multichannel(session, settings, sinks.Factory(), MultichannelCaptureOptions{4096, 1e9});
    RecordingController controller(session, negotiator, settings, simple, multichannel, dir.Path());

    bool started = true;
    EXPECT_NO_THROW(started = controller.Start(RecordingMode::Multichannel, kAllOn, kUnity));
    EXPECT_FALSE(started);
    EXPECT_FALSE(multichannel.IsRecording());
    EXPECT_FALSE(session.IsActive());
    EXPECT_EQ(dir.FileCount(), 0u);
}
