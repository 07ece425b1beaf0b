#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "AudioTypes.hpp"
#include "DeviceNegotiator.hpp"
#include "IAudioSession.hpp"
#include "IRecordingSink.hpp"
#include "MultichannelBackend.hpp"
#include "RecorderConfig.hpp"
#include "RecordingController.hpp"
#include "SettingsSnapshot.hpp"
#include "SimpleBackend.hpp"
#include "TaskQueue.hpp"

namespace mcrec {

// Entry point for front ends. Start, stop and renegotiation run on a
// background worker; callers get a future and are never blocked by
// session activation or file I/O.
class Recorder {
public:
    using StateCallback = RecordingController::StateCallback;
    using WarningCallback = DeviceNegotiator::WarningCallback;
    using ChannelCountCallback = DeviceNegotiator::ChannelCountCallback;

    Recorder(RecorderConfig config, std::unique_ptr<IAudioSession> session, SinkFactory sinkFactory);

    // Stops a running recording and waits for the file to be closed.
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    std::future<bool> StartRecording(RecordingMode mode, std::vector<bool> enabledChannels,
                                     std::vector<float> channelGains);

    // Uses the mode and channel vectors from the configuration.
    std::future<bool> StartRecording();

    // The file is closed once the future is ready.
    std::future<void> StopRecording();

    // Call on every device attach/detach.
    std::future<void> OnRouteChanged();

    void SetChannelSettings(std::vector<bool> enabledChannels, std::vector<float> channelGains);
    ChannelSettings GetChannelSettings() const;

    bool IsRecording() const;
    std::optional<RecordingMode> ActiveMode() const;
    std::string LastRecordingPath() const;
    std::chrono::steady_clock::duration ElapsedTime() const;
    CaptureStats LastStats() const;

    std::optional<NegotiatedRoute> CurrentRoute() const;
    std::vector<DeviceDescriptor> AvailableInputs();

    const RecorderConfig& Config() const { return _config; }

    void SetRecordingStateCallback(StateCallback callback);
    void SetChannelCountChangedCallback(ChannelCountCallback callback);
    void SetWarningCallback(WarningCallback callback);

private:
    RecorderConfig _config;
    std::unique_ptr<IAudioSession> _session;
    SettingsSnapshot<ChannelSettings> _settings;
    DeviceNegotiator _negotiator;
    SimpleBackend _simpleBackend;
    MultichannelBackend _multichannelBackend;
    RecordingController _controller;
    TaskQueue _worker;
};

} // namespace mcrec
