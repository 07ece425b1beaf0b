#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "AudioTypes.hpp"
#include "CaptureBackend.hpp"
#include "ChannelProcessor.hpp"
#include "DeviceNegotiator.hpp"
#include "IAudioSession.hpp"
#include "SettingsSnapshot.hpp"

namespace mcrec {

// Idle <-> Recording(mode). Owns which backend runs and, through it, the
// output file handle. All methods are thread-safe; the state callback runs
// with the controller locked and must not call back into it.
class RecordingController {
public:
    enum class State {
        Idle,
        Recording
    };

    using StateCallback = std::function<void(bool isRecording)>;

    RecordingController(IAudioSession& session,
                        DeviceNegotiator& negotiator,
                        SettingsSnapshot<ChannelSettings>& settings,
                        ICaptureBackend& simpleBackend,
                        ICaptureBackend& multichannelBackend,
                        std::string outputDirectory);
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    // Returns false when already recording or when the start failed; a failed
    // start leaves no open file and the controller Idle.
    bool Start(RecordingMode mode, std::vector<bool> enabledChannels, std::vector<float> channelGains);

    // Backend stop -> session deactivate -> state flip. The file is closed
    // when this returns. No-op when Idle.
    void Stop();

    // Replaces the enabled/gain vectors; a running capture applies them from
    // its next buffer on.
    void SetChannelSettings(std::vector<bool> enabledChannels, std::vector<float> channelGains);
    ChannelSettings GetChannelSettings() const;

    bool IsRecording() const { return _recording.load(); }
    State GetState() const { return _recording.load() ? State::Recording : State::Idle; }
    std::optional<RecordingMode> ActiveMode() const;
    std::string LastRecordingPath() const;
    std::chrono::steady_clock::duration RecordingDuration() const;
    CaptureStats LastStats() const;

    void SetStateCallback(StateCallback callback);

private:
    ICaptureBackend& BackendFor(RecordingMode mode);
    void ChangeState(bool recording);

    IAudioSession& _session;
    DeviceNegotiator& _negotiator;
    SettingsSnapshot<ChannelSettings>& _settings;
    ICaptureBackend& _simpleBackend;
    ICaptureBackend& _multichannelBackend;
    std::string _outputDirectory;

    std::atomic<bool> _recording;
    std::optional<RecordingMode> _activeMode;
    std::string _lastPath;
    std::chrono::steady_clock::time_point _startTime;
    CaptureStats _lastStats;

    StateCallback _stateCallback;
    mutable std::mutex _mutex;
};

} // namespace mcrec
