#include "mcrec/RecordingController.hpp"
#include "mcrec/debug_log.hpp"

#include <exception>
#include <iostream>

namespace mcrec {

RecordingController::RecordingController(IAudioSession& session,
                                         DeviceNegotiator& negotiator,
                                         SettingsSnapshot<ChannelSettings>& settings,
                                         ICaptureBackend& simpleBackend,
                                         ICaptureBackend& multichannelBackend,
                                         std::string outputDirectory)
    : _session(session)
    , _negotiator(negotiator)
    , _settings(settings)
    , _simpleBackend(simpleBackend)
    , _multichannelBackend(multichannelBackend)
    , _outputDirectory(std::move(outputDirectory))
    , _recording(false) {
}

RecordingController::~RecordingController() {
    Stop();
}

bool RecordingController::Start(RecordingMode mode, std::vector<bool> enabledChannels, std::vector<float> channelGains) {
    std::lock_guard<std::mutex> lock(_mutex);

    if (_recording.load()) {
        std::cerr << "Cannot start recording: already recording ("
                  << ToString(_activeMode.value_or(mode)) << ")" << std::endl;
        return false;
    }

    const size_t enabledCount = enabledChannels.size();
    const size_t gainCount = channelGains.size();
    _settings.Publish(ChannelSettings{std::move(enabledChannels), std::move(channelGains)});

    try {
        _session.Activate(mode);
    } catch (const std::exception& e) {
        std::cerr << "Failed to activate session: " << e.what() << std::endl;
        _session.Deactivate();
        return false;
    }

    std::optional<NegotiatedRoute> route = _negotiator.Negotiate(mode);
    if (!route) {
        std::cerr << "Could not start recording: no input device available" << std::endl;
        _session.Deactivate();
        return false;
    }

    if (mode == RecordingMode::Multichannel &&
        (enabledCount != route->channelCount || gainCount != route->channelCount)) {
        std::cerr << "WARNING: channel settings cover " << enabledCount << " enabled / " << gainCount
                  << " gain entries for " << route->channelCount
                  << " input channels, unmatched channels are recorded unprocessed" << std::endl;
    }

    ICaptureBackend& backend = BackendFor(mode);
    std::string path;
    try {
        path = backend.Start(_outputDirectory);
    } catch (const std::exception& e) {
        std::cerr << "Could not start " << ToString(mode) << " recording: " << e.what() << std::endl;
        backend.Stop();
        _session.Deactivate();
        return false;
    }

    _activeMode = mode;
    _lastPath = path;
    _startTime = std::chrono::steady_clock::now();
    _lastStats = CaptureStats{};
    ChangeState(true);

    MCREC_DEBUG_LOG("Started " << ToString(mode) << " recording to " << path << MCREC_DEBUG_LOG_ENDL);
    return true;
}

void RecordingController::Stop() {
    std::lock_guard<std::mutex> lock(_mutex);

    if (!_recording.load() || !_activeMode) {
        return;
    }

    // Mode captured at start decides the backend, whatever the caller flipped since
    ICaptureBackend& backend = BackendFor(*_activeMode);
    backend.Stop();
    _lastStats = backend.Stats();

    _session.Deactivate();

    _activeMode.reset();
    ChangeState(false);

    MCREC_DEBUG_LOG("Stopped recording " << _lastPath << MCREC_DEBUG_LOG_ENDL);
}

void RecordingController::SetChannelSettings(std::vector<bool> enabledChannels, std::vector<float> channelGains) {
    _settings.Publish(ChannelSettings{std::move(enabledChannels), std::move(channelGains)});
}

ChannelSettings RecordingController::GetChannelSettings() const {
    return _settings.Get();
}

std::optional<RecordingMode> RecordingController::ActiveMode() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _activeMode;
}

std::string RecordingController::LastRecordingPath() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastPath;
}

std::chrono::steady_clock::duration RecordingController::RecordingDuration() const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_recording.load()) {
        return std::chrono::steady_clock::duration::zero();
    }
    return std::chrono::steady_clock::now() - _startTime;
}

CaptureStats RecordingController::LastStats() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastStats;
}

void RecordingController::SetStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stateCallback = std::move(callback);
}

ICaptureBackend& RecordingController::BackendFor(RecordingMode mode) {
    return mode == RecordingMode::Multichannel ? _multichannelBackend : _simpleBackend;
}

void RecordingController::ChangeState(bool recording) {
    if (_recording.exchange(recording) == recording) {
        return;
    }
    if (_stateCallback) {
        _stateCallback(recording);
    }
}

} // namespace mcrec
