#include "mcrec/Recorder.hpp"
#include "mcrec/debug_log.hpp"

#include <iostream>

namespace mcrec {

namespace {

std::unique_ptr<IAudioSession> RequireSession(std::unique_ptr<IAudioSession> session) {
    if (!session) {
        throw SessionError("Recorder needs an audio session");
    }
    return session;
}

RecorderConfig Validated(RecorderConfig config) {
    ValidateRecorderConfig(config);
    return config;
}

} // namespace

Recorder::Recorder(RecorderConfig config, std::unique_ptr<IAudioSession> session, SinkFactory sinkFactory)
    : _config(Validated(std::move(config)))
    , _session(RequireSession(std::move(session)))
    , _negotiator(*_session)
    , _simpleBackend(*_session, sinkFactory, _config.simple)
    , _multichannelBackend(*_session, _settings, sinkFactory, _config.multichannel)
    , _controller(*_session, _negotiator, _settings, _simpleBackend, _multichannelBackend, _config.outputDirectory) {
    _settings.Publish(ChannelSettings{_config.enabledChannels, _config.channelGains});
}

Recorder::~Recorder() {
    try {
        _worker.Post([this]() { _controller.Stop(); }).get();
    } catch (const std::exception& e) {
        std::cerr << "Error stopping recording on shutdown: " << e.what() << std::endl;
        _controller.Stop();
    }
    _worker.Shutdown();
}

std::future<bool> Recorder::StartRecording(RecordingMode mode, std::vector<bool> enabledChannels,
                                           std::vector<float> channelGains) {
    MCREC_DEBUG_LOG("Start requested (" << ToString(mode) << ")" << MCREC_DEBUG_LOG_ENDL);
    return _worker.Post([this, mode, enabled = std::move(enabledChannels), gains = std::move(channelGains)]() mutable {
        return _controller.Start(mode, std::move(enabled), std::move(gains));
    });
}

std::future<bool> Recorder::StartRecording() {
    const ChannelSettings settings = _controller.GetChannelSettings();
    return StartRecording(_config.mode, settings.enabledChannels, settings.channelGains);
}

std::future<void> Recorder::StopRecording() {
    MCREC_DEBUG_LOG("Stop requested" << MCREC_DEBUG_LOG_ENDL);
    return _worker.Post([this]() { _controller.Stop(); });
}

std::future<void> Recorder::OnRouteChanged() {
    return _worker.Post([this]() { _negotiator.OnRouteChanged(); });
}

void Recorder::SetChannelSettings(std::vector<bool> enabledChannels, std::vector<float> channelGains) {
    _controller.SetChannelSettings(std::move(enabledChannels), std::move(channelGains));
}

ChannelSettings Recorder::GetChannelSettings() const {
    return _controller.GetChannelSettings();
}

bool Recorder::IsRecording() const {
    return _controller.IsRecording();
}

std::optional<RecordingMode> Recorder::ActiveMode() const {
    return _controller.ActiveMode();
}

std::string Recorder::LastRecordingPath() const {
    return _controller.LastRecordingPath();
}

std::chrono::steady_clock::duration Recorder::ElapsedTime() const {
    return _controller.RecordingDuration();
}

CaptureStats Recorder::LastStats() const {
    return _controller.LastStats();
}

std::optional<NegotiatedRoute> Recorder::CurrentRoute() const {
    return _negotiator.CurrentRoute();
}

std::vector<DeviceDescriptor> Recorder::AvailableInputs() {
    return _session->AvailableInputs();
}

void Recorder::SetRecordingStateCallback(StateCallback callback) {
    _controller.SetStateCallback(std::move(callback));
}

void Recorder::SetChannelCountChangedCallback(ChannelCountCallback callback) {
    _negotiator.SetChannelCountChangedCallback(std::move(callback));
}

void Recorder::SetWarningCallback(WarningCallback callback) {
    _negotiator.SetWarningCallback(std::move(callback));
}

} // namespace mcrec
