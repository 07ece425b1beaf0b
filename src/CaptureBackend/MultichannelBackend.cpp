#include "mcrec/MultichannelBackend.hpp"
#include "mcrec/RecordingFileName.hpp"
#include "mcrec/debug_log.hpp"

#include <filesystem>

namespace mcrec {

MultichannelBackend::MultichannelBackend(IAudioSession& session,
                                         SettingsSnapshot<ChannelSettings>& settings,
                                         SinkFactory sinkFactory,
                                         MultichannelCaptureOptions options)
    : _session(session)
    , _settings(settings)
    , _sinkFactory(std::move(sinkFactory))
    , _options(options)
    , _state(State::Idle) {
}

MultichannelBackend::~MultichannelBackend() {
    Stop();
}

std::string MultichannelBackend::Start(const std::string& outputDirectory) {
    std::lock_guard<std::mutex> lock(_controlMutex);

    if (_state.load() != State::Idle) {
        MCREC_DEBUG_LOG("Multichannel recording already in progress, ignoring start" << MCREC_DEBUG_LOG_ENDL);
        return _path;
    }
    _state = State::Armed;
    _lastStats = CaptureStats{};

    bool created = false;
    try {
        std::optional<DeviceDescriptor> device = _session.PreferredInput();
        if (!device) {
            throw CaptureError("No input device selected");
        }

        // Live format of the input as negotiated
        _format = _session.InputFormat();
        if (_format.channels == 0 || _format.sampleRate == 0) {
            throw CaptureError("Input " + device->name + " reports no usable format");
        }

        StreamParameters parameters;
        parameters.deviceId = device->id;
        parameters.channels = _format.channels;
        parameters.sampleRate = _format.sampleRate;
        parameters.blockFrames = _options.blockFrames;

        _stream = _session.CreateInputStream();
        _stream->Open(parameters, [this](float* samples, unsigned int frames, unsigned int channels) {
            OnBuffer(samples, frames, channels);
        });

        _path = MakeRecordingPath(outputDirectory, RecordingMode::Multichannel);
        _sink = _sinkFactory();
        SinkFormat format;
        format.container = SinkContainer::CafFloat32;
        format.sampleRate = _format.sampleRate;
        format.channels = _format.channels;
        _sink->Open(_path, format);
        created = true;

        const size_t capacityFrames = RingCapacityFrames(_format.sampleRate, parameters.blockFrames, _options.bufferSeconds);
        _writer = std::make_unique<DiskWriter>(*_sink, _format.channels, parameters.blockFrames, capacityFrames);
        _writer->Start();

        _stream->Start();
    } catch (...) {
        Teardown();
        if (created) {
            std::error_code ec;
            std::filesystem::remove(_path, ec);
        }
        _path.clear();
        _state = State::Idle;
        throw;
    }

    _state = State::Recording;
    MCREC_DEBUG_LOG("Multichannel recording to " << _path << " (" << _format.channels << " ch, "
                    << _format.sampleRate << " Hz)" << MCREC_DEBUG_LOG_ENDL);
    return _path;
}

void MultichannelBackend::Stop() {
    std::lock_guard<std::mutex> lock(_controlMutex);

    if (_state.load() == State::Idle) {
        return;
    }

    Teardown();
    _state = State::Idle;
    MCREC_DEBUG_LOG("Multichannel recording stopped: " << _lastStats.framesWritten << " frames, "
                    << _lastStats.droppedBuffers << " dropped" << MCREC_DEBUG_LOG_ENDL);
}

CaptureStats MultichannelBackend::Stats() const {
    std::lock_guard<std::mutex> lock(_controlMutex);
    if (!_writer) {
        return _lastStats;
    }
    CaptureStats stats;
    stats.framesWritten = _writer->FramesWritten();
    stats.droppedBuffers = _writer->DroppedBuffers();
    stats.failedWrites = _writer->FailedWrites();
    return stats;
}

StreamFormat MultichannelBackend::Format() const {
    std::lock_guard<std::mutex> lock(_controlMutex);
    return _format;
}

void MultichannelBackend::OnBuffer(float* samples, unsigned int frames, unsigned int channels) noexcept {
    if (!_writer) {
        return;
    }

    PlanarBufferView view{samples, channels, frames};
    if (const ChannelSettings* settings = _settings.Acquire()) {
        ProcessChannels(view, *settings);
    }
    _settings.Release();
    _writer->Push(view);
}

void MultichannelBackend::Teardown() {
    if (_stream) {
        _stream->Stop();
        _stream->Close();
        _stream.reset();
    }
    if (_writer) {
        _writer->Stop();
        _lastStats.framesWritten = _writer->FramesWritten();
        _lastStats.droppedBuffers = _writer->DroppedBuffers();
        _lastStats.failedWrites = _writer->FailedWrites();
        _writer.reset();
    }
    if (_sink) {
        _sink->Close();
        _sink.reset();
    }

    // No callback can hold a snapshot any more
    _settings.Reclaim();
}

} // namespace mcrec
