#include "mcrec/SimpleBackend.hpp"
#include "mcrec/RecordingFileName.hpp"
#include "mcrec/debug_log.hpp"

#include <filesystem>

namespace mcrec {

SimpleBackend::SimpleBackend(IAudioSession& session, SinkFactory sinkFactory, SimpleCaptureOptions options)
    : _session(session)
    , _sinkFactory(std::move(sinkFactory))
    , _options(options)
    , _recording(false) {
}

SimpleBackend::~SimpleBackend() {
    Stop();
}

std::string SimpleBackend::Start(const std::string& outputDirectory) {
    std::lock_guard<std::mutex> lock(_controlMutex);

    if (_recording.load()) {
        throw CaptureError("Simple recorder is already recording to " + (_sink ? _sink->Path() : std::string()));
    }

    _session.Activate(RecordingMode::Simple);

    std::optional<DeviceDescriptor> device = _session.PreferredInput();
    if (!device) {
        throw CaptureError("No input device selected");
    }

    unsigned int sampleRate = _options.sampleRate;
    if (!device->sampleRates.empty() && !device->SupportsSampleRate(sampleRate)) {
        sampleRate = device->preferredSampleRate ? device->preferredSampleRate : _session.InputFormat().sampleRate;
        MCREC_DEBUG_LOG(_options.sampleRate << " not supported, using preferred rate: " << sampleRate
                        << MCREC_DEBUG_LOG_ENDL);
    }

    const std::string path = MakeRecordingPath(outputDirectory, RecordingMode::Simple);
    _lastStats = CaptureStats{};

    try {
        _sink = _sinkFactory();
        SinkFormat format;
        format.container = SinkContainer::OggVorbis;
        format.sampleRate = sampleRate;
        format.channels = 1;
        format.quality = _options.quality;
        _sink->Open(path, format);

        StreamParameters parameters;
        parameters.deviceId = device->id;
        parameters.channels = 1;
        parameters.sampleRate = sampleRate;
        parameters.blockFrames = _options.blockFrames;

        _stream = _session.CreateInputStream();
        _stream->Open(parameters, [this](float* samples, unsigned int frames, unsigned int channels) {
            _writer->Push(PlanarBufferView{samples, channels, frames});
        });

        const size_t capacityFrames = RingCapacityFrames(sampleRate, parameters.blockFrames, _options.bufferSeconds);
        _writer = std::make_unique<DiskWriter>(*_sink, 1, parameters.blockFrames, capacityFrames);
        _writer->Start();
        _stream->Start();
    } catch (...) {
        const bool created = _sink && _sink->IsOpen();
        Teardown();
        if (created) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
        throw;
    }

    _recording = true;
    MCREC_DEBUG_LOG("Started recording to " << path << MCREC_DEBUG_LOG_ENDL);
    return path;
}

void SimpleBackend::Stop() {
    std::lock_guard<std::mutex> lock(_controlMutex);

    if (!_recording.load()) {
        return;
    }

    Teardown();
    _recording = false;
    MCREC_DEBUG_LOG("Recording stopped." << MCREC_DEBUG_LOG_ENDL);
}

CaptureStats SimpleBackend::Stats() const {
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

void SimpleBackend::Teardown() {
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
}

} // namespace mcrec
