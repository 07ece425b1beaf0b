#include "mcrec/RtAudioSession.hpp"
#include "mcrec/debug_log.hpp"

#include <algorithm>
#include <iostream>

namespace mcrec {

RtAudioInputStream::RtAudioInputStream()
    : _channels(0)
    , _overflows(0) {
    _audio.showWarnings(false);
}

RtAudioInputStream::~RtAudioInputStream() {
    Close();
}

int RtAudioInputStream::OnAudio(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                                double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    auto* self = static_cast<RtAudioInputStream*>(userData);

    if (status & RTAUDIO_INPUT_OVERFLOW) {
        self->_overflows.fetch_add(1, std::memory_order_relaxed);
    }

    if (inputBuffer && self->_callback) {
        self->_callback(static_cast<float*>(inputBuffer), nBufferFrames, self->_channels);
    }

    return 0;
}

void RtAudioInputStream::Open(StreamParameters& parameters, BufferCallback callback) {
    std::lock_guard<std::mutex> lock(_streamMutex);

    if (_audio.isStreamOpen()) {
        throw CaptureError("Input stream already open");
    }

    RtAudio::StreamParameters input;
    input.deviceId = parameters.deviceId;
    input.nChannels = parameters.channels;
    input.firstChannel = 0;

    RtAudio::StreamOptions options;
    options.flags = RTAUDIO_NONINTERLEAVED | RTAUDIO_SCHEDULE_REALTIME;
    options.streamName = "mcrec";

    _callback = std::move(callback);
    _channels = parameters.channels;
    _overflows = 0;

    unsigned int bufferFrames = parameters.blockFrames;

    MCREC_DEBUG_LOG("Opening input stream: device " << parameters.deviceId << ", "
                    << parameters.channels << " ch, " << parameters.sampleRate << " Hz, "
                    << bufferFrames << " frames" << MCREC_DEBUG_LOG_ENDL);

    if (_audio.openStream(nullptr, &input, RTAUDIO_FLOAT32, parameters.sampleRate,
                          &bufferFrames, &RtAudioInputStream::OnAudio, this, &options)) {
        _callback = nullptr;
        throw CaptureError("Error opening input stream: " + _audio.getErrorText());
    }

    if (bufferFrames != parameters.blockFrames) {
        MCREC_DEBUG_LOG("Block size adjusted to " << bufferFrames << " frames" << MCREC_DEBUG_LOG_ENDL);
    }
    parameters.blockFrames = bufferFrames;
}

void RtAudioInputStream::Start() {
    std::lock_guard<std::mutex> lock(_streamMutex);

    if (!_audio.isStreamOpen()) {
        throw CaptureError("Cannot start: input stream not open");
    }
    if (_audio.isStreamRunning()) {
        return;
    }
    if (_audio.startStream()) {
        throw CaptureError("Error starting input stream: " + _audio.getErrorText());
    }
}

void RtAudioInputStream::Stop() {
    std::lock_guard<std::mutex> lock(_streamMutex);

    if (_audio.isStreamOpen() && _audio.isStreamRunning()) {
        if (_audio.stopStream()) {
            std::cerr << "Error stopping input stream: " << _audio.getErrorText() << std::endl;
        }
    }
}

void RtAudioInputStream::Close() {
    Stop();

    std::lock_guard<std::mutex> lock(_streamMutex);
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
    _callback = nullptr;

    const unsigned int overflows = _overflows.load();
    if (overflows > 0) {
        std::cerr << "Warning: input stream reported " << overflows << " overflows" << std::endl;
        _overflows = 0;
    }
}

bool RtAudioInputStream::IsOpen() const {
    std::lock_guard<std::mutex> lock(_streamMutex);
    return _audio.isStreamOpen();
}

bool RtAudioInputStream::IsRunning() const {
    std::lock_guard<std::mutex> lock(_streamMutex);
    return _audio.isStreamRunning();
}

RtAudioSession::RtAudioSession()
    : _active(false)
    , _preferredChannels(1) {
    _probe.showWarnings(false);

    if (_probe.getDeviceIds().empty()) {
        throw SessionError("No audio devices found");
    }
}

RtAudioSession::~RtAudioSession() {
    Deactivate();
}

void RtAudioSession::Activate(RecordingMode mode) {
    const std::vector<DeviceDescriptor> inputs = AvailableInputs();
    if (inputs.empty()) {
        throw SessionError("No input devices found!");
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_preferred) {
            const unsigned int defaultId = _probe.getDefaultInputDevice();
            auto it = std::find_if(inputs.begin(), inputs.end(),
                                   [defaultId](const DeviceDescriptor& d) { return d.id == defaultId; });
            _preferred = it != inputs.end() ? *it : inputs.front();
        }
    }

    _active = true;
    MCREC_DEBUG_LOG("Audio session active (" << ToString(mode) << ")" << MCREC_DEBUG_LOG_ENDL);
}

void RtAudioSession::Deactivate() {
    if (_active.exchange(false)) {
        MCREC_DEBUG_LOG("Audio session deactivated" << MCREC_DEBUG_LOG_ENDL);
    }
}

std::vector<DeviceDescriptor> RtAudioSession::AvailableInputs() {
    std::lock_guard<std::mutex> lock(_mutex);

    std::vector<DeviceDescriptor> inputs;
    for (unsigned int id : _probe.getDeviceIds()) {
        RtAudio::DeviceInfo info = _probe.getDeviceInfo(id);
        if (info.inputChannels < 1) {
            continue;
        }

        DeviceDescriptor device;
        device.id = info.ID;
        device.name = info.name;
        device.type = ClassifyDevice(info.name);
        device.maxChannels = info.inputChannels;
        device.preferredSampleRate = info.preferredSampleRate;
        device.sampleRates = info.sampleRates;
        inputs.push_back(std::move(device));
    }
    return inputs;
}

void RtAudioSession::SetPreferredInput(const DeviceDescriptor& device) {
    std::lock_guard<std::mutex> lock(_mutex);
    _preferred = device;
    _preferredChannels = std::min(std::max(_preferredChannels, 1u), std::max(device.maxChannels, 1u));
}

std::optional<DeviceDescriptor> RtAudioSession::PreferredInput() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _preferred;
}

void RtAudioSession::SetPreferredInputChannels(unsigned int channels) {
    std::lock_guard<std::mutex> lock(_mutex);
    const unsigned int maxChannels = _preferred ? std::max(_preferred->maxChannels, 1u) : 1u;
    _preferredChannels = std::min(std::max(channels, 1u), maxChannels);
}

StreamFormat RtAudioSession::InputFormat() const {
    std::lock_guard<std::mutex> lock(_mutex);

    StreamFormat format;
    format.channels = _preferredChannels;
    if (_preferred) {
        format.sampleRate = _preferred->preferredSampleRate;
    }
    if (format.sampleRate == 0) {
        format.sampleRate = 48000;
    }
    return format;
}

std::unique_ptr<IInputStream> RtAudioSession::CreateInputStream() {
    return std::make_unique<RtAudioInputStream>();
}

} // namespace mcrec
