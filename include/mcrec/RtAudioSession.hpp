#pragma once

#include <RtAudio.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "IAudioSession.hpp"

namespace mcrec {

class RtAudioInputStream : public IInputStream {
public:
    RtAudioInputStream();
    ~RtAudioInputStream() override;

    void Open(StreamParameters& parameters, BufferCallback callback) override;
    void Start() override;
    void Stop() override;
    void Close() override;

    bool IsOpen() const override;
    bool IsRunning() const override;

private:
    static int OnAudio(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                       double streamTime, RtAudioStreamStatus status, void* userData);

    mutable RtAudio _audio;
    BufferCallback _callback;
    unsigned int _channels;
    std::atomic<unsigned int> _overflows;
    mutable std::mutex _streamMutex;
};

// Session over the default RtAudio API of the host. Route changes are not
// observed here; callers re-run negotiation when hardware changes.
class RtAudioSession : public IAudioSession {
public:
    RtAudioSession();
    ~RtAudioSession() override;

    void Activate(RecordingMode mode) override;
    void Deactivate() override;
    bool IsActive() const override { return _active.load(); }

    std::vector<DeviceDescriptor> AvailableInputs() override;

    void SetPreferredInput(const DeviceDescriptor& device) override;
    std::optional<DeviceDescriptor> PreferredInput() const override;

    void SetPreferredInputChannels(unsigned int channels) override;
    StreamFormat InputFormat() const override;

    std::unique_ptr<IInputStream> CreateInputStream() override;

private:
    RtAudio _probe;
    std::atomic<bool> _active;
    std::optional<DeviceDescriptor> _preferred;
    unsigned int _preferredChannels;
    mutable std::mutex _mutex;
};

} // namespace mcrec
