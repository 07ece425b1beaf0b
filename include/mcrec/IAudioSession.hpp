#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "AudioTypes.hpp"

namespace mcrec {

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message) : std::runtime_error(message) {}
};

class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& message) : std::runtime_error(message) {}
};

struct StreamParameters {
    unsigned int deviceId = 0;
    unsigned int channels = 1;
    unsigned int sampleRate = 48000;
    unsigned int blockFrames = 512;
};

// Capture stream on one input device. Buffers arrive non-interleaved:
// channel i of a block starts at samples + i * frames.
class IInputStream {
public:
    // Runs on the audio thread. Must not throw, block or allocate.
    using BufferCallback = std::function<void(float* samples, unsigned int frames, unsigned int channels)>;

    virtual ~IInputStream() = default;

    // Throws CaptureError. parameters.blockFrames is updated to the size the
    // driver actually granted.
    virtual void Open(StreamParameters& parameters, BufferCallback callback) = 0;
    virtual void Start() = 0;
    virtual void Stop() = 0;
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;
    virtual bool IsRunning() const = 0;
};

// The process-wide hardware session. One instance, passed by reference to
// everything that touches hardware.
class IAudioSession {
public:
    virtual ~IAudioSession() = default;

    // Throws SessionError when the session cannot be brought up.
    virtual void Activate(RecordingMode mode) = 0;
    virtual void Deactivate() = 0;
    virtual bool IsActive() const = 0;

    virtual std::vector<DeviceDescriptor> AvailableInputs() = 0;

    virtual void SetPreferredInput(const DeviceDescriptor& device) = 0;
    virtual std::optional<DeviceDescriptor> PreferredInput() const = 0;

    virtual void SetPreferredInputChannels(unsigned int channels) = 0;

    // Rate and channel count the preferred input will deliver.
    virtual StreamFormat InputFormat() const = 0;

    virtual std::unique_ptr<IInputStream> CreateInputStream() = 0;
};

} // namespace mcrec
