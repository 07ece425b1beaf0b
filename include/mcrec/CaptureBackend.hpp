#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "AudioTypes.hpp"
#include "IAudioSession.hpp"

namespace mcrec {

constexpr unsigned int kMaxSampleRate = 768000;
constexpr unsigned int kMaxBlockFrames = 65536;
constexpr double kMaxBufferSeconds = 60.0;

struct SimpleCaptureOptions {
    unsigned int sampleRate = 44100;
    double quality = 0.9;
    unsigned int blockFrames = 512;
    double bufferSeconds = 4.0;
};

struct MultichannelCaptureOptions {
    unsigned int blockFrames = 4096;
    double bufferSeconds = 4.0;
};

// Ring length in frames for the disk writer. Throws CaptureError when the
// options fall outside the supported limits.
inline size_t RingCapacityFrames(unsigned int sampleRate, unsigned int blockFrames, double bufferSeconds) {
    if (sampleRate == 0 || sampleRate > kMaxSampleRate) {
        throw CaptureError("Unsupported sample rate: " + std::to_string(sampleRate));
    }
    if (blockFrames == 0 || blockFrames > kMaxBlockFrames) {
        throw CaptureError("Unsupported block size: " + std::to_string(blockFrames));
    }
    if (!(bufferSeconds > 0.0 && bufferSeconds <= kMaxBufferSeconds)) {
        throw CaptureError("Unsupported buffer length: " + std::to_string(bufferSeconds) + " s");
    }
    return static_cast<size_t>(sampleRate * bufferSeconds);
}

struct CaptureStats {
    uint64_t framesWritten = 0;
    uint64_t droppedBuffers = 0;
    uint64_t failedWrites = 0;
};

class ICaptureBackend {
public:
    virtual ~ICaptureBackend() = default;

    // Opens the output file in outputDirectory and starts capturing.
    // Returns the file path. Throws SessionError, CaptureError or SinkException;
    // on throw no file handle is left open.
    virtual std::string Start(const std::string& outputDirectory) = 0;

    // Stops capturing and closes the file. No-op when idle, idempotent.
    virtual void Stop() = 0;

    virtual bool IsRecording() const = 0;
    virtual RecordingMode Mode() const = 0;
    virtual CaptureStats Stats() const = 0;
};

} // namespace mcrec
