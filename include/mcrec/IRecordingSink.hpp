#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace mcrec {

class SinkException : public std::runtime_error {
public:
    explicit SinkException(const std::string& message) : std::runtime_error(message) {}
};

enum class SinkContainer {
    OggVorbis,  // compressed, simple mode
    CafFloat32  // uncompressed 32-bit float, multichannel mode
};

struct SinkFormat {
    SinkContainer container = SinkContainer::CafFloat32;
    unsigned int sampleRate = 48000;
    unsigned int channels = 1;
    double quality = 0.9; // encoder quality in [0, 1], compressed containers only
};

const char* FileExtension(SinkContainer container);

// The output file handle of one recording: absent -> open -> closed.
class IRecordingSink {
public:
    virtual ~IRecordingSink() = default;

    // Throws SinkException when the file cannot be created.
    virtual void Open(const std::string& path, const SinkFormat& format) = 0;

    // Appends interleaved frames. Returns false on a short or failed write.
    virtual bool Write(const float* interleaved, size_t frames) = 0;

    // Finalises the container. Safe to call more than once.
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;
    virtual const std::string& Path() const = 0;
};

using SinkFactory = std::function<std::unique_ptr<IRecordingSink>()>;

} // namespace mcrec
