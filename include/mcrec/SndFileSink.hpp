#pragma once

#include <sndfile.h>

#include <cstdint>
#include <string>

#include "IRecordingSink.hpp"

namespace mcrec {

// libsndfile backed sink. CAF files get their header rewritten on every
// append so an interrupted recording is still a playable file.
class SndFileSink : public IRecordingSink {
public:
    SndFileSink();
    ~SndFileSink() override;

    SndFileSink(const SndFileSink&) = delete;
    SndFileSink& operator=(const SndFileSink&) = delete;

    void Open(const std::string& path, const SinkFormat& format) override;
    bool Write(const float* interleaved, size_t frames) override;
    void Close() override;

    bool IsOpen() const override { return _file != nullptr; }
    const std::string& Path() const override { return _path; }

    uint64_t FramesWritten() const { return _framesWritten; }

private:
    SNDFILE* _file;
    std::string _path;
    SinkFormat _format;
    uint64_t _framesWritten;
};

SinkFactory MakeSndFileSinkFactory();

} // namespace mcrec
