#include "mcrec/SndFileSink.hpp"
#include "mcrec/debug_log.hpp"

#include <iostream>
#include <memory>

namespace mcrec {

const char* FileExtension(SinkContainer container) {
    switch (container) {
        case SinkContainer::OggVorbis: return "ogg";
        case SinkContainer::CafFloat32: return "caf";
    }
    return "raw";
}

SndFileSink::SndFileSink()
    : _file(nullptr)
    , _framesWritten(0) {
}

SndFileSink::~SndFileSink() {
    Close();
}

void SndFileSink::Open(const std::string& path, const SinkFormat& format) {
    if (_file) {
        throw SinkException("Sink already open: " + _path);
    }
    if (format.channels == 0 || format.sampleRate == 0) {
        throw SinkException("Invalid sink format for " + path);
    }

    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(format.sampleRate);
    sfinfo.channels = static_cast<int>(format.channels);
    switch (format.container) {
        case SinkContainer::OggVorbis:
            sfinfo.format = SF_FORMAT_OGG | SF_FORMAT_VORBIS;
            break;
        case SinkContainer::CafFloat32:
            sfinfo.format = SF_FORMAT_CAF | SF_FORMAT_FLOAT;
            break;
    }

    if (!sf_format_check(&sfinfo)) {
        throw SinkException("libsndfile does not support the requested format for " + path);
    }

    SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &sfinfo);
    if (!file) {
        throw SinkException("Could not open output file " + path + ": " + sf_strerror(nullptr));
    }

    if (format.container == SinkContainer::OggVorbis) {
        double quality = format.quality;
        if (sf_command(file, SFC_SET_VBR_ENCODING_QUALITY, &quality, sizeof(quality)) != SF_TRUE) {
            std::cerr << "Warning: encoder quality " << quality << " rejected for " << path << std::endl;
        }
    } else {
        sf_command(file, SFC_SET_UPDATE_HEADER_AUTO, nullptr, SF_TRUE);
    }

    _file = file;
    _path = path;
    _format = format;
    _framesWritten = 0;

    MCREC_DEBUG_LOG("Opened " << path << " (" << format.sampleRate << " Hz, "
                    << format.channels << " ch, ." << FileExtension(format.container) << ")"
                    << MCREC_DEBUG_LOG_ENDL);
}

bool SndFileSink::Write(const float* interleaved, size_t frames) {
    if (!_file || !interleaved) {
        return false;
    }
    if (frames == 0) {
        return true;
    }

    const sf_count_t written = sf_writef_float(_file, interleaved, static_cast<sf_count_t>(frames));
    if (written > 0) {
        _framesWritten += static_cast<uint64_t>(written);
    }
    return written == static_cast<sf_count_t>(frames);
}

void SndFileSink::Close() {
    if (!_file) {
        return;
    }

    sf_write_sync(_file);
    const int err = sf_close(_file);
    _file = nullptr;

    if (err != 0) {
        std::cerr << "Error closing " << _path << ": " << sf_error_number(err) << std::endl;
        return;
    }

    MCREC_DEBUG_LOG("Closed " << _path << " after " << _framesWritten << " frames" << MCREC_DEBUG_LOG_ENDL);
}

SinkFactory MakeSndFileSinkFactory() {
    return []() -> std::unique_ptr<IRecordingSink> { return std::make_unique<SndFileSink>(); };
}

} // namespace mcrec
