#include "mcrec/DiskWriter.hpp"
#include "mcrec/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace mcrec {

namespace {
constexpr size_t kWriteChunkFrames = 4096;
constexpr auto kIdleWait = std::chrono::milliseconds(10);
}

DiskWriter::DiskWriter(IRecordingSink& sink, unsigned int channels, size_t maxBlockFrames, size_t capacityFrames)
    : _sink(sink)
    , _channels(std::max(channels, 1u))
    , _maxBlockFrames(std::max<size_t>(maxBlockFrames, 1))
    , _ring(std::max(capacityFrames, _maxBlockFrames) * _channels)
    , _interleaved(_maxBlockFrames * _channels)
    , _chunk(kWriteChunkFrames * _channels)
    , _running(false)
    , _framesWritten(0)
    , _droppedBuffers(0)
    , _failedWrites(0)
    , _reportedDrops(0) {
}

DiskWriter::~DiskWriter() {
    Stop();
}

void DiskWriter::Start() {
    if (_running.load()) {
        return;
    }
    _ring.Reset();
    _framesWritten = 0;
    _droppedBuffers = 0;
    _failedWrites = 0;
    _reportedDrops = 0;

    _running = true;
    _thread = std::thread(&DiskWriter::WriterThread, this);
}

void DiskWriter::Stop() {
    if (_running.exchange(false)) {
        _wake.notify_one();
    }
    if (_thread.joinable()) {
        _thread.join();
    }
}

bool DiskWriter::Push(const PlanarBufferView& buffer) noexcept {
    if (!_running.load(std::memory_order_acquire)) {
        return false;
    }
    if (!buffer.data || buffer.channelCount != _channels) {
        _droppedBuffers.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    if (buffer.frameCount == 0) {
        return true;
    }

    // All or nothing: the consumer only ever frees space, so this holds for the whole push
    if (_ring.Space() < buffer.frameCount * _channels) {
        _droppedBuffers.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    for (size_t offset = 0; offset < buffer.frameCount; offset += _maxBlockFrames) {
        const size_t frames = std::min(_maxBlockFrames, buffer.frameCount - offset);

        float* out = _interleaved.data();
        for (size_t i = 0; i < frames; ++i) {
            for (size_t ch = 0; ch < _channels; ++ch) {
                *out++ = buffer.Channel(ch)[offset + i];
            }
        }
        _ring.Write(_interleaved.data(), frames * _channels);
    }
    return true;
}

void DiskWriter::WriterThread() {
    while (_running.load()) {
        if (DrainOnce() == 0) {
            std::unique_lock<std::mutex> lock(_wakeMutex);
            _wake.wait_for(lock, kIdleWait, [this] { return !_running.load(); });
        }
        ReportDrops();
    }

    // Flush whatever the callback managed to push before the stream stopped
    while (DrainOnce() > 0) {
    }
    ReportDrops();

    MCREC_DEBUG_LOG("Disk writer finished: " << _framesWritten.load() << " frames, "
                    << _droppedBuffers.load() << " dropped buffers, "
                    << _failedWrites.load() << " failed writes" << MCREC_DEBUG_LOG_ENDL);
}

size_t DiskWriter::DrainOnce() {
    const size_t samples = _ring.Read(_chunk.data(), _chunk.size());
    const size_t frames = samples / _channels;
    if (frames == 0) {
        return 0;
    }

    if (_sink.Write(_chunk.data(), frames)) {
        _framesWritten.fetch_add(frames);
    } else {
        const uint64_t failures = _failedWrites.fetch_add(1) + 1;
        std::cerr << "Error writing audio buffer to " << _sink.Path() << " (" << frames
                  << " frames dropped, " << failures << " failed writes)" << std::endl;
    }
    return frames;
}

void DiskWriter::ReportDrops() {
    const uint64_t drops = _droppedBuffers.load();
    if (drops != _reportedDrops) {
        std::cerr << "Warning: " << (drops - _reportedDrops) << " audio buffer(s) dropped, writer fell behind"
                  << std::endl;
        _reportedDrops = drops;
    }
}

} // namespace mcrec
