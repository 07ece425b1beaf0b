#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "ChannelProcessor.hpp"
#include "IRecordingSink.hpp"
#include "RingBuffer.hpp"

namespace mcrec {

// Moves captured audio from the audio callback to the sink.
//
// Push() runs on the audio thread: it interleaves into preallocated scratch
// memory and copies into a lock-free ring. A dedicated thread drains the
// ring into the sink. Only the writer thread touches the sink between
// Start() and Stop().
class DiskWriter {
public:
    DiskWriter(IRecordingSink& sink, unsigned int channels, size_t maxBlockFrames, size_t capacityFrames);
    ~DiskWriter();

    DiskWriter(const DiskWriter&) = delete;
    DiskWriter& operator=(const DiskWriter&) = delete;

    void Start();

    // Drains what is left in the ring and joins the writer thread. Does not
    // close the sink.
    void Stop();

    // Audio thread. Returns false and counts a drop when the ring is full or
    // the buffer does not match the channel count.
    bool Push(const PlanarBufferView& buffer) noexcept;

    bool IsRunning() const { return _running.load(); }

    uint64_t FramesWritten() const { return _framesWritten.load(); }
    uint64_t DroppedBuffers() const { return _droppedBuffers.load(); }
    uint64_t FailedWrites() const { return _failedWrites.load(); }

private:
    void WriterThread();
    size_t DrainOnce();
    void ReportDrops();

    IRecordingSink& _sink;
    const unsigned int _channels;
    const size_t _maxBlockFrames;

    RingBuffer<float> _ring;
    std::vector<float> _interleaved; // audio thread scratch
    std::vector<float> _chunk;       // writer thread scratch

    std::atomic<bool> _running;
    std::thread _thread;
    std::mutex _wakeMutex;
    std::condition_variable _wake;

    std::atomic<uint64_t> _framesWritten;
    std::atomic<uint64_t> _droppedBuffers;
    std::atomic<uint64_t> _failedWrites;
    uint64_t _reportedDrops;
};

} // namespace mcrec
