#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstring>
#include <memory>
#include <type_traits>

namespace mcrec {

/**
 * Lock-free single-producer, single-consumer ring buffer.
 * One writer thread (audio callback) and one reader thread (disk writer).
 * One slot is kept free to tell full from empty.
 */
template <typename T>
class RingBuffer {
    static_assert(std::is_trivially_copyable<T>::value, "RingBuffer needs trivially copyable elements");

public:
    explicit RingBuffer(size_t capacity)
        : _capacity(capacity + 1)
        , _buffer(new T[capacity + 1]())
        , _writeIndex(0)
        , _readIndex(0) {}

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /**
     * Producer side. Writes all of count or nothing.
     * @return false when there is not enough free space
     */
    bool Write(const T* data, size_t count) noexcept {
        if (!data || count == 0) {
            return true;
        }

        const size_t writeIdx = _writeIndex.load(std::memory_order_relaxed);
        const size_t readIdx = _readIndex.load(std::memory_order_acquire);

        if (FreeSpace(writeIdx, readIdx) < count) {
            return false;
        }

        const size_t firstChunk = std::min(count, _capacity - writeIdx);
        std::memcpy(_buffer.get() + writeIdx, data, firstChunk * sizeof(T));
        if (firstChunk < count) {
            std::memcpy(_buffer.get(), data + firstChunk, (count - firstChunk) * sizeof(T));
        }

        _writeIndex.store((writeIdx + count) % _capacity, std::memory_order_release);
        return true;
    }

    /**
     * Consumer side.
     * @return number of elements copied into data, at most count
     */
    size_t Read(T* data, size_t count) noexcept {
        if (!data || count == 0) {
            return 0;
        }

        const size_t readIdx = _readIndex.load(std::memory_order_relaxed);
        const size_t writeIdx = _writeIndex.load(std::memory_order_acquire);

        const size_t toRead = std::min(count, Used(writeIdx, readIdx));
        if (toRead == 0) {
            return 0;
        }

        const size_t firstChunk = std::min(toRead, _capacity - readIdx);
        std::memcpy(data, _buffer.get() + readIdx, firstChunk * sizeof(T));
        if (firstChunk < toRead) {
            std::memcpy(data + firstChunk, _buffer.get(), (toRead - firstChunk) * sizeof(T));
        }

        _readIndex.store((readIdx + toRead) % _capacity, std::memory_order_release);
        return toRead;
    }

    size_t Available() const noexcept {
        return Used(_writeIndex.load(std::memory_order_acquire), _readIndex.load(std::memory_order_acquire));
    }

    size_t Space() const noexcept {
        return FreeSpace(_writeIndex.load(std::memory_order_acquire), _readIndex.load(std::memory_order_acquire));
    }

    size_t Capacity() const noexcept { return _capacity - 1; }

    // Only when neither side is running.
    void Reset() noexcept {
        _writeIndex.store(0, std::memory_order_release);
        _readIndex.store(0, std::memory_order_release);
    }

private:
    size_t Used(size_t writeIdx, size_t readIdx) const noexcept {
        return writeIdx >= readIdx ? writeIdx - readIdx : _capacity - readIdx + writeIdx;
    }

    size_t FreeSpace(size_t writeIdx, size_t readIdx) const noexcept {
        return _capacity - Used(writeIdx, readIdx) - 1;
    }

    const size_t _capacity;
    std::unique_ptr<T[]> _buffer;
    std::atomic<size_t> _writeIndex;
    std::atomic<size_t> _readIndex;
};

} // namespace mcrec
