#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace mcrec {

// Single-writer publish of an immutable value to one real-time reader.
//
// The control thread calls Publish(); the audio thread brackets each use with
// Acquire() and Release() and may read the returned pointer in between
// without locking. The pointer held by the reader is marked in-use, so
// Publish() frees every other replaced value at once and at most two values
// are alive at any time.
template <typename T>
class SettingsSnapshot {
public:
    SettingsSnapshot() : _current(nullptr), _inUse(nullptr) {}

    SettingsSnapshot(const SettingsSnapshot&) = delete;
    SettingsSnapshot& operator=(const SettingsSnapshot&) = delete;

    void Publish(T value) {
        std::lock_guard<std::mutex> lock(_publishMutex);
        _values.push_back(std::make_unique<const T>(std::move(value)));
        _current.store(_values.back().get());
        RetireUnused();
    }

    // Reader side. Lock-free; loops only while a publish races the marking.
    const T* Acquire() noexcept {
        const T* current = _current.load();
        for (;;) {
            _inUse.store(current);
            const T* latest = _current.load();
            if (latest == current) {
                return current;
            }
            current = latest;
        }
    }

    void Release() noexcept {
        _inUse.store(nullptr);
    }

    // Returns a copy of the current value, or a default one if nothing was published.
    T Get() const {
        std::lock_guard<std::mutex> lock(_publishMutex);
        const T* current = _current.load();
        return current ? *current : T{};
    }

    // Frees every value the reader does not hold, except the current one.
    void Reclaim() {
        std::lock_guard<std::mutex> lock(_publishMutex);
        RetireUnused();
    }

    size_t RetainedCount() const {
        std::lock_guard<std::mutex> lock(_publishMutex);
        return _values.size();
    }

private:
    void RetireUnused() {
        const T* current = _current.load();
        const T* inUse = _inUse.load();
        auto it = _values.begin();
        while (it != _values.end()) {
            if (it->get() != current && it->get() != inUse) {
                it = _values.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::atomic<const T*> _current;
    std::atomic<const T*> _inUse;
    mutable std::mutex _publishMutex;
    std::vector<std::unique_ptr<const T>> _values;
};

} // namespace mcrec
