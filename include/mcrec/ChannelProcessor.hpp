#pragma once

#include <cstddef>
#include <vector>

namespace mcrec {

// Mutable view over non-interleaved float samples laid out channel after
// channel: channel i starts at data + i * frameCount. Does not own memory.
struct PlanarBufferView {
    float* data = nullptr;
    size_t channelCount = 0;
    size_t frameCount = 0;

    float* Channel(size_t index) const noexcept { return data + index * frameCount; }
};

struct ChannelSettings {
    std::vector<bool> enabledChannels;
    std::vector<float> channelGains;
};

// Zeroes disabled channels, then scales enabled channels whose gain is not
// exactly 1.0. Channels without an enabledChannels entry are left untouched;
// a missing gain entry counts as unity. Safe on the audio callback thread.
void ProcessChannels(const PlanarBufferView& buffer, const ChannelSettings& settings) noexcept;

// Resizes both vectors to channelCount. Existing entries are kept, new
// channels come up enabled at unity gain.
void ResizeChannelSettings(ChannelSettings& settings, size_t channelCount);

} // namespace mcrec
