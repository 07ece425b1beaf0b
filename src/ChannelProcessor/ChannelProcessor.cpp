#include "mcrec/ChannelProcessor.hpp"

#include <algorithm>

namespace mcrec {

void ProcessChannels(const PlanarBufferView& buffer, const ChannelSettings& settings) noexcept {
    if (!buffer.data || buffer.frameCount == 0) {
        return;
    }

    const size_t enabledCount = settings.enabledChannels.size();
    const size_t gainCount = settings.channelGains.size();

    for (size_t ch = 0; ch < buffer.channelCount; ++ch) {
        if (ch >= enabledCount) {
            continue;
        }

        float* samples = buffer.Channel(ch);

        // Mute wins over gain
        if (!settings.enabledChannels[ch]) {
            std::fill(samples, samples + buffer.frameCount, 0.0f);
            continue;
        }

        const float gain = ch < gainCount ? settings.channelGains[ch] : 1.0f;
        if (gain != 1.0f) {
            for (size_t i = 0; i < buffer.frameCount; ++i) {
                samples[i] *= gain;
            }
        }
    }
}

void ResizeChannelSettings(ChannelSettings& settings, size_t channelCount) {
    settings.enabledChannels.resize(channelCount, true);
    settings.channelGains.resize(channelCount, 1.0f);
}

} // namespace mcrec
