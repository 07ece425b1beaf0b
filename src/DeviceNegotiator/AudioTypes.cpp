#include "mcrec/AudioTypes.hpp"

#include <algorithm>
#include <cctype>

namespace mcrec {

bool DeviceDescriptor::SupportsSampleRate(unsigned int rate) const {
    return std::find(sampleRates.begin(), sampleRates.end(), rate) != sampleRates.end();
}

const char* ToString(RecordingMode mode) {
    switch (mode) {
        case RecordingMode::Simple: return "simple";
        case RecordingMode::Multichannel: return "multichannel";
    }
    return "unknown";
}

const char* ToString(DeviceType type) {
    switch (type) {
        case DeviceType::UsbAudio: return "USB audio";
        case DeviceType::HeadsetMic: return "headset mic";
        case DeviceType::BuiltInMic: return "built-in mic";
        case DeviceType::Other: return "other";
    }
    return "unknown";
}

DeviceType ClassifyDevice(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto contains = [&lower](const char* needle) { return lower.find(needle) != std::string::npos; };

    if (contains("usb")) {
        return DeviceType::UsbAudio;
    }
    if (contains("headset")) {
        return DeviceType::HeadsetMic;
    }
    if (contains("built-in") || contains("internal") || contains("hda") || contains("pch")) {
        return DeviceType::BuiltInMic;
    }
    return DeviceType::Other;
}

std::vector<std::string> MakeChannelNames(const DeviceDescriptor& device, unsigned int channelCount) {
    if (device.channelNames.size() >= channelCount) {
        return std::vector<std::string>(device.channelNames.begin(), device.channelNames.begin() + channelCount);
    }

    std::vector<std::string> names;
    names.reserve(channelCount);
    for (unsigned int i = 0; i < channelCount; ++i) {
        names.push_back("Channel " + std::to_string(i + 1));
    }
    return names;
}

} // namespace mcrec
