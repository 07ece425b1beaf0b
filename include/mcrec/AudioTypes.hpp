#pragma once

#include <string>
#include <vector>

namespace mcrec {

enum class RecordingMode {
    Simple,
    Multichannel
};

enum class DeviceType {
    UsbAudio,
    HeadsetMic,
    BuiltInMic,
    Other
};

struct DeviceDescriptor {
    unsigned int id = 0;
    std::string name;
    DeviceType type = DeviceType::Other;
    unsigned int maxChannels = 0;
    unsigned int preferredSampleRate = 0;
    std::vector<unsigned int> sampleRates;
    std::vector<std::string> channelNames;

    bool SupportsSampleRate(unsigned int rate) const;
};

struct StreamFormat {
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
};

// Result of one negotiation pass against the session's current inputs.
struct NegotiatedRoute {
    DeviceDescriptor device;
    unsigned int channelCount = 0;
    bool degraded = false; // multichannel requested, hardware gave one channel
    std::vector<std::string> channelNames;
};

const char* ToString(RecordingMode mode);
const char* ToString(DeviceType type);

// Maps a hardware name onto a device class. Case-insensitive.
DeviceType ClassifyDevice(const std::string& name);

// Hardware channel names if present, otherwise "Channel 1".."Channel N".
std::vector<std::string> MakeChannelNames(const DeviceDescriptor& device, unsigned int channelCount);

} // namespace mcrec
