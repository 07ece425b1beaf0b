#include "mcrec/DeviceNegotiator.hpp"
#include "mcrec/debug_log.hpp"

#include <algorithm>
#include <iostream>

namespace mcrec {

DeviceNegotiator::DeviceNegotiator(IAudioSession& session)
    : _session(session)
    , _lastMode(RecordingMode::Simple)
    , _lastChannelCount(0) {
}

std::optional<DeviceDescriptor> DeviceNegotiator::SelectInput(const std::vector<DeviceDescriptor>& candidates) {
    static const DeviceType preferredTypes[] = {
        DeviceType::UsbAudio,
        DeviceType::HeadsetMic,
        DeviceType::BuiltInMic
    };

    for (DeviceType type : preferredTypes) {
        auto it = std::find_if(candidates.begin(), candidates.end(),
                               [type](const DeviceDescriptor& d) { return d.type == type; });
        if (it != candidates.end()) {
            return *it;
        }
    }

    if (candidates.empty()) {
        return std::nullopt;
    }
    return candidates.front();
}

unsigned int DeviceNegotiator::ResolveChannelCount(RecordingMode mode, const DeviceDescriptor& device) {
    if (mode == RecordingMode::Simple) {
        return 1;
    }

    if (device.maxChannels > 1) {
        MCREC_DEBUG_LOG("Multichannel mode - requesting all " << device.maxChannels
                        << " channels of " << device.name << MCREC_DEBUG_LOG_ENDL);
        return device.maxChannels;
    }

    Warn("Multichannel mode requested, but " + device.name + " only supports 1 channel");
    return 1;
}

std::optional<NegotiatedRoute> DeviceNegotiator::Negotiate(RecordingMode mode) {
    const std::vector<DeviceDescriptor> inputs = _session.AvailableInputs();

    MCREC_DEBUG_LOG("Found " << inputs.size() << " available inputs:" << MCREC_DEBUG_LOG_ENDL);
    for (const auto& input : inputs) {
        MCREC_DEBUG_LOG("  - " << input.name << " (" << ToString(input.type) << ", "
                        << input.maxChannels << " ch)" << MCREC_DEBUG_LOG_ENDL);
    }

    std::optional<DeviceDescriptor> selected = SelectInput(inputs);
    std::optional<NegotiatedRoute> route;

    if (!selected) {
        Warn("No suitable input device found");
    } else {
        if (selected->type == DeviceType::Other) {
            Warn("No USB, headset or built-in input found, falling back to " + selected->name);
        }

        _session.SetPreferredInput(*selected);
        const unsigned int channels = ResolveChannelCount(mode, *selected);
        _session.SetPreferredInputChannels(channels);

        NegotiatedRoute negotiated;
        negotiated.device = *selected;
        negotiated.channelCount = channels;
        negotiated.degraded = mode == RecordingMode::Multichannel && channels < 2;
        negotiated.channelNames = MakeChannelNames(*selected, channels);
        route = std::move(negotiated);

        MCREC_DEBUG_LOG("Selected input: " << selected->name << ", " << channels
                        << " channel(s)" << MCREC_DEBUG_LOG_ENDL);
    }

    ChannelCountCallback notify;
    const unsigned int channelCount = route ? route->channelCount : 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _lastMode = mode;
        _route = route;
        if (channelCount != _lastChannelCount) {
            _lastChannelCount = channelCount;
            notify = _onChannelCountChanged;
        }
    }

    if (notify) {
        notify(channelCount);
    }
    return route;
}

std::optional<NegotiatedRoute> DeviceNegotiator::OnRouteChanged() {
    RecordingMode mode;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        mode = _lastMode;
    }
    MCREC_DEBUG_LOG("Audio route changed, renegotiating (" << ToString(mode) << ")" << MCREC_DEBUG_LOG_ENDL);
    return Negotiate(mode);
}

std::optional<NegotiatedRoute> DeviceNegotiator::CurrentRoute() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _route;
}

void DeviceNegotiator::SetWarningCallback(WarningCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _onWarning = std::move(callback);
}

void DeviceNegotiator::SetChannelCountChangedCallback(ChannelCountCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _onChannelCountChanged = std::move(callback);
}

void DeviceNegotiator::Warn(const std::string& message) {
    std::cerr << "WARNING: " << message << std::endl;

    WarningCallback callback;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _onWarning;
    }
    if (callback) {
        callback(message);
    }
}

} // namespace mcrec
