#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "AudioTypes.hpp"
#include "IAudioSession.hpp"

namespace mcrec {

// Picks the input device and channel count for the session.
//
// Nothing is cached across hardware changes: whoever observes a route
// change calls OnRouteChanged(), which re-runs the whole negotiation.
class DeviceNegotiator {
public:
    using WarningCallback = std::function<void(const std::string&)>;
    using ChannelCountCallback = std::function<void(unsigned int)>;

    explicit DeviceNegotiator(IAudioSession& session);

    // USB audio > headset mic > built-in mic > first candidate.
    static std::optional<DeviceDescriptor> SelectInput(const std::vector<DeviceDescriptor>& candidates);

    // 1 for simple mode. For multichannel the device's maxChannels, or 1 with
    // a warning when the hardware only has one channel.
    unsigned int ResolveChannelCount(RecordingMode mode, const DeviceDescriptor& device);

    // Selects and configures the preferred input. Empty when the session has
    // no inputs at all.
    std::optional<NegotiatedRoute> Negotiate(RecordingMode mode);

    // Re-runs Negotiate() with the mode of the last negotiation.
    std::optional<NegotiatedRoute> OnRouteChanged();

    std::optional<NegotiatedRoute> CurrentRoute() const;

    void SetWarningCallback(WarningCallback callback);
    void SetChannelCountChangedCallback(ChannelCountCallback callback);

private:
    void Warn(const std::string& message);

    IAudioSession& _session;
    RecordingMode _lastMode;
    std::optional<NegotiatedRoute> _route;
    unsigned int _lastChannelCount;

    WarningCallback _onWarning;
    ChannelCountCallback _onChannelCountChanged;
    mutable std::mutex _mutex;
};

} // namespace mcrec
