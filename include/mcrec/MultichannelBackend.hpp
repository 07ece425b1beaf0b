#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "CaptureBackend.hpp"
#include "ChannelProcessor.hpp"
#include "DiskWriter.hpp"
#include "IAudioSession.hpp"
#include "IRecordingSink.hpp"
#include "SettingsSnapshot.hpp"

namespace mcrec {

// Records every negotiated input channel to an uncompressed float file.
// Each delivered buffer is muted/gained in place on the audio thread using
// the latest published ChannelSettings, then handed to the disk writer.
class MultichannelBackend : public ICaptureBackend {
public:
    enum class State {
        Idle,
        Armed,
        Recording
    };

    MultichannelBackend(IAudioSession& session,
                        SettingsSnapshot<ChannelSettings>& settings,
                        SinkFactory sinkFactory,
                        MultichannelCaptureOptions options = {});
    ~MultichannelBackend() override;

    // A second Start() while armed or recording does nothing and returns the
    // current path.
    std::string Start(const std::string& outputDirectory) override;
    void Stop() override;

    bool IsRecording() const override { return _state.load() == State::Recording; }
    RecordingMode Mode() const override { return RecordingMode::Multichannel; }
    CaptureStats Stats() const override;

    State GetState() const { return _state.load(); }
    StreamFormat Format() const;

private:
    void OnBuffer(float* samples, unsigned int frames, unsigned int channels) noexcept;
    void Teardown();

    IAudioSession& _session;
    SettingsSnapshot<ChannelSettings>& _settings;
    SinkFactory _sinkFactory;
    MultichannelCaptureOptions _options;

    std::unique_ptr<IRecordingSink> _sink;
    std::unique_ptr<IInputStream> _stream;
    std::unique_ptr<DiskWriter> _writer;
    std::string _path;
    StreamFormat _format;

    std::atomic<State> _state;
    CaptureStats _lastStats;
    mutable std::mutex _controlMutex;
};

} // namespace mcrec
