#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "CaptureBackend.hpp"
#include "DiskWriter.hpp"
#include "IAudioSession.hpp"
#include "IRecordingSink.hpp"

namespace mcrec {

// Mono, compressed recording. The encoder owns the whole buffer path;
// buffers are not processed on the way to disk.
//
// Start() must not be called while recording.
class SimpleBackend : public ICaptureBackend {
public:
    SimpleBackend(IAudioSession& session, SinkFactory sinkFactory, SimpleCaptureOptions options = {});
    ~SimpleBackend() override;

    std::string Start(const std::string& outputDirectory) override;
    void Stop() override;

    bool IsRecording() const override { return _recording.load(); }
    RecordingMode Mode() const override { return RecordingMode::Simple; }
    CaptureStats Stats() const override;

private:
    void Teardown();

    IAudioSession& _session;
    SinkFactory _sinkFactory;
    SimpleCaptureOptions _options;

    std::unique_ptr<IRecordingSink> _sink;
    std::unique_ptr<IInputStream> _stream;
    std::unique_ptr<DiskWriter> _writer;

    std::atomic<bool> _recording;
    CaptureStats _lastStats;
    mutable std::mutex _controlMutex;
};

} // namespace mcrec
