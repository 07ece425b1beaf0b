#include <atomic>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "mcrec/ChannelProcessor.hpp"
#include "mcrec/Recorder.hpp"
#include "mcrec/RecorderConfig.hpp"
#include "mcrec/RecordingFileName.hpp"
#include "mcrec/RtAudioSession.hpp"
#include "mcrec/SndFileSink.hpp"

using namespace mcrec;

class RecorderApplication {
public:
    explicit RecorderApplication(RecorderConfig config)
        : _config(std::move(config)), _mode(_config.mode), _running(true) {
        _settings.enabledChannels = _config.enabledChannels;
        _settings.channelGains = _config.channelGains;
    }

    bool Run() {
        try {
            _recorder = std::make_unique<Recorder>(_config, std::make_unique<RtAudioSession>(),
                                                   MakeSndFileSinkFactory());
        } catch (const std::exception& e) {
            std::cerr << "Failed to initialize recorder: " << e.what() << std::endl;
            return false;
        }

        _recorder->SetRecordingStateCallback([](bool recording) {
            std::cout << "[STATE] " << (recording ? "Recording" : "Idle") << std::endl;
        });
        _recorder->SetWarningCallback([](const std::string& message) {
            std::cout << "[WARNING] " << message << std::endl;
        });
        _recorder->SetChannelCountChangedCallback([this](unsigned int count) {
            OnChannelCountChanged(count);
        });

        PrintHelp();

        std::string command;
        while (_running && std::cin >> command) {
            if (!ProcessCommand(command)) {
                break;
            }
        }

        _recorder->StopRecording().get();
        return true;
    }

private:
    void OnChannelCountChanged(unsigned int count) {
        std::cout << "[CHANNELS] " << count << std::endl;

        std::lock_guard<std::mutex> lock(_settingsMutex);
        ResizeChannelSettings(_settings, count);
        _recorder->SetChannelSettings(_settings.enabledChannels, _settings.channelGains);
    }

    bool ProcessCommand(const std::string& command) {
        if (command == "start") {
            Start();
        }
        else if (command == "stop") {
            _recorder->StopRecording().get();
            PrintLastRecording();
        }
        else if (command == "mode") {
            std::string mode;
            std::cin >> mode;
            SetMode(mode);
        }
        else if (command == "mute" || command == "unmute") {
            size_t channel = 0;
            if (!ReadChannel(channel)) {
                return true;
            }
            UpdateChannel(channel, command == "unmute", std::nullopt);
        }
        else if (command == "gain") {
            size_t channel = 0;
            float gain = 1.0f;
            if (!ReadChannel(channel) || !(std::cin >> gain) || !(gain >= 0.0f)) {
                ResetInput();
                std::cout << "Usage: gain <channel> <value >= 0>" << std::endl;
                return true;
            }
            UpdateChannel(channel, std::nullopt, gain);
        }
        else if (command == "devices") {
            PrintDevices();
        }
        else if (command == "route") {
            PrintRoute();
        }
        else if (command == "rescan") {
            _recorder->OnRouteChanged().get();
            PrintRoute();
        }
        else if (command == "status") {
            PrintStatus();
        }
        else if (command == "quit" || command == "exit") {
            _running = false;
            return false;
        }
        else if (command == "help") {
            PrintHelp();
        }
        else {
            std::cout << "Unknown command: " << command << std::endl;
            PrintHelp();
        }
        return true;
    }

    void Start() {
        ChannelSettings settings;
        {
            std::lock_guard<std::mutex> lock(_settingsMutex);
            settings = _settings;
        }

        bool started = false;
        try {
            started = _recorder->StartRecording(_mode, settings.enabledChannels, settings.channelGains).get();
        } catch (const std::exception& e) {
            std::cerr << "Error starting recording: " << e.what() << std::endl;
        }
        if (!started) {
            std::cout << "Recording did not start" << std::endl;
            return;
        }
        std::cout << "Recording to " << _recorder->LastRecordingPath() << std::endl;
    }

    void SetMode(const std::string& mode) {
        if (mode == "simple") {
            _mode = RecordingMode::Simple;
        } else if (mode == "multi" || mode == "multichannel") {
            _mode = RecordingMode::Multichannel;
        } else {
            std::cout << "Usage: mode simple|multi" << std::endl;
            return;
        }

        if (_recorder->IsRecording()) {
            std::cout << "Mode set to " << ToString(_mode) << ", applies to the next recording" << std::endl;
        } else {
            std::cout << "Mode set to " << ToString(_mode) << std::endl;
        }
    }

    bool ReadChannel(size_t& channel) {
        if (!(std::cin >> channel)) {
            ResetInput();
            std::cout << "Expected a channel number" << std::endl;
            return false;
        }
        return true;
    }

    void UpdateChannel(size_t channel, std::optional<bool> enabled, std::optional<float> gain) {
        std::lock_guard<std::mutex> lock(_settingsMutex);

        if (channel >= _settings.enabledChannels.size()) {
            std::cout << "No such channel: " << channel << " (" << _settings.enabledChannels.size()
                      << " configured)" << std::endl;
            return;
        }
        if (enabled) {
            _settings.enabledChannels[channel] = *enabled;
        }
        if (gain) {
            _settings.channelGains[channel] = *gain;
        }
        _recorder->SetChannelSettings(_settings.enabledChannels, _settings.channelGains);
        std::cout << "Channel " << channel << ": " << (_settings.enabledChannels[channel] ? "on" : "muted")
                  << ", gain " << _settings.channelGains[channel] << std::endl;
    }

    void ResetInput() {
        std::cin.clear();
        std::string rest;
        std::getline(std::cin, rest);
    }

    void PrintDevices() {
        std::vector<DeviceDescriptor> inputs = _recorder->AvailableInputs();
        if (inputs.empty()) {
            std::cout << "No input devices" << std::endl;
            return;
        }
        for (const auto& input : inputs) {
            std::cout << "  [" << input.id << "] " << input.name << " (" << ToString(input.type) << ", "
                      << input.maxChannels << " ch, " << input.preferredSampleRate << " Hz)" << std::endl;
        }
    }

    void PrintRoute() {
        std::optional<NegotiatedRoute> route = _recorder->CurrentRoute();
        if (!route) {
            std::cout << "No route negotiated" << std::endl;
            return;
        }
        std::cout << "Input: " << route->device.name << ", " << route->channelCount << " channel(s)"
                  << (route->degraded ? " (multichannel not available)" : "") << std::endl;
        for (size_t i = 0; i < route->channelNames.size(); ++i) {
            std::cout << "  " << i << ": " << route->channelNames[i] << std::endl;
        }
    }

    void PrintStatus() {
        std::cout << "State: " << (_recorder->IsRecording() ? "Recording" : "Idle")
                  << ", mode: " << ToString(_mode) << std::endl;

        if (_recorder->IsRecording()) {
            std::cout << "Elapsed: " << FormatElapsed(_recorder->ElapsedTime())
                      << ", file: " << _recorder->LastRecordingPath() << std::endl;
        }

        std::lock_guard<std::mutex> lock(_settingsMutex);
        for (size_t i = 0; i < _settings.enabledChannels.size(); ++i) {
            std::cout << "  ch " << i << ": " << (_settings.enabledChannels[i] ? "on   " : "muted")
                      << " gain " << std::fixed << std::setprecision(2) << _settings.channelGains[i]
                      << std::defaultfloat << std::endl;
        }
    }

    void PrintLastRecording() {
        const std::string path = _recorder->LastRecordingPath();
        if (path.empty()) {
            return;
        }
        const CaptureStats stats = _recorder->LastStats();
        std::cout << "Saved " << path << " (" << stats.framesWritten << " frames";
        if (stats.droppedBuffers > 0 || stats.failedWrites > 0) {
            std::cout << ", " << stats.droppedBuffers << " dropped buffers, "
                      << stats.failedWrites << " failed writes";
        }
        std::cout << ")" << std::endl;
    }

    void PrintHelp() {
        std::cout << "\n=== Multichannel Recorder ===" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  start            - Start recording" << std::endl;
        std::cout << "  stop             - Stop recording" << std::endl;
        std::cout << "  mode simple|multi - Select recording mode" << std::endl;
        std::cout << "  mute <n>         - Silence channel n" << std::endl;
        std::cout << "  unmute <n>       - Re-enable channel n" << std::endl;
        std::cout << "  gain <n> <x>     - Set gain of channel n" << std::endl;
        std::cout << "  devices          - List input devices" << std::endl;
        std::cout << "  route            - Show the negotiated input" << std::endl;
        std::cout << "  rescan           - Renegotiate after plugging a device" << std::endl;
        std::cout << "  status           - Show recorder state" << std::endl;
        std::cout << "  help             - Show this help" << std::endl;
        std::cout << "  quit             - Exit application" << std::endl;
        std::cout << "=============================\n" << std::endl;
    }

    RecorderConfig _config;
    RecordingMode _mode;
    ChannelSettings _settings;
    std::mutex _settingsMutex;
    std::unique_ptr<Recorder> _recorder;
    std::atomic<bool> _running;
};

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cout << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }

    RecorderConfig config;
    if (argc == 2) {
        try {
            config = LoadRecorderConfig(argv[1]);
        } catch (const ConfigError& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    RecorderApplication app(std::move(config));
    return app.Run() ? 0 : 1;
}
