#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "AudioTypes.hpp"
#include "CaptureBackend.hpp"

namespace mcrec {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct RecorderConfig {
    std::string outputDirectory = ".";
    RecordingMode mode = RecordingMode::Simple;
    std::vector<bool> enabledChannels;
    std::vector<float> channelGains;
    SimpleCaptureOptions simple;
    MultichannelCaptureOptions multichannel;
};

// Missing keys keep their defaults, unknown keys are ignored.
// Throws ConfigError on malformed JSON or out-of-range values.
RecorderConfig ParseRecorderConfig(const std::string& text);
RecorderConfig LoadRecorderConfig(const std::string& path);

void SaveRecorderConfig(const RecorderConfig& config, const std::string& path);
nlohmann::json ToJson(const RecorderConfig& config);

void ValidateRecorderConfig(const RecorderConfig& config);

} // namespace mcrec
