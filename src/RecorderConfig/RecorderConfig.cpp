#include "mcrec/RecorderConfig.hpp"
#include "mcrec/debug_log.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace mcrec {

namespace {

RecordingMode ParseMode(const std::string& value) {
    if (value == "simple") {
        return RecordingMode::Simple;
    }
    if (value == "multichannel" || value == "multi") {
        return RecordingMode::Multichannel;
    }
    throw ConfigError("Unknown recording mode: " + value);
}

const char* ModeKey(RecordingMode mode) {
    return mode == RecordingMode::Multichannel ? "multichannel" : "simple";
}

template <typename T>
void ReadValue(const nlohmann::json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

void ValidateRecorderConfig(const RecorderConfig& config) {
    for (size_t i = 0; i < config.channelGains.size(); ++i) {
        const float gain = config.channelGains[i];
        if (!std::isfinite(gain) || gain < 0.0f) {
            throw ConfigError("Gain for channel " + std::to_string(i) + " must be a finite value >= 0");
        }
    }
    if (config.simple.sampleRate == 0 || config.simple.sampleRate > kMaxSampleRate) {
        throw ConfigError("simple.sample_rate must be within [1, " + std::to_string(kMaxSampleRate) + "]");
    }
    if (!(config.simple.quality >= 0.0 && config.simple.quality <= 1.0)) {
        throw ConfigError("simple.quality must be within [0, 1]");
    }
    for (unsigned int blockFrames : {config.simple.blockFrames, config.multichannel.blockFrames}) {
        if (blockFrames == 0 || blockFrames > kMaxBlockFrames) {
            throw ConfigError("block_frames must be within [1, " + std::to_string(kMaxBlockFrames) + "]");
        }
    }
    for (double bufferSeconds : {config.simple.bufferSeconds, config.multichannel.bufferSeconds}) {
        if (!(bufferSeconds > 0.0 && bufferSeconds <= kMaxBufferSeconds)) {
            throw ConfigError("buffer_seconds must be within (0, " + std::to_string(kMaxBufferSeconds) + "]");
        }
    }
}

RecorderConfig ParseRecorderConfig(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Error parsing config: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    RecorderConfig config;
    ReadValue(root, "output_directory", config.outputDirectory);

    std::string mode;
    ReadValue(root, "mode", mode);
    if (!mode.empty()) {
        config.mode = ParseMode(mode);
    }

    ReadValue(root, "enabled_channels", config.enabledChannels);
    ReadValue(root, "channel_gains", config.channelGains);

    auto simple = root.find("simple");
    if (simple != root.end() && simple->is_object()) {
        ReadValue(*simple, "sample_rate", config.simple.sampleRate);
        ReadValue(*simple, "quality", config.simple.quality);
        ReadValue(*simple, "block_frames", config.simple.blockFrames);
        ReadValue(*simple, "buffer_seconds", config.simple.bufferSeconds);
    }

    auto multichannel = root.find("multichannel");
    if (multichannel != root.end() && multichannel->is_object()) {
        ReadValue(*multichannel, "block_frames", config.multichannel.blockFrames);
        ReadValue(*multichannel, "buffer_seconds", config.multichannel.bufferSeconds);
    }

    ValidateRecorderConfig(config);
    return config;
}

RecorderConfig LoadRecorderConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Could not open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    MCREC_DEBUG_LOG("Loading config from " << path << MCREC_DEBUG_LOG_ENDL);
    return ParseRecorderConfig(buffer.str());
}

nlohmann::json ToJson(const RecorderConfig& config) {
    nlohmann::json root;
    root["output_directory"] = config.outputDirectory;
    root["mode"] = ModeKey(config.mode);
    root["enabled_channels"] = config.enabledChannels;
    root["channel_gains"] = config.channelGains;
    root["simple"] = {
        {"sample_rate", config.simple.sampleRate},
        {"quality", config.simple.quality},
        {"block_frames", config.simple.blockFrames},
        {"buffer_seconds", config.simple.bufferSeconds}
    };
    root["multichannel"] = {
        {"block_frames", config.multichannel.blockFrames},
        {"buffer_seconds", config.multichannel.bufferSeconds}
    };
    return root;
}

void SaveRecorderConfig(const RecorderConfig& config, const std::string& path) {
    ValidateRecorderConfig(config);

    std::ofstream file(path);
    if (!file) {
        throw ConfigError("Could not write config file: " + path);
    }
    file << ToJson(config).dump(4) << std::endl;
    if (!file) {
        throw ConfigError("Error writing config file: " + path);
    }
}

} // namespace mcrec
