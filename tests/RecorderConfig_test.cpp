#include "mcrec/RecorderConfig.hpp"
#include "mcrec/RecordingFileName.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <regex>
#include <string>

using namespace mcrec;
using namespace std::chrono_literals;

TEST(RecorderConfigTest, EmptyObjectKeepsDefaults) {
    RecorderConfig config = ParseRecorderConfig("{}");

    EXPECT_EQ(config.outputDirectory, ".");
    EXPECT_EQ(config.mode, RecordingMode::Simple);
    EXPECT_TRUE(config.enabledChannels.empty());
    EXPECT_EQ(config.simple.sampleRate, 44100u);
    EXPECT_DOUBLE_EQ(config.simple.quality, 0.9);
    EXPECT_EQ(config.simple.blockFrames, 512u);
    EXPECT_EQ(config.multichannel.blockFrames, 4096u);
}

TEST(RecorderConfigTest, ParsesAllFields) {
    const std::string text = R"({
        "output_directory": "/tmp/takes",
        "mode": "multichannel",
        "enabled_channels": [true, false, true],
        "channel_gains": [1.0, 0.0, 2.5],
        "simple": {"sample_rate": 48000, "quality": 0.5, "block_frames": 256, "buffer_seconds": 2.0},
        "multichannel": {"block_frames": 1024, "buffer_seconds": 8.0},
        "unknown_key": 12
    })";

    RecorderConfig config = ParseRecorderConfig(text);
    EXPECT_EQ(config.outputDirectory, "/tmp/takes");
    EXPECT_EQ(config.mode, RecordingMode::Multichannel);
    EXPECT_EQ(config.enabledChannels, (std::vector<bool>{true, false, true}));
    EXPECT_EQ(config.channelGains, (std::vector<float>{1.0f, 0.0f, 2.5f}));
    EXPECT_EQ(config.simple.sampleRate, 48000u);
    EXPECT_DOUBLE_EQ(config.simple.quality, 0.5);
    EXPECT_EQ(config.simple.blockFrames, 256u);
    EXPECT_DOUBLE_EQ(config.simple.bufferSeconds, 2.0);
    EXPECT_EQ(config.multichannel.blockFrames, 1024u);
    EXPECT_DOUBLE_EQ(config.multichannel.bufferSeconds, 8.0);
}

TEST(RecorderConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(ParseRecorderConfig("not json"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig("[1, 2]"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"mode": "stereo"})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"channel_gains": [1.0, -0.5]})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"channel_gains": "loud"})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"simple": {"quality": 1.5}})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"simple": {"block_frames": 0}})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"multichannel": {"block_frames": 0}})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"multichannel": {"buffer_seconds": 0}})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"multichannel": {"buffer_seconds": 1e9}})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"simple": {"buffer_seconds": 61}})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"multichannel": {"block_frames": 1000000}})"), ConfigError);
    EXPECT_THROW(ParseRecorderConfig(R"({"simple": {"sample_rate": 4000000000}})"), ConfigError);
    EXPECT_NO_THROW(ParseRecorderConfig(R"({"multichannel": {"block_frames": 65536, "buffer_seconds": 60}})"));
}

TEST(RecorderConfigTest, SaveThenLoad) {
    test_utils::TempDir dir;
    const std::string path = dir.Path() + "/recorder.json";

    RecorderConfig config;
    config.outputDirectory = dir.Path();
    config.mode = RecordingMode::Multichannel;
    config.enabledChannels = {true, false};
    config.channelGains = {0.5f, 1.0f};
    config.multichannel.blockFrames = 2048;

    SaveRecorderConfig(config, path);
    RecorderConfig loaded = LoadRecorderConfig(path);

    EXPECT_EQ(loaded.outputDirectory, config.outputDirectory);
    EXPECT_EQ(loaded.mode, RecordingMode::Multichannel);
    EXPECT_EQ(loaded.enabledChannels, config.enabledChannels);
    EXPECT_EQ(loaded.channelGains, config.channelGains);
    EXPECT_EQ(loaded.multichannel.blockFrames, 2048u);

    EXPECT_THROW(LoadRecorderConfig(dir.Path() + "/missing.json"), ConfigError);
}

TEST(RecordingFileNameTest, NamesCarryModeAndLocalTimestamp) {
    std::tm local{};
    local.tm_year = 2024 - 1900;
    local.tm_mon = 2;
    local.tm_mday = 9;
    local.tm_hour = 7;
    local.tm_min = 5;
    local.tm_sec = 3;
    local.tm_isdst = -1;
    const auto when = std::chrono::system_clock::from_time_t(std::mktime(&local));

    EXPECT_EQ(MakeRecordingFileName(RecordingMode::Simple, when), "Recording_2024-03-09_07-05-03.ogg");
    EXPECT_EQ(MakeRecordingFileName(RecordingMode::Multichannel, when),
              "Multichannel_Recording_2024-03-09_07-05-03.caf");

    EXPECT_EQ(MakeRecordingPath("", RecordingMode::Simple, when), "./Recording_2024-03-09_07-05-03.ogg");
    EXPECT_EQ(MakeRecordingPath("/data", RecordingMode::Simple, when), "/data/Recording_2024-03-09_07-05-03.ogg");
}

TEST(RecordingFileNameTest, CurrentNameMatchesPattern) {
    const std::regex pattern(R"(Multichannel_Recording_\d{4}-\d{2}-\d{2}_\d{2}-\d{2}-\d{2}\.caf)");
    EXPECT_TRUE(std::regex_match(MakeRecordingFileName(RecordingMode::Multichannel, std::chrono::system_clock::now()),
                                 pattern));
}

TEST(RecordingFileNameTest, FormatsElapsedTime) {
    EXPECT_EQ(FormatElapsed(std::chrono::steady_clock::duration::zero()), "00:00:00.00");
    EXPECT_EQ(FormatElapsed(1234ms), "00:00:01.23");
    EXPECT_EQ(FormatElapsed(61s + 500ms), "00:01:01.50");
    EXPECT_EQ(FormatElapsed(3h + 25min + 45s + 990ms), "03:25:45.99");
}
