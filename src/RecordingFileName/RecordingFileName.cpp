#include "mcrec/RecordingFileName.hpp"
#include "mcrec/IRecordingSink.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>

namespace mcrec {

namespace {
SinkContainer ContainerFor(RecordingMode mode) {
    return mode == RecordingMode::Multichannel ? SinkContainer::CafFloat32 : SinkContainer::OggVorbis;
}
}

std::string MakeRecordingFileName(RecordingMode mode, std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &local);

    const char* prefix = mode == RecordingMode::Multichannel ? "Multichannel_Recording_" : "Recording_";
    return std::string(prefix) + stamp + "." + FileExtension(ContainerFor(mode));
}

std::string MakeRecordingPath(const std::string& directory, RecordingMode mode,
                              std::chrono::system_clock::time_point when) {
    std::filesystem::path path = directory.empty() ? std::filesystem::path(".") : std::filesystem::path(directory);
    path /= MakeRecordingFileName(mode, when);
    return path.string();
}

std::string FormatElapsed(std::chrono::steady_clock::duration elapsed) {
    using namespace std::chrono;

    const long long hundredthsTotal = duration_cast<milliseconds>(elapsed).count() / 10;
    const long long totalSeconds = hundredthsTotal / 100;
    const int hundredths = static_cast<int>(hundredthsTotal % 100);
    const int hours = static_cast<int>(totalSeconds / 3600);
    const int minutes = static_cast<int>((totalSeconds % 3600) / 60);
    const int seconds = static_cast<int>(totalSeconds % 60);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%02d", hours, minutes, seconds, hundredths);
    return buffer;
}

} // namespace mcrec
