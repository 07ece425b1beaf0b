#pragma once

#include <chrono>
#include <string>

#include "AudioTypes.hpp"

namespace mcrec {

// Recording_<YYYY-MM-DD_HH-mm-ss>.<ext> or Multichannel_Recording_<...>.<ext>,
// local time, one second resolution.
std::string MakeRecordingFileName(RecordingMode mode, std::chrono::system_clock::time_point when);

std::string MakeRecordingPath(const std::string& directory, RecordingMode mode,
                              std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// HH:MM:SS.ss
std::string FormatElapsed(std::chrono::steady_clock::duration elapsed);

} // namespace mcrec
