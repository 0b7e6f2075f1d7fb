// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <chrono>
#include <string_view>

#include "logging.h"
#include "string_utils.h"

namespace Transcribe {

using Clock = std::chrono::steady_clock;

class Timer {
 public:
  Clock::duration Elapsed() const {
    return Clock::now() - start_;
  }

 private:
  Clock::time_point start_{Clock::now()};
};

inline void LogStageTiming(std::string_view stage, const Clock::duration& timing) {
  if (g_log.enabled && g_log.stage_timing) {
    const auto elapsed_usec = std::chrono::duration_cast<std::chrono::microseconds>(timing).count();
    Log("stage_timing", MakeString(stage, " time: ", elapsed_usec, " usec"));
  }
}

}  // namespace Transcribe
