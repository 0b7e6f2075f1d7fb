// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "../config.h"

namespace Transcribe {

struct OnnxSession;

// Log-mel features, [1, num_mels, frames] row major
struct AudioFeatures {
  std::vector<float> data;
  int64_t num_mels{};
  int64_t frames{};        // Allocated time steps
  int64_t valid_frames{};  // Time steps the extractor reported as valid, at most frames
};

// Turns 16kHz mono samples into log-mel features
struct Preprocessor {
  virtual ~Preprocessor() = default;
  virtual AudioFeatures Run(std::span<const float> samples) = 0;
};

struct OnnxPreprocessor : Preprocessor {
  explicit OnnxPreprocessor(const Config& config);
  ~OnnxPreprocessor() override;

  AudioFeatures Run(std::span<const float> samples) override;

  // One frame per hop plus the frame centered on the last sample
  static int64_t FrameCount(int64_t sample_count, int64_t hop_length) { return sample_count / hop_length + 1; }

 private:
  const Config::Model::Preprocessor& config_;
  std::unique_ptr<OnnxSession> session_;
};

}  // namespace Transcribe
