// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "../config.h"
#include "preprocessor.h"

namespace Transcribe {

struct OnnxSession;

// Acoustic encoding, [1, hidden_size, frames] row major
struct EncodedAudio {
  std::vector<float> data;
  int64_t hidden_size{};
  int64_t frames{};        // Allocated time steps, the stride between the values of one column
  int64_t valid_frames{};  // Time steps the encoder reported as valid, at most frames

  // Copies time step t into step, which must hold hidden_size values
  void CopyStep(int64_t t, std::span<float> step) const {
    for (int64_t k = 0; k < hidden_size; k++)
      step[k] = data[k * frames + t];
  }
};

struct Encoder {
  virtual ~Encoder() = default;
  virtual EncodedAudio Run(const AudioFeatures& features) = 0;
};

struct OnnxEncoder : Encoder {
  explicit OnnxEncoder(const Config& config);
  ~OnnxEncoder() override;

  EncodedAudio Run(const AudioFeatures& features) override;

  static int64_t FrameCount(int64_t feature_frames, int64_t subsampling_factor) {
    return (feature_frames + subsampling_factor - 1) / subsampling_factor;
  }

 private:
  const Config::Model::Encoder& config_;
  std::unique_ptr<OnnxSession> session_;
};

}  // namespace Transcribe
