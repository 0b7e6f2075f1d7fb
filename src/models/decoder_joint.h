// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "../config.h"

namespace Transcribe {

struct OnnxSession;

constexpr int32_t NoToken = -1;

// Everything the prediction network carries from one encoder step to the next
struct DecoderState {
  std::vector<float> state1;  // [num_layers, 1, hidden_size]
  std::vector<float> state2;  // [num_layers, 1, hidden_size]
  int32_t last_token{};       // Target fed to the prediction network, starts as the blank
  int32_t last_emitted{NoToken};
};

struct DecoderStepOutput {
  std::vector<float> logits;  // Vocabulary scores followed by the duration scores
  std::vector<float> state1;
  std::vector<float> state2;
};

// The fused prediction and joint network, evaluated once per encoder step
struct DecoderJoint {
  virtual ~DecoderJoint() = default;

  // encoder_step holds one column of the encoder output. The state is not modified.
  virtual DecoderStepOutput Run(std::span<const float> encoder_step, const DecoderState& state) = 0;

  // Number of floats in each of the two recurrent states
  virtual size_t StateSize() const = 0;
};

struct OnnxDecoderJoint : DecoderJoint {
  // vocab_size sizes the logits output, which holds vocab_size + num_durations scores
  OnnxDecoderJoint(const Config& config, int32_t vocab_size);
  ~OnnxDecoderJoint() override;

  DecoderStepOutput Run(std::span<const float> encoder_step, const DecoderState& state) override;
  size_t StateSize() const override { return static_cast<size_t>(state_shape_[0] * state_shape_[1] * state_shape_[2]); }

 private:
  const Config::Model::DecoderJoint& config_;
  int64_t encoder_hidden_size_;
  int64_t logits_size_;
  std::vector<int64_t> state_shape_;
  std::unique_ptr<OnnxSession> session_;
};

}  // namespace Transcribe
