// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

#include "models/decoder_joint.h"
#include "models/encoder.h"

namespace Transcribe {

// Evaluates the decoder-joint for one encoder step. Must not keep references to its arguments.
using DecoderStepFn = std::function<DecoderStepOutput(std::span<const float> encoder_step, const DecoderState& state)>;

// Greedy token-and-duration transducer decoding, one decoder-joint evaluation per encoder step.
// The duration scores are ignored, every step advances exactly one encoder frame.
//
// Per step, the best vocabulary score decides:
//   blank            -> keep the state, forget the last emitted token
//   the last emitted -> suppressed, state kept
//   anything else    -> emitted, becomes the next target and the decoder adopts the new state
struct TdtGreedyDecoder {
  enum struct Status {
    AwaitingStep,
    Done,
  };

  // encoded must outlive the decoder
  TdtGreedyDecoder(const EncodedAudio& encoded, int32_t blank_id, int32_t vocab_size, size_t state_size);

  Status GetStatus() const { return t_ < encoded_.valid_frames ? Status::AwaitingStep : Status::Done; }
  bool IsDone() const { return GetStatus() == Status::Done; }

  void Step(const DecoderStepFn& step_fn);

  int64_t CurrentStep() const { return t_; }
  const DecoderState& State() const { return state_; }
  const std::vector<int32_t>& Tokens() const { return tokens_; }

  // Index of the best of the first vocab_size scores, the lowest index wins a tie
  static int32_t ArgMax(std::span<const float> logits, int32_t vocab_size);

 private:
  const EncodedAudio& encoded_;
  int32_t blank_id_;
  int32_t vocab_size_;
  size_t state_size_;

  DecoderState state_;
  std::vector<int32_t> tokens_;
  std::vector<float> encoder_step_;
  int64_t t_{};
};

// Runs TdtGreedyDecoder until done and returns the emitted token ids
std::vector<int32_t> GreedyTdtDecode(const EncodedAudio& encoded, int32_t blank_id, int32_t vocab_size, size_t state_size, const DecoderStepFn& step_fn);

}  // namespace Transcribe
