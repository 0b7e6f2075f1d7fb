// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "tdt_greedy_decoder.h"
#include "errors.h"
#include "logging.h"
#include "string_utils.h"

#include <utility>

namespace Transcribe {

TdtGreedyDecoder::TdtGreedyDecoder(const EncodedAudio& encoded, int32_t blank_id, int32_t vocab_size, size_t state_size)
    : encoded_{encoded},
      blank_id_{blank_id},
      vocab_size_{vocab_size},
      state_size_{state_size},
      encoder_step_(encoded.hidden_size) {
  if (vocab_size_ <= 0 || blank_id_ < 0 || blank_id_ >= vocab_size_)
    throw InferenceError("decoder", MakeString("blank id ", blank_id_, " is outside the vocabulary of ", vocab_size_));
  if (encoded_.valid_frames > encoded_.frames)
    throw InferenceError("decoder", MakeString("valid encoder length ", encoded_.valid_frames, " exceeds ", encoded_.frames, " frames"));

  state_.state1.resize(state_size_);
  state_.state2.resize(state_size_);
  state_.last_token = blank_id_;
}

int32_t TdtGreedyDecoder::ArgMax(std::span<const float> logits, int32_t vocab_size) {
  int32_t best = 0;
  for (int32_t i = 1; i < vocab_size; i++) {
    if (logits[i] > logits[best])
      best = i;
  }
  return best;
}

void TdtGreedyDecoder::Step(const DecoderStepFn& step_fn) {
  if (IsDone())
    throw std::runtime_error("TdtGreedyDecoder::Step called after the last encoder step");

  encoded_.CopyStep(t_, encoder_step_);
  auto output = step_fn(encoder_step_, state_);

  if (output.logits.size() < static_cast<size_t>(vocab_size_))
    throw InferenceError("decoder", MakeString("step ", t_, " produced ", output.logits.size(), " logits, expected at least ", vocab_size_));

  const int32_t token = ArgMax(output.logits, vocab_size_);

  if (token == blank_id_) {
    state_.last_emitted = NoToken;
    if (g_log.enabled && g_log.decoder_steps)
      Log("decoder_steps", MakeString("t=", t_, " blank"));
  } else if (token == state_.last_emitted) {
    if (g_log.enabled && g_log.decoder_steps)
      Log("decoder_steps", MakeString("t=", t_, " repeat ", token));
  } else {
    if (output.state1.size() != state_size_ || output.state2.size() != state_size_)
      throw InferenceError("decoder", MakeString("step ", t_, " produced states of ", output.state1.size(), " and ", output.state2.size(),
                                                 " values, expected ", state_size_));
    tokens_.push_back(token);
    state_.last_emitted = token;
    state_.last_token = token;
    state_.state1 = std::move(output.state1);
    state_.state2 = std::move(output.state2);
    if (g_log.enabled && g_log.decoder_steps)
      Log("decoder_steps", MakeString("t=", t_, " emit ", token));
  }

  t_++;
}

std::vector<int32_t> GreedyTdtDecode(const EncodedAudio& encoded, int32_t blank_id, int32_t vocab_size, size_t state_size, const DecoderStepFn& step_fn) {
  TdtGreedyDecoder decoder{encoded, blank_id, vocab_size, state_size};
  while (!decoder.IsDone())
    decoder.Step(step_fn);
  return decoder.Tokens();
}

}  // namespace Transcribe
