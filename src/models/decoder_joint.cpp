// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "decoder_joint.h"
#include "onnx_session.h"
#include "../errors.h"
#include "../string_utils.h"

#include <array>

namespace Transcribe {

OnnxDecoderJoint::OnnxDecoderJoint(const Config& config, int32_t vocab_size)
    : config_{config.model.decoder_joint},
      encoder_hidden_size_{config.model.encoder.hidden_size},
      logits_size_{static_cast<int64_t>(vocab_size) + config_.num_durations},
      state_shape_{config_.num_layers, 1, config_.hidden_size},
      session_{std::make_unique<OnnxSession>("decoder", config.config_path / config_.filename,
                                             config.GetSessionOptions(config_.session_options),
                                             std::vector<std::string>{config_.inputs.encoder_step, config_.inputs.targets, config_.inputs.target_length,
                                                                      config_.inputs.states_1, config_.inputs.states_2},
                                             std::vector<std::string>{config_.outputs.logits, config_.outputs.states_1, config_.outputs.states_2})} {
}

OnnxDecoderJoint::~OnnxDecoderJoint() = default;

DecoderStepOutput OnnxDecoderJoint::Run(std::span<const float> encoder_step, const DecoderState& state) {
  if (static_cast<int64_t>(encoder_step.size()) != encoder_hidden_size_)
    throw InferenceError("decoder", MakeString("encoder step has ", encoder_step.size(), " values, expected ", encoder_hidden_size_));
  if (state.state1.size() != StateSize() || state.state2.size() != StateSize())
    throw InferenceError("decoder", MakeString("decoder states must hold ", StateSize(), " values"));

  int32_t target = state.last_token;
  int32_t target_length = 1;

  DecoderStepOutput output;
  output.logits.resize(logits_size_);
  output.state1.resize(StateSize());
  output.state2.resize(StateSize());

  // onnxruntime never writes to an input, the const_casts only satisfy CreateTensor
  auto as_input = [](std::span<const float> values) { return std::span<float>{const_cast<float*>(values.data()), values.size()}; };

  std::array<Ort::Value, 5> inputs{
      CreateTensorView(as_input(encoder_step), {1, encoder_hidden_size_, 1}),
      CreateTensorView(std::span<int32_t>{&target, 1}, {1, 1}),
      CreateTensorView(std::span<int32_t>{&target_length, 1}, {1}),
      CreateTensorView(as_input(state.state1), state_shape_),
      CreateTensorView(as_input(state.state2), state_shape_)};
  std::array<Ort::Value, 3> outputs{
      CreateTensorView(std::span<float>{output.logits}, {1, 1, 1, logits_size_}),
      CreateTensorView(std::span<float>{output.state1}, state_shape_),
      CreateTensorView(std::span<float>{output.state2}, state_shape_)};

  session_->Run(inputs, outputs);
  return output;
}

}  // namespace Transcribe
