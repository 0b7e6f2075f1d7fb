// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "preprocessor.h"
#include "onnx_session.h"
#include "../errors.h"
#include "../logging.h"
#include "../string_utils.h"

#include <array>

namespace Transcribe {

OnnxPreprocessor::OnnxPreprocessor(const Config& config)
    : config_{config.model.preprocessor},
      session_{std::make_unique<OnnxSession>("preprocessor", config.config_path / config_.filename,
                                             config.GetSessionOptions(config_.session_options),
                                             std::vector<std::string>{config_.inputs.waveforms, config_.inputs.waveforms_length},
                                             std::vector<std::string>{config_.outputs.features, config_.outputs.features_length})} {
}

OnnxPreprocessor::~OnnxPreprocessor() = default;

AudioFeatures OnnxPreprocessor::Run(std::span<const float> samples) {
  int64_t sample_count = static_cast<int64_t>(samples.size());

  AudioFeatures features;
  features.num_mels = config_.num_mels;
  features.frames = FrameCount(sample_count, config_.hop_length);
  features.data.resize(features.num_mels * features.frames);
  int64_t features_length{};

  // onnxruntime never writes to an input, the const_cast only satisfies CreateTensor
  std::array<Ort::Value, 2> inputs{
      CreateTensorView(std::span<float>{const_cast<float*>(samples.data()), samples.size()}, {1, sample_count}),
      CreateTensorView(std::span<int64_t>{&sample_count, 1}, {1})};
  std::array<Ort::Value, 2> outputs{
      CreateTensorView(std::span<float>{features.data}, {1, features.num_mels, features.frames}),
      CreateTensorView(std::span<int64_t>{&features_length, 1}, {1})};

  session_->Run(inputs, outputs);

  if (features_length < 0 || features_length > features.frames)
    throw InferenceError("preprocessor", MakeString("valid feature length ", features_length, " is outside [0, ", features.frames, "]"));
  features.valid_frames = features_length;

  if (g_log.enabled && g_log.model_output_shapes)
    Log("model_output_shapes", MakeString("preprocessor valid frames: ", features.valid_frames, " of ", features.frames));

  return features;
}

}  // namespace Transcribe
