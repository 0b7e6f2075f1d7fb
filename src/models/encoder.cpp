// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "encoder.h"
#include "onnx_session.h"
#include "../errors.h"
#include "../logging.h"
#include "../string_utils.h"

#include <algorithm>
#include <array>

namespace Transcribe {

OnnxEncoder::OnnxEncoder(const Config& config)
    : config_{config.model.encoder},
      session_{std::make_unique<OnnxSession>("encoder", config.config_path / config_.filename,
                                             config.GetSessionOptions(config_.session_options),
                                             std::vector<std::string>{config_.inputs.features, config_.inputs.length},
                                             std::vector<std::string>{config_.outputs.encoded, config_.outputs.encoded_length})} {
}

OnnxEncoder::~OnnxEncoder() = default;

EncodedAudio OnnxEncoder::Run(const AudioFeatures& features) {
  // Crop to the valid frames, the padding past them is not audio
  int64_t length = features.valid_frames;
  std::vector<float> cropped(features.num_mels * length);
  for (int64_t m = 0; m < features.num_mels; m++) {
    auto row = features.data.begin() + m * features.frames;
    std::copy(row, row + length, cropped.begin() + m * length);
  }

  EncodedAudio encoded;
  encoded.hidden_size = config_.hidden_size;
  encoded.frames = FrameCount(length, config_.subsampling_factor);
  encoded.data.resize(encoded.hidden_size * encoded.frames);
  int64_t encoded_length{};

  std::array<Ort::Value, 2> inputs{
      CreateTensorView(std::span<float>{cropped}, {1, features.num_mels, length}),
      CreateTensorView(std::span<int64_t>{&length, 1}, {1})};
  std::array<Ort::Value, 2> outputs{
      CreateTensorView(std::span<float>{encoded.data}, {1, encoded.hidden_size, encoded.frames}),
      CreateTensorView(std::span<int64_t>{&encoded_length, 1}, {1})};

  session_->Run(inputs, outputs);

  if (encoded_length < 0 || encoded_length > encoded.frames)
    throw InferenceError("encoder", MakeString("valid encoded length ", encoded_length, " is outside [0, ", encoded.frames, "]"));
  encoded.valid_frames = encoded_length;

  if (g_log.enabled && g_log.model_output_shapes)
    Log("model_output_shapes", MakeString("encoder valid frames: ", encoded.valid_frames, " of ", encoded.frames));

  return encoded;
}

}  // namespace Transcribe
