// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "wav_reader.h"

namespace Transcribe {

constexpr int ModelSampleRate = 16000;

// Decodes a WAV container into mono float samples in [-1, 1] at target_rate.
// Mono input already at target_rate comes back sample for sample.
std::vector<float> NormalizeWav(std::span<const uint8_t> wav_bytes, int target_rate = ModelSampleRate);

// Interleaved samples of any supported encoding to float, integer PCM is divided by its full scale (32768 for 16 bit)
std::vector<float> DecodeSamples(const WavView& wav);

// Mean of the channels of every frame. Returns the input unchanged for channels == 1.
std::vector<float> DownmixToMono(std::vector<float> interleaved, int channels);

// Linear interpolation, the output has floor(input.size() * target_rate / source_rate) samples
std::vector<float> ResampleLinear(std::vector<float> input, int source_rate, int target_rate);

}  // namespace Transcribe
