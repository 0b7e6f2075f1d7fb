// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace Transcribe {

enum struct WavEncoding {
  Pcm,    // Integer samples, 8 bit is unsigned, wider ones are signed little endian
  Float,  // IEEE 754 float32 or float64
};

struct WavFormat {
  WavEncoding encoding{WavEncoding::Pcm};
  bool extensible{};  // Format tag was WAVE_FORMAT_EXTENSIBLE, the encoding comes from its sub format
  int channels{};
  int sample_rate{};
  int bits_per_sample{};
  int block_align{};  // Bytes per frame, channels * bytes per sample

  int BytesPerSample() const { return bits_per_sample / 8; }
};

// A parsed RIFF/WAVE container. data points into the buffer passed to ParseWav and is only valid while that buffer is.
struct WavView {
  WavFormat format;
  std::span<const uint8_t> data;  // Whole frames only

  size_t FrameCount() const { return data.size() / format.block_align; }
};

// Throws DecodeError for anything that isn't a supported RIFF/WAVE container
WavView ParseWav(std::span<const uint8_t> wav_bytes);

// Reads a whole file into memory, no decoding is done here
std::vector<uint8_t> ReadWavFile(const std::filesystem::path& path);

}  // namespace Transcribe
