// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "audio_normalizer.h"
#include "../errors.h"
#include "../logging.h"
#include "../string_utils.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace Transcribe {

namespace {

template <typename T>
T Load(const uint8_t* p) {
  T value;
  std::memcpy(&value, p, sizeof(T));
  return value;
}

float PcmSample(const uint8_t* p, int bits_per_sample) {
  switch (bits_per_sample) {
    case 8:
      return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
    case 16:
      return static_cast<float>(static_cast<int16_t>(p[0] | (p[1] << 8))) / 32768.0f;
    case 24: {
      // Sign extend through the top byte of an int32
      int32_t value = static_cast<int32_t>((static_cast<uint32_t>(p[0]) << 8) | (static_cast<uint32_t>(p[1]) << 16) | (static_cast<uint32_t>(p[2]) << 24)) >> 8;
      return static_cast<float>(value) / 8388608.0f;
    }
    case 32:
      return static_cast<float>(static_cast<double>(Load<int32_t>(p)) / 2147483648.0);
  }
  throw DecodeError(MakeString("unsupported PCM bit depth ", bits_per_sample));
}

}  // namespace

std::vector<float> DecodeSamples(const WavView& wav) {
  const auto& format = wav.format;
  const size_t bytes_per_sample = format.BytesPerSample();
  const size_t count = wav.data.size() / bytes_per_sample;

  std::vector<float> samples(count);
  const uint8_t* p = wav.data.data();

  if (format.encoding == WavEncoding::Float) {
    if (format.bits_per_sample == 32) {
      for (size_t i = 0; i < count; i++, p += bytes_per_sample)
        samples[i] = Load<float>(p);
    } else {
      for (size_t i = 0; i < count; i++, p += bytes_per_sample)
        samples[i] = static_cast<float>(Load<double>(p));
    }
    return samples;
  }

  for (size_t i = 0; i < count; i++, p += bytes_per_sample)
    samples[i] = PcmSample(p, format.bits_per_sample);
  return samples;
}

std::vector<float> DownmixToMono(std::vector<float> interleaved, int channels) {
  if (channels <= 1)
    return interleaved;

  const size_t frames = interleaved.size() / channels;
  std::vector<float> mono(frames);
  for (size_t i = 0; i < frames; i++) {
    float sum = 0.0f;
    for (int c = 0; c < channels; c++)
      sum += interleaved[i * channels + c];
    mono[i] = sum / static_cast<float>(channels);
  }
  return mono;
}

std::vector<float> ResampleLinear(std::vector<float> input, int source_rate, int target_rate) {
  if (source_rate == target_rate || input.empty())
    return input;

  const double ratio = static_cast<double>(source_rate) / static_cast<double>(target_rate);
  const size_t output_length = static_cast<size_t>(static_cast<double>(input.size()) / ratio);
  const size_t last = input.size() - 1;

  std::vector<float> output(output_length);
  for (size_t i = 0; i < output_length; i++) {
    const double position = static_cast<double>(i) * ratio;
    const size_t low = std::min(static_cast<size_t>(position), last);
    const size_t high = std::min(low + 1, last);
    const double fraction = position - static_cast<double>(low);
    output[i] = static_cast<float>((1.0 - fraction) * input[low] + fraction * input[high]);
  }
  return output;
}

std::vector<float> NormalizeWav(std::span<const uint8_t> wav_bytes, int target_rate) {
  auto wav = ParseWav(wav_bytes);

  auto samples = DownmixToMono(DecodeSamples(wav), wav.format.channels);
  samples = ResampleLinear(std::move(samples), wav.format.sample_rate, target_rate);

  if (g_log.enabled && g_log.audio_info)
    Log("audio_info", MakeString("normalized ", wav.FrameCount(), " frames to ", samples.size(), " samples at ", target_rate, " Hz"));

  return samples;
}

}  // namespace Transcribe
