// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "wav_reader.h"
#include "../errors.h"
#include "../logging.h"
#include "../string_utils.h"

#include <cstring>
#include <fstream>
#include <limits>
#include <optional>

namespace Transcribe {

namespace {

constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 0x0003;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

constexpr size_t RiffHeaderSize = 12;
constexpr size_t ChunkHeaderSize = 8;
constexpr size_t FmtChunkMinSize = 16;
constexpr size_t FmtExtensibleSize = 40;
constexpr size_t SubFormatOffset = 24;  // Offset of the sub format GUID inside an extensible fmt chunk

uint16_t ReadU16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t ReadU32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool IsTag(const uint8_t* p, const char (&tag)[5]) {
  return std::memcmp(p, tag, 4) == 0;
}

WavFormat ParseFmtChunk(std::span<const uint8_t> chunk) {
  if (chunk.size() < FmtChunkMinSize)
    throw DecodeError(MakeString("fmt chunk is ", chunk.size(), " bytes, expected at least ", FmtChunkMinSize));

  WavFormat format;
  uint16_t format_tag = ReadU16(chunk.data());
  format.channels = ReadU16(chunk.data() + 2);
  const uint32_t sample_rate = ReadU32(chunk.data() + 4);
  format.block_align = ReadU16(chunk.data() + 12);
  format.bits_per_sample = ReadU16(chunk.data() + 14);

  if (format_tag == WAVE_FORMAT_EXTENSIBLE) {
    if (chunk.size() < FmtExtensibleSize)
      throw DecodeError(MakeString("extensible fmt chunk is ", chunk.size(), " bytes, expected ", FmtExtensibleSize));
    // The first two bytes of the sub format GUID carry the plain format tag
    format_tag = ReadU16(chunk.data() + SubFormatOffset);
    format.extensible = true;
  }

  if (format.channels == 0)
    throw DecodeError("channel count is zero");
  if (sample_rate == 0)
    throw DecodeError("sample rate is zero");
  if (sample_rate > static_cast<uint32_t>(std::numeric_limits<int>::max()))
    throw DecodeError(MakeString("sample rate ", sample_rate, " is out of range"));
  format.sample_rate = static_cast<int>(sample_rate);

  switch (format_tag) {
    case WAVE_FORMAT_PCM:
      format.encoding = WavEncoding::Pcm;
      if (format.bits_per_sample != 8 && format.bits_per_sample != 16 && format.bits_per_sample != 24 && format.bits_per_sample != 32)
        throw DecodeError(MakeString("unsupported PCM bit depth ", format.bits_per_sample));
      break;
    case WAVE_FORMAT_IEEE_FLOAT:
      format.encoding = WavEncoding::Float;
      if (format.bits_per_sample != 32 && format.bits_per_sample != 64)
        throw DecodeError(MakeString("unsupported float bit depth ", format.bits_per_sample));
      break;
    default:
      throw DecodeError(MakeString("unsupported format tag 0x", std::hex, format_tag));
  }

  // Some writers leave block_align at zero, it is fully determined by the other fields for the formats we accept
  const int expected_block_align = format.channels * format.BytesPerSample();
  if (format.block_align != expected_block_align) {
    if (g_log.enabled && g_log.warning)
      Log("warning", MakeString("WAV block_align is ", format.block_align, ", using ", expected_block_align));
    format.block_align = expected_block_align;
  }

  return format;
}

}  // namespace

WavView ParseWav(std::span<const uint8_t> wav_bytes) {
  if (wav_bytes.size() < RiffHeaderSize || !IsTag(wav_bytes.data(), "RIFF") || !IsTag(wav_bytes.data() + 8, "WAVE"))
    throw DecodeError("not a RIFF/WAVE container");

  std::optional<WavFormat> format;
  std::optional<std::span<const uint8_t>> data;

  size_t offset = RiffHeaderSize;
  while (offset + ChunkHeaderSize <= wav_bytes.size() && !(format && data)) {
    const uint8_t* header = wav_bytes.data() + offset;
    const size_t available = wav_bytes.size() - offset - ChunkHeaderSize;
    size_t chunk_size = ReadU32(header + 4);

    if (IsTag(header, "fmt ")) {
      if (chunk_size > available)
        throw DecodeError("fmt chunk is truncated");
      format = ParseFmtChunk(wav_bytes.subspan(offset + ChunkHeaderSize, chunk_size));
    } else if (IsTag(header, "data")) {
      // Recorders that stream to disk often never patch the data size, take what is actually there
      if (chunk_size > available)
        chunk_size = available;
      data = wav_bytes.subspan(offset + ChunkHeaderSize, chunk_size);
    }

    // Chunks are word aligned
    offset += ChunkHeaderSize + chunk_size + (chunk_size & 1);
  }

  if (!format)
    throw DecodeError("missing fmt chunk");
  if (!data)
    throw DecodeError("missing data chunk");

  WavView view{*format, *data};
  // Drop a trailing partial frame
  view.data = view.data.first(view.FrameCount() * view.format.block_align);

  if (g_log.enabled && g_log.audio_info) {
    Log("audio_info", MakeString(view.format.encoding == WavEncoding::Float ? "float" : "pcm",
                                 view.format.extensible ? " (extensible)" : "",
                                 " channels: ", view.format.channels,
                                 " sample_rate: ", view.format.sample_rate,
                                 " bits_per_sample: ", view.format.bits_per_sample,
                                 " frames: ", view.FrameCount()));
  }

  return view;
}

std::vector<uint8_t> ReadWavFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open())
    throw std::runtime_error("Error opening " + path.string());

  std::streamsize const size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(static_cast<size_t>(size));
  if (!file.read(reinterpret_cast<char*>(buffer.data()), size))
    throw std::runtime_error("Error reading " + path.string());
  return buffer;
}

}  // namespace Transcribe
