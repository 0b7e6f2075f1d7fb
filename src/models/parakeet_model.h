// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../config.h"
#include "decoder_joint.h"
#include "encoder.h"
#include "preprocessor.h"
#include "vocabulary.h"

namespace Transcribe {

struct ModelFile {
  std::string name;  // Display name, like "Encoder Data"
  std::filesystem::path path;
};

// Parakeet TDT speech to text: WAV bytes in, text out.
//
// The sessions are created once by LoadModels and reused by every call. A transcription holds a lock for its
// whole pipeline, so concurrent callers are served one after the other.
struct ParakeetModel {
  explicit ParakeetModel(const std::filesystem::path& model_path, std::string_view json_overlay = {});
  explicit ParakeetModel(std::unique_ptr<Config> config);

  // For pipelines built outside of LoadModels. The stages are used as given, LoadModels must not be called.
  ParakeetModel(std::unique_ptr<Config> config, Vocabulary vocabulary,
                std::unique_ptr<Preprocessor> preprocessor, std::unique_ptr<Encoder> encoder, std::unique_ptr<DecoderJoint> decoder_joint);

  ~ParakeetModel();

  // The artifacts of the model directory, in load order
  std::vector<ModelFile> GetModelFiles() const;
  // The artifacts of GetModelFiles that don't exist. Empty when everything is in place.
  std::vector<ModelFile> CheckModels() const;

  // Replace the execution providers of every stage, sessions pick them up on the next LoadModels
  void ClearProviders();
  void AppendProvider(std::string_view provider_name);

  // Fails naming every missing file, then loads the vocabulary and creates the three sessions
  void LoadModels();
  void LoadVocabulary();

  bool IsVocabularyLoaded() const;

  std::string TranscribeWav(std::span<const uint8_t> wav_bytes);
  // samples must be mono at the model sample rate and in [-1, 1]
  std::string TranscribeSamples(std::span<const float> samples);
  std::string TranscribeFile(const std::filesystem::path& wav_path);

  const Vocabulary& GetVocabulary() const { return vocabulary_; }

 private:
  std::string RunPipeline(std::span<const float> samples);

  std::unique_ptr<Config> config_;
  Vocabulary vocabulary_;

  std::unique_ptr<Preprocessor> preprocessor_;
  std::unique_ptr<Encoder> encoder_;
  std::unique_ptr<DecoderJoint> decoder_joint_;

  mutable std::mutex mutex_;
};

}  // namespace Transcribe
