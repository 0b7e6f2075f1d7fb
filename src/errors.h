// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

// Transcription failures. Every one of them is terminal for the current call, nothing is retried internally.

#include <stdexcept>
#include <string>
#include <utility>

namespace Transcribe {

// The audio container is not a WAV file, or is a malformed / unsupported one
struct DecodeError : std::runtime_error {
  explicit DecodeError(const std::string& message) : std::runtime_error("WAV decode error: " + message) {}
};

// The vocabulary table is missing, unreadable or empty
struct VocabLoadError : std::runtime_error {
  explicit VocabLoadError(const std::string& message) : std::runtime_error("Vocabulary load error: " + message) {}
};

// Creating or running one of the inference sessions failed. The stage is "preprocessor", "encoder" or "decoder".
struct InferenceError : std::runtime_error {
  InferenceError(std::string stage, const std::string& message)
      : std::runtime_error(stage + " error: " + message), stage_{std::move(stage)} {}

  const std::string& Stage() const noexcept { return stage_; }

 private:
  std::string stage_;
};

// A transcription was requested before the vocabulary was loaded
struct EmptyVocabularyError : std::runtime_error {
  EmptyVocabularyError() : std::runtime_error("Vocabulary not loaded, call LoadModels or LoadVocabulary first") {}
};

}  // namespace Transcribe
