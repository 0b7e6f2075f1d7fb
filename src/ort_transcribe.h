// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#if __cplusplus >= 202002L
#include <span>
#endif

#include "ort_transcribe_c.h"

// Transcribe C++ API
//
// This is a zero cost wrapper around the C API, and provides for a set of C++ classes with automatic resource management

/* A simple end to end example of how to transcribe a recording:
 *
 * auto transcriber = OtrTranscriber::Create("parakeet-tdt-0.6b-v2");
 * transcriber->LoadModels();
 *
 * auto text = transcriber->TranscribeFile("recording.wav");
 * std::cout << text << std::endl;
 */

// The types defined in this file are to give us zero overhead C++ style interfaces around an opaque C pointer.
// For example, there is no actual 'OtrTranscriber' type defined anywhere, so we create a fake definition here
// that lets users have a C++ style OtrTranscriber type that can be held in a std::unique_ptr.
//
// This OtrAbstract struct is to prevent accidentally trying to use them by value.
struct OtrAbstract {
  OtrAbstract() = delete;
  OtrAbstract(const OtrAbstract&) = delete;
  void operator=(const OtrAbstract&) = delete;
};

struct OtrResult : OtrAbstract {
  const char* GetError() const { return OtrResultGetError(this); }
  OtrErrorKind GetErrorKind() const { return OtrResultGetErrorKind(this); }
  const char* GetStage() const { return OtrResultGetStage(this); }
  static void operator delete(void* p) { OtrDestroyResult(reinterpret_cast<OtrResult*>(p)); }
};

// Thrown by OtrCheckResult, keeps the error kind and stage of the C API result
struct OtrException : std::runtime_error {
  OtrException(const OtrResult& result)
      : std::runtime_error(result.GetError()), kind_{result.GetErrorKind()}, stage_{result.GetStage()} {}

  OtrErrorKind Kind() const { return kind_; }
  const std::string& Stage() const { return stage_; }

 private:
  OtrErrorKind kind_;
  std::string stage_;
};

// This is used to turn OtrResult return values from the C API into std::runtime_error exceptions
inline void OtrCheckResult(OtrResult* result) {
  if (result) {
    std::unique_ptr<OtrResult> p_result{result};  // Take ownership so it's destroyed properly
    throw OtrException(*p_result);
  }
}

// Takes ownership of a string returned by the C API
inline std::string OtrTakeString(const char* p) {
  std::string string{p};
  OtrDestroyString(p);
  return string;
}

struct OtrStringArray : OtrAbstract {
  size_t Count() const {
    return OtrStringArrayGetCount(this);
  }

  const char* Get(size_t index) const {
    const char* out;
    OtrCheckResult(OtrStringArrayGetString(this, index, &out));
    return out;
  }

  static void operator delete(void* p) { OtrDestroyStringArray(reinterpret_cast<OtrStringArray*>(p)); }
};

struct OtrTranscriber : OtrAbstract {
  static std::unique_ptr<OtrTranscriber> Create(const char* model_path) {
    OtrTranscriber* p;
    OtrCheckResult(OtrCreateTranscriber(model_path, &p));
    return std::unique_ptr<OtrTranscriber>(p);
  }

  static std::unique_ptr<OtrTranscriber> Create(const char* model_path, const char* json_overlay) {
    OtrTranscriber* p;
    OtrCheckResult(OtrCreateTranscriberWithOverlay(model_path, json_overlay, &p));
    return std::unique_ptr<OtrTranscriber>(p);
  }

  // Paths of the model files that don't exist
  std::vector<std::string> CheckModels() const {
    OtrStringArray* p;
    OtrCheckResult(OtrTranscriberCheckModels(this, &p));
    std::unique_ptr<OtrStringArray> missing{p};

    std::vector<std::string> paths;
    for (size_t i = 0; i < missing->Count(); i++)
      paths.emplace_back(missing->Get(i));
    return paths;
  }

  void ClearProviders() {
    OtrCheckResult(OtrTranscriberClearProviders(this));
  }

  void AppendProvider(const char* provider) {
    OtrCheckResult(OtrTranscriberAppendProvider(this, provider));
  }

  void LoadModels() {
    OtrCheckResult(OtrTranscriberLoadModels(this));
  }

  std::string TranscribeWav(const uint8_t* wav_data, size_t wav_size) {
    const char* out;
    OtrCheckResult(OtrTranscribeWav(this, wav_data, wav_size, &out));
    return OtrTakeString(out);
  }

  std::string TranscribeSamples(const float* samples, size_t sample_count) {
    const char* out;
    OtrCheckResult(OtrTranscribeSamples(this, samples, sample_count, &out));
    return OtrTakeString(out);
  }

#if __cplusplus >= 202002L
  std::string TranscribeWav(std::span<const uint8_t> wav_data) {
    return TranscribeWav(wav_data.data(), wav_data.size());
  }

  std::string TranscribeSamples(std::span<const float> samples) {
    return TranscribeSamples(samples.data(), samples.size());
  }
#endif

  std::string TranscribeFile(const char* wav_path) {
    const char* out;
    OtrCheckResult(OtrTranscribeFile(this, wav_path, &out));
    return OtrTakeString(out);
  }

  static void operator delete(void* p) { OtrDestroyTranscriber(reinterpret_cast<OtrTranscriber*>(p)); }
};

struct OtrHandle {
  OtrHandle() = default;
  ~OtrHandle() noexcept {
    OtrShutdown();
  }
};

// Global Transcribe API functions

namespace Otr {

inline void SetLogBool(const char* name, bool value) {
  OtrCheckResult(OtrSetLogBool(name, value));
}

inline void SetLogString(const char* name, const char* value) {
  OtrCheckResult(OtrSetLogString(name, value));
}

}  // namespace Otr
