// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ort_transcribe_c.h"
#include "transcribe.h"

namespace Transcribe {

struct Result {
  Result(const char* what, OtrErrorKind kind, std::string stage = {}) : what_{what}, kind_{kind}, stage_{std::move(stage)} {}
  std::string what_;
  OtrErrorKind kind_;
  std::string stage_;
};

}  // namespace Transcribe

// Allocate a null terminated C string from a std::string
const char* AllocOtrString(const std::string& string) {
  auto length = string.length() + 1;
  auto cstr_buffer = std::make_unique<char[]>(length);
  std::memcpy(cstr_buffer.get(), string.c_str(), length);
  return cstr_buffer.release();
}

// This type can't be created or copied by value, only by pointer
struct OtrAbstract {
  OtrAbstract() = delete;
  OtrAbstract(const OtrAbstract&) = delete;
  void operator=(const OtrAbstract&) = delete;
};

struct OtrResult : Transcribe::Result, OtrAbstract {};
struct OtrStringArray : std::vector<std::string>, OtrAbstract {};
struct OtrTranscriber : Transcribe::ParakeetModel, OtrAbstract {};

// Helper function to return a unique pointer as a raw pointer. It won't compile if the types are wrong.
template <typename T, typename U>
T* ReturnUnique(std::unique_ptr<U> p) {
  return static_cast<T*>(p.release());
}

template <typename... Args>
OtrResult* MakeResult(Args&&... args) {
  return ReturnUnique<OtrResult>(std::make_unique<Transcribe::Result>(std::forward<Args>(args)...));
}

extern "C" {

#define OTR_TRY try {
#define OTR_CATCH                                                          \
  }                                                                        \
  catch (const Transcribe::DecodeError& e) {                               \
    return MakeResult(e.what(), OtrErrorKind_decode);                      \
  }                                                                        \
  catch (const Transcribe::VocabLoadError& e) {                            \
    return MakeResult(e.what(), OtrErrorKind_vocab_load);                  \
  }                                                                        \
  catch (const Transcribe::InferenceError& e) {                            \
    return MakeResult(e.what(), OtrErrorKind_inference, e.Stage());        \
  }                                                                        \
  catch (const Transcribe::EmptyVocabularyError& e) {                      \
    return MakeResult(e.what(), OtrErrorKind_empty_vocabulary);            \
  }                                                                        \
  catch (const std::exception& e) {                                        \
    return MakeResult(e.what(), OtrErrorKind_generic);                     \
  }

void OTR_API_CALL OtrShutdown() {
  Transcribe::Shutdown();
}

const char* OTR_API_CALL OtrResultGetError(const OtrResult* result) {
  return result->what_.c_str();
}

OtrErrorKind OTR_API_CALL OtrResultGetErrorKind(const OtrResult* result) {
  return result->kind_;
}

const char* OTR_API_CALL OtrResultGetStage(const OtrResult* result) {
  return result->stage_.c_str();
}

OtrResult* OTR_API_CALL OtrSetLogBool(const char* name, bool value) {
  OTR_TRY
  Transcribe::SetLogBool(name, value);
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrSetLogString(const char* name, const char* value) {
  OTR_TRY
  // Turn nullptr into an empty std::string (nullptr directly will crash the std::string constructor)
  Transcribe::SetLogString(name, value ? value : std::string{});
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrCreateTranscriber(const char* model_path, OtrTranscriber** out) {
  return OtrCreateTranscriberWithOverlay(model_path, nullptr, out);
}

OtrResult* OTR_API_CALL OtrCreateTranscriberWithOverlay(const char* model_path, const char* json_overlay, OtrTranscriber** out) {
  OTR_TRY
  if (!model_path)
    throw std::runtime_error("model_path must not be null");
  *out = ReturnUnique<OtrTranscriber>(std::make_unique<Transcribe::ParakeetModel>(model_path, json_overlay ? json_overlay : std::string_view{}));
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrTranscriberCheckModels(const OtrTranscriber* transcriber, OtrStringArray** missing_files) {
  OTR_TRY
  auto missing = std::make_unique<std::vector<std::string>>();
  for (auto& file : transcriber->CheckModels())
    missing->push_back(file.path.string());
  *missing_files = ReturnUnique<OtrStringArray>(std::move(missing));
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrTranscriberClearProviders(OtrTranscriber* transcriber) {
  OTR_TRY
  transcriber->ClearProviders();
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrTranscriberAppendProvider(OtrTranscriber* transcriber, const char* provider) {
  OTR_TRY
  if (!provider)
    throw std::runtime_error("provider must not be null");
  transcriber->AppendProvider(provider);
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrTranscriberLoadModels(OtrTranscriber* transcriber) {
  OTR_TRY
  transcriber->LoadModels();
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrTranscribeWav(OtrTranscriber* transcriber, const uint8_t* wav_data, size_t wav_size, const char** out) {
  OTR_TRY
  *out = AllocOtrString(transcriber->TranscribeWav(std::span<const uint8_t>{wav_data, wav_size}));
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrTranscribeSamples(OtrTranscriber* transcriber, const float* samples, size_t sample_count, const char** out) {
  OTR_TRY
  *out = AllocOtrString(transcriber->TranscribeSamples(std::span<const float>{samples, sample_count}));
  return nullptr;
  OTR_CATCH
}

OtrResult* OTR_API_CALL OtrTranscribeFile(OtrTranscriber* transcriber, const char* wav_path, const char** out) {
  OTR_TRY
  *out = AllocOtrString(transcriber->TranscribeFile(wav_path));
  return nullptr;
  OTR_CATCH
}

size_t OTR_API_CALL OtrStringArrayGetCount(const OtrStringArray* string_array) {
  return string_array->size();
}

OtrResult* OTR_API_CALL OtrStringArrayGetString(const OtrStringArray* string_array, size_t index, const char** out) {
  OTR_TRY
  *out = string_array->at(index).c_str();
  return nullptr;
  OTR_CATCH
}

void OTR_API_CALL OtrDestroyResult(OtrResult* p) { delete p; }
void OTR_API_CALL OtrDestroyString(const char* p) { delete[] p; }
void OTR_API_CALL OtrDestroyStringArray(OtrStringArray* p) { delete p; }
void OTR_API_CALL OtrDestroyTranscriber(OtrTranscriber* p) { delete p; }

}  // extern "C"
