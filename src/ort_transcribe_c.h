// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <stdint.h>
#include <cstddef>

#ifdef __cplusplus
extern "C" {
#endif

#ifdef _WIN32
#ifdef BUILDING_ORT_TRANSCRIBE_C
#define OTR_EXPORT __declspec(dllexport)
#else
#define OTR_EXPORT __declspec(dllimport)
#endif
#define OTR_API_CALL _stdcall
#else
// To make symbols visible on macOS/iOS
#ifdef __APPLE__
#define OTR_EXPORT __attribute__((visibility("default")))
#else
#define OTR_EXPORT
#endif
#define OTR_API_CALL
#endif

// ONNX Runtime Transcribe C API
// A transcriber can be shared between threads, its transcriptions run one at a time.

typedef enum OtrErrorKind {
  OtrErrorKind_none,
  OtrErrorKind_generic,           // Configuration, file access or argument errors
  OtrErrorKind_decode,            // The audio is not a supported WAV container
  OtrErrorKind_vocab_load,        // The vocabulary is missing, unreadable or empty
  OtrErrorKind_inference,         // A session failed to load or run, see OtrResultGetStage
  OtrErrorKind_empty_vocabulary,  // Transcription was requested before the models were loaded
} OtrErrorKind;

typedef struct OtrResult OtrResult;
typedef struct OtrTranscriber OtrTranscriber;
typedef struct OtrStringArray OtrStringArray;

/* \brief Call this on process exit to cleanly shutdown the library & its onnxruntime usage
 */
OTR_EXPORT void OTR_API_CALL OtrShutdown();

/*
 * \param[in] result OtrResult that contains the error message.
 * \return Error message contained in the OtrResult. The const char* is owned by the OtrResult
 *         and will be freed when the OtrResult is destroyed.
 */
OTR_EXPORT const char* OTR_API_CALL OtrResultGetError(const OtrResult* result);
OTR_EXPORT OtrErrorKind OTR_API_CALL OtrResultGetErrorKind(const OtrResult* result);

/*
 * \return "preprocessor", "encoder" or "decoder" for OtrErrorKind_inference errors, an empty string otherwise.
 *         Owned by the OtrResult.
 */
OTR_EXPORT const char* OTR_API_CALL OtrResultGetStage(const OtrResult* result);

/*
 * \param[in] Set logging options, see logging.h 'struct LogItems' for the list of available options
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrSetLogBool(const char* name, bool value);
OTR_EXPORT OtrResult* OTR_API_CALL OtrSetLogString(const char* name, const char* value);

OTR_EXPORT void OTR_API_CALL OtrDestroyResult(OtrResult*);
OTR_EXPORT void OTR_API_CALL OtrDestroyString(const char*);

/*
 * \brief Creates a transcriber for a model directory. Nothing is loaded yet, see OtrTranscriberLoadModels.
 * \param[in] model_path Directory holding the model files and an optional transcribe_config.json
 * \param[out] out The created transcriber
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrCreateTranscriber(const char* model_path, OtrTranscriber** out);

/*
 * \brief Same as OtrCreateTranscriber, with a json document applied on top of transcribe_config.json
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrCreateTranscriberWithOverlay(const char* model_path, const char* json_overlay, OtrTranscriber** out);
OTR_EXPORT void OTR_API_CALL OtrDestroyTranscriber(OtrTranscriber* transcriber);

/*
 * \brief Removes the execution providers of every stage, leaving the CPU. Takes effect on the next OtrTranscriberLoadModels.
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrTranscriberClearProviders(OtrTranscriber* transcriber);

/*
 * \brief Adds an execution provider (e.g. "cuda") to every stage, after the ones already listed.
 *        Takes effect on the next OtrTranscriberLoadModels.
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrTranscriberAppendProvider(OtrTranscriber* transcriber, const char* provider);

/*
 * \brief Lists the model files that are not present
 * \param[out] missing_files Paths of the missing files, an empty array when the model directory is complete
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrTranscriberCheckModels(const OtrTranscriber* transcriber, OtrStringArray** missing_files);

/*
 * \brief Loads the vocabulary and creates the inference sessions. Fails listing the missing files if any.
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrTranscriberLoadModels(OtrTranscriber* transcriber);

/*
 * \brief Transcribes a complete WAV file image
 * \param[out] out UTF-8 text, destroy it with OtrDestroyString
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrTranscribeWav(OtrTranscriber* transcriber, const uint8_t* wav_data, size_t wav_size, const char** out);

/*
 * \brief Transcribes audio that is already 16kHz mono float in [-1, 1]
 * \param[out] out UTF-8 text, destroy it with OtrDestroyString
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrTranscribeSamples(OtrTranscriber* transcriber, const float* samples, size_t sample_count, const char** out);

/*
 * \brief Reads and transcribes a WAV file
 * \param[out] out UTF-8 text, destroy it with OtrDestroyString
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrTranscribeFile(OtrTranscriber* transcriber, const char* wav_path, const char** out);

OTR_EXPORT size_t OTR_API_CALL OtrStringArrayGetCount(const OtrStringArray* string_array);

/*
 * \param[out] out The string at index, owned by the OtrStringArray
 */
OTR_EXPORT OtrResult* OTR_API_CALL OtrStringArrayGetString(const OtrStringArray* string_array, size_t index, const char** out);
OTR_EXPORT void OTR_API_CALL OtrDestroyStringArray(OtrStringArray* string_array);

#ifdef __cplusplus
}
#endif
