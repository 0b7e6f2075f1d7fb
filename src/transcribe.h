// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

// The C++ side of the library, what ort_transcribe_c.cpp and the tests build on
#pragma once

#include "audio/audio_normalizer.h"
#include "audio/wav_reader.h"
#include "config.h"
#include "errors.h"
#include "logging.h"
#include "models/onnx_session.h"
#include "models/parakeet_model.h"
#include "models/vocabulary.h"
#include "tdt_greedy_decoder.h"
