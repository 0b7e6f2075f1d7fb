// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once
/*
 * General purpose logging for the transcriber
 *
 * The two functions to access the log are at the top, SetLogBool and SetLogString.
 * These functions modify the variables in the global LogItems structure.
 *
 * For example, to enable logging, just SetLogBool("enabled", true)
 * To dump the shapes of every session input, SetLogBool("model_input_shapes", true)
 *
 * NOTE: The names in LogItems must match the strings in the APIs and the strings displayed for log entries.
 *       This makes it easy to know what option is displaying which data, and to easily know how to turn options off.
 *
 * Logging to a file is special: SetLogString("filename", "path") as "filename" is not a string in LogItems
 *
 * COLOR: Output uses ANSI SGR terminal codes, see 'struct SGR' below. "warning" messages will appear in yellow,
 *        transcripts in green.
 *        There is no red for errors, as errors are exceptions.
 */
#include <cstddef>
#include <ostream>
#include <string_view>

namespace Transcribe {

using CallbackFn = void (*)(const char* string, size_t length);

void SetLogBool(std::string_view name, bool value);
void SetLogString(std::string_view name, std::string_view value);
void SetLogCallback(CallbackFn callback);

struct LogItems {
  // Special log related entries
  bool enabled{};        // Global on/off for all logging
  bool ansi_tags{true};  // Use ansi SGR color & style tags to make console output easier to read
  bool warning{true};    // warning messages, like config values that were set but don't apply

  // Loggable actions, will always have the name below with the log entry
  bool audio_info{};           // Container format, channel count, sample rate and bit depth of every decoded WAV
  bool session_create{};       // Model path and options of every inference session that is created
  bool model_input_shapes{};   // Input tensor names & shapes before a session runs
  bool model_output_shapes{};  // Output tensor names & shapes, and the valid lengths read back after a session runs
  bool decoder_steps{};        // Every greedy decoder decision (blank, repeat, emit). Very verbose
  bool stage_timing{};         // Wall time spent in every pipeline stage
  bool transcript{};           // The final text of every transcription
};

extern LogItems g_log;

// Ansi SGR (Set Graphics Rendition) escape codes to colorize the logs when sent to a console
enum struct SGR : int {
  Reset = 0,
  Bold = 1,
  Bg_Green = 42,
  Bg_Yellow = 43,
  Bg_Blue = 44,
};

std::ostream& operator<<(std::ostream& stream, SGR sgr_code);

// Writes the label, then text and a newline when text isn't empty. More can be streamed to the returned stream.
std::ostream& Log(std::string_view label, std::string_view text = {});
}  // namespace Transcribe
