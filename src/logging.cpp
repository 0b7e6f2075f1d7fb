// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include "logging.h"

#include <cassert>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace Transcribe {

LogItems g_log;

static std::ostream*& GlobalLogStreamPtr() {
  static std::ostream* stream = &std::cerr;
  return stream;
}

static std::unique_ptr<std::ofstream> gp_logfile;
static CallbackFn gp_callback{};

// Custom stream that calls gp_callback on every line of output
struct CallbackStream : std::ostream {
  CallbackStream() : std::ostream{&m_buffer} {}

  struct CustomBuffer : std::stringbuf {
    int sync() override {
      auto string = str();
      if (gp_callback)
        gp_callback(string.c_str(), string.size());
      str("");
      return 0;
    }
  };

  CustomBuffer m_buffer;
} gp_callback_stream;

static void SetLogStream() {
  if (gp_callback)
    GlobalLogStreamPtr() = &gp_callback_stream;
  else if (gp_logfile)
    GlobalLogStreamPtr() = gp_logfile.get();
  else
    GlobalLogStreamPtr() = &std::cerr;
}

namespace {

struct BoolOption {
  std::string_view name;
  bool LogItems::*member;
};

// Every switch of LogItems, by the name used in SetLogBool and printed in the log entries
constexpr BoolOption bool_options[] = {
    {"enabled", &LogItems::enabled},
    {"ansi_tags", &LogItems::ansi_tags},
    {"warning", &LogItems::warning},
    {"audio_info", &LogItems::audio_info},
    {"session_create", &LogItems::session_create},
    {"model_input_shapes", &LogItems::model_input_shapes},
    {"model_output_shapes", &LogItems::model_output_shapes},
    {"decoder_steps", &LogItems::decoder_steps},
    {"stage_timing", &LogItems::stage_timing},
    {"transcript", &LogItems::transcript},
};

}  // namespace

void SetLogBool(std::string_view name, bool value) {
  for (auto& option : bool_options) {
    if (option.name == name) {
      g_log.*option.member = value;
      return;
    }
  }
  throw std::runtime_error("Unknown log option: " + std::string(name));
}

void SetLogString(std::string_view name, std::string_view value) {
  if (name == "filename") {
    if (value.empty())
      gp_logfile.reset();
    else {
      auto logfile = std::make_unique<std::ofstream>(std::string(value));
      if (!logfile->is_open())
        throw std::runtime_error("Unable to open log file: " + std::string(value));
      gp_logfile = std::move(logfile);
      // If a filename was provided, log callback will be disabled
      gp_callback = nullptr;
    }

    SetLogStream();
  } else
    throw std::runtime_error("Unknown log option: " + std::string(name));
}

void SetLogCallback(CallbackFn fn) {
  gp_callback = fn;
  // If a callback was provided, file logging will be disabled
  if (gp_callback) {
    gp_logfile.reset();
  }

  SetLogStream();
}

std::ostream& operator<<(std::ostream& stream, SGR sgr_code) {
  if (g_log.ansi_tags) {
    stream << "\x1b[" << static_cast<int>(sgr_code) << 'm';
  }
  return stream;
}

std::ostream& Log(std::string_view label, std::string_view string) {
  assert(g_log.enabled);

  auto& stream = *GlobalLogStreamPtr();
  // Warnings are yellow, transcripts green, everything else blue
  const SGR background = label == "warning" ? SGR::Bg_Yellow : label == "transcript" ? SGR::Bg_Green : SGR::Bg_Blue;
  stream << SGR::Bold << background << "  " << label << "  " << SGR::Reset << ' ';
  if (!string.empty())
    stream << string << std::endl;
  return stream;
}

}  // namespace Transcribe
