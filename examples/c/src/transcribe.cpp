// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "ort_transcribe.h"

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double>;

bool FileExists(const char* path) {
  return static_cast<bool>(std::ifstream(path));
}

struct Arguments {
  std::string model_path;
  std::vector<std::string> wav_paths;
  std::string execution_provider;
  bool verbose{};
};

// An empty provider keeps the ones listed in transcribe_config.json
bool OverridesProviders(const std::string& execution_provider) {
  return !execution_provider.empty() && execution_provider != "follow_config";
}

void PrintResult(const std::string& wav_path, const std::string& text, Duration elapsed) {
  const auto default_precision{std::cout.precision()};
  std::cout << wav_path << std::endl;
  std::cout << "    " << (text.empty() ? "<no speech>" : text) << std::endl;
  std::cout << std::fixed << std::showpoint << std::setprecision(2)
            << "    (" << elapsed.count() << "s)" << std::setprecision(default_precision) << std::endl;
}

// C++ API Example

void CXX_API(const Arguments& arguments) {
  if (arguments.verbose) {
    Otr::SetLogBool("enabled", true);
    Otr::SetLogBool("audio_info", true);
    Otr::SetLogBool("stage_timing", true);
  }

  std::cout << "Creating transcriber..." << std::endl;
  auto transcriber = OtrTranscriber::Create(arguments.model_path.c_str());
  if (OverridesProviders(arguments.execution_provider)) {
    transcriber->ClearProviders();
    transcriber->AppendProvider(arguments.execution_provider.c_str());
  }

  auto missing = transcriber->CheckModels();
  if (!missing.empty()) {
    std::cerr << "Missing model files:" << std::endl;
    for (auto& path : missing)
      std::cerr << "    " << path << std::endl;
    throw std::runtime_error("Model directory is incomplete: " + arguments.model_path);
  }

  std::cout << "Loading models..." << std::endl;
  transcriber->LoadModels();

  for (auto& wav_path : arguments.wav_paths) {
    if (!FileExists(wav_path.c_str()))
      throw std::runtime_error("Audio file not found: " + wav_path);

    auto start = Clock::now();
    auto text = transcriber->TranscribeFile(wav_path.c_str());
    PrintResult(wav_path, text, Clock::now() - start);
  }
}

// C API Example

struct Deleters {
  void operator()(OtrTranscriber* p) {
    OtrDestroyTranscriber(p);
  }
  void operator()(OtrStringArray* p) {
    OtrDestroyStringArray(p);
  }
  void operator()(const char* p) {
    OtrDestroyString(p);
  }
};

using OtrTranscriberPtr = std::unique_ptr<OtrTranscriber, Deleters>;
using OtrStringArrayPtr = std::unique_ptr<OtrStringArray, Deleters>;

void CheckResult(OtrResult* result) {
  if (result) {
    std::string string = OtrResultGetError(result);
    OtrDestroyResult(result);
    throw std::runtime_error(string);
  }
}

void C_API(const Arguments& arguments) {
  if (arguments.verbose) {
    CheckResult(OtrSetLogBool("enabled", true));
    CheckResult(OtrSetLogBool("audio_info", true));
    CheckResult(OtrSetLogBool("stage_timing", true));
  }

  std::cout << "Creating transcriber..." << std::endl;
  OtrTranscriberPtr transcriber;
  {
    OtrTranscriber* p;
    CheckResult(OtrCreateTranscriber(arguments.model_path.c_str(), &p));
    transcriber.reset(p);
  }
  if (OverridesProviders(arguments.execution_provider)) {
    CheckResult(OtrTranscriberClearProviders(transcriber.get()));
    CheckResult(OtrTranscriberAppendProvider(transcriber.get(), arguments.execution_provider.c_str()));
  }

  size_t missing_count;
  {
    OtrStringArray* p;
    CheckResult(OtrTranscriberCheckModels(transcriber.get(), &p));
    OtrStringArrayPtr missing{p};
    missing_count = OtrStringArrayGetCount(missing.get());
    for (size_t i = 0; i < missing_count; i++) {
      const char* path;
      CheckResult(OtrStringArrayGetString(missing.get(), i, &path));
      std::cerr << "Missing model file: " << path << std::endl;
    }
  }
  if (missing_count != 0)
    throw std::runtime_error("Model directory is incomplete: " + arguments.model_path);

  std::cout << "Loading models..." << std::endl;
  CheckResult(OtrTranscriberLoadModels(transcriber.get()));

  for (auto& wav_path : arguments.wav_paths) {
    auto start = Clock::now();
    const char* text;
    CheckResult(OtrTranscribeFile(transcriber.get(), wav_path.c_str(), &text));
    std::unique_ptr<const char, Deleters> owned_text{text};
    PrintResult(wav_path, text, Clock::now() - start);
  }
}

static void print_usage(int /*argc*/, char** argv) {
  std::cerr << "usage: " << argv[0] << " <model_path> <wav_path>... [--ep <execution_provider>] [--verbose]" << std::endl;
  std::cerr << "  model_path:         [required] Path to the folder containing vocab.txt, the onnx models and an optional transcribe_config.json" << std::endl;
  std::cerr << "  wav_path:           [required] One or more WAV files, any sample rate, channel count and bit depth" << std::endl;
  std::cerr << "  execution_provider: [optional] Run every stage on this execution provider (e.g. \"cpu\", \"cuda\")" << std::endl;
  std::cerr << "                      It replaces the providers of transcribe_config.json, their options included." << std::endl;
  std::cerr << "                      If not specified, the provider options of transcribe_config.json will be used." << std::endl;
  std::cerr << "  --verbose:          [optional] Log the audio format and the time spent in every stage" << std::endl;
}

bool parse_args(int argc, char** argv, Arguments& arguments) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--verbose") {
      arguments.verbose = true;
    } else if (arg == "--ep") {
      if (i + 1 >= argc) {
        print_usage(argc, argv);
        return false;
      }
      arguments.execution_provider = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argc, argv);
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() < 2) {
    print_usage(argc, argv);
    return false;
  }
  arguments.model_path = positional[0];
  arguments.wav_paths.assign(positional.begin() + 1, positional.end());
  return true;
}

int main(int argc, char** argv) {
  Arguments arguments;
  if (!parse_args(argc, argv, arguments)) {
    return -1;
  }

  std::cout << "--------------------" << std::endl;
  std::cout << "Hello, Transcriber!" << std::endl;
  std::cout << "--------------------" << std::endl;

  // Responsible for cleaning up the library during shutdown
  OtrHandle handle;

  try {
#ifdef USE_CXX
    std::cout << "C++ API" << std::endl;
    CXX_API(arguments);
#else
    std::cout << "C API" << std::endl;
    C_API(arguments);
#endif
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return -1;
  }

  return 0;
}
