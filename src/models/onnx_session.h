// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "../config.h"

namespace Transcribe {

struct OrtGlobals {
  OrtGlobals();

  std::unique_ptr<Ort::Env> env_;

 private:
  OrtGlobals(const OrtGlobals&) = delete;
  void operator=(const OrtGlobals&) = delete;
};

std::unique_ptr<OrtGlobals>& GetOrtGlobals();
void Shutdown();  // Do this once at exit, Ort code will fail after this call
Ort::Env& GetOrtEnv();

// Wraps a caller owned buffer, the buffer must outlive the returned value
template <typename T>
Ort::Value CreateTensorView(std::span<T> data, const std::vector<int64_t>& shape) {
  static const auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  return Ort::Value::CreateTensor<T>(memory_info, data.data(), data.size(), shape.data(), shape.size());
}

void SetSessionOptions(const Config::SessionOptions& config_session_options, Ort::SessionOptions& session_options);

// One inference session of the pipeline. The stage name ("preprocessor", "encoder" or "decoder") tags every error it raises.
struct OnnxSession {
  OnnxSession(std::string stage, const std::filesystem::path& model_path, const Config::SessionOptions& config_session_options,
              std::vector<std::string> input_names, std::vector<std::string> output_names);

  // Inputs and outputs are in the order of the names given to the constructor. The outputs are pre-allocated by the caller
  // and their shapes must match what the graph produces, else an InferenceError is thrown.
  void Run(std::span<const Ort::Value> inputs, std::span<Ort::Value> outputs);

  const std::string& Stage() const { return stage_; }

 private:
  void LogShapes(std::string_view label, std::span<const std::string> names, std::span<const Ort::Value> values) const;

  std::string stage_;
  std::filesystem::path model_path_;
  std::unique_ptr<Ort::Session> session_;

  std::vector<std::string> input_names_, output_names_;
  std::vector<const char*> input_names_c_, output_names_c_;
};

}  // namespace Transcribe
