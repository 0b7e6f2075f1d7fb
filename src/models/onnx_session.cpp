// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "onnx_session.h"
#include "../errors.h"
#include "../logging.h"
#include "../string_utils.h"

#include <algorithm>
#include <cstdlib>
#include <thread>
#include <unordered_map>

namespace Transcribe {

namespace {

OrtLoggingLevel GetDefaultOrtLoggingLevel() {
  const char* verbose = std::getenv("ORTTRANSCRIBE_ORT_VERBOSE_LOGGING");
  if (verbose != nullptr && (std::string_view{verbose} == "1" || std::string_view{verbose} == "true"))
    return ORT_LOGGING_LEVEL_VERBOSE;
  return ORT_LOGGING_LEVEL_ERROR;
}

GraphOptimizationLevel ToGraphOptimizationLevel(std::string_view level) {
  if (level == "disable_all")
    return GraphOptimizationLevel::ORT_DISABLE_ALL;
  if (level == "enable_basic")
    return GraphOptimizationLevel::ORT_ENABLE_BASIC;
  if (level == "enable_extended")
    return GraphOptimizationLevel::ORT_ENABLE_EXTENDED;
  if (level == "enable_all")
    return GraphOptimizationLevel::ORT_ENABLE_ALL;
  throw std::runtime_error("Unknown graph_optimization_level: " + std::string(level));
}

void AppendCudaProvider(const Config::ProviderOptions& provider_options, Ort::SessionOptions& session_options) {
  const auto& api = Ort::GetApi();
  OrtCUDAProviderOptionsV2* cuda_options{};
  Ort::ThrowOnError(api.CreateCUDAProviderOptions(&cuda_options));
  std::unique_ptr<OrtCUDAProviderOptionsV2, decltype(api.ReleaseCUDAProviderOptions)> owned{cuda_options, api.ReleaseCUDAProviderOptions};

  std::vector<const char*> keys, values;
  for (auto& option : provider_options.options) {
    keys.emplace_back(option.first.c_str());
    values.emplace_back(option.second.c_str());
  }
  Ort::ThrowOnError(api.UpdateCUDAProviderOptions(cuda_options, keys.data(), values.data(), keys.size()));
  session_options.AppendExecutionProvider_CUDA_V2(*cuda_options);
}

}  // namespace

OrtGlobals::OrtGlobals()
    : env_{std::make_unique<Ort::Env>(GetDefaultOrtLoggingLevel(), "ort-transcribe")} {
}

// Ensure Shutdown() has been called before process exit
struct EnsureShutdown {
  ~EnsureShutdown() {
    if (GetOrtGlobals()) {
      Shutdown();
    }
  }
};

std::unique_ptr<OrtGlobals>& GetOrtGlobals() {
  static auto globals = std::make_unique<OrtGlobals>();
  static auto validate = std::make_unique<EnsureShutdown>();  // Must be after the above line so the destructor runs before the above destructor
  return globals;
}

void Shutdown() {
  GetOrtGlobals().reset();  // Delete now because on process exit is too late
}

Ort::Env& GetOrtEnv() {
  auto& globals = GetOrtGlobals();
  if (!globals)
    throw std::runtime_error("Shutdown was already called, onnxruntime is no longer available");
  return *globals->env_;
}

void SetSessionOptions(const Config::SessionOptions& config_session_options, Ort::SessionOptions& session_options) {
  // Default to a limit of 16 threads to optimize performance
  constexpr int min_thread_nums = 1;
  constexpr int max_thread_nums = 16;
  int num_of_cores = std::max(min_thread_nums, static_cast<int>(std::thread::hardware_concurrency() / 2));
  session_options.SetIntraOpNumThreads(std::min(num_of_cores, max_thread_nums));

  if (config_session_options.intra_op_num_threads.has_value())
    session_options.SetIntraOpNumThreads(config_session_options.intra_op_num_threads.value());

  if (config_session_options.inter_op_num_threads.has_value())
    session_options.SetInterOpNumThreads(config_session_options.inter_op_num_threads.value());

  if (config_session_options.enable_cpu_mem_arena.has_value()) {
    if (config_session_options.enable_cpu_mem_arena.value())
      session_options.EnableCpuMemArena();
    else
      session_options.DisableCpuMemArena();
  }

  if (config_session_options.enable_mem_pattern.has_value()) {
    if (config_session_options.enable_mem_pattern.value())
      session_options.EnableMemPattern();
    else
      session_options.DisableMemPattern();
  }

  if (config_session_options.log_id.has_value())
    session_options.SetLogId(config_session_options.log_id.value().c_str());

  if (config_session_options.log_severity_level.has_value())
    session_options.SetLogSeverityLevel(config_session_options.log_severity_level.value());

  if (config_session_options.enable_profiling.has_value()) {
    std::filesystem::path profile_file_prefix{config_session_options.enable_profiling.value()};
    session_options.EnableProfiling(profile_file_prefix.c_str());
  }

  if (config_session_options.graph_optimization_level.has_value())
    session_options.SetGraphOptimizationLevel(ToGraphOptimizationLevel(config_session_options.graph_optimization_level.value()));

  for (auto& config_entry : config_session_options.config_entries)
    session_options.AddConfigEntry(config_entry.first.c_str(), config_entry.second.c_str());

  // Providers are tried in the order listed, anything they can't run falls back to the CPU
  for (auto& provider_options : config_session_options.provider_options) {
    if (provider_options.name == "cpu")
      continue;
    if (provider_options.name == "cuda") {
      AppendCudaProvider(provider_options, session_options);
      continue;
    }

    std::unordered_map<std::string, std::string> options;
    for (auto& option : provider_options.options)
      options.emplace(option.first, option.second);
    session_options.AppendExecutionProvider(provider_options.name, options);
  }
}

OnnxSession::OnnxSession(std::string stage, const std::filesystem::path& model_path, const Config::SessionOptions& config_session_options,
                         std::vector<std::string> input_names, std::vector<std::string> output_names)
    : stage_{std::move(stage)},
      model_path_{model_path},
      input_names_{std::move(input_names)},
      output_names_{std::move(output_names)} {
  for (auto& name : input_names_)
    input_names_c_.push_back(name.c_str());
  for (auto& name : output_names_)
    output_names_c_.push_back(name.c_str());

  try {
    Ort::SessionOptions session_options;
    SetSessionOptions(config_session_options, session_options);
    session_ = std::make_unique<Ort::Session>(GetOrtEnv(), model_path_.c_str(), session_options);
  } catch (const std::exception& e) {
    throw InferenceError(stage_, MakeString("error creating session for ", model_path_.string(), ": ", e.what()));
  }

  if (g_log.enabled && g_log.session_create) {
    std::ostringstream names;
    names << model_path_.string() << " inputs:";
    for (auto& name : input_names_)
      names << ' ' << name;
    names << " outputs:";
    for (auto& name : output_names_)
      names << ' ' << name;
    Log("session_create", MakeString(stage_, ' ', names.str()));
  }
}

void OnnxSession::LogShapes(std::string_view label, std::span<const std::string> names, std::span<const Ort::Value> values) const {
  auto& stream = Log(label);
  stream << stage_;
  for (size_t i = 0; i < values.size(); i++) {
    stream << std::endl
           << "  " << names[i] << ": " << ShapeToString(values[i].GetTensorTypeAndShapeInfo().GetShape());
  }
  stream << std::endl;
}

void OnnxSession::Run(std::span<const Ort::Value> inputs, std::span<Ort::Value> outputs) {
  if (inputs.size() != input_names_c_.size() || outputs.size() != output_names_c_.size())
    throw InferenceError(stage_, MakeString("expected ", input_names_c_.size(), " inputs and ", output_names_c_.size(),
                                            " outputs, got ", inputs.size(), " and ", outputs.size()));

  if (g_log.enabled && g_log.model_input_shapes)
    LogShapes("model_input_shapes", input_names_, inputs);

  try {
    session_->Run(Ort::RunOptions{nullptr}, input_names_c_.data(), inputs.data(), inputs.size(),
                  output_names_c_.data(), outputs.data(), outputs.size());
  } catch (const Ort::Exception& e) {
    throw InferenceError(stage_, e.what());
  }

  if (g_log.enabled && g_log.model_output_shapes)
    LogShapes("model_output_shapes", output_names_, outputs);
}

}  // namespace Transcribe
