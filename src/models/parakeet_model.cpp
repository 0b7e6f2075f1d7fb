// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "parakeet_model.h"
#include "../audio/audio_normalizer.h"
#include "../errors.h"
#include "../logging.h"
#include "../string_utils.h"
#include "../tdt_greedy_decoder.h"
#include "../timer.h"

#include <utility>

namespace Transcribe {

namespace {

// Stage failures that aren't already tagged get the stage name, so the caller can tell which model failed
template <typename Fn>
auto RunStage(std::string_view stage, Fn&& fn) {
  Timer timer;
  try {
    auto result = fn();
    LogStageTiming(stage, timer.Elapsed());
    return result;
  } catch (const InferenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw InferenceError(std::string(stage), e.what());
  }
}

}  // namespace

ParakeetModel::ParakeetModel(const std::filesystem::path& model_path, std::string_view json_overlay)
    : ParakeetModel{std::make_unique<Config>(model_path, json_overlay)} {
}

ParakeetModel::ParakeetModel(std::unique_ptr<Config> config) : config_{std::move(config)} {
}

ParakeetModel::ParakeetModel(std::unique_ptr<Config> config, Vocabulary vocabulary,
                             std::unique_ptr<Preprocessor> preprocessor, std::unique_ptr<Encoder> encoder, std::unique_ptr<DecoderJoint> decoder_joint)
    : config_{std::move(config)},
      vocabulary_{std::move(vocabulary)},
      preprocessor_{std::move(preprocessor)},
      encoder_{std::move(encoder)},
      decoder_joint_{std::move(decoder_joint)} {
}

ParakeetModel::~ParakeetModel() = default;

std::vector<ModelFile> ParakeetModel::GetModelFiles() const {
  const auto& model = config_->model;
  const auto& root = config_->config_path;

  std::vector<ModelFile> files{
      {"Vocabulary", root / model.vocabulary.filename},
      {"Preprocessor (nemo128)", root / model.preprocessor.filename},
      {"Encoder", root / model.encoder.filename},
  };
  if (!model.encoder.data_filename.empty())
    files.push_back({"Encoder Data", root / model.encoder.data_filename});
  files.push_back({"Decoder", root / model.decoder_joint.filename});
  return files;
}

std::vector<ModelFile> ParakeetModel::CheckModels() const {
  std::vector<ModelFile> missing;
  for (auto& file : GetModelFiles()) {
    if (!std::filesystem::exists(file.path))
      missing.push_back(file);
  }
  return missing;
}

void ParakeetModel::ClearProviders() {
  std::lock_guard<std::mutex> lock{mutex_};
  Transcribe::ClearProviders(*config_);
}

void ParakeetModel::AppendProvider(std::string_view provider_name) {
  std::lock_guard<std::mutex> lock{mutex_};
  Transcribe::AppendProvider(*config_, provider_name);
}

void ParakeetModel::LoadModels() {
  auto missing = CheckModels();
  if (!missing.empty()) {
    std::ostringstream message;
    message << "Missing model files in " << config_->config_path.string() << ":";
    for (auto& file : missing)
      message << ' ' << file.name << " (" << file.path.filename().string() << ")";
    throw std::runtime_error(message.str());
  }

  LoadVocabulary();

  std::lock_guard<std::mutex> lock{mutex_};
  Timer timer;
  preprocessor_ = std::make_unique<OnnxPreprocessor>(*config_);
  encoder_ = std::make_unique<OnnxEncoder>(*config_);
  decoder_joint_ = std::make_unique<OnnxDecoderJoint>(*config_, vocabulary_.Size());
  LogStageTiming("load_models", timer.Elapsed());
}

void ParakeetModel::LoadVocabulary() {
  const auto& vocabulary_config = config_->model.vocabulary;
  auto vocabulary = Vocabulary::Load(config_->config_path / vocabulary_config.filename, vocabulary_config.blank_token);

  std::lock_guard<std::mutex> lock{mutex_};
  vocabulary_ = std::move(vocabulary);
}

bool ParakeetModel::IsVocabularyLoaded() const {
  std::lock_guard<std::mutex> lock{mutex_};
  return !vocabulary_.Empty();
}

std::string ParakeetModel::TranscribeWav(std::span<const uint8_t> wav_bytes) {
  if (!IsVocabularyLoaded())
    throw EmptyVocabularyError();

  Timer timer;
  auto samples = NormalizeWav(wav_bytes, config_->audio.sample_rate);
  LogStageTiming("normalize", timer.Elapsed());

  return RunPipeline(samples);
}

std::string ParakeetModel::TranscribeSamples(std::span<const float> samples) {
  return RunPipeline(samples);
}

std::string ParakeetModel::TranscribeFile(const std::filesystem::path& wav_path) {
  auto wav_bytes = ReadWavFile(wav_path);
  return TranscribeWav(wav_bytes);
}

std::string ParakeetModel::RunPipeline(std::span<const float> samples) {
  std::lock_guard<std::mutex> lock{mutex_};

  if (vocabulary_.Empty())
    throw EmptyVocabularyError();
  if (!preprocessor_)
    throw InferenceError("preprocessor", "session not loaded");
  if (!encoder_)
    throw InferenceError("encoder", "session not loaded");
  if (!decoder_joint_)
    throw InferenceError("decoder", "session not loaded");

  Timer total;

  auto features = RunStage("preprocessor", [&] { return preprocessor_->Run(samples); });
  auto encoded = RunStage("encoder", [&] { return encoder_->Run(features); });
  auto tokens = RunStage("decoder", [&] {
    return GreedyTdtDecode(encoded, vocabulary_.BlankId(), vocabulary_.Size(), decoder_joint_->StateSize(),
                           [this](std::span<const float> encoder_step, const DecoderState& state) {
                             return decoder_joint_->Run(encoder_step, state);
                           });
  });

  auto text = vocabulary_.Detokenize(tokens);
  LogStageTiming("transcribe", total.Elapsed());

  if (g_log.enabled && g_log.transcript)
    Log("transcript", text.empty() ? std::string_view{"<empty>"} : std::string_view{text});

  return text;
}

}  // namespace Transcribe
