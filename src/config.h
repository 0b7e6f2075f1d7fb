// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Transcribe {

struct Config {
  Config() = default;
  // Reads transcribe_config.json from the model directory when present, then applies json_overlay on top.
  // A model directory without a config file (or one that does not exist yet) uses the defaults below.
  Config(const std::filesystem::path& path, std::string_view json_overlay = {});

  static constexpr std::string_view FileName = "transcribe_config.json";

  struct Defaults {
    static constexpr std::string_view ModelType = "parakeet_tdt";

    // Model artifact names
    static constexpr std::string_view VocabularyFileName = "vocab.txt";
    static constexpr std::string_view PreprocessorFileName = "nemo128.onnx";
    static constexpr std::string_view EncoderFileName = "encoder-model.int8.onnx";
    static constexpr std::string_view EncoderDataFileName = "encoder-model.onnx.data";
    static constexpr std::string_view DecoderJointFileName = "decoder-model.int8.onnx";

    static constexpr std::string_view BlankToken = "<blk>";

    // Preprocessor (feature extractor) graph names
    static constexpr std::string_view WaveformsName = "waveforms";
    static constexpr std::string_view WaveformsLengthName = "waveforms_lens";
    static constexpr std::string_view FeaturesName = "features";
    static constexpr std::string_view FeaturesLengthName = "features_lens";

    // Encoder graph names
    static constexpr std::string_view AudioSignalName = "audio_signal";
    static constexpr std::string_view LengthName = "length";
    static constexpr std::string_view EncodedName = "outputs";
    static constexpr std::string_view EncodedLengthName = "encoded_lengths";

    // Decoder-joint graph names
    static constexpr std::string_view EncoderStepName = "encoder_outputs";
    static constexpr std::string_view TargetsName = "targets";
    static constexpr std::string_view TargetLengthName = "target_length";
    static constexpr std::string_view InputStates1Name = "input_states_1";
    static constexpr std::string_view InputStates2Name = "input_states_2";
    static constexpr std::string_view LogitsName = "outputs";
    static constexpr std::string_view OutputStates1Name = "output_states_1";
    static constexpr std::string_view OutputStates2Name = "output_states_2";
  };

  std::filesystem::path config_path;  // Path of the model directory

  using NamedString = std::pair<std::string, std::string>;
  struct ProviderOptions {
    std::string name;
    std::vector<NamedString> options;
  };

  struct SessionOptions {
    std::optional<int> intra_op_num_threads;
    std::optional<int> inter_op_num_threads;
    std::optional<bool> enable_cpu_mem_arena;
    std::optional<bool> enable_mem_pattern;
    std::optional<std::string> log_id;
    std::optional<int> log_severity_level;
    std::optional<std::string> enable_profiling;
    std::optional<std::string> graph_optimization_level;  // "disable_all", "enable_basic", "enable_extended" or "enable_all"
    std::vector<NamedString> config_entries;              // Entries go into Ort::SessionOptions::AddConfigEntry

    std::vector<ProviderOptions> provider_options;  // Execution providers in order of preference, the CPU is always the fallback
  };

  struct Model {
    std::string type{Defaults::ModelType};

    // Shared by every stage that doesn't have its own session_options
    SessionOptions session_options;

    struct Vocabulary {
      std::string filename{Defaults::VocabularyFileName};
      std::string blank_token{Defaults::BlankToken};
    } vocabulary;

    struct Preprocessor {
      std::string filename{Defaults::PreprocessorFileName};
      std::optional<SessionOptions> session_options;

      int num_mels{128};
      int hop_length{160};  // 10ms @ 16kHz

      struct Inputs {
        std::string waveforms{Defaults::WaveformsName};
        std::string waveforms_length{Defaults::WaveformsLengthName};
      } inputs;

      struct Outputs {
        std::string features{Defaults::FeaturesName};
        std::string features_length{Defaults::FeaturesLengthName};
      } outputs;
    } preprocessor;

    struct Encoder {
      std::string filename{Defaults::EncoderFileName};
      std::string data_filename{Defaults::EncoderDataFileName};  // External weights, resolved by onnxruntime relative to filename. Empty when the graph is self contained
      std::optional<SessionOptions> session_options;

      int hidden_size{1024};
      int subsampling_factor{8};

      struct Inputs {
        std::string features{Defaults::AudioSignalName};
        std::string length{Defaults::LengthName};
      } inputs;

      struct Outputs {
        std::string encoded{Defaults::EncodedName};
        std::string encoded_length{Defaults::EncodedLengthName};
      } outputs;
    } encoder;

    struct DecoderJoint {
      std::string filename{Defaults::DecoderJointFileName};
      std::optional<SessionOptions> session_options;

      int hidden_size{640};
      int num_layers{2};
      int num_durations{5};  // TDT duration classes appended after the vocabulary logits

      struct Inputs {
        std::string encoder_step{Defaults::EncoderStepName};
        std::string targets{Defaults::TargetsName};
        std::string target_length{Defaults::TargetLengthName};
        std::string states_1{Defaults::InputStates1Name};
        std::string states_2{Defaults::InputStates2Name};
      } inputs;

      struct Outputs {
        std::string logits{Defaults::LogitsName};
        std::string states_1{Defaults::OutputStates1Name};
        std::string states_2{Defaults::OutputStates2Name};
      } outputs;
    } decoder_joint;
  } model;

  struct Audio {
    int sample_rate{16000};
  } audio;

  // Session options for a stage, falling back to the shared model.session_options
  const SessionOptions& GetSessionOptions(const std::optional<SessionOptions>& stage_options) const {
    return stage_options.has_value() ? *stage_options : model.session_options;
  }
};

void OverlayConfig(Config& config, std::string_view json);

// Provider changes apply to the shared session options and to every stage that has its own
void ClearProviders(Config& config);
void AppendProvider(Config& config, std::string_view provider_name);

}  // namespace Transcribe
