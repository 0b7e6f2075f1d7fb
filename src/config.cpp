// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "config.h"
#include "json.h"
#include "logging.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace Transcribe {

namespace {

// The range check comes first, casting a double outside the int range is undefined
int ToInt(std::string_view name, double value, int min_value) {
  if (!(value >= min_value && value <= std::numeric_limits<int>::max()) || value != std::trunc(value))
    throw std::runtime_error(std::string(name) + " must be an integer of at least " + std::to_string(min_value));
  return static_cast<int>(value);
}

int ToPositiveInt(std::string_view name, double value) {
  return ToInt(name, value, 1);
}

struct ProviderOptions_Element : JSON::Element {
  explicit ProviderOptions_Element(Config::ProviderOptions& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    v_.options.emplace_back(name, value);
  }

 private:
  Config::ProviderOptions& v_;
};

struct ProviderOptionsObject_Element : JSON::Element {
  explicit ProviderOptionsObject_Element(std::vector<Config::ProviderOptions>& v) : v_{v} {}

  JSON::Element& OnObject(std::string_view name) override {
    for (auto& v : v_) {
      if (v.name == name) {
        options_element_ = std::make_unique<ProviderOptions_Element>(v);
        return *options_element_;
      }
    }

    auto& options = v_.emplace_back();
    options.name = name;
    options_element_ = std::make_unique<ProviderOptions_Element>(options);
    return *options_element_;
  }

 private:
  std::vector<Config::ProviderOptions>& v_;
  std::unique_ptr<ProviderOptions_Element> options_element_;
};

struct ProviderOptionsArray_Element : JSON::Element {
  explicit ProviderOptionsArray_Element(std::vector<Config::ProviderOptions>& v) : v_{v} {}

  JSON::Element& OnObject(std::string_view name) override { return object_; }

 private:
  std::vector<Config::ProviderOptions>& v_;
  ProviderOptionsObject_Element object_{v_};
};

struct NamedStrings_Element : JSON::Element {
  explicit NamedStrings_Element(std::vector<Config::NamedString>& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    v_.emplace_back(name, value);
  }

 private:
  std::vector<Config::NamedString>& v_;
};

struct SessionOptions_Element : JSON::Element {
  explicit SessionOptions_Element(Config::SessionOptions& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "log_id")
      v_.log_id = value;
    else if (name == "enable_profiling")
      v_.enable_profiling = value;
    else if (name == "graph_optimization_level") {
      if (value != "disable_all" && value != "enable_basic" && value != "enable_extended" && value != "enable_all")
        throw std::runtime_error("Unknown graph_optimization_level: " + std::string(value));
      v_.graph_optimization_level = value;
    } else
      throw JSON::unknown_value_error{};
  }

  void OnNumber(std::string_view name, double value) override {
    if (name == "intra_op_num_threads")
      v_.intra_op_num_threads = ToInt(name, value, 0);
    else if (name == "inter_op_num_threads")
      v_.inter_op_num_threads = ToInt(name, value, 0);
    else if (name == "log_severity_level")
      v_.log_severity_level = ToInt(name, value, 0);
    else
      throw JSON::unknown_value_error{};
  }

  void OnBool(std::string_view name, bool value) override {
    if (name == "enable_cpu_mem_arena")
      v_.enable_cpu_mem_arena = value;
    else if (name == "enable_mem_pattern")
      v_.enable_mem_pattern = value;
    else
      throw JSON::unknown_value_error{};
  }

  JSON::Element& OnArray(std::string_view name) override {
    if (name == "provider_options")
      return provider_options_;
    throw JSON::unknown_value_error{};
  }

  JSON::Element& OnObject(std::string_view name) override {
    if (name == "config_entries")
      return config_entries_;
    throw JSON::unknown_value_error{};
  }

 private:
  Config::SessionOptions& v_;
  ProviderOptionsArray_Element provider_options_{v_.provider_options};
  NamedStrings_Element config_entries_{v_.config_entries};
};

// "session_options" inside a stage starts from a copy of the shared options so a stage only has to list what differs
struct StageSessionOptions_Element : JSON::Element {
  StageSessionOptions_Element(std::optional<Config::SessionOptions>& v, const Config::SessionOptions& shared)
      : v_{v}, shared_{shared} {}

  SessionOptions_Element& Get() {
    if (!v_.has_value())
      v_ = shared_;
    element_ = std::make_unique<SessionOptions_Element>(*v_);
    return *element_;
  }

 private:
  std::optional<Config::SessionOptions>& v_;
  const Config::SessionOptions& shared_;
  std::unique_ptr<SessionOptions_Element> element_;
};

struct Vocabulary_Element : JSON::Element {
  explicit Vocabulary_Element(Config::Model::Vocabulary& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "filename")
      v_.filename = value;
    else if (name == "blank_token")
      v_.blank_token = value;
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::Vocabulary& v_;
};

struct PreprocessorInputs_Element : JSON::Element {
  explicit PreprocessorInputs_Element(Config::Model::Preprocessor::Inputs& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "waveforms")
      v_.waveforms = value;
    else if (name == "waveforms_length")
      v_.waveforms_length = value;
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::Preprocessor::Inputs& v_;
};

struct PreprocessorOutputs_Element : JSON::Element {
  explicit PreprocessorOutputs_Element(Config::Model::Preprocessor::Outputs& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "features")
      v_.features = value;
    else if (name == "features_length")
      v_.features_length = value;
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::Preprocessor::Outputs& v_;
};

struct Preprocessor_Element : JSON::Element {
  Preprocessor_Element(Config::Model::Preprocessor& v, const Config::SessionOptions& shared)
      : v_{v}, session_options_{v.session_options, shared} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "filename")
      v_.filename = value;
    else
      throw JSON::unknown_value_error{};
  }

  void OnNumber(std::string_view name, double value) override {
    if (name == "num_mels")
      v_.num_mels = ToPositiveInt(name, value);
    else if (name == "hop_length")
      v_.hop_length = ToPositiveInt(name, value);
    else
      throw JSON::unknown_value_error{};
  }

  Element& OnObject(std::string_view name) override {
    if (name == "session_options")
      return session_options_.Get();
    if (name == "inputs")
      return inputs_;
    if (name == "outputs")
      return outputs_;
    throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::Preprocessor& v_;
  StageSessionOptions_Element session_options_;
  PreprocessorInputs_Element inputs_{v_.inputs};
  PreprocessorOutputs_Element outputs_{v_.outputs};
};

struct EncoderInputs_Element : JSON::Element {
  explicit EncoderInputs_Element(Config::Model::Encoder::Inputs& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "features")
      v_.features = value;
    else if (name == "length")
      v_.length = value;
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::Encoder::Inputs& v_;
};

struct EncoderOutputs_Element : JSON::Element {
  explicit EncoderOutputs_Element(Config::Model::Encoder::Outputs& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "encoded")
      v_.encoded = value;
    else if (name == "encoded_length")
      v_.encoded_length = value;
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::Encoder::Outputs& v_;
};

struct Encoder_Element : JSON::Element {
  Encoder_Element(Config::Model::Encoder& v, const Config::SessionOptions& shared)
      : v_{v}, session_options_{v.session_options, shared} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "filename")
      v_.filename = value;
    else if (name == "data_filename")
      v_.data_filename = value;
    else
      throw JSON::unknown_value_error{};
  }

  void OnNumber(std::string_view name, double value) override {
    if (name == "hidden_size")
      v_.hidden_size = ToPositiveInt(name, value);
    else if (name == "subsampling_factor")
      v_.subsampling_factor = ToPositiveInt(name, value);
    else
      throw JSON::unknown_value_error{};
  }

  Element& OnObject(std::string_view name) override {
    if (name == "session_options")
      return session_options_.Get();
    if (name == "inputs")
      return inputs_;
    if (name == "outputs")
      return outputs_;
    throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::Encoder& v_;
  StageSessionOptions_Element session_options_;
  EncoderInputs_Element inputs_{v_.inputs};
  EncoderOutputs_Element outputs_{v_.outputs};
};

struct DecoderJointInputs_Element : JSON::Element {
  explicit DecoderJointInputs_Element(Config::Model::DecoderJoint::Inputs& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "encoder_step")
      v_.encoder_step = value;
    else if (name == "targets")
      v_.targets = value;
    else if (name == "target_length")
      v_.target_length = value;
    else if (name == "states_1")
      v_.states_1 = value;
    else if (name == "states_2")
      v_.states_2 = value;
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::DecoderJoint::Inputs& v_;
};

struct DecoderJointOutputs_Element : JSON::Element {
  explicit DecoderJointOutputs_Element(Config::Model::DecoderJoint::Outputs& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "logits")
      v_.logits = value;
    else if (name == "states_1")
      v_.states_1 = value;
    else if (name == "states_2")
      v_.states_2 = value;
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::DecoderJoint::Outputs& v_;
};

struct DecoderJoint_Element : JSON::Element {
  DecoderJoint_Element(Config::Model::DecoderJoint& v, const Config::SessionOptions& shared)
      : v_{v}, session_options_{v.session_options, shared} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "filename")
      v_.filename = value;
    else
      throw JSON::unknown_value_error{};
  }

  void OnNumber(std::string_view name, double value) override {
    if (name == "hidden_size")
      v_.hidden_size = ToPositiveInt(name, value);
    else if (name == "num_layers")
      v_.num_layers = ToPositiveInt(name, value);
    else if (name == "num_durations")
      v_.num_durations = ToInt(name, value, 0);
    else
      throw JSON::unknown_value_error{};
  }

  Element& OnObject(std::string_view name) override {
    if (name == "session_options")
      return session_options_.Get();
    if (name == "inputs")
      return inputs_;
    if (name == "outputs")
      return outputs_;
    throw JSON::unknown_value_error{};
  }

 private:
  Config::Model::DecoderJoint& v_;
  StageSessionOptions_Element session_options_;
  DecoderJointInputs_Element inputs_{v_.inputs};
  DecoderJointOutputs_Element outputs_{v_.outputs};
};

struct Model_Element : JSON::Element {
  explicit Model_Element(Config::Model& v) : v_{v} {}

  void OnString(std::string_view name, std::string_view value) override {
    if (name == "type") {
      if (value != Config::Defaults::ModelType)
        throw std::runtime_error("Unsupported model type: " + std::string(value));
      v_.type = value;
    } else
      throw JSON::unknown_value_error{};
  }

  Element& OnObject(std::string_view name) override {
    if (name == "session_options")
      return session_options_;
    if (name == "vocabulary")
      return vocabulary_;
    if (name == "preprocessor")
      return preprocessor_;
    if (name == "encoder")
      return encoder_;
    if (name == "decoder_joint")
      return decoder_joint_;
    throw JSON::unknown_value_error{};
  }

 private:
  Config::Model& v_;
  SessionOptions_Element session_options_{v_.session_options};
  Vocabulary_Element vocabulary_{v_.vocabulary};
  Preprocessor_Element preprocessor_{v_.preprocessor, v_.session_options};
  Encoder_Element encoder_{v_.encoder, v_.session_options};
  DecoderJoint_Element decoder_joint_{v_.decoder_joint, v_.session_options};
};

struct Audio_Element : JSON::Element {
  explicit Audio_Element(Config::Audio& v) : v_{v} {}

  void OnNumber(std::string_view name, double value) override {
    if (name == "sample_rate")
      v_.sample_rate = ToPositiveInt(name, value);
    else
      throw JSON::unknown_value_error{};
  }

 private:
  Config::Audio& v_;
};

struct Root_Element : JSON::Element {
  explicit Root_Element(Config& config) : config_{config} {}

  Element& OnObject(std::string_view name) override {
    if (name == "model")
      return model_element_;
    if (name == "audio")
      return audio_element_;
    throw JSON::unknown_value_error{};
  }

  Config& config_;
  Model_Element model_element_{config_.model};
  Audio_Element audio_element_{config_.audio};
};

struct RootObject_Element : JSON::Element {
  explicit RootObject_Element(JSON::Element& t) : t_{t} {}

  Element& OnObject(std::string_view /*name*/) override {
    return t_;
  }

  JSON::Element& t_;
};

void ParseConfig(const std::filesystem::path& filename, Config& config) {
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw std::runtime_error("Error opening " + filename.string());
  }
  std::streamsize const size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<char> buffer(static_cast<size_t>(size));
  if (!file.read(buffer.data(), size)) {
    throw std::runtime_error("Error reading " + filename.string());
  }

  Root_Element root{config};
  RootObject_Element root_object{root};
  try {
    JSON::Parse(root_object, std::string_view(buffer.data(), buffer.size()));
  } catch (const std::exception& message) {
    std::ostringstream oss;
    oss << "Error encountered while parsing '" << filename.string() << "' " << message.what();
    throw std::runtime_error(oss.str());
  }
}

// The shared session options and every stage override
std::vector<Config::SessionOptions*> AllSessionOptions(Config& config) {
  std::vector<Config::SessionOptions*> all{&config.model.session_options};
  for (auto* stage_options : {&config.model.preprocessor.session_options, &config.model.encoder.session_options,
                              &config.model.decoder_joint.session_options}) {
    if (stage_options->has_value())
      all.push_back(&stage_options->value());
  }
  return all;
}

}  // namespace

void ClearProviders(Config& config) {
  for (auto* session_options : AllSessionOptions(config))
    session_options->provider_options.clear();
}

void AppendProvider(Config& config, std::string_view provider_name) {
  if (provider_name.empty())
    throw std::runtime_error("Execution provider name must not be empty");

  for (auto* session_options : AllSessionOptions(config)) {
    auto& providers = session_options->provider_options;
    if (std::none_of(providers.begin(), providers.end(), [&](auto& provider) { return provider.name == provider_name; }))
      providers.emplace_back().name = provider_name;
  }
}

void OverlayConfig(Config& config, std::string_view json) {
  Root_Element root{config};
  RootObject_Element root_object{root};
  try {
    JSON::Parse(root_object, json);
  } catch (const std::exception& message) {
    std::ostringstream oss;
    oss << "Error encountered while parsing config overlay: " << message.what();
    throw std::runtime_error(oss.str());
  }
}

Config::Config(const std::filesystem::path& path, std::string_view json_overlay) : config_path{path} {
  auto config_file = path / FileName;
  if (std::filesystem::exists(config_file))
    ParseConfig(config_file, *this);
  else if (g_log.enabled && g_log.warning)
    Log("warning", "No " + std::string(FileName) + " in " + path.string() + ", using the default model layout");

  if (!json_overlay.empty())
    OverlayConfig(*this, json_overlay);
}

}  // namespace Transcribe
