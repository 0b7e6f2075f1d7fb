// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "config.h"
#include "json.h"
#include "logging.h"
#include "test_utils.h"

using namespace Transcribe;

TEST(ConfigTests, DefaultsMatchThePublishedModel) {
  test_utils::TempDirectory directory{"config_defaults"};
  Config config{directory.Path()};

  EXPECT_EQ(config.config_path.string(), directory.Path().string());
  EXPECT_EQ(config.model.type, "parakeet_tdt");
  EXPECT_EQ(config.model.vocabulary.filename, "vocab.txt");
  EXPECT_EQ(config.model.vocabulary.blank_token, "<blk>");
  EXPECT_EQ(config.model.preprocessor.filename, "nemo128.onnx");
  EXPECT_EQ(config.model.preprocessor.num_mels, 128);
  EXPECT_EQ(config.model.preprocessor.hop_length, 160);
  EXPECT_EQ(config.model.encoder.filename, "encoder-model.int8.onnx");
  EXPECT_EQ(config.model.encoder.data_filename, "encoder-model.onnx.data");
  EXPECT_EQ(config.model.encoder.hidden_size, 1024);
  EXPECT_EQ(config.model.encoder.subsampling_factor, 8);
  EXPECT_EQ(config.model.encoder.inputs.features, "audio_signal");
  EXPECT_EQ(config.model.encoder.outputs.encoded_length, "encoded_lengths");
  EXPECT_EQ(config.model.decoder_joint.filename, "decoder-model.int8.onnx");
  EXPECT_EQ(config.model.decoder_joint.hidden_size, 640);
  EXPECT_EQ(config.model.decoder_joint.num_layers, 2);
  EXPECT_EQ(config.model.decoder_joint.num_durations, 5);
  EXPECT_EQ(config.model.decoder_joint.inputs.states_2, "input_states_2");
  EXPECT_EQ(config.model.decoder_joint.outputs.logits, "outputs");
  EXPECT_EQ(config.audio.sample_rate, 16000);
  EXPECT_FALSE(config.model.preprocessor.session_options.has_value());
}

TEST(ConfigTests, ReadsConfigFile) {
  test_utils::TempDirectory directory{"config_file"};
  test_utils::WriteFile(directory.Path() / Config::FileName, std::string(R"({
  "model": {
    "type": "parakeet_tdt",
    "session_options": {
      "intra_op_num_threads": 4,
      "log_id": "transcribe",
      "graph_optimization_level": "enable_extended",
      "enable_cpu_mem_arena": false,
      "config_entries": { "session.disable_prepacking": "1" },
      "provider_options": [ { "cuda": { "device_id": "1" } } ]
    },
    "vocabulary": { "filename": "tokens.txt", "blank_token": "<blank>" },
    "preprocessor": { "filename": "mel.onnx", "num_mels": 80 },
    "encoder": {
      "filename": "encoder.onnx",
      "data_filename": "",
      "session_options": { "intra_op_num_threads": 8 },
      "outputs": { "encoded": "encoder_out" }
    },
    "decoder_joint": {
      "hidden_size": 320,
      "inputs": { "targets": "y" }
    }
  },
  "audio": { "sample_rate": 8000 }
})"));

  Config config{directory.Path()};
  EXPECT_EQ(config.model.vocabulary.filename, "tokens.txt");
  EXPECT_EQ(config.model.vocabulary.blank_token, "<blank>");
  EXPECT_EQ(config.model.preprocessor.filename, "mel.onnx");
  EXPECT_EQ(config.model.preprocessor.num_mels, 80);
  EXPECT_EQ(config.model.encoder.data_filename, "");
  EXPECT_EQ(config.model.encoder.outputs.encoded, "encoder_out");
  EXPECT_EQ(config.model.encoder.outputs.encoded_length, "encoded_lengths");
  EXPECT_EQ(config.model.decoder_joint.hidden_size, 320);
  EXPECT_EQ(config.model.decoder_joint.inputs.targets, "y");
  EXPECT_EQ(config.audio.sample_rate, 8000);

  auto& shared = config.model.session_options;
  EXPECT_EQ(shared.intra_op_num_threads, 4);
  EXPECT_EQ(shared.log_id, "transcribe");
  EXPECT_EQ(shared.graph_optimization_level, "enable_extended");
  EXPECT_EQ(shared.enable_cpu_mem_arena, false);
  ASSERT_EQ(shared.config_entries.size(), 1u);
  EXPECT_EQ(shared.config_entries[0].first, "session.disable_prepacking");
  ASSERT_EQ(shared.provider_options.size(), 1u);
  EXPECT_EQ(shared.provider_options[0].name, "cuda");
  ASSERT_EQ(shared.provider_options[0].options.size(), 1u);
  EXPECT_EQ(shared.provider_options[0].options[0].second, "1");

  // A stage with its own options starts from the shared ones
  const auto& encoder_options = config.GetSessionOptions(config.model.encoder.session_options);
  EXPECT_EQ(encoder_options.intra_op_num_threads, 8);
  EXPECT_EQ(encoder_options.log_id, "transcribe");
  EXPECT_EQ(encoder_options.provider_options.size(), 1u);

  const auto& preprocessor_options = config.GetSessionOptions(config.model.preprocessor.session_options);
  EXPECT_EQ(&preprocessor_options, &config.model.session_options);
}

TEST(ConfigTests, OverlayAppliesOnTop) {
  test_utils::TempDirectory directory{"config_overlay"};
  test_utils::WriteFile(directory.Path() / Config::FileName, std::string(R"({"model": {"encoder": {"hidden_size": 512}}})"));

  Config config{directory.Path(), R"({"model": {"encoder": {"subsampling_factor": 4}}, "audio": {"sample_rate": 22050}})"};
  EXPECT_EQ(config.model.encoder.hidden_size, 512);
  EXPECT_EQ(config.model.encoder.subsampling_factor, 4);
  EXPECT_EQ(config.audio.sample_rate, 22050);

  OverlayConfig(config, R"({"model": {"session_options": {"provider_options": [{"cuda": {}}]}}})");
  OverlayConfig(config, R"({"model": {"session_options": {"provider_options": [{"cuda": {"device_id": "0"}}]}}})");
  // The same provider listed again updates the existing entry
  ASSERT_EQ(config.model.session_options.provider_options.size(), 1u);
  EXPECT_EQ(config.model.session_options.provider_options[0].options.size(), 1u);
}

TEST(ConfigTests, ProvidersReplaceEveryStage) {
  Config config;
  OverlayConfig(config, R"({"model": {
    "session_options": {"provider_options": [{"dml": {}}]},
    "encoder": {"session_options": {"provider_options": [{"cuda": {"device_id": "1"}}]}}
  }})");

  ClearProviders(config);
  AppendProvider(config, "cuda");
  AppendProvider(config, "cuda");

  // The stage overrides are replaced too, stages without one keep falling back to the shared options
  for (auto* options : {&config.model.session_options, &config.model.encoder.session_options.value()}) {
    ASSERT_EQ(options->provider_options.size(), 1u);
    EXPECT_EQ(options->provider_options[0].name, "cuda");
    EXPECT_TRUE(options->provider_options[0].options.empty());
  }
  EXPECT_FALSE(config.model.preprocessor.session_options.has_value());
  EXPECT_FALSE(config.model.decoder_joint.session_options.has_value());

  // Names are taken as they are, nothing is parsed
  const std::string odd_name = R"(my"provider}]})";
  AppendProvider(config, odd_name);
  ASSERT_EQ(config.model.session_options.provider_options.size(), 2u);
  EXPECT_EQ(config.model.session_options.provider_options[1].name, odd_name);

  EXPECT_THROW(AppendProvider(config, ""), std::runtime_error);

  ClearProviders(config);
  EXPECT_TRUE(config.model.session_options.provider_options.empty());
  EXPECT_TRUE(config.model.encoder.session_options->provider_options.empty());
}

TEST(ConfigTests, Errors) {
  Config config;

  // Unknown keys are errors, not silently ignored
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"encoder": {"hiden_size": 512}}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"speed": 2})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"type": "whisper"}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"session_options": {"graph_optimization_level": "max"}}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"encoder": {"hidden_size": 0}}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"decoder_joint": {"num_layers": 1.5}}})"), std::runtime_error);
  // Past the int range
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"encoder": {"hidden_size": 1e20}}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"decoder_joint": {"num_durations": -1e20}}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"session_options": {"intra_op_num_threads": 4294967296}}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"session_options": {"log_severity_level": -1}}})"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {"encoder": )"), std::runtime_error);
  EXPECT_THROW(OverlayConfig(config, R"({"model": {}} trailing)"), std::runtime_error);

  try {
    OverlayConfig(config, "{\n  \"model\": {\n    \"vocabulary\": { \"path\": \"x\" }\n  }\n}");
    FAIL() << "Expected an error";
  } catch (const std::runtime_error& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("path"), std::string::npos) << message;
    EXPECT_NE(message.find("line"), std::string::npos) << message;
  }

  test_utils::TempDirectory directory{"config_errors"};
  test_utils::WriteFile(directory.Path() / Config::FileName, std::string("{ \"model\": [] }"));
  try {
    Config bad{directory.Path()};
    FAIL() << "Expected an error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(std::string(Config::FileName)), std::string::npos);
  }
}

namespace {

struct Collect_Element : JSON::Element {
  void OnString(std::string_view name, std::string_view value) override { strings.emplace_back(std::string(name) + "=" + std::string(value)); }
  void OnNumber(std::string_view name, double value) override { numbers.push_back(value); }
  void OnBool(std::string_view name, bool value) override { bools.push_back(value); }
  void OnNull(std::string_view name) override { nulls++; }
  JSON::Element& OnArray(std::string_view name) override { return *this; }
  JSON::Element& OnObject(std::string_view name) override { return *this; }

  std::vector<std::string> strings;
  std::vector<double> numbers;
  std::vector<bool> bools;
  int nulls{};
};

}  // namespace

TEST(JsonTests, Values) {
  Collect_Element root;
  JSON::Parse(root, R"({"a": "x\tyé\"", "n": [1, -2.5, 3e2], "t": true, "f": false, "z": null, "o": {"b": "c"}})");

  ASSERT_EQ(root.strings.size(), 2u);
  EXPECT_EQ(root.strings[0], "a=x\ty\xC3\xA9\"");
  EXPECT_EQ(root.strings[1], "b=c");
  EXPECT_EQ(root.numbers, (std::vector<double>{1, -2.5, 300}));
  EXPECT_EQ(root.bools, (std::vector<bool>{true, false}));
  EXPECT_EQ(root.nulls, 1);
}

TEST(JsonTests, Escapes) {
  Collect_Element root;
  JSON::Parse(root, R"(["\u00e9", "\u2581", "\ud83d\ude00"])");
  ASSERT_EQ(root.strings.size(), 3u);
  EXPECT_EQ(root.strings[0], "=\xC3\xA9");
  EXPECT_EQ(root.strings[1], "=\xE2\x96\x81");
  EXPECT_EQ(root.strings[2], "=\xF0\x9F\x98\x80");
}

TEST(JsonTests, Errors) {
  Collect_Element root;
  EXPECT_THROW(JSON::Parse(root, "[01]"), std::runtime_error);
  EXPECT_THROW(JSON::Parse(root, "[-inf]"), std::runtime_error);
  EXPECT_THROW(JSON::Parse(root, "[\"\\ud83d\"]"), std::runtime_error);
  EXPECT_THROW(JSON::Parse(root, "[1,]"), std::runtime_error);
  EXPECT_THROW(JSON::Parse(root, ""), std::runtime_error);

  try {
    JSON::Parse(root, "{\n  \"a\": tru\n}");
    FAIL() << "Expected an error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos) << e.what();
  }
}

TEST(LoggingTests, Options) {
  EXPECT_THROW(SetLogBool("not_an_option", true), std::runtime_error);
  EXPECT_THROW(SetLogString("not_an_option", "x"), std::runtime_error);

  SetLogBool("decoder_steps", true);
  EXPECT_TRUE(g_log.decoder_steps);
  SetLogBool("decoder_steps", false);
  EXPECT_FALSE(g_log.decoder_steps);
}

namespace {
std::string g_logged;
void CollectLog(const char* string, size_t length) {
  g_logged.append(string, length);
}
}  // namespace

TEST(LoggingTests, Callback) {
  g_logged.clear();
  SetLogBool("enabled", true);
  SetLogBool("ansi_tags", false);
  SetLogCallback(CollectLog);

  Log("warning", "something to look at");

  SetLogCallback(nullptr);
  SetLogBool("ansi_tags", true);
  SetLogBool("enabled", false);

  EXPECT_NE(g_logged.find("warning"), std::string::npos);
  EXPECT_NE(g_logged.find("something to look at"), std::string::npos);
  EXPECT_EQ(g_logged.find("\x1b["), std::string::npos);
}
