// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "test_utils.h"

// Builds small ONNX graphs in memory so the inference sessions can be tested without exported models.
// Field numbers follow onnx/onnx.proto.

namespace test_utils {

// Only the integer attribute kinds are needed by the test graphs
struct NodeAttribute {
  std::string name;
  std::vector<int64_t> values;
  bool is_list{};  // INTS when set, else an INT holding values[0]

  static NodeAttribute Int(const std::string& name, int64_t value) { return {name, {value}, false}; }
  static NodeAttribute Ints(const std::string& name, std::vector<int64_t> values) { return {name, std::move(values), true}; }
};

struct NodeConfig {
  std::string op_type;
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::vector<NodeAttribute> attributes;
};

// A graph input or output. Negative dimensions are symbolic and an empty shape leaves the rank unknown.
struct TensorConfig {
  std::string name;
  ONNXTensorElementDataType elem_type;
  std::vector<int64_t> shape;
};

struct FloatInitializer {
  std::string name;
  std::vector<int64_t> dims;
  std::vector<float> values;
};

struct ModelConfig {
  std::vector<TensorConfig> inputs;
  std::vector<TensorConfig> outputs;
  std::vector<NodeConfig> nodes;
  std::vector<FloatInitializer> initializers;

  // Unsqueeze takes its axes as an attribute up to opset 12
  int opset_version{11};
};

class ModelBuilder {
 public:
  // Serializes the configuration as an ONNX ModelProto
  static std::vector<uint8_t> Build(const ModelConfig& config) {
    std::vector<uint8_t> opset_import;
    EncodeString(opset_import, 1, "");  // Default domain
    EncodeInt64(opset_import, 2, config.opset_version);

    std::vector<uint8_t> result;
    EncodeInt64(result, 1, 7);  // ir_version
    EncodeString(result, 2, "ort-transcribe tests");
    EncodeMessage(result, 7, BuildGraphProto(config));
    EncodeMessage(result, 8, opset_import);
    return result;
  }

 private:
  static void EncodeVarint(std::vector<uint8_t>& buffer, uint64_t value) {
    while (value >= 0x80) {
      buffer.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
      value >>= 7;
    }
    buffer.push_back(static_cast<uint8_t>(value));
  }

  static void EncodeKey(std::vector<uint8_t>& buffer, uint32_t field_number, uint32_t wire_type) {
    EncodeVarint(buffer, (field_number << 3) | wire_type);
  }

  static void EncodeString(std::vector<uint8_t>& buffer, uint32_t field_number, const std::string& value) {
    EncodeKey(buffer, field_number, 2);
    EncodeVarint(buffer, value.size());
    buffer.insert(buffer.end(), value.begin(), value.end());
  }

  static void EncodeInt64(std::vector<uint8_t>& buffer, uint32_t field_number, int64_t value) {
    EncodeKey(buffer, field_number, 0);
    EncodeVarint(buffer, static_cast<uint64_t>(value));
  }

  static void EncodeFloat(std::vector<uint8_t>& buffer, uint32_t field_number, float value) {
    EncodeKey(buffer, field_number, 5);
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int shift = 0; shift < 32; shift += 8)
      buffer.push_back(static_cast<uint8_t>(bits >> shift));
  }

  static void EncodeMessage(std::vector<uint8_t>& buffer, uint32_t field_number, const std::vector<uint8_t>& message) {
    EncodeKey(buffer, field_number, 2);
    EncodeVarint(buffer, message.size());
    buffer.insert(buffer.end(), message.begin(), message.end());
  }

  static std::vector<uint8_t> BuildAttributeProto(const NodeAttribute& attribute) {
    constexpr int64_t INT = 2, INTS = 7;  // AttributeProto::AttributeType

    std::vector<uint8_t> result;
    EncodeString(result, 1, attribute.name);
    EncodeInt64(result, 20, attribute.is_list ? INTS : INT);
    if (attribute.is_list) {
      for (auto value : attribute.values)
        EncodeInt64(result, 8, value);  // ints
    } else {
      EncodeInt64(result, 3, attribute.values.at(0));  // i
    }
    return result;
  }

  static std::vector<uint8_t> BuildNodeProto(const NodeConfig& node) {
    std::vector<uint8_t> result;
    for (auto& input : node.inputs)
      EncodeString(result, 1, input);
    for (auto& output : node.outputs)
      EncodeString(result, 2, output);
    EncodeString(result, 4, node.op_type);
    for (auto& attribute : node.attributes)
      EncodeMessage(result, 5, BuildAttributeProto(attribute));
    return result;
  }

  static std::vector<uint8_t> BuildValueInfoProto(const TensorConfig& tensor) {
    std::vector<uint8_t> tensor_type;
    EncodeInt64(tensor_type, 1, static_cast<int64_t>(tensor.elem_type));
    if (!tensor.shape.empty()) {
      std::vector<uint8_t> shape;
      for (size_t i = 0; i < tensor.shape.size(); i++) {
        std::vector<uint8_t> dim;
        if (tensor.shape[i] < 0)
          EncodeString(dim, 2, tensor.name + "_dim" + std::to_string(i));  // dim_param
        else
          EncodeInt64(dim, 1, tensor.shape[i]);  // dim_value
        EncodeMessage(shape, 1, dim);
      }
      EncodeMessage(tensor_type, 2, shape);
    }

    std::vector<uint8_t> type;
    EncodeMessage(type, 1, tensor_type);

    std::vector<uint8_t> result;
    EncodeString(result, 1, tensor.name);
    EncodeMessage(result, 2, type);
    return result;
  }

  static std::vector<uint8_t> BuildTensorProto(const FloatInitializer& initializer) {
    std::vector<uint8_t> result;
    for (auto dim : initializer.dims)
      EncodeInt64(result, 1, dim);
    EncodeInt64(result, 2, ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT);
    for (auto value : initializer.values)
      EncodeFloat(result, 4, value);  // float_data
    EncodeString(result, 8, initializer.name);
    return result;
  }

  static std::vector<uint8_t> BuildGraphProto(const ModelConfig& config) {
    std::vector<uint8_t> result;
    for (auto& node : config.nodes)
      EncodeMessage(result, 1, BuildNodeProto(node));
    EncodeString(result, 2, "test_graph");
    for (auto& initializer : config.initializers)
      EncodeMessage(result, 5, BuildTensorProto(initializer));
    for (auto& input : config.inputs)
      EncodeMessage(result, 11, BuildValueInfoProto(input));
    for (auto& output : config.outputs)
      EncodeMessage(result, 12, BuildValueInfoProto(output));
    return result;
  }
};

inline void WriteModel(const std::filesystem::path& path, const ModelConfig& config) {
  WriteFile(path, ModelBuilder::Build(config));
}

}  // namespace test_utils
