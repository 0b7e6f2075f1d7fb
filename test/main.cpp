// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <iostream>
#include <string>

#include <gtest/gtest.h>

#include "ort_transcribe.h"

// Directory of the parakeet model, overrides MODEL_PATH when given
std::string g_custom_model_path;

int main(int argc, char** argv) {
  std::cout << "ONNX Runtime Transcribe Tests" << std::endl;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--model_path" && i + 1 < argc) {
      g_custom_model_path = argv[++i];
      std::cout << "Using custom model path: " << g_custom_model_path << std::endl;
      break;
    }
  }

  try {
    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();
    std::cout << "Shutting down OnnxRuntime... ";
    OtrShutdown();
    std::cout << "done" << std::endl;
    return result;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
