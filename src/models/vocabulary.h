// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Transcribe {

// SentencePiece word boundary marker U+2581
constexpr std::string_view WordBoundary = "\xE2\x96\x81";

// The token table of the model, one token per line of vocab.txt
struct Vocabulary {
  Vocabulary() = default;
  Vocabulary(std::vector<std::string> tokens, std::string_view blank_token);

  // Throws VocabLoadError when the file can't be read or holds no tokens
  static Vocabulary Load(const std::filesystem::path& path, std::string_view blank_token);

  bool Empty() const { return tokens_.empty(); }
  int32_t Size() const { return static_cast<int32_t>(tokens_.size()); }
  int32_t BlankId() const { return blank_id_; }

  const std::string& operator[](int32_t id) const { return tokens_.at(id); }

  // Joins the token texts, turns word boundaries into spaces and trims the ends
  std::string Detokenize(std::span<const int32_t> ids) const;

 private:
  std::vector<std::string> tokens_;
  int32_t blank_id_{-1};
};

}  // namespace Transcribe
