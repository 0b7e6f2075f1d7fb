// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "vocabulary.h"
#include "../errors.h"
#include "../logging.h"
#include "../string_utils.h"

#include <fstream>
#include <utility>

namespace Transcribe {

Vocabulary::Vocabulary(std::vector<std::string> tokens, std::string_view blank_token) : tokens_{std::move(tokens)} {
  if (tokens_.empty())
    throw VocabLoadError("vocabulary has no tokens");

  // Without an explicit blank marker the blank is the last entry
  blank_id_ = Size() - 1;
  for (int32_t i = 0; i < Size(); i++) {
    if (tokens_[i] == blank_token) {
      blank_id_ = i;
      break;
    }
  }
}

Vocabulary Vocabulary::Load(const std::filesystem::path& path, std::string_view blank_token) {
  std::ifstream file(path);
  if (!file.is_open())
    throw VocabLoadError("error opening " + path.string());

  std::vector<std::string> tokens;
  std::string line;
  while (std::getline(file, line)) {
    // The token is the first field, what follows (the token score) is unused
    auto field = TrimWhitespace(line);
    field = field.substr(0, field.find_first_of(" \t\v\f"));
    if (!field.empty())
      tokens.emplace_back(field);
  }
  if (file.bad())
    throw VocabLoadError("error reading " + path.string());
  if (tokens.empty())
    throw VocabLoadError(path.string() + " has no tokens");

  Vocabulary vocabulary{std::move(tokens), blank_token};
  if (g_log.enabled && g_log.warning && vocabulary[vocabulary.BlankId()] != blank_token)
    Log("warning", MakeString("No ", blank_token, " token in ", path.string(), ", using the last entry '", vocabulary[vocabulary.BlankId()], "' as the blank"));
  return vocabulary;
}

std::string Vocabulary::Detokenize(std::span<const int32_t> ids) const {
  std::string text;
  for (auto id : ids)
    text += tokens_.at(id);
  ReplaceAll(text, WordBoundary, " ");
  return std::string{TrimWhitespace(text)};
}

}  // namespace Transcribe
