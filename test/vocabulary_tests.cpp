// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "errors.h"
#include "models/vocabulary.h"
#include "test_utils.h"

using namespace Transcribe;

TEST(VocabularyTests, BlankMarker) {
  test_utils::TempDirectory directory{"vocab_blank"};
  auto path = directory.Path() / "vocab.txt";
  test_utils::WriteFile(path, "<unk> 0\n\xE2\x96\x81the 1\ns 2\n<blk> 3\nlast 4\n");

  auto vocabulary = Vocabulary::Load(path, "<blk>");
  EXPECT_EQ(vocabulary.Size(), 5);
  EXPECT_EQ(vocabulary.BlankId(), 3);
  EXPECT_EQ(vocabulary[1], "\xE2\x96\x81the");
}

TEST(VocabularyTests, LastEntryIsBlankWithoutMarker) {
  test_utils::TempDirectory directory{"vocab_no_blank"};
  auto path = directory.Path() / "vocab.txt";
  test_utils::WriteFile(path, "a 0\nb 1\nc 2\n");

  auto vocabulary = Vocabulary::Load(path, "<blk>");
  EXPECT_EQ(vocabulary.Size(), 3);
  EXPECT_EQ(vocabulary.BlankId(), 2);
}

TEST(VocabularyTests, BlankLinesAndLineEndings) {
  test_utils::TempDirectory directory{"vocab_lines"};
  auto path = directory.Path() / "vocab.txt";
  // CRLF endings, blank lines and tab separated scores. The blank index counts tokens, not lines.
  test_utils::WriteFile(path, "a\t0\r\n\r\n   \nb 1\r\n<blk>\t2\r\nc");

  auto vocabulary = Vocabulary::Load(path, "<blk>");
  ASSERT_EQ(vocabulary.Size(), 4);
  EXPECT_EQ(vocabulary[0], "a");
  EXPECT_EQ(vocabulary[1], "b");
  EXPECT_EQ(vocabulary[3], "c");
  EXPECT_EQ(vocabulary.BlankId(), 2);
}

TEST(VocabularyTests, ConfigurableBlankToken) {
  auto vocabulary = Vocabulary{{"x", "<pad>", "y"}, "<pad>"};
  EXPECT_EQ(vocabulary.BlankId(), 1);
}

TEST(VocabularyTests, LoadIsIdempotent) {
  test_utils::TempDirectory directory{"vocab_idempotent"};
  auto path = directory.Path() / "vocab.txt";
  test_utils::WriteFile(path, "a 0\n<blk> 1\nb 2\n");

  auto first = Vocabulary::Load(path, "<blk>");
  auto second = Vocabulary::Load(path, "<blk>");
  EXPECT_EQ(first.Size(), second.Size());
  EXPECT_EQ(first.BlankId(), second.BlankId());
}

TEST(VocabularyTests, LoadErrors) {
  test_utils::TempDirectory directory{"vocab_errors"};

  EXPECT_THROW(Vocabulary::Load(directory.Path() / "missing.txt", "<blk>"), VocabLoadError);

  auto empty = directory.Path() / "empty.txt";
  test_utils::WriteFile(empty, "\n  \n\r\n");
  EXPECT_THROW(Vocabulary::Load(empty, "<blk>"), VocabLoadError);

  EXPECT_THROW((Vocabulary{{}, "<blk>"}), VocabLoadError);
}

TEST(VocabularyTests, Detokenize) {
  Vocabulary vocabulary{{"\xE2\x96\x81hello", "\xE2\x96\x81wor", "ld", "!", "<blk>"}, "<blk>"};

  std::vector<int32_t> ids{0, 1, 2};
  EXPECT_EQ(vocabulary.Detokenize(ids), "hello world");

  ids.push_back(3);
  EXPECT_EQ(vocabulary.Detokenize(ids), "hello world!");

  EXPECT_EQ(vocabulary.Detokenize({}), "");

  Vocabulary spaces{{"\xE2\x96\x81", "a", "<blk>"}, "<blk>"};
  std::vector<int32_t> padded{0, 0, 1, 0};
  EXPECT_EQ(spaces.Detokenize(padded), "a");
}

TEST(VocabularyTests, DetokenizeRejectsUnknownIds) {
  Vocabulary vocabulary{{"a", "<blk>"}, "<blk>"};
  std::vector<int32_t> ids{5};
  EXPECT_THROW(vocabulary.Detokenize(ids), std::out_of_range);
}
