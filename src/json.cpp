// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#include "json.h"

#include <charconv>
#include <sstream>
#include <string>
#include <utility>

namespace JSON {

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

struct Parser {
  explicit Parser(std::string_view document) : begin_{document.data()}, current_{begin_}, end_{begin_ + document.size()} {}

  void ParseDocument(Element& root) {
    ParseValue(root, {});
    if (current_ != end_)
      throw std::runtime_error("Unexpected data after the root element");
  }

  // 1 based line and column of the current position, for error messages
  std::pair<int, int> Position() const {
    int line = 1;
    const char* line_start = begin_;
    for (const char* p = begin_; p < current_; p++) {
      if (*p == '\n') {
        line++;
        line_start = p + 1;
      }
    }
    return {line, static_cast<int>(current_ - line_start) + 1};
  }

 private:
  void SkipWhitespace() {
    while (current_ != end_ && (*current_ == ' ' || *current_ == '\t' || *current_ == '\r' || *current_ == '\n'))
      current_++;
  }

  bool Accept(char c) {
    if (current_ == end_ || *current_ != c)
      return false;
    current_++;
    return true;
  }

  bool Accept(std::string_view word) {
    if (static_cast<size_t>(end_ - current_) < word.size() || std::string_view(current_, word.size()) != word)
      return false;
    current_ += word.size();
    return true;
  }

  char Next() {
    if (current_ == end_)
      throw std::runtime_error("Unexpected end of JSON data");
    return *current_++;
  }

  void ParseValue(Element& element, std::string_view name) {
    SkipWhitespace();
    try {
      if (current_ == end_)
        throw std::runtime_error("Unexpected end of JSON data");

      switch (*current_) {
        case '{':
          current_++;
          ParseObject(element.OnObject(name));
          break;
        case '[':
          current_++;
          ParseArray(element.OnArray(name));
          break;
        case '"':
          current_++;
          element.OnString(name, ParseString());
          break;
        default:
          if (Accept("true"))
            element.OnBool(name, true);
          else if (Accept("false"))
            element.OnBool(name, false);
          else if (Accept("null"))
            element.OnNull(name);
          else if (*current_ == '-' || IsDigit(*current_))
            element.OnNumber(name, ParseNumber());
          else
            throw std::runtime_error("Unexpected character");
      }
    } catch (const unknown_value_error&) {
      throw std::runtime_error(" Unknown value \"" + std::string(name) + "\"");
    } catch (const type_mismatch&) {
      throw std::runtime_error(" Unexpected type for value \"" + std::string(name) + "\"");
    } catch (const std::runtime_error& e) {
      if (name.empty())
        throw;
      throw std::runtime_error(std::string(name) + ":" + e.what());
    }
    SkipWhitespace();
  }

  void ParseObject(Element& element) {
    SkipWhitespace();
    if (Accept('}')) {
      element.OnComplete(true);
      return;
    }

    while (true) {
      if (!Accept('"'))
        throw std::runtime_error("Expecting \" to start the next member name, possibly due to a trailing ','");
      const auto name = ParseString();

      SkipWhitespace();
      if (!Accept(':'))
        throw std::runtime_error("Expecting :");

      ParseValue(element, name);

      if (Accept(',')) {
        SkipWhitespace();
        continue;
      }
      if (Accept('}')) {
        element.OnComplete(false);
        return;
      }
      throw std::runtime_error("Expecting } or ,");
    }
  }

  void ParseArray(Element& element) {
    SkipWhitespace();
    if (Accept(']')) {
      element.OnComplete(true);
      return;
    }

    while (true) {
      ParseValue(element, {});
      if (Accept(','))
        continue;
      if (Accept(']')) {
        element.OnComplete(false);
        return;
      }
      throw std::runtime_error("Expecting ] or ,");
    }
  }

  // Checks the JSON number grammar first, from_chars alone would also take "inf", "nan" and leading zeros
  double ParseNumber() {
    const char* p = current_;
    if (p != end_ && *p == '-')
      p++;
    if (p == end_ || !IsDigit(*p))
      throw std::runtime_error("Expecting number");
    if (*p == '0' && p + 1 != end_ && IsDigit(p[1]))
      throw std::runtime_error("Numbers can't have leading zeros");

    double value{};
    auto result = std::from_chars(current_, end_, value);
    if (result.ec != std::errc{})
      throw std::runtime_error("Expecting number");
    current_ = result.ptr;
    return value;
  }

  unsigned ParseHex4() {
    if (end_ - current_ < 4)
      throw std::runtime_error("End of data parsing a \\u escape");
    unsigned value{};
    auto result = std::from_chars(current_, current_ + 4, value, 16);
    if (result.ec != std::errc{} || result.ptr != current_ + 4)
      throw std::runtime_error("Invalid \\u escape");
    current_ += 4;
    return value;
  }

  // \uXXXX, including a surrogate pair for code points past the basic multilingual plane
  unsigned ParseCodePoint() {
    unsigned code_point = ParseHex4();
    if (code_point >= 0xDC00 && code_point <= 0xDFFF)
      throw std::runtime_error("Unpaired low surrogate in \\u escape");
    if (code_point >= 0xD800 && code_point <= 0xDBFF) {
      if (!Accept("\\u"))
        throw std::runtime_error("Unpaired high surrogate in \\u escape");
      unsigned low = ParseHex4();
      if (low < 0xDC00 || low > 0xDFFF)
        throw std::runtime_error("Invalid low surrogate in \\u escape");
      code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
    }
    return code_point;
  }

  static void AppendUtf8(std::string& string, unsigned code_point) {
    if (code_point < 0x80) {
      string.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
      string.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
      string.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
      string.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
      string.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
      string.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
      string.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
      string.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
      string.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
      string.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
  }

  // The opening quote has already been consumed
  std::string ParseString() {
    std::string string;
    while (true) {
      char c = Next();
      if (c == '"')
        return string;
      if (static_cast<unsigned char>(c) < 0x20)
        throw std::runtime_error("Control character in string");
      if (c != '\\') {
        string.push_back(c);
        continue;
      }

      switch (c = Next()) {
        case '"':
        case '\\':
        case '/':
          string.push_back(c);
          break;
        case 'b':
          string.push_back('\b');
          break;
        case 'f':
          string.push_back('\f');
          break;
        case 'n':
          string.push_back('\n');
          break;
        case 'r':
          string.push_back('\r');
          break;
        case 't':
          string.push_back('\t');
          break;
        case 'u':
          AppendUtf8(string, ParseCodePoint());
          break;
        default:
          throw std::runtime_error("Invalid escape sequence");
      }
    }
  }

  const char* begin_;
  const char* current_;
  const char* end_;
};

}  // namespace

void Parse(Element& element, std::string_view document) {
  Parser parser{document};
  try {
    parser.ParseDocument(element);
  } catch (const std::exception& e) {
    auto [line, column] = parser.Position();
    std::ostringstream message;
    message << "JSON Error: " << e.what() << " at line " << line << " column " << column;
    throw std::runtime_error(message.str());
  }
}

}  // namespace JSON
