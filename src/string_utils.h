// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Transcribe {

template <typename... Args>
inline std::string MakeString(Args&&... args) {
  std::ostringstream s;
  (s << ... << std::forward<Args>(args));
  return s.str();
}

// Formats a tensor shape as [d0,d1,...]
template <typename T>
inline std::string ShapeToString(const std::vector<T>& shape) {
  std::ostringstream s;
  s << '[';
  for (size_t i = 0; i < shape.size(); i++) {
    if (i != 0)
      s << ',';
    s << shape[i];
  }
  s << ']';
  return s.str();
}

inline void ReplaceAll(std::string& string, std::string_view from, std::string_view to) {
  if (from.empty())
    return;
  for (size_t pos = 0; (pos = string.find(from, pos)) != std::string::npos; pos += to.size())
    string.replace(pos, from.size(), to);
}

inline std::string_view TrimWhitespace(std::string_view string) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";
  const auto first = string.find_first_not_of(whitespace);
  if (first == std::string_view::npos)
    return {};
  const auto last = string.find_last_not_of(whitespace);
  return string.substr(first, last - first + 1);
}

}  // namespace Transcribe
