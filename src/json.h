// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License.
#pragma once
// JSON Parser
//
// Implement one JSON::Element per JSON element of interest (it's per element, so a JSON tree structure
// requires a tree of JSON::Element objects), then call JSON::Parse with the root element and the document.
//
// For the elements inside of an array, the names will be empty strings.
// The root element also has no name.
//
#include <stdexcept>
#include <string_view>

namespace JSON {
struct unknown_value_error : std::exception {};  // Throw this from any Element callback to report the unknown value name
struct type_mismatch : std::exception {};        // Throw this when a value has the wrong JSON type for its name

struct Element {
  virtual ~Element() = default;

  virtual void OnComplete(bool empty) {}  // Called when parsing for this element is finished (empty is true when it's an empty element)

  virtual void OnString(std::string_view name, std::string_view value) { throw unknown_value_error{}; }
  virtual void OnNumber(std::string_view name, double value) { throw unknown_value_error{}; }
  virtual void OnBool(std::string_view name, bool value) { throw unknown_value_error{}; }
  virtual void OnNull(std::string_view name) { throw unknown_value_error{}; }

  virtual Element& OnArray(std::string_view name) { throw unknown_value_error{}; }
  virtual Element& OnObject(std::string_view name) { throw unknown_value_error{}; }
};

void Parse(Element& element, std::string_view document);
}  // namespace JSON
