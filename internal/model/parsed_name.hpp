#pragma once

#include <optional>
#include <string>

#include "internal/model/parse_type.hpp"

namespace resolver::model {

/*
  Structured name components.

  Every field is nullable: a component the parser could not identify is
  std::nullopt, never an empty string.
*/
struct ParsedName {
  std::optional<std::string> prefix;
  std::optional<std::string> given;
  std::optional<std::string> middle;
  std::optional<std::string> family;
  std::optional<std::string> suffix;
  std::optional<std::string> nickname;

  bool Empty() const {
    return !prefix && !given && !middle && !family && !suffix && !nickname;
  }
};

/*
  Fixed tagged result of the parser adapter.

  failed      -> the string could not be segmented at all (confidence 0)
  placeholder -> the string is a stand-in for an unnamed person
                 ("Female (2)", "Unknown") rather than a name
*/
struct ParseResult {
  ParsedName name;
  ParseType  type        = ParseType::kUnknown;
  double     confidence  = 0.0;
  bool       failed      = false;
  bool       placeholder = false;
};

} // namespace resolver::model
