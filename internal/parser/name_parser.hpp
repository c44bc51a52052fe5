#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/parsed_name.hpp"

namespace resolver::parser {

/*
  Name parser adapter boundary.

  Implementations turn one raw name into a model::ParseResult and nothing
  else: no parser-specific types cross this interface. Parse() must be
  pure (same input, same output) and safe to call from several threads.
*/
class NameParser {
 public:
  virtual ~NameParser() = default;

  virtual model::ParseResult Parse(std::string_view raw_name) const = 0;
};

// Optional structured fields supplied by the upstream extractor.
struct NameHints {
  std::optional<model::ParseType> type;
  std::optional<std::string>      given;
  std::optional<std::string>      family;
};

// Type hint overrides the parsed type; given/family hints only fill
// components the parser left empty. Failed and placeholder results keep
// their components empty.
void ApplyHints(model::ParseResult& result, const NameHints& hints);

} // namespace resolver::parser
