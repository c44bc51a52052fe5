#pragma once

#include <string_view>

#include "internal/parser/name_parser.hpp"

namespace resolver::parser {

/*
  Rule-based segmenter for Western-order personal names, organizations
  and the placeholder strings the upstream extractors emit.

  Rules, first match wins:
    no letters                      -> failed, confidence 0
    placeholder ("Female (2)", "?") -> Unknown, 0.1, placeholder
    organization marker             -> Organization, 0.8
    joined ("A & B", "A and B")     -> Household, 0.3, no components
    "Family, Given Middle"          -> Person, 0.9 (0.5 initials-only given)
    "Given Middle Family"           -> Person, 0.9 (0.7 with an initial,
                                       0.3 initials-only)
    single word                     -> family only, Unknown, 0.1 (0.0 for
                                       a single letter)

  Stateless; one instance can be shared by every worker.
*/
class RuleNameParser final : public NameParser {
 public:
  model::ParseResult Parse(std::string_view raw_name) const override;
};

// "Female (2)", "Male", "male 12": descriptive stand-in for an unnamed
// person, as opposed to a generic unknown marker.
bool IsDescriptivePlaceholder(std::string_view raw_name);

} // namespace resolver::parser
