#pragma once

#include <string>
#include <string_view>

#include "internal/db/model/mention_record.hpp"
#include "internal/model/parsed_name.hpp"

namespace resolver::blocking {

// Key of the designated low-confidence block.
inline constexpr std::string_view kUnblockableKey = "";

/*
  Deterministic blocking key from parsed components.

  soundex-v1: Soundex(family) + "-" + first letter of given  ("S530-J")
  soundex-v2: Soundex(family) + "-" + Soundex(given)         ("S530-J500")
  no given name: Soundex(family) alone.
  Names Soundex cannot code (Cyrillic, Greek, CJK, ...) use the normalized
  word in place of the code ("петров-и").

  Failed parses, placeholders, a missing family name (households carry
  none) and initials-only names map to kUnblockableKey. The key depends on the
  components only, never on the parsed type, so identical strings with
  different type hints land in the same block.

  Throws util::ConfigError for an unknown version.
*/
std::string DeriveBlockingKey(const model::ParseResult& parsed, std::string_view version);

std::string DeriveBlockingKey(const db::model::MentionRecord& mention, std::string_view version);

// Normalized "given middle family" used for edit similarity and
// sorted-neighborhood ordering. Falls back to the raw name when the parse
// produced no name components.
std::string ComparisonName(const db::model::MentionRecord& mention);

} // namespace resolver::blocking
