#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace resolver::parser {

/*
  Comparison-key normalization for names.

  Used only to derive blocking keys and similarity inputs; the raw name
  and parsed components keep their original spelling.

  - Latin-1 and Latin Extended-A letters are folded to ASCII
    ("Müller" -> "Muller", "Łukasz" -> "Lukasz", "ß" -> "ss")
  - letters of other scripts are kept as UTF-8 ("Петров", "李")
  - other non-ASCII symbols and combining marks are dropped
  - output is lowercase (Cyrillic, Greek and Armenian case pairs included)
*/

// Fold Latin diacritics to ASCII, keep other scripts' letters, case and
// punctuation.
std::string FoldDiacritics(std::string_view utf8);

// Code points of a UTF-8 string; invalid bytes decode to U+FFFD.
std::u32string DecodeUtf8(std::string_view utf8);

// Folded, lowercase, letters and digits only ("O'Brien-Smith" -> "obriensmith").
std::string NormalizeToken(std::string_view token);

// Folded, lowercase; apostrophes dropped, other punctuation becomes a
// separator; whitespace collapsed and trimmed ("Smith,  John A." -> "smith john a").
std::string NormalizeFullName(std::string_view name);

// Number of letters after folding, in any script.
std::size_t LetterCount(std::string_view token);

// Trims and collapses ASCII whitespace, leaves everything else untouched.
std::string CollapseWhitespace(std::string_view text);

} // namespace resolver::parser
