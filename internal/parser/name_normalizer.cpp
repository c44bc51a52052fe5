#include "internal/parser/name_normalizer.hpp"

#include <cctype>
#include <cstdint>
#include <string>

namespace resolver::parser {

namespace {

// ASCII fold for U+00C0..U+017F. Empty entries are dropped (multiplication
// and division signs).
constexpr const char* kLatinFold[] = {
    "A", "A", "A", "A", "A", "A", "AE", "C",  // U+00C0
    "E", "E", "E", "E", "I", "I", "I",  "I",  // U+00C8
    "D", "N", "O", "O", "O", "O", "O",  "",   // U+00D0
    "O", "U", "U", "U", "U", "Y", "TH", "ss", // U+00D8
    "a", "a", "a", "a", "a", "a", "ae", "c",  // U+00E0
    "e", "e", "e", "e", "i", "i", "i",  "i",  // U+00E8
    "d", "n", "o", "o", "o", "o", "o",  "",   // U+00F0
    "o", "u", "u", "u", "u", "y", "th", "y",  // U+00F8
    "A", "a", "A", "a", "A", "a", "C",  "c",  // U+0100
    "C", "c", "C", "c", "C", "c", "D",  "d",  // U+0108
    "D", "d", "E", "e", "E", "e", "E",  "e",  // U+0110
    "E", "e", "E", "e", "G", "g", "G",  "g",  // U+0118
    "G", "g", "G", "g", "H", "h", "H",  "h",  // U+0120
    "I", "i", "I", "i", "I", "i", "I",  "i",  // U+0128
    "I", "i", "IJ", "ij", "J", "j", "K", "k", // U+0130
    "k", "L", "l", "L", "l", "L", "l",  "L",  // U+0138
    "l", "L", "l", "N", "n", "N", "n",  "N",  // U+0140
    "n", "n", "N", "n", "O", "o", "O",  "o",  // U+0148
    "O", "o", "OE", "oe", "R", "r", "R", "r", // U+0150
    "R", "r", "S", "s", "S", "s", "S",  "s",  // U+0158
    "S", "s", "T", "t", "T", "t", "T",  "t",  // U+0160
    "U", "u", "U", "u", "U", "u", "U",  "u",  // U+0168
    "U", "u", "U", "u", "W", "w", "Y",  "y",  // U+0170
    "Y", "Z", "z", "Z", "z", "Z", "z",  "s",  // U+0178
};

constexpr char32_t kFoldFirst = 0x00C0;
constexpr char32_t kFoldLast  = 0x017F;

// Decodes one UTF-8 sequence starting at `i`; invalid bytes decode to
// U+FFFD and consume a single byte.
char32_t NextCodePoint(std::string_view s, std::size_t& i) {
  const auto lead = static_cast<unsigned char>(s[i]);
  if (lead < 0x80) {
    ++i;
    return lead;
  }

  std::size_t len = 0;
  char32_t    cp  = 0;
  if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp  = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp  = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp  = lead & 0x07;
  } else {
    ++i;
    return 0xFFFD;
  }

  if (i + len > s.size()) {
    ++i;
    return 0xFFFD;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const auto cont = static_cast<unsigned char>(s[i + k]);
    if ((cont & 0xC0) != 0x80) {
      ++i;
      return 0xFFFD;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  i += len;
  return cp;
}

bool IsApostrophe(char32_t cp) {
  return cp == '\'' || cp == 0x2019 || cp == 0x2018 || cp == '`';
}

// Letters past Latin Extended-A. Combining marks, general punctuation,
// symbols, CJK punctuation, fullwidth ASCII punctuation, private use and
// emoji are not letters.
bool IsScriptLetter(char32_t cp) {
  if (cp <= kFoldLast) return false;
  if (cp >= 0x02B0 && cp <= 0x036F) return false;
  if (cp >= 0x2000 && cp <= 0x2BFF) return false;
  if (cp >= 0x3000 && cp <= 0x303F) return false;
  if (cp >= 0xD800 && cp <= 0xF8FF) return false;
  if (cp >= 0xFE00 && cp <= 0xFE0F) return false;
  if (cp >= 0xFF00 && cp <= 0xFF20) return false;
  if (cp == 0xFFFD) return false;
  return cp < 0x1F000;
}

char32_t LowerScriptLetter(char32_t cp) {
  if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20; // Cyrillic А..Я
  if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50; // Cyrillic Ѐ..Џ
  if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20; // Greek Α..Ω
  if (cp >= 0x0531 && cp <= 0x0556) return cp + 0x30; // Armenian
  return cp;
}

void AppendUtf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Folded text only carries non-ASCII bytes for kept script letters.
bool IsLetterByte(unsigned char uc) {
  return uc >= 0x80 || std::isalnum(uc);
}

std::string Fold(std::string_view utf8, bool lower) {
  std::string out;
  out.reserve(utf8.size());

  std::size_t i = 0;
  while (i < utf8.size()) {
    const char32_t cp = NextCodePoint(utf8, i);
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp >= kFoldFirst && cp <= kFoldLast) {
      out += kLatinFold[cp - kFoldFirst];
    } else if (IsScriptLetter(cp)) {
      AppendUtf8(out, lower ? LowerScriptLetter(cp) : cp);
    } else if (IsApostrophe(cp)) {
      out.push_back('\'');
    } else if (cp == 0x2013 || cp == 0x2014 || cp == 0x00A0) {
      // dashes and no-break space separate tokens
      out.push_back(' ');
    }
  }
  return out;
}

} // namespace

std::string FoldDiacritics(std::string_view utf8) {
  return Fold(utf8, false);
}

std::u32string DecodeUtf8(std::string_view utf8) {
  std::u32string out;
  out.reserve(utf8.size());
  std::size_t i = 0;
  while (i < utf8.size()) out.push_back(NextCodePoint(utf8, i));
  return out;
}

std::string NormalizeToken(std::string_view token) {
  std::string out;
  for (char c : Fold(token, true)) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x80) {
      out.push_back(c);
    } else if (std::isalnum(uc)) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  return out;
}

std::string NormalizeFullName(std::string_view name) {
  std::string out;
  bool        pending_space = false;
  for (char c : Fold(name, true)) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == '\'') {
      continue;
    }
    if (IsLetterByte(uc)) {
      if (pending_space && !out.empty()) out.push_back(' ');
      pending_space = false;
      out.push_back(uc >= 0x80 ? c : static_cast<char>(std::tolower(uc)));
    } else {
      pending_space = true;
    }
  }
  return out;
}

std::size_t LetterCount(std::string_view token) {
  std::size_t count = 0;
  for (char c : Fold(token, false)) {
    const auto uc = static_cast<unsigned char>(c);
    // one lead byte per kept script letter
    if (std::isalpha(uc) || uc >= 0xC0) ++count;
  }
  return count;
}

std::string CollapseWhitespace(std::string_view text) {
  std::string out;
  bool        pending_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = true;
      continue;
    }
    if (pending_space && !out.empty()) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

} // namespace resolver::parser
