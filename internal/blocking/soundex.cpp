#include "internal/blocking/soundex.hpp"

#include <cctype>

namespace resolver::blocking {

namespace {

// '0' separates codes (vowels, y); 'h' and 'w' are skipped without
// separating.
char Code(char lower) {
  switch (lower) {
    case 'b':
    case 'f':
    case 'p':
    case 'v':
      return '1';
    case 'c':
    case 'g':
    case 'j':
    case 'k':
    case 'q':
    case 's':
    case 'x':
    case 'z':
      return '2';
    case 'd':
    case 't':
      return '3';
    case 'l':
      return '4';
    case 'm':
    case 'n':
      return '5';
    case 'r':
      return '6';
    case 'h':
    case 'w':
      return 'h';
    default:
      return '0';
  }
}

} // namespace

std::string Soundex(std::string_view word) {
  std::string out;
  char        previous = 0;

  for (char raw : word) {
    const auto uc = static_cast<unsigned char>(raw);
    if (!std::isalpha(uc)) continue;
    const char lower = static_cast<char>(std::tolower(uc));
    const char code  = Code(lower);

    if (out.empty()) {
      out.push_back(static_cast<char>(std::toupper(uc)));
      previous = code;
      continue;
    }
    if (code == 'h') continue;
    if (code != '0' && code != previous) {
      out.push_back(code);
      if (out.size() == 4) break;
    }
    previous = code;
  }

  if (out.empty()) return out;
  out.resize(4, '0');
  return out;
}

} // namespace resolver::blocking
