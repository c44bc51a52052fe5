#pragma once

#include <string>
#include <string_view>

namespace resolver::blocking {

// American Soundex ("Robert" -> "R163", "Tymczak" -> "T522").
// Non-letters are skipped; returns "" when the input has no letter.
std::string Soundex(std::string_view word);

} // namespace resolver::blocking
