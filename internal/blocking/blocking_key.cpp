#include "internal/blocking/blocking_key.hpp"

#include "internal/blocking/soundex.hpp"
#include "internal/config/resolution_settings.hpp"
#include "internal/parser/name_normalizer.hpp"
#include "internal/util/errors.hpp"

namespace resolver::blocking {

namespace {

bool IsInitials(const std::string& normalized_family, const std::string& normalized_given) {
  return parser::LetterCount(normalized_family) <= 2 && parser::LetterCount(normalized_given) <= 2;
}

// Soundex for Latin names; scripts Soundex cannot code block on the
// normalized word itself.
std::string PhoneticCode(const std::string& normalized) {
  auto code = Soundex(normalized);
  if (!code.empty() || parser::LetterCount(normalized) == 0) return code;
  return normalized;
}

// First UTF-8 sequence of a non-empty string.
std::string FirstLetter(const std::string& code) {
  std::size_t len = 1;
  while (len < code.size() && (static_cast<unsigned char>(code[len]) & 0xC0) == 0x80) ++len;
  return code.substr(0, len);
}

std::string KeyFromComponents(const model::ParsedName& name, bool failed, bool placeholder, std::string_view version) {
  if (version != config::kBlockingKeySoundexV1 && version != config::kBlockingKeySoundexV2) {
    throw util::ConfigError("unknown blocking key version: " + std::string(version));
  }

  if (failed || placeholder || !name.family) {
    return std::string(kUnblockableKey);
  }

  const auto family = parser::NormalizeToken(*name.family);
  const auto given  = name.given ? parser::NormalizeToken(*name.given) : std::string{};
  if (parser::LetterCount(family) < 2 || IsInitials(family, given)) {
    return std::string(kUnblockableKey);
  }

  auto key = PhoneticCode(family);
  if (key.empty()) return std::string(kUnblockableKey);

  const auto given_code = PhoneticCode(given);
  if (given_code.empty()) return key;

  key.push_back('-');
  if (version == config::kBlockingKeySoundexV1) {
    key += FirstLetter(given_code);
  } else {
    key += given_code;
  }
  return key;
}

} // namespace

std::string DeriveBlockingKey(const model::ParseResult& parsed, std::string_view version) {
  return KeyFromComponents(parsed.name, parsed.failed, parsed.placeholder, version);
}

std::string DeriveBlockingKey(const db::model::MentionRecord& mention, std::string_view version) {
  return KeyFromComponents(mention.name, mention.parse_failed, mention.placeholder, version);
}

std::string ComparisonName(const db::model::MentionRecord& mention) {
  std::string joined;
  for (const auto* part : {&mention.name.given, &mention.name.middle, &mention.name.family}) {
    if (!*part) continue;
    if (!joined.empty()) joined.push_back(' ');
    joined += **part;
  }
  auto normalized = parser::NormalizeFullName(joined);
  if (normalized.empty()) normalized = parser::NormalizeFullName(mention.raw_name);
  return normalized;
}

} // namespace resolver::blocking
