#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace resolver::model {

enum class ParseType : std::uint8_t {
  kUnknown      = 0,
  kPerson       = 1,
  kOrganization = 2,
  kHousehold    = 3,
};

constexpr std::string_view ToString(ParseType type) {
  switch (type) {
    case ParseType::kPerson:
      return "Person";
    case ParseType::kOrganization:
      return "Organization";
    case ParseType::kHousehold:
      return "Household";
    case ParseType::kUnknown:
    default:
      return "Unknown";
  }
}

// Accepts the spellings used by the upstream extractors
// ("individual", "corporation", ...), case-insensitively.
inline std::optional<ParseType> ParseTypeFromString(std::string_view value) {
  std::string lowered;
  lowered.reserve(value.size());
  for (char c : value) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lowered == "person" || lowered == "individual") return ParseType::kPerson;
  if (lowered == "organization" || lowered == "organisation" || lowered == "corporation") return ParseType::kOrganization;
  if (lowered == "household") return ParseType::kHousehold;
  if (lowered == "unknown") return ParseType::kUnknown;
  return std::nullopt;
}

// Two types conflict only when both are known and differ.
constexpr bool TypesConflict(ParseType a, ParseType b) {
  return a != ParseType::kUnknown && b != ParseType::kUnknown && a != b;
}

} // namespace resolver::model
