#include "internal/parser/rule_name_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/parser/name_normalizer.hpp"

namespace resolver::parser {

using model::ParseResult;
using model::ParseType;

namespace {

const std::unordered_set<std::string> kPrefixes = {"mr", "mrs", "ms", "miss", "mx", "dr", "prof", "professor", "sir", "dame", "lady",
                                                   "lord", "rev", "reverend", "hon", "capt", "captain", "madam", "mme", "mlle"};

const std::unordered_set<std::string> kSuffixes = {"jr", "sr", "ii", "iii", "iv", "phd", "md", "esq", "dds", "cpa", "jd", "mba"};

const std::unordered_set<std::string> kLegalForms = {"inc",          "llc",     "ltd",   "corp", "co",  "gmbh", "plc", "sa", "ag", "lp",
                                                     "llp",          "limited", "sarl",  "bv",   "nv",  "pty",  "srl", "spa",
                                                     "incorporated", "company", "corporation"};

const std::unordered_set<std::string> kInstitutionWords = {"foundation", "trust",     "bank",     "group",     "university", "hotel",
                                                           "airlines",   "airline",   "aviation", "holdings",  "associates", "partners",
                                                           "institute",  "hospital",  "ministry", "agency",    "club",       "church",
                                                           "charters",   "charter",   "services", "management", "capital",   "investments"};

// Institution words that are also surnames ("Frank Church", "Lucy Trust").
const std::unordered_set<std::string> kSurnameInstitutionWords = {"trust", "bank", "club", "church", "charter", "capital"};

const std::unordered_set<std::string> kFamilyParticles = {"van", "von", "der", "den", "de", "del", "della", "di", "da", "la",
                                                          "le",  "du",  "st",  "bin", "al", "ibn", "ter",   "ten", "dos", "das"};

const std::unordered_set<std::string> kPlaceholderWords = {"unknown", "unidentified", "anonymous", "female", "male", "none", "null"};

constexpr double kConfidenceFailed       = 0.0;
constexpr double kConfidencePlaceholder  = 0.1;
constexpr double kConfidenceSingleWord   = 0.1;
constexpr double kConfidenceOrganization = 0.8;
constexpr double kConfidenceHousehold    = 0.3;
constexpr double kConfidenceFull         = 0.9;
constexpr double kConfidenceWithInitial  = 0.7;
constexpr double kConfidenceCommaInitial = 0.5;
constexpr double kConfidenceInitialsOnly = 0.3;

std::vector<std::string> SplitTokens(std::string_view s) {
  std::vector<std::string> tokens;
  std::string              current;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) tokens.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) tokens.push_back(std::move(current));
  return tokens;
}

// Strips separators stuck to a token ("Smith," -> "Smith", "J." -> "J").
std::string CleanToken(std::string_view token) {
  constexpr std::string_view kStrip = ".,;:";
  std::size_t                b      = 0;
  std::size_t                e      = token.size();
  while (b < e && kStrip.find(token[b]) != std::string_view::npos) ++b;
  while (e > b && kStrip.find(token[e - 1]) != std::string_view::npos) --e;
  return std::string(token.substr(b, e - b));
}

std::string Join(const std::vector<std::string>& tokens, std::size_t begin, std::size_t end) {
  std::string out;
  for (std::size_t i = begin; i < end && i < tokens.size(); ++i) {
    if (!out.empty()) out.push_back(' ');
    out += tokens[i];
  }
  return out;
}

std::optional<std::string> JoinOpt(const std::vector<std::string>& tokens) {
  if (tokens.empty()) return std::nullopt;
  return Join(tokens, 0, tokens.size());
}

bool AllDigits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool AllShort(const std::vector<std::string>& tokens) {
  return std::all_of(tokens.begin(), tokens.end(), [](const std::string& t) { return LetterCount(t) <= 2; });
}

bool IsInitial(std::string_view token) {
  return LetterCount(token) <= 1;
}

ParseResult Failed() {
  ParseResult r;
  r.failed     = true;
  r.type       = ParseType::kUnknown;
  r.confidence = kConfidenceFailed;
  return r;
}

ParseResult Placeholder() {
  ParseResult r;
  r.placeholder = true;
  r.type        = ParseType::kUnknown;
  r.confidence  = kConfidencePlaceholder;
  return r;
}

bool IsPlaceholder(std::string_view collapsed, const std::string& normalized) {
  if (collapsed.find('?') != std::string_view::npos) return true;
  if (normalized == "n a" || normalized == "na") return true;

  bool saw_word = false;
  for (const auto& token : SplitTokens(normalized)) {
    if (AllDigits(token)) continue;
    if (!kPlaceholderWords.contains(token)) return false;
    saw_word = true;
  }
  return saw_word;
}

bool IsHousehold(std::string_view collapsed) {
  if (collapsed.find('&') != std::string_view::npos || collapsed.find('+') != std::string_view::npos) return true;
  std::string lowered(collapsed);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered.find(" and ") != std::string::npos;
}

bool HasLegalForm(const std::vector<std::string>& tokens) {
  return std::any_of(tokens.begin(), tokens.end(), [](const std::string& t) { return kLegalForms.contains(NormalizeToken(t)); });
}

// An institution word only marks an organization in natural order, and a
// surname-like one not when it is the family token of "Given Family".
bool HasInstitutionWord(const std::vector<std::string>& tokens) {
  std::vector<std::string> core;
  for (const auto& token : tokens) {
    auto norm = NormalizeToken(token);
    if (!norm.empty() && !kPrefixes.contains(norm) && !kSuffixes.contains(norm)) core.push_back(std::move(norm));
  }
  for (std::size_t i = 0; i < core.size(); ++i) {
    if (!kInstitutionWords.contains(core[i])) continue;
    const bool person_shaped = core.size() == 2 && i == 1 && !kInstitutionWords.contains(core[0]);
    if (person_shaped && kSurnameInstitutionWords.contains(core[i])) continue;
    return true;
  }
  return false;
}

// `comma_order` is true when the text already splits as "Family, Given".
std::optional<ParseResult> ParseOrganization(const std::vector<std::string>& tokens, bool comma_order) {
  const bool marker = HasLegalForm(tokens) || (!comma_order && HasInstitutionWord(tokens));
  if (!marker) return std::nullopt;

  std::vector<std::string> core;
  for (const auto& token : tokens) {
    if (kLegalForms.contains(NormalizeToken(token))) continue;
    auto cleaned = CleanToken(token);
    if (!cleaned.empty()) core.push_back(std::move(cleaned));
  }
  // "Smith & Co" leaves a dangling joiner
  while (!core.empty() && (core.back() == "&" || NormalizeToken(core.back()) == "and")) core.pop_back();
  if (core.empty()) {
    for (const auto& token : tokens) core.push_back(CleanToken(token));
  }

  ParseResult r;
  r.type        = ParseType::kOrganization;
  r.confidence  = kConfidenceOrganization;
  r.name.family = Join(core, 0, core.size());
  return r;
}

// Removes the first quoted or parenthesised span and returns its content.
std::optional<std::string> ExtractNickname(std::string& text) {
  for (const auto& [open, close] : {std::pair{'"', '"'}, std::pair{'(', ')'}}) {
    const auto b = text.find(open);
    if (b == std::string::npos) continue;
    const auto e = text.find(close, b + 1);
    if (e == std::string::npos) continue;

    auto inner = CollapseWhitespace(std::string_view(text).substr(b + 1, e - b - 1));
    text.erase(b, e - b + 1);
    if (!inner.empty()) return inner;
  }

  // 'Bud' as a single token
  auto tokens = SplitTokens(text);
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    const auto& t = tokens[i];
    if (t.size() > 2 && t.front() == '\'' && t.back() == '\'') {
      auto nickname = t.substr(1, t.size() - 2);
      tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(i));
      text = Join(tokens, 0, tokens.size());
      return nickname;
    }
  }
  return std::nullopt;
}

struct Peeled {
  std::vector<std::string> prefixes;
  std::vector<std::string> core;
  std::vector<std::string> suffixes;
};

// At least one core token is always kept ("Miss" alone is a name).
Peeled Peel(std::vector<std::string> tokens, bool peel_prefixes, bool peel_suffixes) {
  Peeled p;
  std::size_t b = 0;
  std::size_t e = tokens.size();
  if (peel_prefixes) {
    while (e - b > 1 && kPrefixes.contains(NormalizeToken(tokens[b]))) {
      p.prefixes.push_back(CleanToken(tokens[b]));
      ++b;
    }
  }
  if (peel_suffixes) {
    std::vector<std::string> reversed;
    while (e - b > 1 && kSuffixes.contains(NormalizeToken(tokens[e - 1]))) {
      reversed.push_back(CleanToken(tokens[e - 1]));
      --e;
    }
    p.suffixes.assign(reversed.rbegin(), reversed.rend());
  }
  for (std::size_t i = b; i < e; ++i) {
    auto cleaned = CleanToken(tokens[i]);
    if (!cleaned.empty()) p.core.push_back(std::move(cleaned));
  }
  return p;
}

ParseResult SingleWord(const std::string& word) {
  ParseResult r;
  r.type        = ParseType::kUnknown;
  r.name.family = word;
  r.confidence  = LetterCount(word) <= 1 ? kConfidenceFailed : kConfidenceSingleWord;
  return r;
}

ParseResult NaturalOrder(const Peeled& p) {
  const auto& core = p.core;
  if (core.size() == 1) {
    auto r          = SingleWord(core[0]);
    r.name.prefix   = JoinOpt(p.prefixes);
    r.name.suffix   = JoinOpt(p.suffixes);
    return r;
  }

  // family keeps its particles: "Ludwig van Beethoven"
  std::size_t family_start = core.size() - 1;
  while (family_start > 1 && kFamilyParticles.contains(NormalizeToken(core[family_start - 1]))) --family_start;

  ParseResult r;
  r.type        = ParseType::kPerson;
  r.name.prefix = JoinOpt(p.prefixes);
  r.name.given  = core[0];
  if (family_start > 1) r.name.middle = Join(core, 1, family_start);
  r.name.family = Join(core, family_start, core.size());
  r.name.suffix = JoinOpt(p.suffixes);

  if (AllShort(core)) {
    r.confidence = kConfidenceInitialsOnly;
  } else if (IsInitial(core.front()) || IsInitial(core.back())) {
    r.confidence = kConfidenceWithInitial;
  } else {
    r.confidence = kConfidenceFull;
  }
  return r;
}

std::optional<ParseResult> CommaOrder(const std::string& text) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (true) {
    const auto comma = text.find(',', start);
    parts.push_back(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  if (parts.size() < 2) return std::nullopt;

  auto left  = SplitTokens(parts[0]);
  auto right = SplitTokens(parts[1]);

  std::vector<std::string> trailing_suffixes;
  for (std::size_t i = 2; i < parts.size(); ++i) {
    for (auto& t : SplitTokens(parts[i])) trailing_suffixes.push_back(CleanToken(t));
  }

  // "John Smith, Jr." is natural order with a suffix
  const bool right_is_suffix = !right.empty() && std::all_of(right.begin(), right.end(), [](const std::string& t) {
    return kSuffixes.contains(NormalizeToken(t));
  });
  if (right_is_suffix || left.empty() || right.empty()) {
    return std::nullopt;
  }

  auto family_side = Peel(left, true, true);
  auto given_side  = Peel(right, true, true);
  if (family_side.core.empty() || given_side.core.empty()) {
    return std::nullopt;
  }

  ParseResult r;
  r.type        = ParseType::kPerson;
  r.name.family = Join(family_side.core, 0, family_side.core.size());
  r.name.given  = given_side.core[0];
  if (given_side.core.size() > 1) r.name.middle = Join(given_side.core, 1, given_side.core.size());

  std::vector<std::string> prefixes = family_side.prefixes;
  prefixes.insert(prefixes.end(), given_side.prefixes.begin(), given_side.prefixes.end());
  std::vector<std::string> suffixes = family_side.suffixes;
  suffixes.insert(suffixes.end(), given_side.suffixes.begin(), given_side.suffixes.end());
  suffixes.insert(suffixes.end(), trailing_suffixes.begin(), trailing_suffixes.end());
  r.name.prefix = JoinOpt(prefixes);
  r.name.suffix = JoinOpt(suffixes);

  r.confidence = AllShort(given_side.core) ? kConfidenceCommaInitial : kConfidenceFull;
  return r;
}

} // namespace

bool IsDescriptivePlaceholder(std::string_view raw_name) {
  const auto tokens = SplitTokens(NormalizeFullName(raw_name));
  if (tokens.empty() || tokens.size() > 2) return false;
  if (tokens[0] != "female" && tokens[0] != "male") return false;
  return tokens.size() == 1 || AllDigits(tokens[1]);
}

ParseResult RuleNameParser::Parse(std::string_view raw_name) const {
  std::string text       = CollapseWhitespace(raw_name);
  const auto  normalized = NormalizeFullName(text);

  // letters in any script; symbols and digits alone cannot be segmented
  if (LetterCount(normalized) == 0) {
    return Failed();
  }

  if (IsPlaceholder(text, normalized)) {
    return Placeholder();
  }

  const auto tokens = SplitTokens(text);
  if (auto org = ParseOrganization(tokens, CommaOrder(text).has_value())) {
    return *org;
  }

  if (IsHousehold(text)) {
    ParseResult r;
    r.type       = ParseType::kHousehold;
    r.confidence = kConfidenceHousehold;
    return r;
  }

  auto nickname = ExtractNickname(text);

  ParseResult result;
  if (auto comma = CommaOrder(text)) {
    result = std::move(*comma);
  } else {
    // drop commas that did not mark "Family, Given"
    std::replace(text.begin(), text.end(), ',', ' ');
    auto peeled = Peel(SplitTokens(text), true, true);
    if (peeled.core.empty()) {
      return Failed();
    }
    result = NaturalOrder(peeled);
  }

  result.name.nickname = nickname;
  return result;
}

} // namespace resolver::parser
