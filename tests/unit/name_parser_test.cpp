#include "internal/parser/rule_name_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using resolver::model::ParseResult;
using resolver::model::ParseType;
using resolver::parser::ApplyHints;
using resolver::parser::IsDescriptivePlaceholder;
using resolver::parser::NameHints;
using resolver::parser::RuleNameParser;

ParseResult Parse(const std::string& raw) {
  RuleNameParser parser;
  return parser.Parse(raw);
}

void TestNaturalOrder() {
  auto r = Parse("Jeffrey Epstein");
  assert(!r.failed && !r.placeholder);
  assert(r.type == ParseType::kPerson);
  assert(r.name.given == "Jeffrey");
  assert(r.name.family == "Epstein");
  assert(!r.name.middle);
  assert(r.confidence == 0.9);
}

void TestCommaOrder() {
  auto r = Parse("Epstein, Jeffrey E.");
  assert(r.type == ParseType::kPerson);
  assert(r.name.family == "Epstein");
  assert(r.name.given == "Jeffrey");
  assert(r.name.middle == "E");
  assert(r.confidence == 0.9);

  auto initial = Parse("Smith, J.");
  assert(initial.name.family == "Smith");
  assert(initial.name.given == "J");
  assert(initial.confidence == 0.5);
}

void TestTrailingSuffixAfterComma() {
  auto r = Parse("John Smith, Jr.");
  assert(r.name.given == "John");
  assert(r.name.family == "Smith");
  assert(r.name.suffix == "Jr");
}

void TestPrefixAndSuffixArePeeled() {
  auto r = Parse("Dr. John A. Smith Jr.");
  assert(r.name.prefix == "Dr");
  assert(r.name.given == "John");
  assert(r.name.middle == "A");
  assert(r.name.family == "Smith");
  assert(r.name.suffix == "Jr");
  assert(r.confidence == 0.9);
}

void TestFamilyParticlesStayWithFamily() {
  auto r = Parse("Ludwig van Beethoven");
  assert(r.name.given == "Ludwig");
  assert(r.name.family == "van Beethoven");
  assert(!r.name.middle);
}

void TestNickname() {
  auto quoted = Parse("Robert \"Bob\" Jones");
  assert(quoted.name.nickname == "Bob");
  assert(quoted.name.given == "Robert");
  assert(quoted.name.family == "Jones");

  auto parens = Parse("William (Bill) Clinton");
  assert(parens.name.nickname == "Bill");
  assert(parens.name.family == "Clinton");
}

void TestInitialsLowerConfidence() {
  auto initials = Parse("J. R.");
  assert(initials.type == ParseType::kPerson);
  assert(initials.confidence == 0.3);

  auto leading = Parse("J. Smith");
  assert(leading.name.given == "J");
  assert(leading.confidence == 0.7);
}

void TestSingleWord() {
  auto r = Parse("Madonna");
  assert(r.type == ParseType::kUnknown);
  assert(r.name.family == "Madonna");
  assert(!r.name.given);
  assert(r.confidence == 0.1);
  assert(!r.failed);

  auto letter = Parse("J");
  assert(letter.confidence == 0.0);
  assert(!letter.failed);
}

void TestOrganization() {
  auto trust = Parse("Southern Trust Company");
  assert(trust.type == ParseType::kOrganization);
  assert(trust.name.family == "Southern Trust");
  assert(trust.confidence == 0.8);

  auto llc = Parse("Acme Holdings LLC");
  assert(llc.name.family == "Acme Holdings");

  auto co = Parse("Smith & Co.");
  assert(co.type == ParseType::kOrganization);
  assert(co.name.family == "Smith");
}

void TestInstitutionWordAsSurname() {
  auto natural = Parse("Frank Church");
  assert(natural.type == ParseType::kPerson);
  assert(natural.name.given == "Frank");
  assert(natural.name.family == "Church");
  assert(natural.confidence == 0.9);

  auto comma = Parse("Church, Frank");
  assert(comma.type == ParseType::kPerson);
  assert(comma.name.given == "Frank");
  assert(comma.name.family == "Church");

  auto titled = Parse("Mr. Frank Church Jr.");
  assert(titled.type == ParseType::kPerson);
  assert(titled.name.family == "Church");

  // legal forms mark an organization in any position
  assert(Parse("Church, Frank LLC").type == ParseType::kOrganization);
  // institution words that are not surnames still mark one
  assert(Parse("Clinton Foundation").type == ParseType::kOrganization);
  assert(Parse("Bank of America").type == ParseType::kOrganization);
  assert(Parse("First Baptist Church of Palm Beach").type == ParseType::kOrganization);
}

void TestNonLatinNamesSegment() {
  auto r = Parse("Иван Петров");
  assert(!r.failed);
  assert(r.type == ParseType::kPerson);
  assert(r.name.given == "Иван");
  assert(r.name.family == "Петров");
  assert(r.confidence == 0.9);

  auto comma = Parse("Петров, Иван");
  assert(comma.name.family == "Петров");
  assert(comma.name.given == "Иван");

  auto cjk = Parse("李");
  assert(!cjk.failed);
  assert(cjk.name.family == "李");
}

void TestHousehold() {
  auto r = Parse("John & Jane Doe");
  assert(r.type == ParseType::kHousehold);
  assert(r.confidence == 0.3);
  assert(r.name.Empty());

  assert(Parse("Mr. and Mrs. Smith").type == ParseType::kHousehold);
}

void TestPlaceholders() {
  for (const char* raw : {"Female (2)", "Unknown", "N/A", "unidentified male", "Anonymous 3"}) {
    auto r = Parse(raw);
    assert(r.placeholder);
    assert(!r.failed);
    assert(r.confidence == 0.1);
    assert(r.name.Empty());
  }

  assert(IsDescriptivePlaceholder("Female (2)"));
  assert(IsDescriptivePlaceholder("male"));
  assert(!IsDescriptivePlaceholder("Unknown"));
  assert(!IsDescriptivePlaceholder("Female Pilot"));
}

void TestFailedParse() {
  for (const char* raw : {"?", "", "   ", "1234", "--"}) {
    auto r = Parse(raw);
    assert(r.failed);
    assert(r.confidence == 0.0);
    assert(r.name.Empty());
  }

  // a question mark anywhere is a stand-in, not a name
  auto partial = Parse("John ?");
  assert(partial.placeholder);
}

void TestDiacriticsKeepOriginalSpelling() {
  auto r = Parse("José Müller");
  assert(r.name.given == "José");
  assert(r.name.family == "Müller");
}

void TestParseIsDeterministic() {
  RuleNameParser parser;
  auto           a = parser.Parse("Epstein, Jeffrey E.");
  auto           b = parser.Parse("Epstein, Jeffrey E.");
  assert(a.name.given == b.name.given);
  assert(a.name.middle == b.name.middle);
  assert(a.name.family == b.name.family);
  assert(a.confidence == b.confidence);
}

void TestHintsOverrideTypeAndFillGaps() {
  auto r = Parse("Madonna");
  NameHints hints;
  hints.type   = ParseType::kPerson;
  hints.given  = "Madonna";
  hints.family = "Ciccone";
  ApplyHints(r, hints);
  assert(r.type == ParseType::kPerson);
  assert(r.name.given == "Madonna");
  // the parser already found a family name
  assert(r.name.family == "Madonna");

  auto failed = Parse("?");
  ApplyHints(failed, hints);
  assert(failed.type == ParseType::kPerson);
  assert(!failed.name.given);
}

} // namespace

int main() {
  TestNaturalOrder();
  TestCommaOrder();
  TestTrailingSuffixAfterComma();
  TestPrefixAndSuffixArePeeled();
  TestFamilyParticlesStayWithFamily();
  TestNickname();
  TestInitialsLowerConfidence();
  TestSingleWord();
  TestOrganization();
  TestInstitutionWordAsSurname();
  TestNonLatinNamesSegment();
  TestHousehold();
  TestPlaceholders();
  TestFailedParse();
  TestDiacriticsKeepOriginalSpelling();
  TestParseIsDeterministic();
  TestHintsOverrideTypeAndFillGaps();

  std::cout << "resolver_unit_name_parser: pass\n";
  return 0;
}
