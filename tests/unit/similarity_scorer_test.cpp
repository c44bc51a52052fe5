#include "internal/scoring/similarity_scorer.hpp"
#include "internal/scoring/string_similarity.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/blocking/blocking_key.hpp"
#include "internal/parser/rule_name_parser.hpp"

namespace {

using resolver::config::ResolutionSettings;
using resolver::db::model::MentionRecord;
using resolver::model::CandidateOrigin;
using resolver::model::ParseType;
using resolver::model::TypeAgreement;
using resolver::scoring::ScoringSide;
using resolver::scoring::SimilarityScorer;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

struct Side {
  MentionRecord mention;
  std::string   key;
  std::string   comparison;

  ScoringSide View() const {
    return ScoringSide{mention, key, comparison};
  }
};

Side MakeSide(const std::string& id, const std::string& raw, std::vector<float> embedding = {}) {
  resolver::parser::RuleNameParser parser;
  const auto                       parsed = parser.Parse(raw);

  Side s;
  s.mention.mention_id       = id;
  s.mention.raw_name         = raw;
  s.mention.name             = parsed.name;
  s.mention.parse_type       = parsed.type;
  s.mention.parse_confidence = parsed.confidence;
  s.mention.parse_failed     = parsed.failed;
  s.mention.placeholder      = parsed.placeholder;
  s.mention.embedding        = std::move(embedding);
  if (!s.mention.embedding.empty()) s.mention.embedding_model = "name-embed-v1";
  s.key        = resolver::blocking::DeriveBlockingKey(s.mention, resolver::config::kBlockingKeySoundexV1);
  s.comparison = resolver::blocking::ComparisonName(s.mention);
  return s;
}

void TestStringSimilarity() {
  using namespace resolver::scoring;
  assert(LevenshteinDistance("kitten", "sitting") == 3);
  assert(LevenshteinDistance("", "abc") == 3);
  assert(Near(NormalizedLevenshteinSimilarity("jon smith", "john smyth"), 0.8));
  assert(NormalizedLevenshteinSimilarity("", "") == 0.0);
  assert(NormalizedLevenshteinSimilarity("abc", "abc") == 1.0);
  // code points, not bytes
  assert(LevenshteinDistance("петров", "петрова") == 1);
  assert(Near(NormalizedLevenshteinSimilarity("иван", "иванн"), 0.8));

  assert(Near(Cosine({1.0f, 0.0f}, {2.0f, 0.0f}), 1.0));
  assert(Near(Cosine({1.0f, 0.0f}, {-1.0f, 0.0f}), -1.0));
  assert(Cosine({1.0f, 0.0f}, {0.0f, 1.0f}) == 0.0);
  assert(Cosine({1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}) == 0.0);
  assert(Cosine({0.0f, 0.0f}, {1.0f, 0.0f}) == 0.0);
}

void TestNearSpellingComposite() {
  ResolutionSettings settings;
  SimilarityScorer   scorer(settings);

  auto a    = MakeSide("m1", "Jon Smith");
  auto b    = MakeSide("m2", "John Smyth");
  auto pair = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);

  assert(pair.signals.phonetic_match);
  assert(Near(pair.signals.edit_similarity, 0.8));
  assert(!pair.signals.embedding_similarity);
  // (0.3 * 1 + 0.5 * 0.8) / 0.8
  assert(Near(pair.composite_score, 0.875));
  assert(!pair.signals.capped);
}

void TestPairIsOrderedById() {
  ResolutionSettings settings;
  SimilarityScorer   scorer(settings);

  auto a   = MakeSide("m9", "Jon Smith");
  auto b   = MakeSide("m2", "John Smyth");
  auto fwd = scorer.Score(a.View(), b.View(), CandidateOrigin::kCrossBlock);
  auto rev = scorer.Score(b.View(), a.View(), CandidateOrigin::kCrossBlock);

  assert(fwd.mention_id_a == "m2" && fwd.mention_id_b == "m9");
  assert(rev.mention_id_a == "m2" && rev.mention_id_b == "m9");
  assert(fwd.composite_score == rev.composite_score);
  assert(fwd.origin == CandidateOrigin::kCrossBlock);
}

void TestIdenticalNamesScoreOne() {
  ResolutionSettings settings;
  SimilarityScorer   scorer(settings);

  auto a    = MakeSide("m1", "Jeffrey Epstein");
  auto b    = MakeSide("m2", "Epstein, Jeffrey");
  auto pair = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);
  assert(Near(pair.composite_score, 1.0));
  assert(pair.signals.type_agreement == TypeAgreement::kAgree);
}

void TestTypeConflictIsCapped() {
  ResolutionSettings settings;
  SimilarityScorer   scorer(settings);

  auto a                = MakeSide("m1", "Jeffrey Epstein");
  auto b                = MakeSide("m2", "Jeffrey Epstein");
  b.mention.parse_type  = ParseType::kOrganization;
  auto pair             = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);

  assert(pair.signals.type_agreement == TypeAgreement::kConflict);
  assert(pair.signals.capped);
  assert(pair.composite_score == settings.type_conflict_cap);

  // Unknown against a known type is only a partial agreement
  b.mention.parse_type = ParseType::kUnknown;
  auto partial         = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);
  assert(partial.signals.type_agreement == TypeAgreement::kPartial);
  assert(!partial.signals.capped);
}

void TestUnblockablePairIsCapped() {
  ResolutionSettings settings;
  settings.weights = {0.0, 1.0, 0.0};
  SimilarityScorer scorer(settings);

  auto a    = MakeSide("m1", "J. R.");
  auto b    = MakeSide("m2", "J. R.");
  auto pair = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);

  assert(pair.signals.low_confidence);
  assert(!pair.signals.phonetic_match);
  assert(pair.signals.capped);
  assert(pair.composite_score == settings.low_confidence_cap);
}

void TestFailedParseScoresZero() {
  ResolutionSettings settings;
  SimilarityScorer   scorer(settings);

  auto a    = MakeSide("m1", "?");
  auto b    = MakeSide("m2", "?");
  auto pair = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);
  assert(pair.signals.parse_failed);
  assert(pair.composite_score == 0.0);
}

void TestIdenticalCyrillicNamesScoreOne() {
  ResolutionSettings settings;
  SimilarityScorer   scorer(settings);

  auto a    = MakeSide("m1", "Иван Петров");
  auto b    = MakeSide("m2", "Петров, Иван");
  auto pair = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);
  assert(!pair.signals.parse_failed);
  assert(!pair.signals.low_confidence);
  assert(pair.signals.phonetic_match);
  assert(Near(pair.composite_score, 1.0));
}

void TestEmbeddingSignal() {
  ResolutionSettings settings;
  settings.embedding_model_id = "name-embed-v1";
  SimilarityScorer scorer(settings);

  auto a    = MakeSide("m1", "Jon Smith", {1.0f, 0.0f});
  auto b    = MakeSide("m2", "John Smyth", {1.0f, 0.0f});
  auto pair = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);

  assert(pair.signals.embedding_similarity);
  assert(Near(*pair.signals.embedding_similarity, 1.0));
  // (0.3 + 0.4 + 0.2) / 1.0
  assert(Near(pair.composite_score, 0.9));

  // a vector from another model is ignored
  b.mention.embedding_model = "other-model";
  auto mixed                = scorer.Score(a.View(), b.View(), CandidateOrigin::kWithinBlock);
  assert(!mixed.signals.embedding_similarity);
  assert(Near(mixed.composite_score, 0.875));

  // no configured model: embeddings never count
  ResolutionSettings plain;
  SimilarityScorer   plain_scorer(plain);
  assert(!plain_scorer.EmbeddingUsable(a.mention));
}

} // namespace

int main() {
  TestStringSimilarity();
  TestNearSpellingComposite();
  TestPairIsOrderedById();
  TestIdenticalNamesScoreOne();
  TestTypeConflictIsCapped();
  TestUnblockablePairIsCapped();
  TestFailedParseScoresZero();
  TestIdenticalCyrillicNamesScoreOne();
  TestEmbeddingSignal();

  std::cout << "resolver_unit_similarity_scorer: pass\n";
  return 0;
}
