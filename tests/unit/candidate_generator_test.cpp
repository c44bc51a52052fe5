#include "internal/candidates/candidate_generator.hpp"
#include "internal/candidates/embedding_index.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/blocking/blocking_index.hpp"
#include "internal/parser/rule_name_parser.hpp"

namespace {

using resolver::blocking::BlockingIndex;
using resolver::candidates::CandidateGenerator;
using resolver::candidates::CandidateRef;
using resolver::candidates::EmbeddingIndex;
using resolver::config::ResolutionSettings;
using resolver::db::model::MentionRecord;
using resolver::model::CandidateOrigin;

MentionRecord MakeMention(const std::string& id, const std::string& raw, std::vector<float> embedding = {},
                          const std::string& model = "name-embed-v1") {
  resolver::parser::RuleNameParser parser;
  const auto                       parsed = parser.Parse(raw);

  MentionRecord m;
  m.mention_id       = id;
  m.source_reference = "doc-1";
  m.raw_name         = raw;
  m.name             = parsed.name;
  m.parse_type       = parsed.type;
  m.parse_confidence = parsed.confidence;
  m.parse_failed     = parsed.failed;
  m.placeholder      = parsed.placeholder;
  m.embedding        = std::move(embedding);
  if (!m.embedding.empty()) m.embedding_model = model;
  return m;
}

std::set<std::pair<std::string, std::string>> IdPairs(const BlockingIndex& index, const std::vector<CandidateRef>& refs) {
  std::set<std::pair<std::string, std::string>> out;
  for (const auto& ref : refs) {
    const auto& a = index.Mention(ref.a).mention_id;
    const auto& b = index.Mention(ref.b).mention_id;
    assert(a < b);
    out.emplace(a, b);
  }
  return out;
}

ResolutionSettings CrossBlockSettings() {
  ResolutionSettings settings;
  settings.embedding_model_id       = "name-embed-v1";
  settings.cross_block.enabled      = true;
  settings.cross_block.top_k        = 5;
  settings.cross_block.min_cosine   = 0.8;
  settings.cross_block.min_parse_confidence = 0.7;
  return settings;
}

std::vector<MentionRecord> SmithBlock() {
  return {
      MakeMention("m1", "John Smith"), MakeMention("m2", "Jon Smith"),  MakeMention("m3", "Jane Smith"),
      MakeMention("m4", "Jake Smyth"), MakeMention("m5", "Joan Smith"),
  };
}

void TestSmallBlockEnumeratesAllPairs() {
  auto               mentions = SmithBlock();
  auto               index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings settings;
  CandidateGenerator generator(index, settings);

  assert(index.Blocks().size() == 1);
  auto refs = generator.ForBlock(index.Blocks()[0]);
  assert(refs.size() == 10);
  assert(IdPairs(index, refs).size() == 10);
  for (const auto& ref : refs) assert(ref.origin == CandidateOrigin::kWithinBlock);
}

void TestOversizedBlockUsesSortedNeighborhood() {
  auto               mentions = SmithBlock();
  auto               index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings settings;
  settings.max_block_size = 3;
  CandidateGenerator generator(index, settings);

  auto refs = generator.ForBlock(index.Blocks()[0]);
  // window of 2: 2 + 2 + 2 + 1
  assert(refs.size() == 7);
  for (const auto& ref : refs) assert(ref.origin == CandidateOrigin::kSampledBlock);

  // order by comparison name: jake smyth, jane smith, joan smith, john smith, jon smith
  auto pairs = IdPairs(index, refs);
  assert(pairs.count({"m3", "m4"}) == 1);
  assert(pairs.count({"m1", "m2"}) == 1);
  assert(pairs.count({"m2", "m4"}) == 0);

  // the same input always samples the same pairs
  assert(IdPairs(index, generator.ForBlock(index.Blocks()[0])) == pairs);
}

void TestCrossBlockNeighbors() {
  std::vector<MentionRecord> mentions = {
      MakeMention("m1", "Bill Clinton", {1.0f, 0.0f, 0.0f}),
      MakeMention("m2", "William Clinton", {0.9f, 0.1f, 0.0f}),
      MakeMention("m3", "Hillary Clinton", {0.0f, 1.0f, 0.0f}),
      MakeMention("m4", "Bill Clinton", {1.0f, 0.0f, 0.0f}),
  };
  auto       index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  const auto settings = CrossBlockSettings();
  CandidateGenerator generator(index, settings);

  auto embeddings = generator.BuildEmbeddingIndex();
  assert(embeddings.Size() == 4);

  // m4 shares m1's block and is skipped; m3 is too far away
  auto from_m1 = generator.CrossBlockFor(0, embeddings);
  assert(from_m1.size() == 1);
  assert(index.Mention(from_m1[0].b).mention_id == "m2");
  assert(from_m1[0].origin == CandidateOrigin::kCrossBlock);

  auto from_m2 = generator.CrossBlockFor(1, embeddings);
  assert(IdPairs(index, from_m2) == (std::set<std::pair<std::string, std::string>>{{"m1", "m2"}, {"m2", "m4"}}));
}

void TestCrossBlockEligibility() {
  std::vector<MentionRecord> mentions = {
      MakeMention("m1", "Bill Clinton", {1.0f, 0.0f}),
      MakeMention("m2", "Clinton", {1.0f, 0.0f}),
      MakeMention("m3", "William Clinton", {1.0f, 0.0f}, "other-model"),
      MakeMention("m4", "William Clinton"),
  };
  auto index = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);

  auto               settings = CrossBlockSettings();
  CandidateGenerator generator(index, settings);
  assert(generator.CrossBlockEligible(0));
  assert(!generator.CrossBlockEligible(1)); // single word, low confidence
  assert(!generator.CrossBlockEligible(2)); // vector from another model
  assert(!generator.CrossBlockEligible(3)); // no vector

  settings.cross_block.enabled = false;
  CandidateGenerator disabled(index, settings);
  assert(!disabled.CrossBlockEligible(0));
  assert(disabled.BuildEmbeddingIndex().Size() == 0);
}

void TestDeduplicatePrefersWithinBlock() {
  auto               mentions = SmithBlock();
  auto               index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings settings;
  CandidateGenerator generator(index, settings);

  std::vector<CandidateRef> refs = {
      {1, 2, CandidateOrigin::kCrossBlock},
      {0, 1, CandidateOrigin::kWithinBlock},
      {1, 2, CandidateOrigin::kWithinBlock},
      {0, 1, CandidateOrigin::kWithinBlock},
  };
  generator.Deduplicate(refs);
  assert(refs.size() == 2);
  assert(refs[0].a == 0 && refs[0].b == 1);
  assert(refs[1].a == 1 && refs[1].b == 2);
  assert(refs[1].origin == CandidateOrigin::kWithinBlock);
}

void TestEmbeddingIndexSearch() {
  EmbeddingIndex embeddings;
  assert(embeddings.Add(7, {1.0f, 0.0f}));
  assert(embeddings.Add(3, {2.0f, 0.0f}));
  assert(embeddings.Add(5, {0.6f, 0.8f}));
  assert(!embeddings.Add(9, {1.0f, 0.0f, 0.0f})); // wrong dimension
  assert(!embeddings.Add(9, {0.0f, 0.0f}));       // zero norm
  assert(embeddings.Size() == 3);
  assert(embeddings.Dimension() == 2);

  auto hits = embeddings.Search({1.0f, 0.0f}, 5, 0.5, 99);
  assert(hits.size() == 3);
  // equal cosine: smaller id first
  assert(hits[0].id == 3);
  assert(hits[1].id == 7);
  assert(hits[2].id == 5);

  auto top1 = embeddings.Search({1.0f, 0.0f}, 1, 0.5, 3);
  assert(top1.size() == 1 && top1[0].id == 7);

  assert(embeddings.Search({1.0f, 0.0f}, 5, 0.9, 99).size() == 2);
  assert(embeddings.Search({1.0f}, 5, 0.0, 99).empty());
}

} // namespace

int main() {
  TestSmallBlockEnumeratesAllPairs();
  TestOversizedBlockUsesSortedNeighborhood();
  TestCrossBlockNeighbors();
  TestCrossBlockEligibility();
  TestDeduplicatePrefersWithinBlock();
  TestEmbeddingIndexSearch();

  std::cout << "resolver_unit_candidate_generator: pass\n";
  return 0;
}
