#include "internal/export/audit_export.hpp"
#include "internal/export/jsonl.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/parser/rule_name_parser.hpp"
#include "internal/pipeline/mention_ingestor.hpp"
#include "internal/pipeline/resolution_pipeline.hpp"
#include "internal/provenance/public_projection.hpp"
#include "internal/runtime/worker_pool.hpp"

namespace {

using resolver::config::ResolutionSettings;
using resolver::db::memory::MemoryRepository;

resolver::v1::MentionInput Input(const std::string& id, const std::string& raw) {
  resolver::v1::MentionInput input;
  input.set_mention_id(id);
  input.set_raw_name(raw);
  input.set_source_reference("flight-log-" + id);
  input.set_source_system("court-filings");
  return input;
}

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

template <typename Message>
Message ParseLine(const std::string& line) {
  Message message;
  auto    status = google::protobuf::util::JsonStringToMessage(line, &message);
  assert(status.ok());
  return message;
}

std::shared_ptr<MemoryRepository> ResolvedRepository(const ResolutionSettings& settings) {
  auto repository = std::make_shared<MemoryRepository>();

  resolver::parser::RuleNameParser    parser;
  resolver::pipeline::MentionIngestor ingestor(repository, parser, settings);
  auto summary = ingestor.IngestBatch({
      Input("m1", "Jeffrey Epstein"),
      Input("m2", "Epstein, Jeffrey"),
      Input("m3", "Jon Smith"),
      Input("m4", "John Smyth"),
      Input("m5", "Female (2)"),
      Input("m6", "Southern Trust Company"),
  });
  assert(summary.inserted == 6);

  resolver::runtime::WorkerPool      pool(2);
  resolver::pipeline::ResolutionPipeline pipeline(repository, settings, pool);
  auto report = pipeline.Run();
  assert(report.Status() == "committed");
  return repository;
}

void TestReadMentionLines() {
  std::istringstream in(R"({"mention_id":"m1","raw_name":"Jeffrey Epstein","source_reference":"doc-1"}

{"raw_name": 5
{"raw_name":"Jon Smith","nickname":"Jonny"}
{"rawName":"John Smyth","sourceReference":"doc-2","embedding":[0.5,0.25]}
)");
  auto lines = resolver::exporter::ReadMentionLines(in);

  assert(lines.inputs.size() == 2);
  assert(lines.inputs[0].mention_id() == "m1");
  assert(lines.inputs[1].raw_name() == "John Smyth");
  assert(lines.inputs[1].embedding_size() == 2);

  assert(lines.errors.size() == 2);
  assert(lines.errors[0].rfind("line 3:", 0) == 0);
  assert(lines.errors[1].rfind("line 4:", 0) == 0);
}

void TestWriteJsonLineUsesProtoFieldNames() {
  resolver::v1::PublicMention mention;
  mention.set_mention_id("m1");
  mention.set_source_reference("doc-1");

  std::ostringstream out;
  resolver::exporter::WriteJsonLine(mention, out);
  assert(out.str() == "{\"mention_id\":\"m1\",\"source_reference\":\"doc-1\"}\n");
}

void TestEntityExport() {
  ResolutionSettings settings;
  auto               repository = ResolvedRepository(settings);

  std::ostringstream out;
  assert(resolver::exporter::ExportEntities(*repository, out) == 5);

  const auto lines = Lines(out.str());
  assert(lines.size() == 5);

  bool saw_epstein     = false;
  bool saw_placeholder = false;
  for (const auto& line : lines) {
    auto entity = ParseLine<resolver::v1::EntityExport>(line);
    if (entity.members_size() == 2) {
      saw_epstein = true;
      assert(entity.is_verified());
      assert(entity.entity_type() == "Person");
      assert(entity.canonical_mention_id() == "m1");
      assert(entity.canonical_name() == "Jeffrey Epstein");
      assert(entity.members(0).mention_id() == "m1");
      assert(entity.members(1).mention_id() == "m2");
    }
    if (entity.canonical_mention_id() == "m5") {
      saw_placeholder = true;
      assert(entity.suppress_from_public());
      assert(entity.suppression_reasons_size() >= 1);
      assert(entity.suppression_reasons(0) == "descriptive_placeholder");
    }
  }
  assert(saw_epstein && saw_placeholder);
}

void TestPublicExportHidesSuppressed() {
  ResolutionSettings settings;
  auto               repository = ResolvedRepository(settings);

  std::ostringstream out;
  assert(resolver::exporter::ExportPublic(*repository, settings.public_disclosure_floor, out) == 4);
  assert(out.str().find("Female") == std::string::npos);
  assert(out.str().find("m5") == std::string::npos);

  for (const auto& line : Lines(out.str())) {
    auto entity = ParseLine<resolver::v1::PublicEntity>(line);
    for (const auto& mention : entity.mentions()) {
      assert(mention.source_reference() == "flight-log-" + mention.mention_id());
      assert(mention.source_system() == "court-filings");
    }
  }
}

resolver::db::model::EntityRecord Entity(const std::string& id, const std::string& name, double confidence) {
  resolver::db::model::EntityRecord entity;
  entity.entity_id            = id;
  entity.canonical_name       = name;
  entity.canonical_mention_id = id + "-m1";
  entity.confidence           = confidence;
  return entity;
}

resolver::db::model::MentionRecord Mention(const std::string& id, const std::string& raw) {
  resolver::db::model::MentionRecord mention;
  mention.mention_id       = id;
  mention.raw_name         = raw;
  mention.source_reference = "flight-log-" + id;
  return mention;
}

void TestLowConfidenceSingletonStaysPrivate() {
  ResolutionSettings settings;

  // unsuppressed, but a lone 0.1 surname is below the disclosure floor
  std::vector<resolver::db::model::EntityRecord> entities = {
      Entity("e1", "Madonna", 0.1),
      Entity("e2", "Jeffrey Epstein", 0.9),
      Entity("e3", "Maxwell", 0.1),
      Entity("e4", "Larry Summers", settings.public_disclosure_floor),
  };
  std::vector<resolver::db::model::EntityMentionRecord> memberships = {
      {.entity_id = "e1", .mention_id = "e1-m1"}, {.entity_id = "e2", .mention_id = "e2-m1"},
      {.entity_id = "e3", .mention_id = "e3-m1"}, {.entity_id = "e3", .mention_id = "e3-m2"},
      {.entity_id = "e4", .mention_id = "e4-m1"},
  };
  std::vector<resolver::db::model::MentionRecord> mentions = {
      Mention("e1-m1", "Madonna"), Mention("e2-m1", "Jeffrey Epstein"), Mention("e3-m1", "Maxwell"),
      Mention("e3-m2", "Maxwell"), Mention("e4-m1", "Larry Summers"),
  };

  auto projection =
      resolver::provenance::BuildPublicProjection(entities, memberships, mentions, settings.public_disclosure_floor);

  assert(projection.size() == 3);
  for (const auto& entity : projection) assert(entity.entity_id() != "e1");
  assert(projection[0].entity_id() == "e2");
  // the floor only gates singletons
  assert(projection[1].entity_id() == "e3");
  assert(projection[1].mentions_size() == 2);
  // at the floor is published
  assert(projection[2].entity_id() == "e4");
}

void TestDecisionAndReviewExports() {
  ResolutionSettings settings;
  auto               repository = ResolvedRepository(settings);

  std::ostringstream decisions;
  assert(resolver::exporter::ExportDecisions(*repository, "", decisions) == 2);

  const auto lines = Lines(decisions.str());
  auto       merge = ParseLine<resolver::v1::MergeDecisionExport>(lines[0]);
  assert(merge.mention_id_a() == "m1" && merge.mention_id_b() == "m2");
  assert(merge.decision() == "merge");
  assert(merge.origin() == "within_block");
  assert(merge.signals().phonetic_match());
  assert(merge.reason() == "above_t_high");

  auto review = ParseLine<resolver::v1::MergeDecisionExport>(lines[1]);
  assert(review.decision() == "review");
  assert(!review.run_id().empty());

  std::ostringstream unknown_run;
  assert(resolver::exporter::ExportDecisions(*repository, "no-such-run", unknown_run) == 0);

  std::ostringstream queue;
  assert(resolver::exporter::ExportReviewQueue(*repository, queue) == 1);
  auto item = ParseLine<resolver::v1::ReviewItemExport>(Lines(queue.str())[0]);
  assert(item.mention_id_a() == "m3");
  assert(item.raw_name_a() == "Jon Smith");
  assert(item.raw_name_b() == "John Smyth");
  assert(item.run_id() == review.run_id());
}

} // namespace

int main() {
  TestReadMentionLines();
  TestWriteJsonLineUsesProtoFieldNames();
  TestEntityExport();
  TestPublicExportHidesSuppressed();
  TestLowConfidenceSingletonStaysPrivate();
  TestDecisionAndReviewExports();

  std::cout << "resolver_unit_audit_export: pass\n";
  return 0;
}
