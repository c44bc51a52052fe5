#include "internal/export/audit_export.hpp"

#include <map>
#include <sstream>
#include <vector>

#include "internal/export/jsonl.hpp"
#include "internal/provenance/public_projection.hpp"

namespace resolver::exporter {

namespace {

std::vector<std::string> SplitReasons(const std::string& joined) {
  std::vector<std::string> out;
  std::stringstream        ss(joined);
  std::string              part;
  while (std::getline(ss, part, ',')) {
    if (!part.empty()) out.push_back(part);
  }
  return out;
}

} // namespace

resolver::v1::MergeDecisionExport ToExport(const db::model::MergeDecisionRecord& record) {
  resolver::v1::MergeDecisionExport out;
  out.set_run_id(record.run_id);
  out.set_mention_id_a(record.mention_id_a);
  out.set_mention_id_b(record.mention_id_b);
  out.set_decision(std::string(model::ToString(record.decision)));
  out.set_origin(std::string(model::ToString(record.origin)));
  out.set_composite_score(record.composite_score);
  out.set_reason(record.reason);
  out.set_decided_at_ms(record.decided_at_ms);

  auto* signals = out.mutable_signals();
  signals->set_phonetic_match(record.signals.phonetic_match);
  signals->set_edit_similarity(record.signals.edit_similarity);
  signals->set_has_embedding(record.signals.embedding_similarity.has_value());
  signals->set_embedding_similarity(record.signals.embedding_similarity.value_or(0.0));
  signals->set_type_agreement(std::string(model::ToString(record.signals.type_agreement)));
  signals->set_low_confidence(record.signals.low_confidence);
  signals->set_parse_failed(record.signals.parse_failed);
  signals->set_capped(record.signals.capped);
  return out;
}

std::size_t ExportEntities(db::Repository& repository, std::ostream& out) {
  auto       tx          = repository.Begin();
  const auto entities    = repository.ListEntities(*tx);
  const auto memberships = repository.ListEntityMentions(*tx);
  tx->Rollback();

  std::map<std::string, std::vector<const db::model::EntityMentionRecord*>> members;
  for (const auto& row : memberships) members[row.entity_id].push_back(&row);

  for (const auto& entity : entities) {
    resolver::v1::EntityExport e;
    e.set_entity_id(entity.entity_id);
    e.set_canonical_name(entity.canonical_name);
    e.set_canonical_mention_id(entity.canonical_mention_id);
    e.set_entity_type(std::string(model::ToString(entity.entity_type)));
    e.set_is_verified(entity.is_verified);
    e.set_suppress_from_public(entity.suppress_from_public);
    e.set_confidence(entity.confidence);
    e.set_run_id(entity.run_id);
    for (const auto& reason : SplitReasons(entity.suppression_reasons)) e.add_suppression_reasons(reason);
    for (const auto* row : members[entity.entity_id]) {
      auto* m = e.add_members();
      m->set_mention_id(row->mention_id);
      m->set_composite_score(row->composite_score);
    }
    WriteJsonLine(e, out);
  }
  return entities.size();
}

std::size_t ExportPublic(db::Repository& repository, double public_disclosure_floor, std::ostream& out) {
  auto       tx          = repository.Begin();
  const auto entities    = repository.ListEntities(*tx);
  const auto memberships = repository.ListEntityMentions(*tx);
  const auto mentions    = repository.ListMentions(*tx);
  tx->Rollback();

  const auto projection = provenance::BuildPublicProjection(entities, memberships, mentions, public_disclosure_floor);
  for (const auto& entity : projection) WriteJsonLine(entity, out);
  return projection.size();
}

std::size_t ExportDecisions(db::Repository& repository, const std::string& run_id, std::ostream& out) {
  auto       tx        = repository.Begin();
  const auto decisions = repository.ListMergeDecisions(*tx, run_id);
  tx->Rollback();

  for (const auto& decision : decisions) WriteJsonLine(ToExport(decision), out);
  return decisions.size();
}

std::size_t ExportReviewQueue(db::Repository& repository, std::ostream& out) {
  auto       tx    = repository.Begin();
  const auto items = repository.ListReviewItems(*tx);

  std::size_t written = 0;
  for (const auto& item : items) {
    resolver::v1::ReviewItemExport e;
    e.set_run_id(item.run_id);
    e.set_mention_id_a(item.mention_id_a);
    e.set_mention_id_b(item.mention_id_b);
    e.set_composite_score(item.composite_score);
    e.set_origin(std::string(model::ToString(item.origin)));
    if (auto a = repository.GetMention(*tx, item.mention_id_a)) e.set_raw_name_a(a->raw_name);
    if (auto b = repository.GetMention(*tx, item.mention_id_b)) e.set_raw_name_b(b->raw_name);
    WriteJsonLine(e, out);
    ++written;
  }
  tx->Rollback();
  return written;
}

} // namespace resolver::exporter
