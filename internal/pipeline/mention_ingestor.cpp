#include "internal/pipeline/mention_ingestor.hpp"

#include <utility>

#include "internal/blocking/blocking_key.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/parser/name_normalizer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace resolver::pipeline {

using observability::StringField;

namespace {

constexpr std::size_t kMaxSummaryExamples = 5;
constexpr const char* kDefaultProtectionReason = "upstream";

} // namespace

MentionIngestor::MentionIngestor(std::shared_ptr<db::Repository> repository, const parser::NameParser& parser,
                                 const config::ResolutionSettings& settings)
    : repository_(std::move(repository)), parser_(parser), settings_(settings) {
}

db::model::MentionRecord MentionIngestor::Prepare(const resolver::v1::MentionInput& input) const {
  if (parser::CollapseWhitespace(input.raw_name()).empty()) {
    throw util::InvalidState("missing raw_name (source_reference=" + input.source_reference() + ")");
  }
  if (input.source_reference().empty()) {
    throw util::InvalidState("missing source_reference (raw_name=" + input.raw_name() + ")");
  }

  db::model::MentionRecord record;
  record.mention_id       = input.mention_id().empty() ? util::NewId() : input.mention_id();
  record.source_reference = input.source_reference();
  record.source_system    = input.source_system();
  record.raw_name         = input.raw_name();

  auto parsed = parser_.Parse(input.raw_name());

  parser::NameHints hints;
  if (!input.entity_type_hint().empty()) {
    hints.type = model::ParseTypeFromString(input.entity_type_hint());
    if (!hints.type) {
      RESOLVER_LOG_WARN("ignoring unknown entity type hint",
                        {StringField("mention_id", record.mention_id), StringField("hint", input.entity_type_hint())});
    }
  }
  if (!input.given_name_hint().empty()) hints.given = input.given_name_hint();
  if (!input.family_name_hint().empty()) hints.family = input.family_name_hint();
  parser::ApplyHints(parsed, hints);

  record.name             = parsed.name;
  record.parse_type       = parsed.type;
  record.parse_confidence = parsed.confidence;
  record.parse_failed     = parsed.failed;
  record.placeholder      = parsed.placeholder;

  record.blocking_key_version = settings_.blocking_key_version;
  record.blocking_key         = blocking::DeriveBlockingKey(parsed, settings_.blocking_key_version);

  record.embedding.assign(input.embedding().begin(), input.embedding().end());
  record.embedding_model = input.embedding_model();

  record.ingested_at_ms = util::NowMs();
  return record;
}

IngestOutcome MentionIngestor::Ingest(db::Transaction& tx, const resolver::v1::MentionInput& input) {
  IngestOutcome outcome;

  db::model::MentionRecord record;
  try {
    record = Prepare(input);
  } catch (const util::InvalidState& e) {
    RESOLVER_LOG_WARN("rejected mention", {StringField("error", e.what())});
    outcome.status = IngestStatus::kRejected;
    outcome.error  = e.what();
    return outcome;
  }
  outcome.mention_id = record.mention_id;

  // checked up front: a failed insert would poison a postgres transaction
  if (repository_->GetMention(tx, record.mention_id)) {
    RESOLVER_LOG_DEBUG("skipping duplicate mention", {StringField("mention_id", record.mention_id)});
    outcome.status = IngestStatus::kDuplicate;
    return outcome;
  }

  db::ThrowIfDbError(repository_->InsertMention(tx, record), "insert mention " + record.mention_id);

  if (input.is_protected()) {
    db::model::ProtectionFlagRecord flag;
    flag.mention_id    = record.mention_id;
    flag.reason        = input.protection_reason().empty() ? kDefaultProtectionReason : input.protection_reason();
    flag.flagged_at_ms = record.ingested_at_ms;
    db::ThrowIfDbError(repository_->AddProtectionFlag(tx, flag), "flag mention " + record.mention_id);
  }

  outcome.status = IngestStatus::kInserted;
  return outcome;
}

IngestSummary MentionIngestor::IngestBatch(const std::vector<resolver::v1::MentionInput>& inputs) {
  IngestSummary summary;
  auto          tx = repository_->Begin();

  for (const auto& input : inputs) {
    auto outcome = Ingest(*tx, input);
    switch (outcome.status) {
      case IngestStatus::kInserted:
        ++summary.inserted;
        break;
      case IngestStatus::kDuplicate:
        ++summary.duplicates;
        break;
      case IngestStatus::kRejected:
        ++summary.rejected;
        if (summary.examples.size() < kMaxSummaryExamples) summary.examples.push_back(outcome.error);
        break;
    }
  }

  tx->Commit();
  RESOLVER_LOG_INFO("ingested mentions", {observability::IntField("inserted", static_cast<std::int64_t>(summary.inserted)),
                                          observability::IntField("duplicates", static_cast<std::int64_t>(summary.duplicates)),
                                          observability::IntField("rejected", static_cast<std::int64_t>(summary.rejected))});
  return summary;
}

void MentionIngestor::Flag(const std::string& mention_id, const std::string& reason) {
  auto tx = repository_->Begin();

  db::model::ProtectionFlagRecord flag;
  flag.mention_id    = mention_id;
  flag.reason        = reason.empty() ? kDefaultProtectionReason : reason;
  flag.flagged_at_ms = util::NowMs();
  db::ThrowIfDbError(repository_->AddProtectionFlag(*tx, flag), "flag mention " + mention_id);

  tx->Commit();
  RESOLVER_LOG_INFO("flagged mention", {StringField("mention_id", mention_id), StringField("reason", flag.reason)});
}

} // namespace resolver::pipeline
