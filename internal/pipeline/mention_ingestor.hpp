#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/resolution_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/parser/name_parser.hpp"
#include "resolver/v1/records.pb.h"

namespace resolver::pipeline {

enum class IngestStatus : std::uint8_t {
  kInserted  = 0,
  kDuplicate = 1, // id already stored; the stored mention is kept
  kRejected  = 2,
};

struct IngestOutcome {
  IngestStatus status = IngestStatus::kRejected;
  std::string  mention_id;
  std::string  error;
};

struct IngestSummary {
  std::uint64_t            inserted   = 0;
  std::uint64_t            duplicates = 0;
  std::uint64_t            rejected   = 0;
  std::vector<std::string> examples; // first few rejection messages
};

/*
  Entry point for upstream mention records.

  Validates, parses once, derives the ingestion-time blocking key and
  stores the immutable mention (plus a protection flag when the record
  carries the hint). Records without raw_name or source_reference are
  rejected, logged and counted, never stored.
*/
class MentionIngestor {
 public:
  MentionIngestor(std::shared_ptr<db::Repository> repository, const parser::NameParser& parser,
                  const config::ResolutionSettings& settings);

  // Throws util::InvalidState when the record is not acceptable.
  db::model::MentionRecord Prepare(const resolver::v1::MentionInput& input) const;

  IngestOutcome Ingest(db::Transaction& tx, const resolver::v1::MentionInput& input);

  // All inputs in one transaction.
  IngestSummary IngestBatch(const std::vector<resolver::v1::MentionInput>& inputs);

  // Appends a protection flag to a stored mention.
  void Flag(const std::string& mention_id, const std::string& reason);

 private:
  std::shared_ptr<db::Repository>   repository_;
  const parser::NameParser&         parser_;
  const config::ResolutionSettings& settings_;
};

} // namespace resolver::pipeline
