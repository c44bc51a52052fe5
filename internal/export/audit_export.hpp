#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "internal/db/api/repository.hpp"
#include "resolver/v1/records.pb.h"

namespace resolver::exporter {

/*
  JSON-lines exports of the committed state. Each call reads through one
  transaction and returns the number of lines written.

  entities   EntityExport, every entity with members (non-public)
  public     PublicEntity, suppression and disclosure floor applied
  decisions  MergeDecisionExport, whole log or one run (non-public)
  review     ReviewItemExport, pending queue with raw names (non-public)
*/
std::size_t ExportEntities(db::Repository& repository, std::ostream& out);
std::size_t ExportPublic(db::Repository& repository, double public_disclosure_floor, std::ostream& out);
std::size_t ExportDecisions(db::Repository& repository, const std::string& run_id, std::ostream& out);
std::size_t ExportReviewQueue(db::Repository& repository, std::ostream& out);

resolver::v1::MergeDecisionExport ToExport(const db::model::MergeDecisionRecord& record);

} // namespace resolver::exporter
