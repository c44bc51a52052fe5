#pragma once

#include <cstdint>
#include <string>

namespace resolver::db::model {

// Upstream protection marker. Append-only.
struct ProtectionFlagRecord {
  std::string mention_id;
  std::string reason;
  uint64_t    flagged_at_ms = 0;
};

/*
  Set on every member of a suppressed entity. No pipeline path removes a
  latch, which is what keeps suppression monotonic across runs.
*/
struct SuppressionLatchRecord {
  std::string mention_id;
  std::string reason;
  std::string run_id;
  uint64_t    latched_at_ms = 0;
};

} // namespace resolver::db::model
