#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace resolver::db::model {

enum class RunStatus : std::uint8_t {
  kRunning   = 0,
  kCommitted = 1,
  kAborted   = 2,
};

constexpr std::string_view ToString(RunStatus status) {
  switch (status) {
    case RunStatus::kCommitted:
      return "committed";
    case RunStatus::kAborted:
      return "aborted";
    case RunStatus::kRunning:
    default:
      return "running";
  }
}

struct RunRecord {
  std::string run_id;
  uint64_t    started_at_ms  = 0;
  uint64_t    finished_at_ms = 0;
  RunStatus   status         = RunStatus::kRunning;

  // Hash of the resolution settings the run used.
  std::string config_fingerprint;

  // RunReport rendered as JSON.
  std::string report_json;
};

} // namespace resolver::db::model
