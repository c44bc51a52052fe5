#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "resolver/v1/records.pb.h"

namespace resolver::pipeline {

/*
  Per-run accumulation of counters and a few examples per category.

  Non-fatal problems (rejected inputs, sampled blocks, ignored overrides)
  land here instead of failing the run. Persisted as JSON with the run
  record and printed by `entity-resolver report`.
*/
class RunReport {
 public:
  static constexpr std::size_t kMaxExamplesPerCategory = 5;

  explicit RunReport(std::string run_id = {}) : run_id_(std::move(run_id)) {
  }

  void Count(std::string_view key, std::uint64_t n = 1);
  void Example(std::string_view category, std::string detail);

  std::uint64_t CountOf(std::string_view key) const;

  void SetStatus(std::string status) {
    status_ = std::move(status);
  }
  void SetError(std::string error) {
    error_ = std::move(error);
  }

  const std::string& RunId() const {
    return run_id_;
  }
  const std::string& Status() const {
    return status_;
  }
  const std::string& Error() const {
    return error_;
  }

  resolver::v1::RunReport ToProto() const;

  // Throws std::runtime_error if protobuf refuses to render.
  std::string ToJson() const;

  static RunReport FromJson(const std::string& json);

 private:
  std::string                                   run_id_;
  std::string                                   status_;
  std::string                                   error_;
  std::map<std::string, std::uint64_t, std::less<>> counts_;
  std::vector<std::pair<std::string, std::string>>  examples_;
  std::map<std::string, std::size_t, std::less<>>   examples_per_category_;
};

} // namespace resolver::pipeline
