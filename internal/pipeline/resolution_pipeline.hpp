#pragma once

#include <memory>

#include "internal/config/resolution_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pipeline/run_report.hpp"
#include "internal/runtime/worker_pool.hpp"

namespace resolver::pipeline {

struct RunOptions {
  // Resolve and report, then roll back instead of committing.
  bool dry_run = false;
};

/*
  Batch resolution run.

    load       mentions, flags, latches, overrides, previous partition
    check      previous partition references only known rows
    block      immutable BlockingIndex under the configured key version
    generate   per-block and cross-block candidates on the worker pool
    score      per-chunk scoring on the worker pool
    resolve    single-writer classification + union-find
    suppress   suppression policy, latching
    commit     partition, review queue, decision log, latches and run
               record in one transaction

  Any failure rolls back, records the run as aborted and rethrows, so the
  previous committed partition stays in place.
*/
class ResolutionPipeline {
 public:
  ResolutionPipeline(std::shared_ptr<db::Repository> repository, config::ResolutionSettings settings, runtime::WorkerPool& pool);

  RunReport Run(const RunOptions& options = {});

 private:
  RunReport Execute(const std::string& run_id, uint64_t started_at_ms, const RunOptions& options);
  void      RecordAbort(const std::string& run_id, uint64_t started_at_ms, RunReport report);

  std::shared_ptr<db::Repository> repository_;
  config::ResolutionSettings      settings_;
  runtime::WorkerPool&            pool_;
};

} // namespace resolver::pipeline
