#include "internal/pipeline/resolution_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/blocking/blocking_index.hpp"
#include "internal/candidates/candidate_generator.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/parser/name_normalizer.hpp"
#include "internal/provenance/merge_decision_log.hpp"
#include "internal/provenance/suppression_policy.hpp"
#include "internal/resolution/resolution_engine.hpp"
#include "internal/scoring/similarity_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace resolver::pipeline {

using observability::IntField;
using observability::StringField;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr std::size_t kCrossBlockChunk = 256;
constexpr std::size_t kScoreChunk      = 1024;

template <typename Fn>
auto Stage(std::string_view name, Fn&& fn) {
  observability::SpanScope span(std::string("resolver.") + std::string(name));
  const auto               start = SteadyClock::now();
  if constexpr (std::is_void_v<decltype(fn())>) {
    fn();
    observability::Metrics::Instance().ObserveStageDurationMs(name, util::ElapsedMs(start));
  } else {
    auto result = fn();
    observability::Metrics::Instance().ObserveStageDurationMs(name, util::ElapsedMs(start));
    return result;
  }
}

std::string Join(const std::vector<std::string>& parts, char sep) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out.push_back(sep);
    out += p;
  }
  return out;
}

// Every membership row must point at a stored mention and entity.
void CheckIntegrity(const std::vector<db::model::MentionRecord>& mentions, const std::vector<db::model::EntityRecord>& entities,
                    const std::vector<db::model::EntityMentionRecord>& memberships) {
  std::set<std::string> mention_ids;
  for (const auto& m : mentions) mention_ids.insert(m.mention_id);
  std::set<std::string> entity_ids;
  for (const auto& e : entities) entity_ids.insert(e.entity_id);

  for (const auto& row : memberships) {
    if (!mention_ids.contains(row.mention_id)) {
      throw util::DataIntegrityViolation("entity_mentions row (entity_id=" + row.entity_id + ", mention_id=" + row.mention_id +
                                         ") references an unknown mention");
    }
    if (!entity_ids.contains(row.entity_id)) {
      throw util::DataIntegrityViolation("entity_mentions row (entity_id=" + row.entity_id + ", mention_id=" + row.mention_id +
                                         ") references an unknown entity");
    }
  }
}

resolution::PriorPartition BuildPrior(const std::vector<db::model::EntityMentionRecord>& memberships) {
  std::map<std::string, std::vector<std::string>> grouped;
  for (const auto& row : memberships) grouped[row.entity_id].push_back(row.mention_id);

  resolution::PriorPartition prior;
  for (auto& [entity_id, ids] : grouped) {
    std::sort(ids.begin(), ids.end());
    prior.emplace(std::move(ids), entity_id);
  }
  return prior;
}

} // namespace

ResolutionPipeline::ResolutionPipeline(std::shared_ptr<db::Repository> repository, config::ResolutionSettings settings,
                                       runtime::WorkerPool& pool)
    : repository_(std::move(repository)), settings_(std::move(settings)), pool_(pool) {
}

RunReport ResolutionPipeline::Run(const RunOptions& options) {
  const auto run_id        = util::NewId();
  const auto started_at_ms = util::NowMs();

  observability::SpanScope span("resolver.run");
  span.SetAttribute("run_id", run_id);
  RESOLVER_LOG_INFO("resolution run started",
                    {StringField("run_id", run_id), StringField("config", settings_.Fingerprint()),
                     StringField("key_version", settings_.blocking_key_version), observability::DoubleField("t_low", settings_.t_low),
                     observability::DoubleField("t_high", settings_.t_high), observability::BoolField("dry_run", options.dry_run)});

  try {
    auto report = Execute(run_id, started_at_ms, options);
    span.SetAttribute("entities", static_cast<std::int64_t>(report.CountOf("entities")));
    span.SetAttribute("review_items", static_cast<std::int64_t>(report.CountOf("review_items")));
    observability::Metrics::Instance().RecordRun(report.Status());
    return report;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    RESOLVER_LOG_ERROR("resolution run aborted", {StringField("run_id", run_id), StringField("error", e.what())});
    observability::Metrics::Instance().RecordRun(db::model::ToString(db::model::RunStatus::kAborted));

    if (!options.dry_run) {
      RunReport report(run_id);
      report.SetStatus(std::string(db::model::ToString(db::model::RunStatus::kAborted)));
      report.SetError(e.what());
      RecordAbort(run_id, started_at_ms, std::move(report));
    }
    throw;
  }
}

void ResolutionPipeline::RecordAbort(const std::string& run_id, uint64_t started_at_ms, RunReport report) {
  try {
    auto tx = repository_->Begin();

    db::model::RunRecord run;
    run.run_id             = run_id;
    run.started_at_ms      = started_at_ms;
    run.finished_at_ms     = util::NowMs();
    run.status             = db::model::RunStatus::kAborted;
    run.config_fingerprint = settings_.Fingerprint();
    run.report_json        = report.ToJson();
    db::ThrowIfDbError(repository_->UpsertRun(*tx, run), "record aborted run");
    tx->Commit();
  } catch (const std::exception& e) {
    // the original failure is rethrown by the caller
    RESOLVER_LOG_ERROR("failed to record aborted run", {StringField("run_id", run_id), StringField("error", e.what())});
  }
}

RunReport ResolutionPipeline::Execute(const std::string& run_id, uint64_t started_at_ms, const RunOptions& options) {
  RunReport report(run_id);
  auto      tx = repository_->Begin();

  // ---------------------------------------------------------------------
  // Load
  // ---------------------------------------------------------------------

  std::vector<db::model::MentionRecord>          mentions;
  std::vector<db::model::ProtectionFlagRecord>   flags;
  std::vector<db::model::SuppressionLatchRecord> latches;
  std::vector<db::model::ReviewOverrideRecord>   overrides;
  std::vector<db::model::EntityRecord>           prior_entities;
  std::vector<db::model::EntityMentionRecord>    prior_memberships;

  Stage("load", [&] {
    mentions          = repository_->ListMentions(*tx);
    flags             = repository_->ListProtectionFlags(*tx);
    latches           = repository_->ListSuppressionLatches(*tx);
    overrides         = repository_->ListReviewOverrides(*tx);
    prior_entities    = repository_->ListEntities(*tx);
    prior_memberships = repository_->ListEntityMentions(*tx);
  });

  CheckIntegrity(mentions, prior_entities, prior_memberships);
  const auto prior = BuildPrior(prior_memberships);

  report.Count("mentions", mentions.size());
  report.Count("protection_flags", flags.size());
  report.Count("review_overrides", overrides.size());

  // ---------------------------------------------------------------------
  // Block
  // ---------------------------------------------------------------------

  const auto index = Stage("block", [&] { return blocking::BlockingIndex::Build(mentions, settings_.blocking_key_version); });

  report.Count("blocks", index.Blocks().size());
  for (std::size_t i = 0; i < index.MentionCount(); ++i) {
    const auto& mention = index.Mention(i);
    if (index.IsUnblockable(i)) report.Count("unblockable_mentions");
    if (mention.parse_failed) {
      report.Count("parse_failed_mentions");
      report.Example("parse_failed", mention.mention_id + ": " + mention.raw_name);
    }
  }

  // ---------------------------------------------------------------------
  // Generate
  // ---------------------------------------------------------------------

  const candidates::CandidateGenerator generator(index, settings_);
  std::vector<candidates::CandidateRef> refs = Stage("generate", [&] {
    const auto& blocks = index.Blocks();
    const auto  embeddings =
        settings_.cross_block.enabled ? generator.BuildEmbeddingIndex() : candidates::EmbeddingIndex{};

    const std::size_t cross_chunks = settings_.cross_block.enabled ? (index.MentionCount() + kCrossBlockChunk - 1) / kCrossBlockChunk : 0;
    std::vector<std::vector<candidates::CandidateRef>> slots(blocks.size() + cross_chunks);

    std::vector<std::function<void()>> tasks;
    tasks.reserve(slots.size());
    for (std::size_t b = 0; b < blocks.size(); ++b) {
      tasks.emplace_back([&, b] { slots[b] = generator.ForBlock(blocks[b]); });
    }
    for (std::size_t c = 0; c < cross_chunks; ++c) {
      tasks.emplace_back([&, c] {
        auto&             out = slots[blocks.size() + c];
        const std::size_t end = std::min(index.MentionCount(), (c + 1) * kCrossBlockChunk);
        for (std::size_t i = c * kCrossBlockChunk; i < end; ++i) {
          auto found = generator.CrossBlockFor(i, embeddings);
          out.insert(out.end(), found.begin(), found.end());
        }
      });
    }
    pool_.RunAll(std::move(tasks));

    std::vector<candidates::CandidateRef> merged;
    for (auto& slot : slots) merged.insert(merged.end(), slot.begin(), slot.end());
    generator.Deduplicate(merged);
    return merged;
  });

  for (const auto& block : index.Blocks()) {
    if (block.members.size() > settings_.max_block_size) {
      report.Count("sampled_blocks");
      report.Example("sampled_block", "key=\"" + block.key + "\" members=" + std::to_string(block.members.size()));
    }
  }
  for (const auto& ref : refs) {
    report.Count("candidates_" + std::string(model::ToString(ref.origin)));
  }

  // ---------------------------------------------------------------------
  // Score
  // ---------------------------------------------------------------------

  const scoring::SimilarityScorer scorer(settings_);
  std::vector<model::CandidatePair> pairs = Stage("score", [&] {
    const std::size_t                              chunks = (refs.size() + kScoreChunk - 1) / kScoreChunk;
    std::vector<std::vector<model::CandidatePair>> slots(chunks);

    std::vector<std::function<void()>> tasks;
    tasks.reserve(chunks);
    for (std::size_t c = 0; c < chunks; ++c) {
      tasks.emplace_back([&, c] {
        const std::size_t end = std::min(refs.size(), (c + 1) * kScoreChunk);
        auto&             out = slots[c];
        out.reserve(end - c * kScoreChunk);
        for (std::size_t r = c * kScoreChunk; r < end; ++r) {
          const auto&                ref = refs[r];
          const scoring::ScoringSide a{index.Mention(ref.a), index.KeyOf(ref.a), index.ComparisonNameOf(ref.a)};
          const scoring::ScoringSide b{index.Mention(ref.b), index.KeyOf(ref.b), index.ComparisonNameOf(ref.b)};
          out.push_back(scorer.Score(a, b, ref.origin));
        }
      });
    }
    pool_.RunAll(std::move(tasks));

    // chunks are contiguous ranges of the sorted refs, so the result stays sorted
    std::vector<model::CandidatePair> merged;
    merged.reserve(refs.size());
    for (auto& slot : slots) {
      std::move(slot.begin(), slot.end(), std::back_inserter(merged));
    }
    return merged;
  });

  // ---------------------------------------------------------------------
  // Resolve
  // ---------------------------------------------------------------------

  const resolution::ResolutionEngine engine(index, scorer, settings_);
  auto outcome = Stage("resolve", [&] { return engine.Resolve(std::move(pairs), overrides, prior); });

  for (const auto& ignored : outcome.ignored_overrides) {
    report.Count("overrides_ignored");
    report.Example("ignored_override", ignored.mention_id_a + " / " + ignored.mention_id_b + " references an unknown mention");
  }

  // ---------------------------------------------------------------------
  // Suppress
  // ---------------------------------------------------------------------

  const provenance::SuppressionPolicy policy(index, settings_, flags, latches);
  const auto suppression = Stage("suppress", [&] { return policy.Evaluate(outcome.entities); });

  // ---------------------------------------------------------------------
  // Write
  // ---------------------------------------------------------------------

  const uint64_t now = util::NowMs();
  std::size_t    review_items = 0;

  provenance::MergeDecisionLog decision_log(*repository_, *tx, run_id, settings_.log_discarded_pairs);

  Stage("write", [&] {
    db::ThrowIfDbError(repository_->ClearResolution(*tx), "clear resolution");

    std::set<std::string> already_latched;
    for (const auto& latch : latches) already_latched.insert(latch.mention_id);

    for (std::size_t e = 0; e < outcome.entities.size(); ++e) {
      const auto& entity    = outcome.entities[e];
      const auto& decision  = suppression[e];
      const auto& canonical = index.Mention(entity.canonical_index);

      db::model::EntityRecord record;
      record.entity_id            = entity.entity_id;
      record.canonical_name       = parser::CollapseWhitespace(canonical.raw_name);
      record.canonical_mention_id = canonical.mention_id;
      record.entity_type          = entity.entity_type;
      record.is_verified          = entity.is_verified;
      record.suppress_from_public = decision.suppressed;
      record.confidence           = entity.confidence;
      record.suppression_reasons  = Join(decision.reasons, ',');
      record.run_id               = run_id;
      record.resolved_at_ms       = now;
      db::ThrowIfDbError(repository_->InsertEntity(*tx, record), "insert entity " + record.entity_id);

      for (std::size_t m = 0; m < entity.members.size(); ++m) {
        db::model::EntityMentionRecord row;
        row.entity_id       = entity.entity_id;
        row.mention_id      = index.Mention(entity.members[m]).mention_id;
        row.composite_score = entity.member_scores[m];
        db::ThrowIfDbError(repository_->InsertEntityMention(*tx, row), "insert membership " + row.mention_id);

        if (decision.suppressed && !already_latched.contains(row.mention_id)) {
          db::model::SuppressionLatchRecord latch;
          latch.mention_id    = row.mention_id;
          latch.reason        = record.suppression_reasons;
          latch.run_id        = run_id;
          latch.latched_at_ms = now;
          db::ThrowIfDbError(repository_->LatchSuppression(*tx, latch), "latch " + row.mention_id);
          report.Count("latches_added");
        }
      }

      report.Count("entities");
      if (entity.members.size() == 1) report.Count("singleton_entities");
      if (entity.is_verified) report.Count("verified_entities");
      if (decision.suppressed) report.Count("suppressed_entities");
      for (const auto& reason : decision.reasons) report.Count("suppressed_" + reason);
    }

    db::ThrowIfDbError(repository_->ClearReviewQueue(*tx), "clear review queue");
    for (const auto& edge : outcome.edges) {
      if (edge.decision != model::EdgeDecision::kReview) continue;
      db::model::ReviewItemRecord item;
      item.run_id          = run_id;
      item.mention_id_a    = edge.pair.mention_id_a;
      item.mention_id_b    = edge.pair.mention_id_b;
      item.composite_score = edge.pair.composite_score;
      item.origin          = edge.pair.origin;
      db::ThrowIfDbError(repository_->InsertReviewItem(*tx, item), "insert review item");
      ++review_items;
    }
    report.Count("review_items", review_items);

    report.Count("decisions_logged", decision_log.Append(outcome.edges, now));
    for (const auto& [decision, count] : decision_log.Counts()) {
      report.Count("decisions_" + decision, count);
    }
    for (const auto& edge : outcome.edges) {
      if (edge.manual) report.Count("overrides_applied");
    }

    report.SetStatus(options.dry_run ? "dry_run" : std::string(db::model::ToString(db::model::RunStatus::kCommitted)));

    db::model::RunRecord run;
    run.run_id             = run_id;
    run.started_at_ms      = started_at_ms;
    run.finished_at_ms     = util::NowMs();
    run.status             = db::model::RunStatus::kCommitted;
    run.config_fingerprint = settings_.Fingerprint();
    run.report_json        = report.ToJson();
    db::ThrowIfDbError(repository_->UpsertRun(*tx, run), "record run");
  });

  if (options.dry_run) {
    tx->Rollback();
  } else {
    tx->Commit();
  }

  auto& metrics = observability::Metrics::Instance();
  for (const auto& [decision, count] : decision_log.Counts()) {
    metrics.RecordDecisions(decision, count);
  }
  if (!options.dry_run) {
    metrics.SetPartitionSize(outcome.entities.size(), review_items);
  }

  RESOLVER_LOG_INFO("resolution run finished",
                    {StringField("run_id", run_id), StringField("status", report.Status()),
                     IntField("mentions", static_cast<std::int64_t>(mentions.size())),
                     IntField("entities", static_cast<std::int64_t>(outcome.entities.size())),
                     IntField("review_items", static_cast<std::int64_t>(review_items))});
  return report;
}

} // namespace resolver::pipeline
