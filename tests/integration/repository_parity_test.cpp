#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

namespace {

using resolver::db::ErrorCode;
using resolver::db::Repository;
using resolver::db::memory::MemoryRepository;
using resolver::db::model::EntityMentionRecord;
using resolver::db::model::EntityRecord;
using resolver::db::model::MentionRecord;
using resolver::db::model::MergeDecisionRecord;
using resolver::db::model::ProtectionFlagRecord;
using resolver::db::model::ReviewItemRecord;
using resolver::db::model::ReviewOverrideRecord;
using resolver::db::model::ReviewVerdict;
using resolver::db::model::RunRecord;
using resolver::db::model::RunStatus;
using resolver::db::model::SuppressionLatchRecord;
using resolver::model::CandidateOrigin;
using resolver::model::EdgeDecision;
using resolver::model::ParseType;
using resolver::model::TypeAgreement;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

MentionRecord MakeMention(const std::string& id, const std::string& given, const std::string& family) {
  MentionRecord m;
  m.mention_id           = id;
  m.source_reference     = "exhibit-" + id;
  m.source_system        = "court-filings";
  m.raw_name             = given + " " + family;
  m.name.given           = given;
  m.name.family          = family;
  m.parse_type           = ParseType::kPerson;
  m.parse_confidence     = 0.9;
  m.blocking_key         = "S530-J";
  m.blocking_key_version = "soundex-v1";
  m.ingested_at_ms       = 1000;
  return m;
}

// Mentions and flags in a shared database belong to earlier runs too;
// only rows carrying this run's prefix are compared.
template <typename T, typename Id>
std::vector<T> WithPrefix(const std::vector<T>& rows, const std::string& prefix, Id id_of) {
  std::vector<T> out;
  for (const auto& row : rows) {
    if (id_of(row).rfind(prefix, 0) == 0) out.push_back(row);
  }
  return out;
}

void VerifyMentionRoundTrip(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();

  auto full            = MakeMention(p + "m2", "Jeffrey", "Epstein");
  full.name.middle     = "E";
  full.name.suffix     = "Jr";
  full.embedding       = {0.25F, -0.5F, 1.0F};
  full.embedding_model = "names-v1";
  assert(repo.InsertMention(*tx, full));

  auto bare             = MakeMention(p + "m1", "", "");
  bare.raw_name         = "?";
  bare.name             = {};
  bare.parse_type       = ParseType::kUnknown;
  bare.parse_confidence = 0.0;
  bare.parse_failed     = true;
  bare.blocking_key     = "";
  assert(repo.InsertMention(*tx, bare));

  auto read = repo.GetMention(*tx, p + "m2");
  assert(read.has_value());
  assert(read->raw_name == "Jeffrey Epstein");
  assert(read->source_reference == "exhibit-" + p + "m2");
  assert(read->name.given == std::optional<std::string>("Jeffrey"));
  assert(read->name.middle == std::optional<std::string>("E"));
  assert(read->name.suffix == std::optional<std::string>("Jr"));
  assert(!read->name.prefix.has_value());
  assert(!read->name.nickname.has_value());
  assert(read->parse_type == ParseType::kPerson);
  assert(read->parse_confidence == 0.9);
  assert(read->embedding.size() == 3);
  assert(read->embedding[1] == -0.5F);
  assert(read->embedding_model == "names-v1");
  assert(read->ingested_at_ms == 1000);

  auto failed = repo.GetMention(*tx, p + "m1");
  assert(failed.has_value());
  assert(failed->parse_failed);
  assert(failed->name.Empty());
  assert(failed->embedding.empty());

  assert(!repo.GetMention(*tx, p + "missing").has_value());

  auto listed = WithPrefix(repo.ListMentions(*tx), p, [](const MentionRecord& m) { return m.mention_id; });
  assert(listed.size() == 2);
  assert(listed[0].mention_id == p + "m1");
  assert(listed[1].mention_id == p + "m2");

  tx->Commit();

  // A failed statement aborts a postgres transaction, so each rejection
  // gets its own.
  {
    auto dup_tx = repo.Begin();
    auto dup    = repo.InsertMention(*dup_tx, MakeMention(p + "m1", "Other", "Name"));
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    dup_tx->Rollback();
  }
  {
    auto flag_tx = repo.Begin();
    auto flag    = repo.AddProtectionFlag(*flag_tx, ProtectionFlagRecord{.mention_id = p + "missing", .reason = "minor", .flagged_at_ms = 1});
    assert(!flag);
    assert(flag.code == ErrorCode::NotFound);
    flag_tx->Rollback();
  }
}

void VerifyProtectionFlags(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();
  assert(repo.InsertMention(*tx, MakeMention(p + "f1", "Jane", "Roe")));
  assert(repo.AddProtectionFlag(*tx, ProtectionFlagRecord{.mention_id = p + "f1", .reason = "victim", .flagged_at_ms = 20}));
  assert(repo.AddProtectionFlag(*tx, ProtectionFlagRecord{.mention_id = p + "f1", .reason = "minor", .flagged_at_ms = 10}));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto flags   = WithPrefix(repo.ListProtectionFlags(*read_tx), p, [](const ProtectionFlagRecord& f) { return f.mention_id; });
  assert(flags.size() == 2);
  assert(flags[0].reason == "minor");
  assert(flags[1].reason == "victim");
  read_tx->Commit();
}

void VerifyResolutionReplace(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();
  assert(repo.ClearResolution(*tx));

  EntityRecord entity;
  entity.entity_id            = p + "e1";
  entity.canonical_name       = "Jeffrey Epstein";
  entity.canonical_mention_id = p + "m2";
  entity.entity_type          = ParseType::kPerson;
  entity.is_verified          = true;
  entity.confidence           = 0.95;
  entity.suppression_reasons  = "protected_flag,k_anonymity";
  entity.suppress_from_public = true;
  entity.run_id               = p + "run";
  entity.resolved_at_ms       = 5;
  assert(repo.InsertEntity(*tx, entity));

  assert(repo.InsertEntityMention(*tx, EntityMentionRecord{.entity_id = p + "e1", .mention_id = p + "m2", .composite_score = 0.95}));
  assert(repo.InsertEntityMention(*tx, EntityMentionRecord{.entity_id = p + "e1", .mention_id = p + "m1", .composite_score = 0.0}));
  tx->Commit();

  {
    auto bad_tx = repo.Begin();
    auto again  = repo.InsertEntityMention(*bad_tx, EntityMentionRecord{.entity_id = p + "e1", .mention_id = p + "m2", .composite_score = 1.0});
    assert(!again);
    assert(again.code == ErrorCode::ConstraintViolation);
    bad_tx->Rollback();
  }
  {
    auto bad_tx = repo.Begin();
    auto orphan = repo.InsertEntityMention(*bad_tx, EntityMentionRecord{.entity_id = p + "nope", .mention_id = p + "f1", .composite_score = 1.0});
    assert(!orphan);
    assert(orphan.code == ErrorCode::ConstraintViolation);
    bad_tx->Rollback();
  }

  auto read_tx = repo.Begin();
  auto read    = repo.GetEntity(*read_tx, p + "e1");
  assert(read.has_value());
  assert(read->canonical_mention_id == p + "m2");
  assert(read->is_verified);
  assert(read->suppress_from_public);
  assert(read->suppression_reasons == "protected_flag,k_anonymity");
  assert(read->entity_type == ParseType::kPerson);

  auto members = repo.ListEntityMentions(*read_tx);
  assert(members.size() == 2);
  assert(members[0].mention_id == p + "m1");
  assert(members[1].mention_id == p + "m2");
  assert(members[1].composite_score == 0.95);

  assert(repo.ClearResolution(*read_tx));
  assert(repo.ListEntities(*read_tx).empty());
  assert(repo.ListEntityMentions(*read_tx).empty());
  read_tx->Rollback();

  // the clear above was rolled back
  auto check_tx = repo.Begin();
  assert(repo.ListEntities(*check_tx).size() == 1);
  check_tx->Commit();
}

void VerifyDecisionLog(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();

  MergeDecisionRecord merge;
  merge.run_id                       = p + "run-a";
  merge.mention_id_a                 = p + "m1";
  merge.mention_id_b                 = p + "m2";
  merge.decision                     = EdgeDecision::kMerge;
  merge.origin                       = CandidateOrigin::kCrossBlock;
  merge.composite_score              = 0.97;
  merge.signals.phonetic_match       = true;
  merge.signals.edit_similarity      = 0.9;
  merge.signals.embedding_similarity = 0.8;
  merge.signals.type_agreement       = TypeAgreement::kPartial;
  merge.reason                       = "above_t_high";
  merge.decided_at_ms                = 7;
  assert(repo.AppendMergeDecision(*tx, merge));

  auto review            = merge;
  review.mention_id_b    = p + "f1";
  review.decision        = EdgeDecision::kReview;
  review.origin          = CandidateOrigin::kWithinBlock;
  review.composite_score = 0.8;
  review.signals         = {};
  review.reason          = "between_thresholds";
  assert(repo.AppendMergeDecision(*tx, review));

  auto other   = merge;
  other.run_id = p + "run-b";
  assert(repo.AppendMergeDecision(*tx, other));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto run_a   = repo.ListMergeDecisions(*read_tx, p + "run-a");
  assert(run_a.size() == 2);
  assert(run_a[0].decision == EdgeDecision::kMerge);
  assert(run_a[0].origin == CandidateOrigin::kCrossBlock);
  assert(run_a[0].signals.phonetic_match);
  assert(run_a[0].signals.embedding_similarity == std::optional<double>(0.8));
  assert(run_a[0].signals.type_agreement == TypeAgreement::kPartial);
  assert(run_a[1].reason == "between_thresholds");
  assert(!run_a[1].signals.embedding_similarity.has_value());

  assert(repo.ListMergeDecisions(*read_tx, p + "run-b").size() == 1);
  assert(repo.ListMergeDecisions(*read_tx, p + "run-none").empty());
  assert(repo.ListMergeDecisions(*read_tx, "").size() >= 3);
  read_tx->Commit();
}

void VerifyReviewQueueAndOverrides(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();
  assert(repo.ClearReviewQueue(*tx));
  assert(repo.InsertReviewItem(*tx, ReviewItemRecord{.run_id = p + "run", .mention_id_a = p + "m2", .mention_id_b = p + "m3", .composite_score = 0.8}));
  assert(repo.InsertReviewItem(*tx, ReviewItemRecord{.run_id = p + "run", .mention_id_a = p + "m1", .mention_id_b = p + "m2", .composite_score = 0.7}));

  ReviewOverrideRecord split{.mention_id_a = p + "m1", .mention_id_b = p + "m2", .verdict = ReviewVerdict::kForceSplit, .reviewer = "ana", .note = "", .decided_at_ms = 1};
  assert(repo.UpsertReviewOverride(*tx, split));
  auto merge          = split;
  merge.verdict       = ReviewVerdict::kForceMerge;
  merge.note          = "same passport";
  merge.decided_at_ms = 2;
  assert(repo.UpsertReviewOverride(*tx, merge));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto items   = repo.ListReviewItems(*read_tx);
  assert(items.size() == 2);
  assert(items[0].mention_id_a == p + "m1");
  assert(items[0].composite_score == 0.7);

  auto overrides = WithPrefix(repo.ListReviewOverrides(*read_tx), p, [](const ReviewOverrideRecord& o) { return o.mention_id_a; });
  assert(overrides.size() == 1);
  assert(overrides[0].verdict == ReviewVerdict::kForceMerge);
  assert(overrides[0].note == "same passport");

  assert(repo.ClearReviewQueue(*read_tx));
  assert(repo.ListReviewItems(*read_tx).empty());
  read_tx->Commit();
}

void VerifySuppressionLatch(Repository& repo, const std::string& p) {
  auto tx = repo.Begin();
  assert(repo.LatchSuppression(*tx, SuppressionLatchRecord{.mention_id = p + "m2", .reason = "k_anonymity", .run_id = p + "run-1", .latched_at_ms = 1}));
  tx->Commit();

  auto again_tx = repo.Begin();
  assert(repo.LatchSuppression(*again_tx, SuppressionLatchRecord{.mention_id = p + "m2", .reason = "protected_flag", .run_id = p + "run-2", .latched_at_ms = 2}));
  again_tx->Commit();

  auto read_tx = repo.Begin();
  auto latches = WithPrefix(repo.ListSuppressionLatches(*read_tx), p, [](const SuppressionLatchRecord& l) { return l.mention_id; });
  assert(latches.size() == 1);
  assert(latches[0].reason == "k_anonymity");
  assert(latches[0].run_id == p + "run-1");
  read_tx->Commit();
}

void VerifyRuns(Repository& repo, const std::string& p) {
  const auto base = NowMs() + 1000;

  auto tx = repo.Begin();
  RunRecord first{.run_id = p + "r1", .started_at_ms = base, .finished_at_ms = 0, .status = RunStatus::kRunning, .config_fingerprint = "abc", .report_json = ""};
  assert(repo.UpsertRun(*tx, first));
  first.status         = RunStatus::kCommitted;
  first.finished_at_ms = base + 10;
  first.report_json    = R"({"run_id":"r1"})";
  assert(repo.UpsertRun(*tx, first));

  RunRecord aborted{.run_id = p + "r2", .started_at_ms = base + 20, .finished_at_ms = base + 30, .status = RunStatus::kAborted, .config_fingerprint = "abc", .report_json = ""};
  assert(repo.UpsertRun(*tx, aborted));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto r1      = repo.GetRun(*read_tx, p + "r1");
  assert(r1.has_value());
  assert(r1->status == RunStatus::kCommitted);
  assert(r1->finished_at_ms == base + 10);
  assert(r1->report_json == R"({"run_id":"r1"})");

  auto latest = repo.LatestCommittedRun(*read_tx);
  assert(latest.has_value());
  assert(latest->run_id == p + "r1");

  auto runs = WithPrefix(repo.ListRuns(*read_tx), p, [](const RunRecord& r) { return r.run_id; });
  assert(runs.size() == 2);
  assert(runs[0].run_id == p + "r1");
  assert(runs[1].status == RunStatus::kAborted);
  assert(!repo.GetRun(*read_tx, p + "r9").has_value());
  read_tx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo, const std::string& p) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertMention(*tx, MakeMention(p + "rb", "Rolled", "Back")));
    assert(repo.GetMention(*tx, p + "rb").has_value());
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.InsertMention(*tx, MakeMention(p + "rb2", "Dropped", "Write")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetMention(*tx, p + "rb").has_value());
  assert(!repo.GetMention(*tx, p + "rb2").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& p) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    auto m      = MakeMention(p + "d1", "Ghislaine", "Maxwell");
    m.embedding = {1.0F, 0.0F};
    assert(repo->InsertMention(*tx, m));
    assert(repo->AddProtectionFlag(*tx, ProtectionFlagRecord{.mention_id = p + "d1", .reason = "sealed", .flagged_at_ms = 3}));
    assert(repo->LatchSuppression(*tx, SuppressionLatchRecord{.mention_id = p + "d1", .reason = "protected_flag", .run_id = p + "dr", .latched_at_ms = 3}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto m  = repo->GetMention(*tx, p + "d1");
  assert(m.has_value());
  assert(m->raw_name == "Ghislaine Maxwell");
  assert(m->embedding.size() == 2);

  auto flags = WithPrefix(repo->ListProtectionFlags(*tx), p + "d1", [](const ProtectionFlagRecord& f) { return f.mention_id; });
  assert(flags.size() == 1);
  auto latches = WithPrefix(repo->ListSuppressionLatches(*tx), p + "d1", [](const SuppressionLatchRecord& l) { return l.mention_id; });
  assert(latches.size() == 1);
  tx->Commit();
}

void RunBackendSuite(BackendFactory backend) {
  const auto prefix = backend.name + "-" + std::to_string(NowMs()) + "-";
  auto       repo   = backend.make_repository();

  VerifyMentionRoundTrip(*repo, prefix);
  VerifyProtectionFlags(*repo, prefix);
  VerifyResolutionReplace(*repo, prefix);
  VerifyDecisionLog(*repo, prefix);
  VerifyReviewQueueAndOverrides(*repo, prefix);
  VerifySuppressionLatch(*repo, prefix);
  VerifyRuns(*repo, prefix);
  VerifyRollbackDiscardsWrites(*repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if RESOLVER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("entity_resolver_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    resolver::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return resolver::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if RESOLVER_DB_POSTGRES
BackendFactory MakePostgresFactory(const std::string& uri) {
  auto make_repo = [uri]() {
    resolver::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
    config.mutable_database()->mutable_postgres()->set_max_connections(2);
    return resolver::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = []() {},
  };
}
#endif

} // namespace

int main() {
  RunBackendSuite(MakeMemoryFactory());

#if RESOLVER_DB_SQLITE
  RunBackendSuite(MakeSqliteFactory());
#endif

#if RESOLVER_DB_POSTGRES
  const char* uri = std::getenv("RESOLVER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    std::cout << "resolver_integration_repository_parity: postgres skipped (RESOLVER_TEST_POSTGRES_URI is not set)\n";
  } else {
    RunBackendSuite(MakePostgresFactory(uri));
  }
#endif

  std::cout << "resolver_integration_repository_parity: pass\n";
  return 0;
}
