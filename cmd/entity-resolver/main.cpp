#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/export/audit_export.hpp"
#include "internal/export/jsonl.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/mention_ingestor.hpp"
#include "internal/pipeline/resolution_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using resolver::factory::Application;
using resolver::observability::IntField;
using resolver::observability::StringField;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  entity-resolver --config <config.yaml> import <mentions.jsonl|->\n"
            << "  entity-resolver --config <config.yaml> flag <mention_id> <reason>\n"
            << "  entity-resolver --config <config.yaml> run [--dry-run]\n"
            << "  entity-resolver --config <config.yaml> review <mention_id_a> <mention_id_b> merge|split [note]\n"
            << "  entity-resolver --config <config.yaml> export entities|public|decisions|review [out.jsonl]\n"
            << "  entity-resolver --config <config.yaml> report [run_id]\n"
            << "  entity-resolver --config <config.yaml> runs\n";
}

static void Shutdown() {
  resolver::observability::ShutdownLogging();
  resolver::observability::ShutdownMetrics();
  resolver::observability::ShutdownTracing();
}

static int Import(Application& app, const std::string& path) {
  std::ifstream file;
  std::istream* in = &std::cin;
  if (path != "-") {
    file.open(path);
    if (!file) throw std::runtime_error("cannot open " + path);
    in = &file;
  }

  auto lines = resolver::exporter::ReadMentionLines(*in);
  for (const auto& error : lines.errors) {
    RESOLVER_LOG_WARN("skipping malformed mention line", {StringField("error", error)});
  }

  resolver::pipeline::MentionIngestor ingestor(app.repository, *app.parser, app.settings);
  auto                                summary = ingestor.IngestBatch(lines.inputs);

  std::cout << "inserted=" << summary.inserted << " duplicates=" << summary.duplicates
            << " rejected=" << summary.rejected + lines.errors.size() << "\n";
  return 0;
}

static int Flag(Application& app, const std::string& mention_id, const std::string& reason) {
  resolver::pipeline::MentionIngestor ingestor(app.repository, *app.parser, app.settings);
  ingestor.Flag(mention_id, reason);
  return 0;
}

static int Run(Application& app, bool dry_run) {
  resolver::pipeline::ResolutionPipeline pipeline(app.repository, app.settings, *app.workers);
  auto                                   report = pipeline.Run({dry_run});
  std::cout << report.ToJson() << "\n";
  return 0;
}

static int Review(Application& app, std::string a, std::string b, const std::string& verdict, const std::string& note) {
  resolver::db::model::ReviewOverrideRecord record;
  if (verdict == "merge") {
    record.verdict = resolver::db::model::ReviewVerdict::kForceMerge;
  } else if (verdict == "split") {
    record.verdict = resolver::db::model::ReviewVerdict::kForceSplit;
  } else {
    std::cerr << "unsupported verdict: " << verdict << "\n";
    return 1;
  }
  if (a == b) {
    std::cerr << "a pair needs two different mentions\n";
    return 1;
  }
  if (b < a) std::swap(a, b);

  auto tx = app.repository->Begin();
  for (const auto& id : {a, b}) {
    if (!app.repository->GetMention(*tx, id)) throw resolver::util::NotFound("unknown mention: " + id);
  }

  const char* user    = std::getenv("USER");
  record.mention_id_a = a;
  record.mention_id_b = b;
  record.reviewer     = user ? user : "cli";
  record.note         = note;
  record.decided_at_ms = resolver::util::NowMs();
  resolver::db::ThrowIfDbError(app.repository->UpsertReviewOverride(*tx, record), "record review verdict");
  tx->Commit();

  RESOLVER_LOG_INFO("recorded review verdict",
                    {StringField("mention_id_a", a), StringField("mention_id_b", b), StringField("verdict", verdict)});
  return 0;
}

static int Export(Application& app, const std::string& what, const std::string& out_path) {
  std::ofstream file;
  std::ostream* out = &std::cout;
  if (!out_path.empty() && out_path != "-") {
    file.open(out_path);
    if (!file) throw std::runtime_error("cannot open " + out_path);
    out = &file;
  }

  std::size_t written = 0;
  if (what == "entities") {
    written = resolver::exporter::ExportEntities(*app.repository, *out);
  } else if (what == "public") {
    written = resolver::exporter::ExportPublic(*app.repository, app.settings.public_disclosure_floor, *out);
  } else if (what == "decisions") {
    written = resolver::exporter::ExportDecisions(*app.repository, "", *out);
  } else if (what == "review") {
    written = resolver::exporter::ExportReviewQueue(*app.repository, *out);
  } else {
    std::cerr << "unsupported export: " << what << "\n";
    return 1;
  }

  RESOLVER_LOG_INFO("export finished", {StringField("kind", what), IntField("lines", static_cast<std::int64_t>(written))});
  return 0;
}

static int Report(Application& app, const std::string& run_id) {
  auto tx  = app.repository->Begin();
  auto run = run_id.empty() ? app.repository->LatestCommittedRun(*tx) : app.repository->GetRun(*tx, run_id);
  tx->Rollback();

  if (!run) {
    throw resolver::util::NotFound(run_id.empty() ? "no committed run" : "unknown run: " + run_id);
  }
  std::cout << run->report_json << "\n";
  return 0;
}

static int Runs(Application& app) {
  auto tx   = app.repository->Begin();
  auto runs = app.repository->ListRuns(*tx);
  tx->Rollback();

  for (const auto& run : runs) {
    std::cout << run.run_id << " " << resolver::db::model::ToString(run.status) << " started=" << resolver::util::FormatUnixMillis(run.started_at_ms)
              << " finished=" << resolver::util::FormatUnixMillis(run.finished_at_ms) << " config=" << run.config_fingerprint << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args[0] != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = args[1];
  const std::string              cmd         = args[2];
  const std::vector<std::string> rest(args.begin() + 3, args.end());

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = resolver::config::ConfigLoader::LoadFromYaml(config_path);

    resolver::observability::InitializeTracing(config);
    resolver::observability::InitializeMetrics(config);
    resolver::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (settings are validated here)
    // ------------------------------------------------------------
    auto app = resolver::factory::Build(config);

    int rc = 1;
    if (cmd == "import" && rest.size() == 1) {
      rc = Import(app, rest[0]);
    } else if (cmd == "flag" && rest.size() == 2) {
      rc = Flag(app, rest[0], rest[1]);
    } else if (cmd == "run" && rest.size() <= 1) {
      if (!rest.empty() && rest[0] != "--dry-run") {
        Usage();
      } else {
        rc = Run(app, !rest.empty());
      }
    } else if (cmd == "review" && (rest.size() == 3 || rest.size() == 4)) {
      rc = Review(app, rest[0], rest[1], rest[2], rest.size() == 4 ? rest[3] : "");
    } else if (cmd == "export" && (rest.size() == 1 || rest.size() == 2)) {
      rc = Export(app, rest[0], rest.size() == 2 ? rest[1] : "");
    } else if (cmd == "report" && rest.size() <= 1) {
      rc = Report(app, rest.empty() ? "" : rest[0]);
    } else if (cmd == "runs" && rest.empty()) {
      rc = Runs(app);
    } else {
      Usage();
    }

    app.workers->Stop();
    Shutdown();
    return rc;
  } catch (const std::exception& e) {
    RESOLVER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }
}
