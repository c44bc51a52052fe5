#include "internal/config/resolution_settings.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using resolver::config::BuildResolutionSettings;
using resolver::config::ConfigLoader;

bool Rejects(const std::string& yaml) {
  try {
    (void)BuildResolutionSettings(ConfigLoader::LoadFromYamlString(yaml));
  } catch (const resolver::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestDefaults() {
  auto s = BuildResolutionSettings(ConfigLoader::LoadFromYamlString(""));
  assert(s.blocking_key_version == "soundex-v1");
  assert(s.t_low == 0.6);
  assert(s.t_high == 0.9);
  assert(s.type_conflict_cap == 0.5);
  assert(s.max_block_size == 50);
  assert(s.public_disclosure_floor == 0.3);
  assert(s.weights.phonetic == 0.3 && s.weights.edit == 0.5 && s.weights.embedding == 0.2);
  assert(!s.cross_block.enabled);
  assert(s.suppression.k_anonymity_k == 2);
  assert(s.suppression.placeholders_are_protected);
  assert(s.log_discarded_pairs);
  assert(s.worker_threads >= 1);
}

void TestOverrides() {
  auto s = BuildResolutionSettings(ConfigLoader::LoadFromYamlString(R"(workers:
  threads: 3
resolution:
  blocking_key_version: soundex-v2
  embedding_model_id: name-embed-v1
  t_low: 0.5
  t_high: 0.8
  max_block_size: 10
  log_discarded_pairs: false
  cross_block:
    enabled: true
    threshold_margin: 0.1
)"));
  assert(s.blocking_key_version == "soundex-v2");
  assert(s.t_low == 0.5 && s.t_high == 0.8);
  assert(s.max_block_size == 10);
  assert(!s.log_discarded_pairs);
  assert(s.cross_block.enabled);
  assert(s.cross_block.threshold_margin == 0.1);
  assert(s.cross_block.top_k == 5);
  assert(s.worker_threads == 3);
}

void TestInvalidValuesAreRejected() {
  assert(Rejects("resolution:\n  t_low: 0.95\n  t_high: 0.9\n"));
  assert(Rejects("resolution:\n  t_high: 1.5\n"));
  assert(Rejects("resolution:\n  blocking_key_version: metaphone\n"));
  assert(Rejects("resolution:\n  max_block_size: 1\n"));
  assert(Rejects("resolution:\n  weights:\n    phonetic: 0.5\n    edit: 0.5\n"));
  assert(Rejects("resolution:\n  weights:\n    phonetic: 0\n    edit: 0\n    embedding: 1\n"));
  assert(Rejects("resolution:\n  cross_block:\n    enabled: true\n"));
  assert(Rejects("workers:\n  threads: 0\n"));
}

void TestFingerprint() {
  auto a = BuildResolutionSettings(ConfigLoader::LoadFromYamlString("workers:\n  threads: 1\n"));
  auto b = BuildResolutionSettings(ConfigLoader::LoadFromYamlString("workers:\n  threads: 8\n"));
  auto c = BuildResolutionSettings(ConfigLoader::LoadFromYamlString("resolution:\n  t_high: 0.95\n"));

  assert(a.Fingerprint().size() == 16);
  // thread count never changes the output
  assert(a.Fingerprint() == b.Fingerprint());
  assert(a.Fingerprint() != c.Fingerprint());
}

} // namespace

int main() {
  TestDefaults();
  TestOverrides();
  TestInvalidValuesAreRejected();
  TestFingerprint();

  std::cout << "resolver_unit_resolution_settings: pass\n";
  return 0;
}
