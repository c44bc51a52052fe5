#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace resolver::config {

inline constexpr const char* kBlockingKeySoundexV1 = "soundex-v1";
inline constexpr const char* kBlockingKeySoundexV2 = "soundex-v2";

/*
  Validated, immutable resolution parameters.

  Built once from RuntimeConfig before any mention is touched. Every
  field is populated (defaults applied); consumers never look at the
  protobuf again.
*/
struct ResolutionSettings {
  std::string blocking_key_version = kBlockingKeySoundexV1;
  std::string embedding_model_id;

  double t_low             = 0.6;
  double t_high            = 0.9;
  double type_conflict_cap = 0.5;
  double low_confidence_cap = 0.75;

  uint32_t max_block_size          = 50;
  double   public_disclosure_floor = 0.3;

  struct Weights {
    double phonetic  = 0.3;
    double edit      = 0.5;
    double embedding = 0.2;
  } weights;

  struct CrossBlock {
    bool     enabled              = false;
    uint32_t top_k                = 5;
    double   min_parse_confidence = 0.7;
    double   min_cosine           = 0.8;
    double   threshold_margin     = 0.05;
  } cross_block;

  struct Suppression {
    uint32_t k_anonymity_k                = 2;
    double   k_anonymity_confidence_floor = 0.3;
    bool     placeholders_are_protected   = true;
  } suppression;

  bool log_discarded_pairs = true;

  uint32_t worker_threads = 1;

  // Stable hash of every field above. Recorded with each run so two runs
  // can be compared for "same parameters".
  std::string Fingerprint() const;
};

// Throws util::ConfigError on the first invalid value.
ResolutionSettings BuildResolutionSettings(const resolver::runtime::config::RuntimeConfig& config);

} // namespace resolver::config
