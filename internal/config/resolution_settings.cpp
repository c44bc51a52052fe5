#include "internal/config/resolution_settings.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <thread>

#include "internal/util/errors.hpp"

namespace resolver::config {

namespace {

void RequireUnit(const char* name, double value) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    std::ostringstream msg;
    msg << "resolution." << name << " must be within [0,1], got " << value;
    throw util::ConfigError(msg.str());
  }
}

void RequireNonNegative(const char* name, double value) {
  if (!std::isfinite(value) || value < 0.0) {
    std::ostringstream msg;
    msg << "resolution." << name << " must be a non-negative number, got " << value;
    throw util::ConfigError(msg.str());
  }
}

// FNV-1a, 64 bit
uint64_t Fnv1a(const std::string& data) {
  uint64_t hash = 1469598103934665603ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

} // namespace

std::string ResolutionSettings::Fingerprint() const {
  std::ostringstream canonical;
  canonical.precision(17);
  canonical << blocking_key_version << '|' << embedding_model_id << '|' << t_low << '|' << t_high << '|' << type_conflict_cap << '|'
            << low_confidence_cap << '|' << max_block_size << '|' << public_disclosure_floor << '|' << weights.phonetic << '|'
            << weights.edit << '|' << weights.embedding << '|' << cross_block.enabled << '|' << cross_block.top_k << '|'
            << cross_block.min_parse_confidence << '|' << cross_block.min_cosine << '|' << cross_block.threshold_margin << '|'
            << suppression.k_anonymity_k << '|' << suppression.k_anonymity_confidence_floor << '|'
            << suppression.placeholders_are_protected << '|' << log_discarded_pairs;
  // worker_threads is excluded: it never changes the output

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(Fnv1a(canonical.str())));
  return buf;
}

ResolutionSettings BuildResolutionSettings(const resolver::runtime::config::RuntimeConfig& config) {
  ResolutionSettings s;
  const auto&        r = config.resolution();

  if (!r.blocking_key_version().empty()) {
    s.blocking_key_version = r.blocking_key_version();
  }
  if (s.blocking_key_version != kBlockingKeySoundexV1 && s.blocking_key_version != kBlockingKeySoundexV2) {
    throw util::ConfigError("resolution.blocking_key_version: unknown version '" + s.blocking_key_version + "'");
  }

  s.embedding_model_id = r.embedding_model_id();

  if (r.has_t_low()) s.t_low = r.t_low();
  if (r.has_t_high()) s.t_high = r.t_high();
  if (r.has_type_conflict_cap()) s.type_conflict_cap = r.type_conflict_cap();
  if (r.has_low_confidence_cap()) s.low_confidence_cap = r.low_confidence_cap();
  if (r.has_public_disclosure_floor()) s.public_disclosure_floor = r.public_disclosure_floor();

  RequireUnit("t_low", s.t_low);
  RequireUnit("t_high", s.t_high);
  RequireUnit("type_conflict_cap", s.type_conflict_cap);
  RequireUnit("low_confidence_cap", s.low_confidence_cap);
  RequireUnit("public_disclosure_floor", s.public_disclosure_floor);

  if (s.t_low > s.t_high) {
    std::ostringstream msg;
    msg << "resolution.t_low (" << s.t_low << ") must not exceed resolution.t_high (" << s.t_high << ")";
    throw util::ConfigError(msg.str());
  }

  if (r.has_max_block_size()) {
    if (r.max_block_size() < 2) {
      throw util::ConfigError("resolution.max_block_size must be at least 2");
    }
    s.max_block_size = r.max_block_size();
  }

  // all three weights or none
  if (r.has_weights()) {
    const auto& w = r.weights();
    if (!w.has_phonetic() || !w.has_edit() || !w.has_embedding()) {
      throw util::ConfigError("resolution.weights: phonetic, edit and embedding are all required");
    }
    s.weights = {w.phonetic(), w.edit(), w.embedding()};
  }
  RequireUnit("weights.phonetic", s.weights.phonetic);
  RequireUnit("weights.edit", s.weights.edit);
  RequireUnit("weights.embedding", s.weights.embedding);
  if (s.weights.phonetic + s.weights.edit <= 0.0) {
    throw util::ConfigError("resolution.weights: phonetic and edit weights cannot both be zero");
  }

  if (r.has_cross_block()) {
    const auto& cb        = r.cross_block();
    s.cross_block.enabled = cb.enabled();
    if (cb.has_top_k()) s.cross_block.top_k = cb.top_k();
    if (cb.has_min_parse_confidence()) s.cross_block.min_parse_confidence = cb.min_parse_confidence();
    if (cb.has_min_cosine()) s.cross_block.min_cosine = cb.min_cosine();
    if (cb.has_threshold_margin()) s.cross_block.threshold_margin = cb.threshold_margin();
  }
  RequireUnit("cross_block.min_parse_confidence", s.cross_block.min_parse_confidence);
  RequireNonNegative("cross_block.threshold_margin", s.cross_block.threshold_margin);
  if (s.cross_block.min_cosine < -1.0 || s.cross_block.min_cosine > 1.0) {
    throw util::ConfigError("resolution.cross_block.min_cosine must be within [-1,1]");
  }
  if (s.cross_block.enabled) {
    if (s.cross_block.top_k == 0) {
      throw util::ConfigError("resolution.cross_block.top_k must be positive when cross-block search is enabled");
    }
    if (s.embedding_model_id.empty()) {
      throw util::ConfigError("resolution.cross_block requires resolution.embedding_model_id");
    }
  }

  if (r.has_suppression()) {
    const auto& sp = r.suppression();
    if (sp.has_k_anonymity_k()) s.suppression.k_anonymity_k = sp.k_anonymity_k();
    if (sp.has_k_anonymity_confidence_floor()) s.suppression.k_anonymity_confidence_floor = sp.k_anonymity_confidence_floor();
    if (sp.has_placeholders_are_protected()) s.suppression.placeholders_are_protected = sp.placeholders_are_protected();
  }
  RequireUnit("suppression.k_anonymity_confidence_floor", s.suppression.k_anonymity_confidence_floor);

  if (r.has_log_discarded_pairs()) s.log_discarded_pairs = r.log_discarded_pairs();

  if (config.workers().has_threads()) {
    if (config.workers().threads() == 0) {
      throw util::ConfigError("workers.threads must be at least 1");
    }
    s.worker_threads = config.workers().threads();
  } else {
    s.worker_threads = std::max(1u, std::thread::hardware_concurrency());
  }

  return s;
}

} // namespace resolver::config
