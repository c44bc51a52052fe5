#include "internal/candidates/embedding_index.hpp"

#include <algorithm>
#include <cmath>

namespace resolver::candidates {

namespace {

double Norm(const std::vector<float>& v) {
  double sum = 0.0;
  for (float x : v) sum += static_cast<double>(x) * x;
  return std::sqrt(sum);
}

} // namespace

bool EmbeddingIndex::Add(std::size_t id, const std::vector<float>& vector) {
  if (vector.empty()) return false;
  if (dimension_ == 0) dimension_ = vector.size();
  if (vector.size() != dimension_) return false;

  const double norm = Norm(vector);
  if (norm == 0.0) return false;

  for (float x : vector) data_.push_back(static_cast<float>(x / norm));
  ids_.push_back(id);
  return true;
}

std::vector<EmbeddingIndex::Neighbor> EmbeddingIndex::Search(const std::vector<float>& query, std::size_t k, double min_cosine,
                                                             std::size_t exclude) const {
  std::vector<Neighbor> hits;
  if (k == 0 || query.size() != dimension_) return hits;

  const double norm = Norm(query);
  if (norm == 0.0) return hits;

  for (std::size_t row = 0; row < ids_.size(); ++row) {
    if (ids_[row] == exclude) continue;
    const float* v   = data_.data() + row * dimension_;
    double       dot = 0.0;
    for (std::size_t i = 0; i < dimension_; ++i) dot += static_cast<double>(query[i]) * v[i];
    const double cosine = std::clamp(dot / norm, -1.0, 1.0);
    if (cosine >= min_cosine) hits.push_back(Neighbor{ids_[row], cosine});
  }

  const auto better = [](const Neighbor& a, const Neighbor& b) {
    if (a.cosine != b.cosine) return a.cosine > b.cosine;
    return a.id < b.id;
  };
  if (hits.size() > k) {
    std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(k), hits.end(), better);
    hits.resize(k);
  } else {
    std::sort(hits.begin(), hits.end(), better);
  }
  return hits;
}

} // namespace resolver::candidates
