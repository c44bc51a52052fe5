#include "internal/scoring/string_similarity.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

#include "internal/parser/name_normalizer.hpp"

namespace resolver::scoring {

namespace {

std::size_t Distance(std::u32string_view a, std::u32string_view b) {
  if (a.size() < b.size()) std::swap(a, b);
  if (b.empty()) return a.size();

  // two rows over the shorter string
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> curr(b.size() + 1);
  std::iota(prev.begin(), prev.end(), std::size_t{0});

  for (std::size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      curr[j]                        = std::min({prev[j] + 1, curr[j - 1] + 1, substitution});
    }
    std::swap(prev, curr);
  }
  return prev[b.size()];
}

} // namespace

std::size_t LevenshteinDistance(std::string_view a, std::string_view b) {
  return Distance(parser::DecodeUtf8(a), parser::DecodeUtf8(b));
}

double NormalizedLevenshteinSimilarity(std::string_view a, std::string_view b) {
  const auto        left    = parser::DecodeUtf8(a);
  const auto        right   = parser::DecodeUtf8(b);
  const std::size_t longest = std::max(left.size(), right.size());
  if (longest == 0) return 0.0;
  return 1.0 - static_cast<double>(Distance(left, right)) / static_cast<double>(longest);
}

double Cosine(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0;

  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) return 0.0;
  return std::clamp(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)), -1.0, 1.0);
}

} // namespace resolver::scoring
