#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace resolver::scoring {

// Levenshtein distance over code points of UTF-8 input.
std::size_t LevenshteinDistance(std::string_view a, std::string_view b);

// 1 - distance / max(len). Two empty strings are 0: nothing to compare.
double NormalizedLevenshteinSimilarity(std::string_view a, std::string_view b);

// Cosine in [-1, 1]; 0 if either vector has zero norm or sizes differ.
double Cosine(const std::vector<float>& a, const std::vector<float>& b);

} // namespace resolver::scoring
