#pragma once

#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

namespace resolver::resolution {

// Disjoint-set forest with path compression and union by size.
class UnionFind {
 public:
  explicit UnionFind(std::size_t n) : parent_(n), size_(n, 1) {
    std::iota(parent_.begin(), parent_.end(), std::size_t{0});
  }

  std::size_t Find(std::size_t i) {
    while (parent_[i] != i) {
      parent_[i] = parent_[parent_[i]];
      i          = parent_[i];
    }
    return i;
  }

  // Returns false if i and j were already connected.
  bool Unite(std::size_t i, std::size_t j) {
    std::size_t root_i = Find(i);
    std::size_t root_j = Find(j);
    if (root_i == root_j) return false;
    if (size_[root_i] < size_[root_j]) std::swap(root_i, root_j);
    parent_[root_j] = root_i;
    size_[root_i] += size_[root_j];
    return true;
  }

  bool Connected(std::size_t i, std::size_t j) {
    return Find(i) == Find(j);
  }

  std::size_t SizeOf(std::size_t i) {
    return size_[Find(i)];
  }

 private:
  std::vector<std::size_t> parent_;
  std::vector<std::size_t> size_;
};

} // namespace resolver::resolution
