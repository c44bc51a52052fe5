#pragma once

#include <cstddef>
#include <vector>

namespace resolver::candidates {

/*
  Exact cosine nearest-neighbor search over name embeddings.

  Vectors are L2-normalized on insert and kept in one flat buffer
  (row-major, dimension fixed by the first vector), so a query is a
  single pass of dot products. Vectors with a different dimension or a
  zero norm are rejected by Add().

  Read-only after construction; Search() is safe to call from several
  workers at once.
*/
class EmbeddingIndex {
 public:
  struct Neighbor {
    std::size_t id     = 0;
    double      cosine = 0.0;
  };

  // Returns false if the vector was not indexed.
  bool Add(std::size_t id, const std::vector<float>& vector);

  // Top k neighbors with cosine >= min_cosine, best first, ties by smaller
  // id. `exclude` is left out of the result (the query's own id).
  std::vector<Neighbor> Search(const std::vector<float>& query, std::size_t k, double min_cosine, std::size_t exclude) const;

  std::size_t Size() const {
    return ids_.size();
  }

  std::size_t Dimension() const {
    return dimension_;
  }

 private:
  std::size_t              dimension_ = 0;
  std::vector<float>       data_;
  std::vector<std::size_t> ids_;
};

} // namespace resolver::candidates
