#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace ragrank::internal {

// Distance space of the graph index.
enum class HnswSpace {
  kL2,           // squared euclidean distance
  kInnerProduct  // 1 - dot product
};

// Search result: chunk_id + distance in the index's space (lower = closer)
struct SearchResult {
  std::string chunk_id;
  float distance;
};

// Abstract interface for approximate nearest-neighbour search
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Add embedding for chunk_id, replacing any previous embedding for it.
  // Returns false on dimension mismatch or index failure.
  virtual bool Add(const std::vector<float>& embedding,
                   const std::string& chunk_id) = 0;

  // Up to k nearest live entries, sorted by distance ascending. Returns
  // false with error_out set when the graph search itself fails; a query
  // of the wrong dimension or an empty index yields true with no results.
  virtual bool Search(const std::vector<float>& query,
                      size_t k,
                      std::vector<SearchResult>* out,
                      std::string* error_out = nullptr) const = 0;

  // Soft-delete chunk_id. Returns false if it is not indexed.
  virtual bool Remove(const std::string& chunk_id) = 0;

  virtual size_t Size() const = 0;
  virtual size_t Dimension() const = 0;
  virtual size_t DeletedCount() const = 0;
  virtual HnswSpace Space() const = 0;

  // Set search parameters (ef_search)
  virtual void SetSearchParam(const std::string& key, int value) = 0;
};

// Factory function for HNSW index (hnswlib). Returns nullptr when the
// library is not compiled in.
// - dimension: embedding dimension (e.g., 384)
// - max_elements: initial capacity (grows automatically)
// - m: max connections per node
// - ef_construction: build-time search depth
std::unique_ptr<VectorIndex> CreateHNSWIndex(
    size_t dimension,
    HnswSpace space,
    size_t max_elements = 10000,
    int m = 16,
    int ef_construction = 200);

}  // namespace ragrank::internal
