#pragma once

#include <ragrank/types.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <rocksdb/status.h>

namespace ragrank {

class ChunkStore;

namespace internal {
class VectorIndex;
}  // namespace internal

/** A backend-native hit: chunk id plus the backend's raw metric value. */
struct RawHit {
  std::string chunk_id;
  double raw_score = 0.0;
};

/**
 * Capability-tagged interface over one vector backend.
 *
 * Backends differ only in the metric they report and whether they can filter
 * on metadata natively; VectorStoreAdapter turns their raw output into a
 * normalised RankedList. Implementations must be safe for concurrent Search()
 * calls. An unreachable backend returns IOError.
 */
class VectorBackend {
 public:
  virtual ~VectorBackend() = default;

  virtual std::string Name() const = 0;

  virtual BackendCapability Capability() const = 0;

  /** Embedding dimension the backend holds (0 = not fixed yet). */
  virtual size_t Dimension() const = 0;

  /**
   * Up to k hits, best first in the backend's own order.
   * filter is non-null only if Capability().supports_metadata_filtering.
   */
  virtual rocksdb::Status Search(const std::vector<float>& query,
                                 size_t k,
                                 const MetadataFilter* filter,
                                 std::vector<RawHit>* out) const = 0;

  /** Make chunk searchable (no-op for backends that read the chunk store). */
  virtual rocksdb::Status Upsert(const Chunk& chunk) = 0;

  virtual rocksdb::Status Remove(const std::string& chunk_id) = 0;

  virtual BackendHealth Health() const = 0;
};

/**
 * Exact nearest-neighbour scan over the embeddings held by a ChunkStore.
 * Reports metric (cosine, dot or l2) and supports native metadata filtering.
 * The store must outlive the backend.
 */
std::unique_ptr<VectorBackend> CreateExactVectorBackend(const ChunkStore* store,
                                                        NativeMetric metric);

struct HnswOptions {
  size_t initial_capacity = 10000;
  int m = 16;                // Max connections per node
  int ef_construction = 200; // Build-time search depth
  int ef_search = 50;        // Query-time search depth
};

/**
 * Approximate backend over an in-memory HNSW graph (hnswlib).
 * metric must be kL2 (raw = euclidean distance) or kDot (raw = inner product).
 * No native metadata filtering. Returns nullptr with error_out set when the
 * metric is unsupported or HNSW support is not compiled in.
 */
std::unique_ptr<VectorBackend> CreateHnswVectorBackend(size_t dimension,
                                                       NativeMetric metric,
                                                       const HnswOptions& opt,
                                                       std::string* error_out = nullptr);

/**
 * Backend over an already built graph index. metric must agree with the
 * index space (kL2 for an L2 graph, kDot for inner product). A failed graph
 * search is reported as IOError naming "hnsw".
 */
std::unique_ptr<VectorBackend> CreateGraphVectorBackend(
    std::unique_ptr<internal::VectorIndex> index,
    NativeMetric metric,
    std::string* error_out = nullptr);

/**
 * Uniform search over any VectorBackend.
 *
 * - Rejects a query whose dimension differs from the backend's (InvalidArgument).
 * - Applies metadata filters natively when the backend can, otherwise
 *   over-fetches and post-filters through the chunk store.
 * - Normalises raw scores with the backend's declared metric.
 * - Maps backend failures to IOError ("backend unavailable").
 */
class VectorStoreAdapter {
 public:
  /**
   * @param backend Vector backend (required)
   * @param store Chunk store used to post-filter; may be null when filters are
   *        never used with a non-filtering backend
   * @param filter_overfetch Initial over-fetch factor for post-filtering
   */
  VectorStoreAdapter(std::shared_ptr<VectorBackend> backend,
                     const ChunkStore* store,
                     size_t filter_overfetch = 4);

  rocksdb::Status Search(const std::vector<float>& query_embedding,
                         size_t k,
                         const MetadataFilter& filters,
                         RankedList* out) const;

  BackendCapability Capability() const { return backend_->Capability(); }
  size_t Dimension() const { return backend_->Dimension(); }
  BackendHealth Health() const { return backend_->Health(); }
  VectorBackend* Backend() const { return backend_.get(); }

 private:
  rocksdb::Status PostFilter(const std::vector<float>& query,
                             size_t k,
                             const MetadataFilter& filters,
                             std::vector<RawHit>* hits) const;

  std::shared_ptr<VectorBackend> backend_;
  const ChunkStore* store_;
  size_t filter_overfetch_;
};

}  // namespace ragrank
