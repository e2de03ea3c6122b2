#include <ragrank/vector_store.hpp>

#include <ragrank/chunk_store.hpp>
#include <ragrank/errors.hpp>
#include <ragrank/internal.hpp>
#include <ragrank/score_normalizer.hpp>
#include <ragrank/vector_index.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace ragrank {

namespace {

// Backend-native ordering: better hit first, ties by chunk id.
void SortHits(std::vector<RawHit>* hits, NativeMetric metric, size_t k) {
  const bool lower_better = LowerIsBetter(metric);
  auto better = [lower_better](const RawHit& a, const RawHit& b) {
    if (a.raw_score != b.raw_score) {
      return lower_better ? a.raw_score < b.raw_score : a.raw_score > b.raw_score;
    }
    return a.chunk_id < b.chunk_id;
  };
  if (hits->size() > k) {
    std::partial_sort(hits->begin(), hits->begin() + static_cast<std::ptrdiff_t>(k),
                      hits->end(), better);
    hits->resize(k);
  } else {
    std::sort(hits->begin(), hits->end(), better);
  }
}

// ---------------------------------------------------------------------------
// Exact scan over the chunk store
// ---------------------------------------------------------------------------

class ExactVectorBackend : public VectorBackend {
 public:
  ExactVectorBackend(const ChunkStore* store, NativeMetric metric)
      : store_(store), metric_(metric) {}

  std::string Name() const override { return "exact_scan"; }

  BackendCapability Capability() const override {
    return BackendCapability{metric_, true};
  }

  size_t Dimension() const override { return store_->Dimension(); }

  rocksdb::Status Search(const std::vector<float>& query,
                         size_t k,
                         const MetadataFilter* filter,
                         std::vector<RawHit>* out) const override {
    out->clear();
    if (!store_->IsOpen()) {
      return BackendUnavailable(Name(), "chunk store is closed");
    }
    if (k == 0) return rocksdb::Status::OK();

    std::vector<RawHit> hits;
    rocksdb::Status s;
    if (filter && !filter->empty()) {
      s = store_->ForEach([&](const Chunk& chunk) {
        if (chunk.embedding.size() == query.size() && MatchesFilter(chunk, *filter)) {
          hits.push_back({chunk.id, Score(query, chunk.embedding)});
        }
        return true;
      });
    } else {
      s = store_->ForEachEmbedding(
          [&](const std::string& chunk_id, const std::vector<float>& embedding) {
            if (embedding.size() == query.size()) {
              hits.push_back({chunk_id, Score(query, embedding)});
            }
            return true;
          });
    }
    if (!s.ok()) return s;

    SortHits(&hits, metric_, k);
    *out = std::move(hits);
    return rocksdb::Status::OK();
  }

  rocksdb::Status Upsert(const Chunk&) override { return rocksdb::Status::OK(); }

  rocksdb::Status Remove(const std::string&) override { return rocksdb::Status::OK(); }

  BackendHealth Health() const override {
    BackendHealth health = store_->Health();
    health.backend = Name();
    return health;
  }

 private:
  double Score(const std::vector<float>& a, const std::vector<float>& b) const {
    switch (metric_) {
      case NativeMetric::kCosine:
        return internal::CosineSimilarity(a, b);
      case NativeMetric::kL2:
        return internal::L2Distance(a, b);
      case NativeMetric::kDot:
      case NativeMetric::kUnknownRange:
        return internal::DotProduct(a, b);
    }
    return 0.0;
  }

  const ChunkStore* store_;
  NativeMetric metric_;
};

// ---------------------------------------------------------------------------
// HNSW graph (hnswlib)
// ---------------------------------------------------------------------------

class HnswVectorBackend : public VectorBackend {
 public:
  HnswVectorBackend(std::unique_ptr<internal::VectorIndex> index, NativeMetric metric)
      : index_(std::move(index)), metric_(metric) {}

  std::string Name() const override { return "hnsw"; }

  BackendCapability Capability() const override {
    return BackendCapability{metric_, false};
  }

  size_t Dimension() const override { return index_->Dimension(); }

  rocksdb::Status Search(const std::vector<float>& query,
                         size_t k,
                         const MetadataFilter*,
                         std::vector<RawHit>* out) const override {
    out->clear();
    std::vector<internal::SearchResult> found;
    std::string error;
    if (!index_->Search(query, k, &found, &error)) {
      return BackendUnavailable(Name(), error);
    }
    for (const auto& r : found) {
      double raw = 0.0;
      if (metric_ == NativeMetric::kL2) {
        // hnswlib reports squared distances
        raw = std::sqrt(std::max(0.0f, r.distance));
      } else {
        raw = 1.0 - static_cast<double>(r.distance);
      }
      out->push_back({r.chunk_id, raw});
    }
    return rocksdb::Status::OK();
  }

  rocksdb::Status Upsert(const Chunk& chunk) override {
    if (chunk.embedding.size() != index_->Dimension()) {
      return ConfigurationError("embedding dimension " +
                                std::to_string(chunk.embedding.size()) +
                                " does not match index dimension " +
                                std::to_string(index_->Dimension()));
    }
    if (!index_->Add(chunk.embedding, chunk.id)) {
      return rocksdb::Status::IOError("hnsw insert failed", chunk.id);
    }
    return rocksdb::Status::OK();
  }

  rocksdb::Status Remove(const std::string& chunk_id) override {
    if (!index_->Remove(chunk_id)) {
      return rocksdb::Status::NotFound("chunk not in hnsw index", chunk_id);
    }
    return rocksdb::Status::OK();
  }

  BackendHealth Health() const override {
    BackendHealth health;
    health.backend = Name();
    health.item_count = index_->Size();
    if (index_->DeletedCount() > health.item_count && health.item_count > 0) {
      health.status = HealthStatus::kDegraded;
      health.message = "more soft-deleted than live entries";
    }
    return health;
  }

 private:
  std::unique_ptr<internal::VectorIndex> index_;
  NativeMetric metric_;
};

}  // namespace

std::unique_ptr<VectorBackend> CreateExactVectorBackend(const ChunkStore* store,
                                                        NativeMetric metric) {
  if (!store) return nullptr;
  return std::make_unique<ExactVectorBackend>(store, metric);
}

std::unique_ptr<VectorBackend> CreateHnswVectorBackend(size_t dimension,
                                                       NativeMetric metric,
                                                       const HnswOptions& opt,
                                                       std::string* error_out) {
  internal::HnswSpace space;
  if (metric == NativeMetric::kL2) {
    space = internal::HnswSpace::kL2;
  } else if (metric == NativeMetric::kDot) {
    space = internal::HnswSpace::kInnerProduct;
  } else {
    if (error_out) {
      *error_out = "hnsw backend supports l2 and dot metrics, not " +
                   std::string(MetricName(metric));
    }
    return nullptr;
  }

  auto index = internal::CreateHNSWIndex(dimension, space, opt.initial_capacity,
                                         opt.m, opt.ef_construction);
  if (!index) {
    if (error_out) {
      *error_out = dimension == 0
                       ? "hnsw backend needs a non-zero dimension"
                       : "hnsw backend requires RAGRANK_ENABLE_SEMANTIC=ON";
    }
    return nullptr;
  }
  index->SetSearchParam("ef_search", opt.ef_search);
  return CreateGraphVectorBackend(std::move(index), metric, error_out);
}

std::unique_ptr<VectorBackend> CreateGraphVectorBackend(
    std::unique_ptr<internal::VectorIndex> index,
    NativeMetric metric,
    std::string* error_out) {
  if (!index) {
    if (error_out) *error_out = "graph index is null";
    return nullptr;
  }
  const internal::HnswSpace expected =
      metric == NativeMetric::kL2 ? internal::HnswSpace::kL2 : internal::HnswSpace::kInnerProduct;
  if ((metric != NativeMetric::kL2 && metric != NativeMetric::kDot) ||
      index->Space() != expected) {
    if (error_out) {
      *error_out = "metric " + std::string(MetricName(metric)) +
                   " does not match the graph index space";
    }
    return nullptr;
  }
  return std::make_unique<HnswVectorBackend>(std::move(index), metric);
}

// ---------------------------------------------------------------------------
// VectorStoreAdapter
// ---------------------------------------------------------------------------

VectorStoreAdapter::VectorStoreAdapter(std::shared_ptr<VectorBackend> backend,
                                       const ChunkStore* store,
                                       size_t filter_overfetch)
    : backend_(std::move(backend)),
      store_(store),
      filter_overfetch_(std::max<size_t>(filter_overfetch, 1)) {}

rocksdb::Status VectorStoreAdapter::Search(const std::vector<float>& query_embedding,
                                           size_t k,
                                           const MetadataFilter& filters,
                                           RankedList* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  *out = RankedList(AdapterKind::kSemantic);

  if (query_embedding.empty()) {
    return ConfigurationError("query embedding is empty");
  }
  const size_t dim = backend_->Dimension();
  if (dim != 0 && dim != query_embedding.size()) {
    return ConfigurationError("query embedding dimension " +
                              std::to_string(query_embedding.size()) +
                              " does not match backend " + backend_->Name() +
                              " dimension " + std::to_string(dim));
  }
  if (k == 0) return rocksdb::Status::OK();

  const BackendCapability cap = backend_->Capability();
  std::vector<RawHit> hits;
  rocksdb::Status s;
  if (filters.empty()) {
    s = backend_->Search(query_embedding, k, nullptr, &hits);
  } else if (cap.supports_metadata_filtering) {
    s = backend_->Search(query_embedding, k, &filters, &hits);
  } else {
    s = PostFilter(query_embedding, k, filters, &hits);
  }
  if (!s.ok()) {
    if (s.IsInvalidArgument() || IsBackendUnavailable(s)) return s;
    return BackendUnavailable(backend_->Name(), s.ToString());
  }

  // Drop duplicate ids (keep first) and anything past k.
  std::unordered_set<std::string> seen;
  std::vector<RawHit> unique;
  unique.reserve(std::min(hits.size(), k));
  for (auto& h : hits) {
    if (unique.size() >= k) break;
    if (seen.insert(h.chunk_id).second) unique.push_back(std::move(h));
  }

  std::vector<double> raw;
  raw.reserve(unique.size());
  for (const auto& h : unique) raw.push_back(h.raw_score);
  const BatchContext batch = BatchContext::FromScores(raw);

  struct Normalised {
    RawHit hit;
    double score;
  };
  std::vector<Normalised> ranked;
  ranked.reserve(unique.size());
  for (auto& h : unique) {
    double n = NormalizeScore(h.raw_score, cap.metric, batch);
    ranked.push_back({std::move(h), n});
  }

  const bool lower_better = LowerIsBetter(cap.metric);
  std::sort(ranked.begin(), ranked.end(),
            [lower_better](const Normalised& a, const Normalised& b) {
              if (a.score != b.score) return a.score > b.score;
              if (a.hit.raw_score != b.hit.raw_score) {
                return lower_better ? a.hit.raw_score < b.hit.raw_score
                                    : a.hit.raw_score > b.hit.raw_score;
              }
              return a.hit.chunk_id < b.hit.chunk_id;
            });

  for (auto& r : ranked) {
    out->Append(std::move(r.hit.chunk_id), r.hit.raw_score, r.score);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status VectorStoreAdapter::PostFilter(const std::vector<float>& query,
                                               size_t k,
                                               const MetadataFilter& filters,
                                               std::vector<RawHit>* hits) const {
  if (!store_) {
    return ConfigurationError("metadata filters on backend " + backend_->Name() +
                              " need a chunk store");
  }

  size_t fetch = k > std::numeric_limits<size_t>::max() / filter_overfetch_
                     ? k
                     : k * filter_overfetch_;
  while (true) {
    std::vector<RawHit> raw;
    rocksdb::Status s = backend_->Search(query, fetch, nullptr, &raw);
    if (!s.ok()) return s;

    hits->clear();
    for (auto& h : raw) {
      Chunk record;
      s = store_->GetRecord(h.chunk_id, &record);
      if (s.IsNotFound()) continue;
      if (!s.ok()) return s;
      if (!MatchesFilter(record, filters)) continue;
      hits->push_back(std::move(h));
      if (hits->size() >= k) return rocksdb::Status::OK();
    }

    // Backend exhausted: nothing more can match.
    if (raw.size() < fetch || fetch > std::numeric_limits<size_t>::max() / 2) {
      return rocksdb::Status::OK();
    }
    fetch *= 2;
  }
}

}  // namespace ragrank
