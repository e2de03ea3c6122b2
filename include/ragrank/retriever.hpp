#pragma once

#include <ragrank/aggregator.hpp>
#include <ragrank/decomposer.hpp>
#include <ragrank/embedder.hpp>
#include <ragrank/lexical_index.hpp>
#include <ragrank/observability.hpp>
#include <ragrank/reranker.hpp>
#include <ragrank/types.hpp>
#include <ragrank/vector_store.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace ragrank {

class ChunkStore;
class FusionEngine;

namespace internal {
class BoundedExecutor;
}  // namespace internal

/** Which adapters a search consults. */
enum class SearchMode {
  kHybrid,    // semantic + lexical, fused
  kSemantic,  // vector store only
  kKeyword    // lexical index only
};

/** Parse "hybrid", "semantic" or "keyword". */
rocksdb::Status ParseSearchMode(std::string_view name, SearchMode* out);

std::string_view SearchModeName(SearchMode mode);

/** Built-in vector backend choice (ignored when custom_vector_backend is set). */
enum class VectorBackendType {
  kExact,  // brute-force scan of the chunk store, native filtering
  kHNSW    // hnswlib graph rebuilt from the chunk store at Open
};

/**
 * Options for ragrank::Retriever.
 *
 * Every collaborator has a built-in implementation and an injection hook;
 * a set hook wins over the corresponding built-in settings.
 */
struct Options {
  // Chunk store (RocksDB) knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // ---------------------------------------------------------------------------
  // Retrieval
  // ---------------------------------------------------------------------------

  // Results returned when SearchRequest::limit is 0
  size_t default_limit = 10;

  // Results whose combined_score and aggregate_score are both below this
  // are dropped (0 = keep all)
  double min_score = 0.0;

  // Each adapter is asked for limit * candidate_multiplier results
  size_t candidate_multiplier = 3;

  // Weights of the combined display score (never used for ordering)
  double semantic_weight = 0.7;
  double keyword_weight = 0.3;

  // Reciprocal rank fusion constant
  double k_rrf = 60.0;

  // ---------------------------------------------------------------------------
  // Decomposition and aggregation
  // ---------------------------------------------------------------------------

  DecompositionStrategy decomposition_strategy = DecompositionStrategy::kRuleBased;
  size_t max_sub_queries = 5;
  AggregationMethod aggregation = AggregationMethod::kMax;
  double weighted_decay = 0.5;

  // GGUF model for kLLM decomposition (empty = rules only)
  std::string llm_model_path;
  int llm_gpu_layers = 0;
  int llm_max_tokens = 200;

  // ---------------------------------------------------------------------------
  // Reranking
  // ---------------------------------------------------------------------------

  // Aggregated results handed to the cross-encoder (at least the limit)
  size_t rerank_candidates = 30;

  // Reranked results scoring below this are dropped
  std::optional<double> rerank_min_score;

  // ONNX cross-encoder (vocab.txt alongside). Empty = reranking unavailable.
  std::string cross_encoder_model_path;

  // ---------------------------------------------------------------------------
  // Embedding and vector backend
  // ---------------------------------------------------------------------------

  // ONNX query encoder (vocab.txt alongside). Empty = semantic search off
  // unless an embedder is injected.
  std::string embedding_model_path;
  EmbedderModelType embedding_model_type = EmbedderModelType::kMiniLM;

  // Threads per ONNX session (0 = runtime default)
  int inference_threads = 0;

  VectorBackendType vector_backend = VectorBackendType::kExact;
  NativeMetric vector_metric = NativeMetric::kCosine;
  HnswOptions hnsw;

  // Initial over-fetch factor when a backend cannot filter natively
  size_t filter_overfetch = 4;

  // Lexical index
  Bm25Options bm25;

  // ---------------------------------------------------------------------------
  // Concurrency
  // ---------------------------------------------------------------------------

  // Worker threads shared by all adapter and reranker calls
  size_t max_concurrency = 8;

  // Per-query deadline in milliseconds (0 = no deadline)
  uint64_t query_timeout_ms = 5000;

  // ---------------------------------------------------------------------------
  // Injection hooks (optional)
  // ---------------------------------------------------------------------------

  std::shared_ptr<const Embedder> custom_embedder;
  std::shared_ptr<VectorBackend> custom_vector_backend;
  std::shared_ptr<LexicalIndex> custom_lexical_index;
  std::shared_ptr<const CrossEncoder> custom_cross_encoder;
  std::shared_ptr<const SubQueryGenerator> custom_sub_query_generator;

  // Observability hooks (optional)
  //
  // If set, Search/Index emit counters and histograms (ragrank.*) and
  // attach attributes/events to spans.
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

/** InvalidArgument describing the first invalid option, OK otherwise. */
rocksdb::Status ValidateOptions(const Options& opt);

struct SearchRequest {
  std::string query;
  SearchMode mode = SearchMode::kHybrid;
  bool decompose = false;
  bool rerank = false;

  // 0 = Options::default_limit
  size_t limit = 0;

  MetadataFilter filters;

  // Per-call overrides
  std::optional<AggregationMethod> aggregation;
  std::optional<double> min_score;
  std::optional<uint64_t> timeout_ms;
};

/** Outcome of one adapter call for one sub-query. */
struct AdapterStatus {
  size_t sub_query_index = 0;
  AdapterKind adapter = AdapterKind::kSemantic;
  rocksdb::Status status;
  size_t results = 0;
  uint64_t latency_us = 0;
};

struct SearchResponse {
  std::vector<AggregatedResult> results;
  std::vector<SubQuery> sub_queries;
  std::vector<AdapterStatus> adapter_statuses;

  bool reranked = false;
  std::string rerank_skipped_reason;  // set when rerank was requested but not applied

  uint64_t latency_us = 0;
};

/**
 * ragrank::Retriever
 *
 * Hybrid retrieval over a RocksDB chunk store: a vector store adapter and a
 * BM25 lexical adapter are searched per sub-query, fused with reciprocal
 * rank fusion, aggregated across sub-queries and optionally reranked with a
 * cross-encoder.
 *
 * Search() is const and safe to call concurrently. Index/Remove calls are
 * serialized internally. Close() may be called from any thread: it waits
 * for in-flight calls to return, and later calls fail with InvalidArgument.
 */
class Retriever {
 public:
  ~Retriever();

  Retriever(const Retriever&) = delete;
  Retriever& operator=(const Retriever&) = delete;

  /**
   * Open or create the chunk store at db_path, load or attach the
   * collaborators and rebuild in-memory indexes from the store.
   *
   * InvalidArgument for invalid options, an embedder whose dimension differs
   * from the stored embeddings, or a model that fails to load.
   */
  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<Retriever>* out,
                              const Options& opt = Options{});

  /**
   * Make chunks searchable. Empty ids are filled with MakeChunkId().
   * InvalidArgument on an embedding dimension mismatch.
   */
  rocksdb::Status Index(const std::vector<Chunk>& chunks);

  /** NotFound if the chunk is not stored. */
  rocksdb::Status Remove(std::string_view chunk_id);

  /** removed may be null. */
  rocksdb::Status RemoveDocument(std::string_view document_id, uint64_t* removed);

  /**
   * Run a query.
   *
   * OK with zero results for an empty query or when nothing matches.
   * Failed adapters are left out and reported in adapter_statuses;
   * Aborted (no searchable backend) only when every adapter call failed.
   */
  rocksdb::Status Search(const SearchRequest& request, SearchResponse* response) const;

  rocksdb::Status Get(std::string_view chunk_id, Chunk* out) const;

  rocksdb::Status Count(uint64_t* out) const;

  /** Store, vector backend, lexical index and reranker health. */
  std::vector<BackendHealth> Health() const;

  /** Embedding dimension expected from chunks and the query embedder (0 = unknown). */
  size_t Dimension() const;

  bool SemanticAvailable() const { return vector_adapter_ && embedder_; }
  bool RerankerAvailable() const { return reranker_ && reranker_->Available(); }

  /** Stop workers and release backend resources. Safe to call multiple times. */
  void Close();

  bool IsOpen() const;

 private:
  explicit Retriever(const Options& opt);

  rocksdb::Status RebuildIndexes();

  // Shared hold for one public call; empty once Close() has begun
  std::shared_lock<std::shared_mutex> EnterCall() const;

  // Caller holds lifecycle_mutex_ (shared or exclusive)
  bool OpenLocked() const;

  Options opt_;

  std::unique_ptr<ChunkStore> store_;
  std::shared_ptr<const Embedder> embedder_;
  std::shared_ptr<VectorStoreAdapter> vector_adapter_;
  std::shared_ptr<LexicalIndex> lexical_;
  std::shared_ptr<const Reranker> reranker_;
  std::string reranker_error_;

  std::shared_ptr<const QueryDecomposer> decomposer_;
  std::unique_ptr<FusionEngine> fusion_;
  std::unique_ptr<internal::BoundedExecutor> executor_;

  bool rebuild_vector_ = false;
  bool rebuild_lexical_ = false;

  // Shared by every call, exclusive in Close()
  mutable std::shared_mutex lifecycle_mutex_;
  std::atomic<bool> closing_{false};
  std::mutex write_mutex_;  // serializes Index/Remove across store and indexes
};

}  // namespace ragrank
