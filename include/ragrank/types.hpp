#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ragrank {

/** Which adapter produced a ranked list. */
enum class AdapterKind {
  kSemantic,  // vector store adapter
  kLexical    // term-frequency (BM25) adapter
};

/** Stable lowercase name ("semantic", "lexical") used in list ids and metrics. */
std::string_view AdapterName(AdapterKind kind);

/** Native similarity/distance metric a vector backend reports. */
enum class NativeMetric {
  kCosine,       // similarity in [-1, 1], higher = closer
  kL2,           // distance in [0, inf), lower = closer
  kDot,          // unbounded inner product, higher = closer
  kUnknownRange  // higher = closer, no declared range
};

std::string_view MetricName(NativeMetric metric);

/** Declared by every vector backend; selects the normalisation mapping. */
struct BackendCapability {
  NativeMetric metric = NativeMetric::kCosine;
  bool supports_metadata_filtering = false;
};

/** Coarse health of a backend, reported by health checks. */
enum class HealthStatus { kHealthy, kDegraded, kUnhealthy };

struct BackendHealth {
  HealthStatus status = HealthStatus::kHealthy;
  std::string backend;   // backend name
  std::string message;   // empty when healthy
  uint64_t item_count = 0;
};

// Exact-match key/value filter. The key "document_id" matches
// Chunk::source_document_id instead of a metadata entry.
using MetadataFilter = std::map<std::string, std::string>;

constexpr const char* kDocumentIdFilterKey = "document_id";

/**
 * Immutable unit of retrievable content, produced by ingestion.
 * The engine never modifies a chunk after it has been indexed.
 */
struct Chunk {
  std::string id;
  std::string text;
  std::string source_document_id;
  uint32_t position = 0;                        // ordinal within the document
  std::vector<float> embedding;                 // fixed dimension per model
  std::map<std::string, std::string> metadata;  // opaque to ranking
};

/** True when every filter entry matches the chunk. An empty filter matches all. */
bool MatchesFilter(const Chunk& chunk, const MetadataFilter& filter);

struct ResultSource {
  AdapterKind adapter = AdapterKind::kSemantic;
  std::optional<size_t> sub_query_index;
};

struct ScoredResult {
  std::string chunk_id;
  double raw_score = 0.0;         // backend-native value
  double normalised_score = 0.0;  // in [0, 1]
  size_t rank = 0;                // 1-based within the originating list
  ResultSource source;
};

/**
 * Ordered results from one adapter for one query.
 *
 * Ranks are assigned by Append(), so they start at 1 and increase by one per
 * item. A chunk id can appear at most once.
 */
class RankedList {
 public:
  RankedList() = default;
  explicit RankedList(AdapterKind adapter) : adapter_(adapter) {}

  /** Append the next-ranked result. Returns false if chunk_id is already present. */
  bool Append(std::string chunk_id, double raw_score, double normalised_score);

  /** Tag every item as coming from the given sub-query. */
  void SetSubQueryIndex(size_t index);

  /** Keep only the first n items. */
  void Truncate(size_t n);

  AdapterKind Adapter() const { return adapter_; }
  const std::vector<ScoredResult>& Items() const { return items_; }
  size_t Size() const { return items_.size(); }
  bool Empty() const { return items_.empty(); }
  bool Contains(const std::string& chunk_id) const { return ids_.count(chunk_id) > 0; }

  const ScoredResult& operator[](size_t i) const { return items_[i]; }
  std::vector<ScoredResult>::const_iterator begin() const { return items_.begin(); }
  std::vector<ScoredResult>::const_iterator end() const { return items_.end(); }

 private:
  AdapterKind adapter_ = AdapterKind::kSemantic;
  std::vector<ScoredResult> items_;
  std::unordered_set<std::string> ids_;
};

/** A ranked list together with the identifier fusion reports it under. */
struct LabeledList {
  std::string list_id;
  RankedList list;
};

/** One list's contribution to a fused result. */
struct ListContribution {
  std::string list_id;
  AdapterKind adapter = AdapterKind::kSemantic;
  size_t rank = 0;
  double raw_score = 0.0;
  double normalised_score = 0.0;
};

struct FusedResult {
  std::string chunk_id;
  double fused_score = 0.0;
  std::vector<std::string> contributing_lists;
  // Scores of the best-ranked occurrence per adapter.
  std::map<AdapterKind, double> best_raw_scores;
  std::map<AdapterKind, double> best_normalised_scores;
  std::vector<ListContribution> contributions;
};

enum class SubQueryOrigin { kRule, kLLM };

struct SubQuery {
  std::string text;
  double weight = 1.0;  // must be > 0
  SubQueryOrigin origin = SubQueryOrigin::kRule;
};

/** Where a final result was found: one entry per (sub-query, adapter) hit. */
struct Attribution {
  size_t sub_query_index = 0;
  AdapterKind adapter = AdapterKind::kSemantic;
  size_t rank = 0;
  double raw_score = 0.0;
  double normalised_score = 0.0;
};

struct AggregatedResult {
  std::string chunk_id;
  double aggregate_score = 0.0;
  std::vector<size_t> matched_sub_queries;   // ascending sub-query indices
  std::map<size_t, double> sub_query_scores;  // weight x fused score per sub-query
  std::vector<Attribution> attributions;

  // Display score: semantic_weight x semantic + keyword_weight x lexical,
  // using best normalised scores. An adapter that missed the chunk adds 0.
  // Never used for ordering.
  double combined_score = 0.0;

  // Citation fields, filled from the chunk store.
  std::string text;
  std::string source_document_id;
  uint32_t position = 0;

  // Set only when the reranker reordered this result.
  std::optional<double> rerank_score;
};

}  // namespace ragrank
