#pragma once

#include <ragrank/types.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace ragrank {

enum class AggregationMethod {
  kMax,      // max over sub-queries of weight x fused_score
  kSum,      // sum over sub-queries of weight x fused_score
  kWeighted  // sum, with weight_i x decay^i by decomposition order
};

/** Parse "max", "sum" or "weighted". Anything else is InvalidArgument. */
rocksdb::Status ParseAggregationMethod(std::string_view name, AggregationMethod* out);

std::string_view AggregationMethodName(AggregationMethod method);

struct AggregatorOptions {
  AggregationMethod method = AggregationMethod::kMax;

  // Geometric decay for kWeighted, in (0, 1]
  double weighted_decay = 0.5;
};

/**
 * Merges per-sub-query fused lists into one list.
 *
 * Every chunk id present in any input list appears exactly once in the
 * output, which is sorted by aggregate_score descending with ties broken
 * by chunk_id ascending. matched_sub_queries lists every sub-query that
 * found the chunk; attributions carry the per (sub-query, list) ranks and
 * scores. Citation fields and combined_score are left for the caller.
 */
class Aggregator {
 public:
  explicit Aggregator(const AggregatorOptions& opt = AggregatorOptions{}) : opt_(opt) {}

  /** InvalidArgument if weighted_decay is outside (0, 1]. */
  rocksdb::Status Validate() const;

  /**
   * @param sub_queries Sub-queries in decomposition order
   * @param fused One fused list per sub-query (same order)
   */
  rocksdb::Status Aggregate(const std::vector<SubQuery>& sub_queries,
                            const std::vector<std::vector<FusedResult>>& fused,
                            std::vector<AggregatedResult>* out) const;

  /** Weight applied to sub-query i under the configured method. */
  double EffectiveWeight(const SubQuery& sub_query, size_t index) const;

 private:
  AggregatorOptions opt_;
};

}  // namespace ragrank
