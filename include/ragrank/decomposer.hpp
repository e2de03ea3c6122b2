#pragma once

#include <ragrank/types.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace ragrank {

enum class DecompositionStrategy {
  kNone,       // whole query as one sub-query
  kRuleBased,  // comparison / multi-aspect / conjunction patterns
  kLLM         // SubQueryGenerator, falling back to rules
};

/** Parse "none", "rule" (or "rule_based") and "llm". */
rocksdb::Status ParseDecompositionStrategy(std::string_view name,
                                           DecompositionStrategy* out);

std::string_view DecompositionStrategyName(DecompositionStrategy strategy);

/**
 * Result of a model-backed decomposition.
 */
struct GenerationResult {
  bool success = false;
  std::vector<SubQuery> sub_queries;
  std::string error_message;  // set if success is false
};

/**
 * Replaceable decomposition strategy backed by a language model.
 * Implementations must be safe for concurrent Generate() calls.
 */
class SubQueryGenerator {
 public:
  virtual ~SubQueryGenerator() = default;

  virtual GenerationResult Generate(std::string_view query,
                                    size_t max_sub_queries) const = 0;

  virtual std::string ModelType() const = 0;
};

/**
 * Parse a model response into sub-queries.
 *
 * Accepts a JSON array of strings or {"text": ..., "weight": ...} objects.
 * Otherwise every non-empty line is a sub-query, with list numbering,
 * bullets and surrounding quotes stripped; lines ending in ':' are skipped.
 * Returns at most max_sub_queries entries with origin kLLM.
 */
std::vector<SubQuery> ParseSubQueryResponse(std::string_view response,
                                            size_t max_sub_queries);

struct DecomposerOptions {
  DecompositionStrategy strategy = DecompositionStrategy::kRuleBased;

  // Upper bound on sub-queries per query (>= 1)
  size_t max_sub_queries = 5;

  // Conjunction fragments shorter than this are dropped
  size_t min_fragment_length = 4;
};

/**
 * Splits a compound query into independently searchable sub-queries.
 *
 * Decompose() is total: it always returns at least one sub-query, the
 * original query with weight 1.0 when nothing matches. Sub-queries are
 * deduplicated case-insensitively and capped at max_sub_queries.
 */
class QueryDecomposer {
 public:
  explicit QueryDecomposer(const DecomposerOptions& opt = DecomposerOptions{},
                           std::shared_ptr<const SubQueryGenerator> generator = nullptr);

  /** InvalidArgument if max_sub_queries is 0. */
  rocksdb::Status Validate() const;

  std::vector<SubQuery> Decompose(std::string_view query) const;

  /** Rule-based path only, regardless of the configured strategy. */
  std::vector<SubQuery> DecomposeWithRules(std::string_view query) const;

  const DecomposerOptions& options() const { return opt_; }

  /** True when Decompose() consults a generator (kLLM with one attached). */
  bool UsesGenerator() const {
    return opt_.strategy == DecompositionStrategy::kLLM && generator_ != nullptr;
  }

 private:
  // Clean, drop empties, dedupe case-insensitively, cap. May return empty.
  std::vector<SubQuery> Finalize(std::vector<SubQuery> candidates) const;

  DecomposerOptions opt_;
  std::shared_ptr<const SubQueryGenerator> generator_;
};

}  // namespace ragrank
