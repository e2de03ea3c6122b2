#pragma once

#include <ragrank/types.hpp>

#include <vector>

#include <rocksdb/status.h>

namespace ragrank {

/** Default reciprocal rank fusion constant. */
constexpr double kDefaultRrfK = 60.0;

/**
 * Reciprocal Rank Fusion over ranked lists for the same query.
 *
 *   fused_score(c) = sum over lists L containing c of 1 / (k_rrf + rank_L(c))
 *
 * Operates on ranks only. Output is sorted by fused_score descending with
 * ties broken by chunk_id ascending. Empty lists are ignored; a single
 * non-empty list passes through with its order preserved.
 *
 * Stateless apart from k_rrf; safe to share across threads.
 */
class FusionEngine {
 public:
  explicit FusionEngine(double k_rrf = kDefaultRrfK) : k_rrf_(k_rrf) {}

  /** InvalidArgument if k_rrf is not a finite value > 0. */
  rocksdb::Status Validate() const;

  rocksdb::Status Fuse(const std::vector<LabeledList>& lists,
                       std::vector<FusedResult>* out) const;

  double k_rrf() const { return k_rrf_; }

 private:
  double k_rrf_;
};

}  // namespace ragrank
