#pragma once

#include <ragrank/types.hpp>

#include <cstddef>
#include <vector>

namespace ragrank {

/**
 * Statistics of the raw scores returned for one query by one backend.
 * Only the batch-relative mappings (dot, unknown_range) read it.
 */
struct BatchContext {
  double min = 0.0;
  double max = 0.0;
  size_t size = 0;  // number of finite scores observed

  static BatchContext FromScores(const std::vector<double>& raw_scores);
};

/**
 * Map a backend-native value onto a canonical [0, 1] relevance score.
 *
 *   cosine         (s + 1) / 2, s clamped to [-1, 1]
 *   l2             1 / (1 + d), d clamped to [0, inf)
 *   dot            (s - min) / (max - min) over the batch; 1.0 for a batch of
 *                  one or a batch with no spread
 *   unknown_range  same as dot
 *
 * NaN maps to 0. The result depends only on the arguments.
 */
double NormalizeScore(double raw_score, NativeMetric metric, const BatchContext& batch);

/** Normalise a batch, deriving the BatchContext from the batch itself. */
std::vector<double> NormalizeScores(const std::vector<double>& raw_scores,
                                    NativeMetric metric);

/** True for metrics where a smaller raw value is a closer match. */
inline bool LowerIsBetter(NativeMetric metric) { return metric == NativeMetric::kL2; }

}  // namespace ragrank
